#ifndef DENSELA_TYPES_HPP
#define DENSELA_TYPES_HPP

#include <cmath>
#include <complex>
#include <concepts>
#include <limits>
#include <type_traits>

namespace densela {

// ==================== Scalar traits ====================
// Customisation point describing what a scalar type can do. Specialise it
// to plug a new number type into the library.
template <typename T, typename Enable = void>
struct ScalarTraits {
  static constexpr bool is_specialized = false;
};

// Signed integers: exact ring, no division
template <typename T>
struct ScalarTraits<T, std::enable_if_t<std::is_integral_v<T> &&
                                        std::is_signed_v<T>>> {
  static constexpr bool is_specialized = true;
  static constexpr bool is_field = false;
  using real_type = T;

  static real_type magnitude(T value) { return value < T{0} ? -value : value; }
};

template <typename T>
struct ScalarTraits<T, std::enable_if_t<std::is_floating_point_v<T>>> {
  static constexpr bool is_specialized = true;
  static constexpr bool is_field = true;
  using real_type = T;

  static real_type magnitude(T value) { return std::abs(value); }
  static constexpr real_type tolerance() {
    return std::numeric_limits<T>::epsilon() * T(4096);
  }
};

template <typename R>
struct ScalarTraits<std::complex<R>,
                    std::enable_if_t<std::is_floating_point_v<R>>> {
  static constexpr bool is_specialized = true;
  static constexpr bool is_field = true;
  using real_type = R;

  static real_type magnitude(const std::complex<R>& value) {
    return std::abs(value);
  }
  static constexpr real_type tolerance() {
    return std::numeric_limits<R>::epsilon() * R(4096);
  }
};

template <typename T>
using real_t = typename ScalarTraits<T>::real_type;

// ==================== Capability concepts ====================

template <typename T>
concept Ring = ScalarTraits<T>::is_specialized && requires(T a, T b) {
  { a + b } -> std::convertible_to<T>;
  { a - b } -> std::convertible_to<T>;
  { a * b } -> std::convertible_to<T>;
  { -a } -> std::convertible_to<T>;
  T{0};
  T{1};
};

template <typename T>
concept Field = Ring<T> && ScalarTraits<T>::is_field && requires(T a, T b) {
  { a / b } -> std::convertible_to<T>;
};

template <typename T>
concept Tolerant = Field<T> && requires(T a) {
  { ScalarTraits<T>::magnitude(a) } -> std::convertible_to<real_t<T>>;
  { ScalarTraits<T>::tolerance() } -> std::convertible_to<real_t<T>>;
} && std::totally_ordered<real_t<T>>;

template <typename T>
concept RealField = Tolerant<T> && std::totally_ordered<T> && requires(T a) {
  { std::sqrt(a) } -> std::convertible_to<T>;
};

// Complex conjugate for complex scalars, identity otherwise
template <Ring T>
T conjugate(const T& value) {
  if constexpr (requires { std::conj(value); } && !std::is_arithmetic_v<T>) {
    return std::conj(value);
  } else {
    return value;
  }
}

// Forward declarations
template <Ring T>
class StorageInterface;

template <Ring T>
class InMemoryStorage;

template <Ring T, typename StoragePolicy>
class Matrix;

template <Ring T>
class Vector;

template <Ring T>
class LineView;

}  // namespace densela
#endif  // DENSELA_TYPES_HPP
