#ifndef DENSELA_VECTOR_HPP
#define DENSELA_VECTOR_HPP

#include <cassert>
#include <cmath>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>
#include "matrix_error.hpp"
#include "types.hpp"

namespace densela {

// ==================== Vector Class ====================
// Strided one-dimensional array. segment() and strided() hand out views that
// alias the same buffer; copying any vector yields a compact owned copy.
template <Ring T>
class Vector {
 private:
  std::shared_ptr<std::vector<T>> buffer_;
  size_t offset_ = 0;
  size_t size_ = 0;
  size_t stride_ = 1;
  bool is_view_ = false;

  // Private constructor for views
  Vector(std::shared_ptr<std::vector<T>> buffer, size_t offset, size_t size,
         size_t stride)
      : buffer_(std::move(buffer)),
        offset_(offset),
        size_(size),
        stride_(stride),
        is_view_(true) {}

  void copy_from(const Vector& other) {
    if (size_ != other.size_)
      DENSELA_THROW(incompatible_size,
                    "Vector size mismatch for view assignment");
    if (buffer_ == other.buffer_) {
      // Aliased source, go through a temporary
      Vector tmp(other);
      for (size_t i = 0; i < size_; ++i)
        operator[](i) = tmp[i];
      return;
    }
    for (size_t i = 0; i < size_; ++i)
      operator[](i) = other[i];
  }

 public:
  using value_type = T;

  // ===== Constructors =====

  Vector() : buffer_(std::make_shared<std::vector<T>>()) {}

  explicit Vector(size_t size, T init_val = T{})
      : buffer_(std::make_shared<std::vector<T>>(size, init_val)),
        size_(size) {}

  Vector(std::initializer_list<T> init)
      : buffer_(std::make_shared<std::vector<T>>(init)), size_(init.size()) {}

  explicit Vector(std::vector<T> data)
      : buffer_(std::make_shared<std::vector<T>>(std::move(data))),
        size_(buffer_->size()) {}

  // Take over a buffer read with the given stride
  static Vector from_buffer(std::vector<T> buffer, size_t size,
                            size_t stride = 1) {
    if (stride == 0)
      DENSELA_THROW(bad_argument, "Vector stride must be positive");
    if (size > 0 && buffer.size() < (size - 1) * stride + 1)
      DENSELA_THROW(bad_size, "Buffer too small for size and stride");
    Vector result(std::make_shared<std::vector<T>>(std::move(buffer)), 0,
                  size, stride);
    result.is_view_ = false;
    return result;
  }

  // Copy constructor (deep, compact)
  Vector(const Vector& other)
      : buffer_(std::make_shared<std::vector<T>>(other.size_)),
        size_(other.size_) {
    for (size_t i = 0; i < size_; ++i)
      (*buffer_)[i] = other[i];
  }

  Vector(Vector&& other) noexcept
      : buffer_(std::move(other.buffer_)),
        offset_(other.offset_),
        size_(std::exchange(other.size_, 0)),
        stride_(other.stride_),
        is_view_(other.is_view_) {}

  Vector& operator=(const Vector& other) {
    if (this == &other)
      return *this;
    if (is_view_) {
      copy_from(other);
    } else {
      Vector tmp(other);
      *this = std::move(tmp);
    }
    return *this;
  }

  // Views write through; owners take over the other buffer
  Vector& operator=(Vector&& other) {
    if (this == &other)
      return *this;
    if (is_view_) {
      copy_from(other);
    } else if (other.is_view_) {
      *this = Vector(other);
    } else {
      buffer_ = std::move(other.buffer_);
      offset_ = other.offset_;
      size_ = other.size_;
      stride_ = other.stride_;
      other.size_ = 0;
    }
    return *this;
  }

  Vector clone() const { return Vector(*this); }

  // ===== Size Information =====
  size_t size() const noexcept { return size_; }
  size_t stride() const noexcept { return stride_; }
  bool empty() const noexcept { return size_ == 0; }
  bool is_view() const noexcept { return is_view_; }

  // ===== Element Access =====

  T& operator[](size_t i) {
    assert(i < size_ && "Vector index out of bounds");
    return (*buffer_)[offset_ + i * stride_];
  }

  const T& operator[](size_t i) const {
    assert(i < size_ && "Vector index out of bounds");
    return (*buffer_)[offset_ + i * stride_];
  }

  T& at(size_t i) {
    if (i >= size_)
      DENSELA_THROW(out_of_range, "Vector index out of range");
    return operator[](i);
  }

  const T& at(size_t i) const {
    if (i >= size_)
      DENSELA_THROW(out_of_range, "Vector index out of range");
    return operator[](i);
  }

  void set(size_t i, const T& value) { at(i) = value; }

  // ===== Views =====

  Vector segment(size_t start, size_t length) const {
    if (start > size_ || length > size_ - start)
      DENSELA_THROW(bad_view, "Segment exceeds vector size");
    return Vector(buffer_, offset_ + start * stride_, length, stride_);
  }

  // Every step-th element starting at start
  Vector strided(size_t start, size_t length, size_t step) const {
    if (step == 0)
      DENSELA_THROW(bad_argument, "Step must be positive");
    if (length > 0 &&
        (start >= size_ || length - 1 > (size_ - 1 - start) / step))
      DENSELA_THROW(bad_view, "Strided view exceeds vector size");
    return Vector(buffer_, offset_ + start * stride_, length, stride_ * step);
  }

  // ===== Transforms =====

  Vector& apply(std::function<T(T)> func) {
    for (size_t i = 0; i < size_; ++i)
      operator[](i) = func(operator[](i));
    return *this;
  }

  Vector map(std::function<T(T)> func) const { return clone().apply(func); }

  void fill(const T& value) {
    for (size_t i = 0; i < size_; ++i)
      operator[](i) = value;
  }

  // ===== Arithmetic =====

  Vector operator+(const Vector& rhs) const {
    if (size_ != rhs.size_)
      DENSELA_THROW(incompatible_size, "Vector sizes mismatch");
    Vector result(size_);
    for (size_t i = 0; i < size_; ++i)
      result[i] = operator[](i) + rhs[i];
    return result;
  }

  Vector operator-(const Vector& rhs) const {
    if (size_ != rhs.size_)
      DENSELA_THROW(incompatible_size, "Vector sizes mismatch");
    Vector result(size_);
    for (size_t i = 0; i < size_; ++i)
      result[i] = operator[](i) - rhs[i];
    return result;
  }

  Vector operator*(const T& scalar) const {
    Vector result(size_);
    for (size_t i = 0; i < size_; ++i)
      result[i] = operator[](i) * scalar;
    return result;
  }

  Vector operator/(const T& scalar) const
    requires Field<T>
  {
    Vector result(size_);
    for (size_t i = 0; i < size_; ++i)
      result[i] = operator[](i) / scalar;
    return result;
  }

  // Inner product, conjugating the left operand for complex scalars
  T dot(const Vector& rhs) const {
    if (size_ != rhs.size_)
      DENSELA_THROW(incompatible_size, "Vector sizes mismatch for dot");
    T sum = T{0};
    for (size_t i = 0; i < size_; ++i)
      sum = sum + conjugate(operator[](i)) * rhs[i];
    return sum;
  }

  real_t<T> norm() const
    requires Tolerant<T>
  {
    real_t<T> sum_squares{0};
    for (size_t i = 0; i < size_; ++i) {
      const real_t<T> m = ScalarTraits<T>::magnitude(operator[](i));
      sum_squares += m * m;
    }
    return std::sqrt(sum_squares);
  }

  // Unit vector in the same direction; zero vector if the norm is negligible
  Vector normalized(
      real_t<T> tolerance = ScalarTraits<T>::tolerance()) const
    requires Tolerant<T>
  {
    const real_t<T> n = norm();
    if (n <= tolerance)
      return Vector(size_);
    return *this / T(n);
  }

  bool is_approx(const Vector& other,
                 real_t<T> tolerance = ScalarTraits<T>::tolerance()) const
    requires Tolerant<T>
  {
    if (size_ != other.size_)
      return false;
    for (size_t i = 0; i < size_; ++i)
      if (ScalarTraits<T>::magnitude(operator[](i) - other[i]) > tolerance)
        return false;
    return true;
  }

  bool operator==(const Vector& other) const {
    if (size_ != other.size_)
      return false;
    for (size_t i = 0; i < size_; ++i)
      if (!(operator[](i) == other[i]))
        return false;
    return true;
  }

  std::vector<T> to_std_vector() const {
    std::vector<T> result;
    result.reserve(size_);
    for (size_t i = 0; i < size_; ++i)
      result.push_back(operator[](i));
    return result;
  }
};

template <Ring T>
Vector<T> operator*(const T& scalar, const Vector<T>& v) {
  return v * scalar;
}

template <Ring T>
std::ostream& operator<<(std::ostream& os, const Vector<T>& v) {
  os << "[";
  for (size_t i = 0; i < v.size(); ++i) {
    os << v[i];
    if (i + 1 < v.size())
      os << ", ";
  }
  os << "]";
  return os;
}

}  // namespace densela
#endif  // DENSELA_VECTOR_HPP
