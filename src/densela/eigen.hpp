#ifndef DENSELA_EIGEN_HPP
#define DENSELA_EIGEN_HPP

#include <algorithm>
#include <cmath>
#include <complex>
#include <optional>
#include <utility>
#include <vector>
#include "decomposition.hpp"
#include "matrix.hpp"
#include "solver_config.hpp"
#include "types.hpp"
#include "vector.hpp"

namespace densela {

// Result of power iteration
template <RealField T>
struct EigenPair {
  T value = T{0};
  Vector<T> vector;
  size_t iterations = 0;
  bool converged = false;
};

// Eigenvalues with their unit eigenvectors stored as the columns of vectors
template <RealField T, typename SP = InMemoryStorage<T>>
struct EigenDecomposition {
  std::vector<T> values;
  Matrix<T, SP> vectors;
  size_t iterations = 0;
  bool converged = true;
};

// ==================== Analytic 2x2 ====================

// Roots of l^2 - tr*l + det, larger real part first. Complex pairs are
// returned as conjugates.
template <RealField T, typename SP>
std::pair<std::complex<T>, std::complex<T>> eigenvalues_2x2(
    const Matrix<T, SP>& m) {
  if (m.rows() != 2 || m.cols() != 2)
    DENSELA_THROW(bad_size, "Matrix must be 2x2");

  const T a = m(0, 0), b = m(0, 1), c = m(1, 0), d = m(1, 1);
  const T half_trace = (a + d) / T{2};
  const T half_gap = (a - d) / T{2};
  const T disc = half_gap * half_gap + b * c;

  if (disc >= T{0}) {
    const T s = std::sqrt(disc);
    return {std::complex<T>(half_trace + s), std::complex<T>(half_trace - s)};
  }
  const T s = std::sqrt(-disc);
  return {std::complex<T>(half_trace, s), std::complex<T>(half_trace, -s)};
}

namespace detail {

// Unit eigenvector of the 2x2 [a b; c d] for eigenvalue lambda. Takes the
// better conditioned of the two candidate kernels; fallback is the unit
// vector e_fallback (scalar matrices).
template <RealField T>
Vector<T> eigenvector_2x2(T a, T b, T c, T d, T lambda, size_t fallback,
                          real_t<T> tolerance) {
  Vector<T> first{b, lambda - a};
  Vector<T> second{lambda - d, c};
  const T n1 = first.norm();
  const T n2 = second.norm();

  if (std::max(n1, n2) <= tolerance) {
    Vector<T> unit(2, T{0});
    unit[fallback] = T{1};
    return unit;
  }
  return n1 >= n2 ? first / n1 : second / n2;
}

}  // namespace detail

// Closed form for a real spectrum; nullopt when the eigenvalues form a
// complex pair.
template <RealField T, typename SP>
std::optional<EigenDecomposition<T, SP>> eigen_2x2(
    const Matrix<T, SP>& m, real_t<T> tolerance = ScalarTraits<T>::tolerance()) {
  if (m.rows() != 2 || m.cols() != 2)
    DENSELA_THROW(bad_size, "Matrix must be 2x2");

  const T a = m(0, 0), b = m(0, 1), c = m(1, 0), d = m(1, 1);
  const T half_trace = (a + d) / T{2};
  const T half_gap = (a - d) / T{2};
  const T disc = half_gap * half_gap + b * c;

  if (disc < -tolerance)
    return std::nullopt;

  const T s = disc > T{0} ? std::sqrt(disc) : T{0};
  const T l1 = half_trace + s;
  const T l2 = half_trace - s;

  // For a diagonal matrix l1 belongs to the larger of a and d
  const size_t first_axis = a >= d ? 0 : 1;

  EigenDecomposition<T, SP> result;
  result.values = {l1, l2};
  result.vectors = Matrix<T, SP>(2, 2, T{0});
  result.vectors.set_column(
      0, detail::eigenvector_2x2(a, b, c, d, l1, first_axis, tolerance));
  result.vectors.set_column(
      1, detail::eigenvector_2x2(a, b, c, d, l2, 1 - first_axis, tolerance));
  return result;
}

// ==================== Power Iteration ====================

// Dominant eigenpair. Stops once the Rayleigh quotient moves by less than
// config.tolerance and ||Av - lv|| is within sqrt(config.tolerance)
// (relative to |l| when that exceeds 1); otherwise gives up after
// config.max_iterations with converged == false.
template <RealField T, typename SP>
EigenPair<T> power_iteration(const Matrix<T, SP>& m, const Vector<T>& start,
                             const SolverConfig<T>& config = {}) {
  if (!m.is_square())
    DENSELA_THROW(not_square, "Power iteration requires square matrix");
  if (start.size() != m.rows())
    DENSELA_THROW(incompatible_size,
                  "Start vector length does not match matrix");
  if (start.norm() <= config.tolerance)
    DENSELA_THROW(bad_argument, "Start vector must be nonzero");

  EigenPair<T> result;
  Vector<T> v = start.normalized(config.tolerance);
  T lambda = T{0};
  const T residual_tolerance = std::sqrt(config.tolerance);

  for (size_t k = 0; k < config.max_iterations; ++k) {
    const Vector<T> w = m * v;
    const T w_norm = w.norm();
    result.iterations = k + 1;

    // v lies in the kernel
    if (w_norm <= config.tolerance) {
      lambda = T{0};
      result.converged = true;
      break;
    }

    const T rayleigh = v.dot(w);
    const T residual = (w - v * rayleigh).norm();
    v = w / w_norm;

    // Rotations keep the quotient fixed while v turns
    if (k > 0 && std::abs(rayleigh - lambda) < config.tolerance &&
        residual <= residual_tolerance * std::max(T{1}, std::abs(rayleigh))) {
      lambda = rayleigh;
      result.converged = true;
      break;
    }
    lambda = rayleigh;
  }

  if (result.converged && lambda != T{0})
    lambda = v.dot(m * v);

  result.value = lambda;
  result.vector = std::move(v);
  return result;
}

// Starts from (1, 1.1, 1.2, ...), which is rarely orthogonal to the
// dominant eigenvector.
template <RealField T, typename SP>
EigenPair<T> power_iteration(const Matrix<T, SP>& m,
                             const SolverConfig<T>& config = {}) {
  Vector<T> start(m.rows());
  for (size_t i = 0; i < start.size(); ++i)
    start[i] = T{1} + T(0.1) * T(i);
  return power_iteration(m, start, config);
}

// ==================== QR Algorithm ====================

namespace detail {

template <RealField T, typename SP>
T max_below_diagonal(const Matrix<T, SP>& m) {
  T result = T{0};
  for (size_t i = 1; i < m.rows(); ++i)
    for (size_t j = 0; j < i; ++j)
      result = std::max(result, std::abs(m(i, j)));
  return result;
}

template <RealField T, typename SP>
bool has_vanishing_pivot(const Matrix<T, SP>& r, real_t<T> tolerance) {
  const auto diagonal = r.diagonal_view();
  for (size_t i = 0; i < diagonal.size(); ++i)
    if (std::abs(diagonal[i]) <= tolerance)
      return true;
  return false;
}

// Eigenvectors of the upper triangular schur matrix, one per column, by
// back substitution. Near-equal diagonal entries get the tolerance as
// denominator.
template <RealField T, typename SP>
Matrix<T, SP> triangular_eigenvectors(const Matrix<T, SP>& schur,
                                      real_t<T> tolerance) {
  const size_t n = schur.rows();
  Matrix<T, SP> y(n, n, T{0});

  for (size_t k = 0; k < n; ++k) {
    const T lambda = schur(k, k);
    y(k, k) = T{1};
    for (size_t i = k; i-- > 0;) {
      T sum = T{0};
      for (size_t j = i + 1; j <= k; ++j)
        sum += schur(i, j) * y(j, k);
      T denom = schur(i, i) - lambda;
      if (std::abs(denom) < tolerance)
        denom = tolerance;
      y(i, k) = -sum / denom;
    }
  }
  return y;
}

}  // namespace detail

// Unshifted QR iteration A_{k+1} = R_k Q_k with V = Q_0 Q_1 ... accumulated.
// Converged once every entry below the diagonal is under config.tolerance.
template <RealField T, typename SP>
EigenDecomposition<T, SP> qr_algorithm(const Matrix<T, SP>& m,
                                       const SolverConfig<T>& config = {}) {
  if (!m.is_square())
    DENSELA_THROW(not_square, "QR algorithm requires square matrix");

  const size_t n = m.rows();
  EigenDecomposition<T, SP> result;
  if (n == 0)
    return result;

  Matrix<T, SP> current = m;
  Matrix<T, SP> accumulated = Matrix<T, SP>::identity(n);
  result.converged = detail::max_below_diagonal(current) < config.tolerance;

  while (!result.converged && result.iterations < config.max_iterations) {
    auto qr = qr_decomposition(current, config.qr_method, config.tolerance);
    // A thin Q with a zeroed column is no longer orthogonal
    if (config.qr_method == QRMethod::GramSchmidt &&
        detail::has_vanishing_pivot(qr.R, config.tolerance)) {
      qr = qr_decomposition(current, QRMethod::Householder, config.tolerance);
    }

    current = qr.R * qr.Q;
    accumulated = accumulated * qr.Q;
    ++result.iterations;
    result.converged = detail::max_below_diagonal(current) < config.tolerance;
  }

  result.values = current.diagonal_view().to_vector().to_std_vector();

  if (m.is_symmetric(config.tolerance)) {
    result.vectors = std::move(accumulated);
    return result;
  }

  Matrix<T, SP> vectors =
      accumulated * detail::triangular_eigenvectors(current, config.tolerance);
  for (size_t k = 0; k < n; ++k)
    vectors.set_column(k, vectors.column_vector(k).normalized(config.tolerance));
  result.vectors = std::move(vectors);
  return result;
}

// Closed form for 2x2 matrices with a real spectrum, QR algorithm otherwise
template <RealField T, typename SP>
EigenDecomposition<T, SP> eigen(const Matrix<T, SP>& m,
                                const SolverConfig<T>& config = {}) {
  if (!m.is_square())
    DENSELA_THROW(not_square, "Eigen decomposition requires square matrix");

  if (m.rows() == 2) {
    if (auto closed_form = eigen_2x2(m, config.tolerance))
      return std::move(*closed_form);
  }
  return qr_algorithm(m, config);
}

}  // namespace densela
#endif  // DENSELA_EIGEN_HPP
