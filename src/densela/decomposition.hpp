#ifndef DENSELA_DECOMPOSITION_HPP
#define DENSELA_DECOMPOSITION_HPP

#include <cmath>
#include <limits>
#include <optional>
#include <utility>
#include "matrix.hpp"
#include "row_reduction.hpp"
#include "solver_config.hpp"
#include "types.hpp"
#include "vector.hpp"

namespace densela {

// ==================== Determinant ====================

// Laplace expansion along the first row. Exact for integer scalars,
// factorial cost: meant for small matrices.
template <Ring T, typename SP>
T cofactor_determinant(const Matrix<T, SP>& m) {
  if (!m.is_square())
    DENSELA_THROW(not_square, "Determinant requires square matrix");

  const size_t n = m.rows();
  if (n == 0)
    return T{1};
  if (n == 1)
    return m(0, 0);
  if (n == 2)
    return m(0, 0) * m(1, 1) - m(0, 1) * m(1, 0);

  T result = T{0};
  for (size_t j = 0; j < n; ++j) {
    if (m(0, j) == T{0})
      continue;
    const T term = m(0, j) * cofactor_determinant(m.minor_matrix(0, j));
    result = (j % 2 == 0) ? result + term : result - term;
  }
  return result;
}

template <Ring T, typename SP>
  requires(!Tolerant<T>)
T determinant(const Matrix<T, SP>& m) {
  return cofactor_determinant(m);
}

// Signed product of the pivots of an echelon pass; 0 as soon as a column
// has no pivot.
template <Tolerant T, typename SP>
T determinant(const Matrix<T, SP>& m,
              real_t<T> tolerance = ScalarTraits<T>::tolerance()) {
  if (!m.is_square())
    DENSELA_THROW(not_square, "Determinant requires square matrix");

  const size_t n = m.rows();
  if (n == 0)
    return T{1};

  Matrix<T, SP> work = m;
  const auto elimination = eliminate(
      work, EchelonForm::Echelon, tolerance,
      std::numeric_limits<size_t>::max(), true);
  if (elimination.rank() < n)
    return T{0};

  return elimination.sign < 0 ? -elimination.pivot_product
                              : elimination.pivot_product;
}

// ==================== Inverse / Solve ====================

template <Tolerant T, typename SP>
bool is_invertible(const Matrix<T, SP>& m,
                   real_t<T> tolerance = ScalarTraits<T>::tolerance()) {
  if (!m.is_square())
    DENSELA_THROW(not_square, "Invertibility requires square matrix");

  Matrix<T, SP> work = m;
  const auto elimination =
      eliminate(work, EchelonForm::Echelon, tolerance,
                std::numeric_limits<size_t>::max(), true);
  return elimination.rank() == m.rows();
}

// Gauss-Jordan on [m | I]; nullopt when m is singular
template <Tolerant T, typename SP>
std::optional<Matrix<T, SP>> inverse(
    const Matrix<T, SP>& m, real_t<T> tolerance = ScalarTraits<T>::tolerance()) {
  if (!m.is_square())
    DENSELA_THROW(not_square, "Inverse requires square matrix");

  const size_t n = m.rows();
  Matrix<T, SP> augmented = m.augmented(Matrix<T, SP>::identity(n));
  const auto elimination =
      eliminate(augmented, EchelonForm::Reduced, tolerance, n, true);
  if (elimination.rank() < n)
    return std::nullopt;

  return augmented.sub_matrix(0, n, n, n);
}

// Solves m * X = rhs by Gauss-Jordan on [m | rhs]; nullopt when m is singular
template <Tolerant T, typename SP>
std::optional<Matrix<T, SP>> solve(
    const Matrix<T, SP>& m, const Matrix<T, SP>& rhs,
    real_t<T> tolerance = ScalarTraits<T>::tolerance()) {
  if (!m.is_square())
    DENSELA_THROW(not_square, "Coefficient matrix must be square");
  if (rhs.rows() != m.rows())
    DENSELA_THROW(incompatible_size,
                  "Incompatible dimensions for system solving");

  const size_t n = m.rows();
  Matrix<T, SP> augmented = m.augmented(rhs);
  const auto elimination =
      eliminate(augmented, EchelonForm::Reduced, tolerance, n, true);
  if (elimination.rank() < n)
    return std::nullopt;

  return augmented.sub_matrix(0, n, n, rhs.cols());
}

template <Tolerant T, typename SP>
std::optional<Vector<T>> solve(
    const Matrix<T, SP>& m, const Vector<T>& rhs,
    real_t<T> tolerance = ScalarTraits<T>::tolerance()) {
  auto x = solve(m, Matrix<T, SP>(rhs, VectorType::ColumnVector), tolerance);
  if (!x)
    return std::nullopt;
  return x->column_vector(0);
}

// ==================== QR Decomposition ====================

template <RealField T, typename SP = InMemoryStorage<T>>
struct QRDecomposition {
  Matrix<T, SP> Q;
  Matrix<T, SP> R;
};

namespace detail {

// Householder vector u (u[0] == 1) and factor tau such that
// (I - tau u u^T) x is a multiple of e1. tau == 0 when x has nothing
// below its first entry to annihilate.
template <RealField T>
std::pair<Vector<T>, T> house_v(const Vector<T>& x, real_t<T> tolerance) {
  const size_t m = x.size();
  Vector<T> u(m, T{0});
  T tau = T{0};

  if (m == 0) {
    return {u, tau};
  }

  u[0] = T{1};
  const T x0 = x[0];
  const T sigma = m > 1 ? x.segment(1, m - 1).norm() : T{0};

  if (sigma <= tolerance) {
    return {u, tau};
  }

  const T mu = std::sqrt(x0 * x0 + sigma * sigma);
  T beta;

  if (x0 <= T{0}) {
    beta = x0 - mu;
  } else {
    beta = -sigma * sigma / (x0 + mu);
  }

  const T scale = T{1} / beta;
  for (size_t i = 1; i < m; ++i) {
    u[i] = x[i] * scale;
  }

  tau = T{2} * beta * beta / (sigma * sigma + beta * beta);
  return {u, tau};
}

template <RealField T, typename SP>
QRDecomposition<T, SP> householder_qr(const Matrix<T, SP>& a,
                                      real_t<T> tolerance) {
  const size_t m = a.rows();
  const size_t n = a.cols();
  Matrix<T, SP> Q = Matrix<T, SP>::identity(m);
  Matrix<T, SP> R = a;

  for (size_t j = 0; j < n && j < m; j++) {
    const Vector<T> x = R.sub_col_view(j, j, m - j).to_vector();
    auto [v, tau] = house_v(x, tolerance);

    if (tau != T{0}) {
      // R <- (I - tau v v^T) R on the trailing block
      for (size_t k = j; k < n; ++k) {
        T s = T{0};
        for (size_t i = 0; i < v.size(); ++i)
          s += v[i] * R(j + i, k);
        s *= tau;
        for (size_t i = 0; i < v.size(); ++i)
          R(j + i, k) -= s * v[i];
      }
      // Q <- Q (I - tau v v^T)
      for (size_t r = 0; r < m; ++r) {
        T s = T{0};
        for (size_t i = 0; i < v.size(); ++i)
          s += Q(r, j + i) * v[i];
        s *= tau;
        for (size_t i = 0; i < v.size(); ++i)
          Q(r, j + i) -= s * v[i];
      }
    }

    for (size_t i = j + 1; i < m; ++i)
      R(i, j) = T{0};
  }

  return {std::move(Q), std::move(R)};
}

// Modified Gram-Schmidt. A column that is (numerically) dependent on the
// previous ones gets a zero column in Q and a zero diagonal entry in R.
template <RealField T, typename SP>
QRDecomposition<T, SP> gram_schmidt_qr(const Matrix<T, SP>& a,
                                       real_t<T> tolerance) {
  const size_t m = a.rows();
  const size_t n = a.cols();
  Matrix<T, SP> Q = Matrix<T, SP>::zeros(m, n);
  Matrix<T, SP> R = Matrix<T, SP>::zeros(n, n);

  for (size_t j = 0; j < n; ++j) {
    Vector<T> v = a.column_vector(j);
    for (size_t k = 0; k < j; ++k) {
      const Vector<T> q = Q.column_vector(k);
      const T r = q.dot(v);
      R(k, j) = r;
      v = v - q * r;
    }

    const T norm = v.norm();
    if (norm <= tolerance) {
      R(j, j) = T{0};
      continue;
    }
    R(j, j) = norm;
    Q.set_column(j, v / norm);
  }

  return {std::move(Q), std::move(R)};
}

}  // namespace detail

// A = Q R. Householder gives an orthogonal m x m Q and m x n R; Gram-Schmidt
// gives an m x n Q with orthonormal (or zero) columns and an n x n R.
template <RealField T, typename SP>
QRDecomposition<T, SP> qr_decomposition(
    const Matrix<T, SP>& a, QRMethod method = QRMethod::Householder,
    real_t<T> tolerance = ScalarTraits<T>::tolerance()) {
  if (a.rows() < a.cols())
    DENSELA_THROW(bad_size, "QR decomposition requires rows >= columns");

  switch (method) {
    case QRMethod::GramSchmidt:
      return detail::gram_schmidt_qr(a, tolerance);
    case QRMethod::Householder:
    default:
      return detail::householder_qr(a, tolerance);
  }
}

}  // namespace densela
#endif  // DENSELA_DECOMPOSITION_HPP
