#ifndef DENSELA_ROW_REDUCTION_HPP
#define DENSELA_ROW_REDUCTION_HPP

#include <algorithm>
#include <limits>
#include <vector>
#include "matrix.hpp"
#include "types.hpp"

namespace densela {

enum class EchelonForm {
  Echelon,  // Eliminate below pivots only, pivots keep their value
  Reduced   // Unit pivots, eliminated above and below
};

// Bookkeeping of one elimination pass
template <Tolerant T>
struct Elimination {
  std::vector<size_t> pivot_columns;
  size_t swaps = 0;
  int sign = 1;             // Parity of the row permutation
  T pivot_product = T{1};   // Product of pivots before normalisation
  bool complete = true;     // False when stopped at a missing pivot

  size_t rank() const noexcept { return pivot_columns.size(); }
};

namespace detail {

// Row in [from, rows) with the largest magnitude in col; lowest index wins ties
template <Tolerant T, typename SP>
size_t find_pivot_row(const Matrix<T, SP>& m, size_t col, size_t from) {
  size_t best = from;
  real_t<T> best_mag = ScalarTraits<T>::magnitude(m(from, col));
  for (size_t i = from + 1; i < m.rows(); ++i) {
    const real_t<T> mag = ScalarTraits<T>::magnitude(m(i, col));
    if (mag > best_mag) {
      best_mag = mag;
      best = i;
    }
  }
  return best;
}

template <Tolerant T, typename SP>
void normalize_pivot_row(Matrix<T, SP>& m, size_t row, size_t col) {
  const T pivot = m(row, col);
  for (size_t j = col + 1; j < m.cols(); ++j) {
    m(row, j) = m(row, j) / pivot;
  }
  m(row, col) = T{1};
}

template <Tolerant T, typename SP>
void eliminate_rows(Matrix<T, SP>& m, size_t row, size_t col,
                    bool reduced_form) {
  const T pivot = m(row, col);
  for (size_t i = 0; i < m.rows(); ++i) {
    if (i == row)
      continue;

    // Only eliminate below the pivot row when not in reduced form
    if (!reduced_form && i < row)
      continue;

    const T factor = m(i, col) / pivot;
    if (factor == T{0})
      continue;
    for (size_t j = col + 1; j < m.cols(); ++j) {
      m(i, j) = m(i, j) - factor * m(row, j);
    }
    m(i, col) = T{0};
  }
}

}  // namespace detail

// Gaussian elimination with partial pivoting, in place.
//
// Columns are scanned left to right (only the first column_limit of them
// are allowed to hold pivots, the rest are carried along by the row
// operations). A column whose best candidate has magnitude <= tolerance has
// no pivot: its remaining entries are zeroed and the pivot row stays put.
// With stop_at_missing_pivot the pass ends at the first such column.
template <Tolerant T, typename SP>
Elimination<T> eliminate(
    Matrix<T, SP>& m, EchelonForm form,
    real_t<T> tolerance = ScalarTraits<T>::tolerance(),
    size_t column_limit = std::numeric_limits<size_t>::max(),
    bool stop_at_missing_pivot = false) {
  Elimination<T> result;
  const bool reduced = form == EchelonForm::Reduced;
  const size_t pivot_cols = std::min(m.cols(), column_limit);

  size_t pivot_row = 0;
  for (size_t col = 0; col < pivot_cols && pivot_row < m.rows(); ++col) {
    const size_t best = detail::find_pivot_row(m, col, pivot_row);

    if (ScalarTraits<T>::magnitude(m(best, col)) <= tolerance) {
      for (size_t i = pivot_row; i < m.rows(); ++i) {
        m(i, col) = T{0};
      }
      if (stop_at_missing_pivot) {
        result.complete = false;
        break;
      }
      continue;
    }

    if (best != pivot_row) {
      m.swap_rows(best, pivot_row);
      ++result.swaps;
      result.sign = -result.sign;
    }

    result.pivot_product = result.pivot_product * m(pivot_row, col);
    if (reduced) {
      detail::normalize_pivot_row(m, pivot_row, col);
    }
    detail::eliminate_rows(m, pivot_row, col, reduced);

    result.pivot_columns.push_back(col);
    ++pivot_row;
  }

  return result;
}

template <Tolerant T, typename SP>
Matrix<T, SP> row_echelon(const Matrix<T, SP>& m,
                          real_t<T> tolerance = ScalarTraits<T>::tolerance()) {
  Matrix<T, SP> result = m;
  eliminate(result, EchelonForm::Echelon, tolerance);
  return result;
}

// Reduced row-echelon form of a copy
template <Tolerant T, typename SP>
Matrix<T, SP> rref(const Matrix<T, SP>& m,
                   real_t<T> tolerance = ScalarTraits<T>::tolerance()) {
  Matrix<T, SP> result = m;
  eliminate(result, EchelonForm::Reduced, tolerance);
  return result;
}

template <Tolerant T, typename SP>
Elimination<T> rref_in_place(
    Matrix<T, SP>& m, real_t<T> tolerance = ScalarTraits<T>::tolerance()) {
  return eliminate(m, EchelonForm::Reduced, tolerance);
}

template <Tolerant T, typename SP>
std::vector<size_t> pivot_columns(
    const Matrix<T, SP>& m,
    real_t<T> tolerance = ScalarTraits<T>::tolerance()) {
  Matrix<T, SP> work = m;
  return eliminate(work, EchelonForm::Echelon, tolerance).pivot_columns;
}

template <Tolerant T, typename SP>
size_t rank(const Matrix<T, SP>& m,
            real_t<T> tolerance = ScalarTraits<T>::tolerance()) {
  return pivot_columns(m, tolerance).size();
}

}  // namespace densela
#endif  // DENSELA_ROW_REDUCTION_HPP
