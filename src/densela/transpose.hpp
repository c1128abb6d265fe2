#ifndef DENSELA_TRANSPOSE_HPP
#define DENSELA_TRANSPOSE_HPP

#include "matrix.hpp"

namespace densela {

// ==================== Transpose View ====================
// Re-indexes an existing matrix with rows and columns swapped. Holds a plain
// reference: the matrix must outlive the view.
template <Ring T, typename StoragePolicy = InMemoryStorage<T>>
class TransposeView {
 public:
  using MatrixType = Matrix<T, StoragePolicy>;
  using value_type = T;

  explicit TransposeView(MatrixType& matrix) noexcept : matrix_(matrix) {}

  size_t rows() const { return matrix_.cols(); }
  size_t cols() const { return matrix_.rows(); }
  size_t size() const { return matrix_.size(); }
  bool is_square() const { return matrix_.is_square(); }

  T& operator()(size_t row, size_t col) { return matrix_(col, row); }
  const T& operator()(size_t row, size_t col) const {
    return matrix_(col, row);
  }

  T& at(size_t row, size_t col) {
    if (row >= rows())
      DENSELA_THROW(row_outbound, "Row index out of range");
    if (col >= cols())
      DENSELA_THROW(col_outbound, "Column index out of range");
    return matrix_(col, row);
  }

  const T& at(size_t row, size_t col) const {
    if (row >= rows())
      DENSELA_THROW(row_outbound, "Row index out of range");
    if (col >= cols())
      DENSELA_THROW(col_outbound, "Column index out of range");
    return matrix_(col, row);
  }

  void set(size_t row, size_t col, const T& value) { at(row, col) = value; }

  // Rows of the transpose are columns of the underlying matrix
  LineView<T> row_view(size_t row) const { return matrix_.col_view(row); }
  LineView<T> col_view(size_t col) const { return matrix_.row_view(col); }
  LineView<T> diagonal_view() const { return matrix_.diagonal_view(); }

  TransposeView& swap_rows(size_t r1, size_t r2) {
    matrix_.swap_columns(r1, r2);
    return *this;
  }

  TransposeView& swap_columns(size_t c1, size_t c2) {
    matrix_.swap_rows(c1, c2);
    return *this;
  }

  MatrixType& underlying() noexcept { return matrix_; }
  const MatrixType& underlying() const noexcept { return matrix_; }

  // Owned, physically transposed copy
  MatrixType materialize() const { return matrix_.transposed(); }

 private:
  MatrixType& matrix_;
};

template <Ring T, typename StoragePolicy>
TransposeView<T, StoragePolicy> transpose(Matrix<T, StoragePolicy>& matrix) {
  return TransposeView<T, StoragePolicy>(matrix);
}

// Transposing a transpose hands back the underlying matrix itself
template <Ring T, typename StoragePolicy>
Matrix<T, StoragePolicy>& transpose(TransposeView<T, StoragePolicy> view) {
  return view.underlying();
}

template <Ring T, typename StoragePolicy>
Matrix<T, StoragePolicy> materialize(const TransposeView<T, StoragePolicy>& view) {
  return view.materialize();
}

}  // namespace densela
#endif  // DENSELA_TRANSPOSE_HPP
