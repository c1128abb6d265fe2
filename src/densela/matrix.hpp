#ifndef DENSELA_MATRIX_HPP
#define DENSELA_MATRIX_HPP

#include <omp.h>
#include <algorithm>
#include <cassert>
#include <cmath>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <span>
#include <utility>
#include <vector>
#include "StoragePolicy.hpp"
#include "library_config.hpp"
#include "matrix_error.hpp"
#include "types.hpp"
#include "vector.hpp"
#include "views.hpp"

namespace densela {

enum class VectorType { RowVector, ColumnVector };

// ==================== Matrix Class ====================
template <Ring T, typename StoragePolicy = InMemoryStorage<T>>
class Matrix {
 private:
  std::shared_ptr<StorageInterface<T>> storage_;
  size_t view_row_start_ = 0;
  size_t view_col_start_ = 0;
  size_t view_rows_;
  size_t view_cols_;
  bool is_view_ = false;

  // Private constructor for views
  Matrix(std::shared_ptr<StorageInterface<T>> storage, size_t vr_start,
         size_t vc_start, size_t vr_size, size_t vc_size)
      : storage_(std::move(storage)),
        view_row_start_(vr_start),
        view_col_start_(vc_start),
        view_rows_(vr_size),
        view_cols_(vc_size),
        is_view_(true) {}

  // Runs kernel(i) for every row, spreading rows over OpenMP threads when
  // the work is large enough. Each row is handled by a single thread.
  template <typename Kernel>
  static void for_each_row(size_t rows, size_t work, Kernel&& kernel) {
    if constexpr (DENSELA_OPENMP_ENABLED) {
#pragma omp parallel for num_threads(ThreadCount) if (work >= PARALLEL_THRESHOLD)
      for (size_t i = 0; i < rows; ++i) {
        kernel(i);
      }
    } else {
      for (size_t i = 0; i < rows; ++i) {
        kernel(i);
      }
    }
  }

  void copy_elements_from(const Matrix& other) {
    if (view_rows_ != other.view_rows_ || view_cols_ != other.view_cols_)
      DENSELA_THROW(incompatible_size,
                    "Matrix dimensions mismatch for assignment");
    // Source may alias this view, copy through a compact temporary then
    const Matrix source = (storage_ == other.storage_) ? Matrix(other) : Matrix();
    const Matrix& src = (storage_ == other.storage_) ? source : other;
    for (size_t i = 0; i < view_rows_; ++i)
      for (size_t j = 0; j < view_cols_; ++j)
        operator()(i, j) = src(i, j);
  }

  LineView<T> make_line(size_t row0, size_t col0, size_t row_step,
                        size_t col_step, size_t length, ViewKind kind,
                        size_t index) const {
    return LineView<T>(storage_, view_row_start_ + row0,
                       view_col_start_ + col0, row_step, col_step, length,
                       kind, index);
  }

 public:
  using value_type = T;
  using real_type = real_t<T>;

  // ===== Constructors =====

  // Default constructor - empty matrix
  Matrix()
      : storage_(std::make_shared<StoragePolicy>(0, 0)),
        view_rows_(0),
        view_cols_(0) {}

  // Size constructor with optional initial value
  Matrix(size_t rows, size_t cols, T init_val = T{})
      : storage_(std::make_shared<StoragePolicy>(rows, cols, init_val)),
        view_rows_(rows),
        view_cols_(cols) {}

  // Generator constructor
  Matrix(size_t rows, size_t cols, std::function<T(size_t, size_t)> generator)
      : storage_(std::make_shared<StoragePolicy>(rows, cols)),
        view_rows_(rows),
        view_cols_(cols) {
    for (size_t i = 0; i < rows; ++i)
      for (size_t j = 0; j < cols; ++j)
        operator()(i, j) = generator(i, j);
  }

  // Initializer list constructor
  Matrix(std::initializer_list<std::initializer_list<T>> init) {
    view_rows_ = init.size();
    view_cols_ = view_rows_ ? init.begin()->size() : 0;
    for (const auto& row : init)
      if (row.size() != view_cols_)
        DENSELA_THROW(bad_size, "All rows must have the same length");
    storage_ = std::make_shared<StoragePolicy>(view_rows_, view_cols_);

    size_t i = 0;
    for (const auto& row : init) {
      size_t j = 0;
      for (const auto& val : row) {
        operator()(i, j) = val;
        ++j;
      }
      ++i;
    }
  }

  // Ingest a flat row-major buffer of exactly rows * cols elements
  Matrix(size_t rows, size_t cols, std::vector<T> data)
      : view_rows_(rows), view_cols_(cols) {
    if (data.size() != rows * cols)
      DENSELA_THROW(bad_size, "Data size does not match matrix dimensions");
    storage_ = std::make_shared<InMemoryStorage<T>>(std::move(data), rows,
                                                    cols, cols);
  }

  // Row or column vector
  Matrix(const Vector<T>& data, VectorType vectorType)
      : storage_(std::make_shared<StoragePolicy>(
            vectorType == VectorType::RowVector ? 1 : data.size(),
            vectorType == VectorType::RowVector ? data.size() : 1)),
        view_rows_(vectorType == VectorType::RowVector ? 1 : data.size()),
        view_cols_(vectorType == VectorType::RowVector ? data.size() : 1) {
    for (size_t i = 0; i < data.size(); ++i) {
      if (vectorType == VectorType::RowVector) {
        operator()(0, i) = data[i];
      } else {
        operator()(i, 0) = data[i];
      }
    }
  }

  // Owned storage with a row pitch larger than cols
  static Matrix with_stride(size_t rows, size_t cols, size_t stride,
                            T init_val = T{}) {
    Matrix result;
    result.storage_ =
        std::make_shared<InMemoryStorage<T>>(rows, cols, init_val, stride);
    result.view_rows_ = rows;
    result.view_cols_ = cols;
    return result;
  }

  // Take over a strided buffer; requires buffer.size() >= rows * stride
  static Matrix from_buffer(std::vector<T> buffer, size_t rows, size_t cols,
                            size_t stride = 0) {
    Matrix result;
    result.storage_ = std::make_shared<InMemoryStorage<T>>(std::move(buffer),
                                                           rows, cols, stride);
    result.view_rows_ = rows;
    result.view_cols_ = cols;
    return result;
  }

  // Create from raw data pointer without ownership transfer
  static Matrix from_data(T* data, size_t rows, size_t cols,
                          size_t stride = 0) {
    return Matrix(std::make_shared<ViewStorage<T>>(data, rows, cols,
                                                   stride ? stride : cols),
                  0, 0, rows, cols);
  }

  // Copy constructor (deep, compact)
  Matrix(const Matrix& other)
      : storage_(std::make_shared<StoragePolicy>(other.view_rows_,
                                                 other.view_cols_)),
        view_rows_(other.view_rows_),
        view_cols_(other.view_cols_) {
    for (size_t i = 0; i < view_rows_; ++i)
      for (size_t j = 0; j < view_cols_; ++j)
        operator()(i, j) = other(i, j);
  }

  // Move constructor
  Matrix(Matrix&& other) noexcept
      : storage_(std::move(other.storage_)),
        view_row_start_(other.view_row_start_),
        view_col_start_(other.view_col_start_),
        view_rows_(std::exchange(other.view_rows_, 0)),
        view_cols_(std::exchange(other.view_cols_, 0)),
        is_view_(other.is_view_) {}

  Matrix clone() const { return Matrix(*this); }

  // Views write through; owners rebind to a copy
  Matrix& operator=(const Matrix& other) {
    if (this == &other)
      return *this;
    if (is_view_) {
      copy_elements_from(other);
    } else {
      Matrix tmp(other);
      *this = std::move(tmp);
    }
    return *this;
  }

  Matrix& operator=(Matrix&& other) {
    if (this == &other)
      return *this;
    if (is_view_) {
      copy_elements_from(other);
    } else if (other.is_view_) {
      *this = Matrix(other);
    } else {
      storage_ = std::move(other.storage_);
      view_row_start_ = other.view_row_start_;
      view_col_start_ = other.view_col_start_;
      view_rows_ = other.view_rows_;
      view_cols_ = other.view_cols_;
      other.view_rows_ = 0;
      other.view_cols_ = 0;
    }
    return *this;
  }

  // ===== Conversion Functions =====

  // Convert to std::vector (flattened)
  std::vector<T> to_vector() const {
    std::vector<T> result;
    result.reserve(view_rows_ * view_cols_);
    for (size_t i = 0; i < view_rows_; ++i) {
      for (size_t j = 0; j < view_cols_; ++j) {
        result.push_back(operator()(i, j));
      }
    }
    return result;
  }

  // Convert to 2D vector
  std::vector<std::vector<T>> to_vector_2d() const {
    std::vector<std::vector<T>> result(view_rows_, std::vector<T>(view_cols_));
    for (size_t i = 0; i < view_rows_; ++i) {
      for (size_t j = 0; j < view_cols_; ++j) {
        result[i][j] = operator()(i, j);
      }
    }
    return result;
  }

  // ===== Size Information =====
  size_t rows() const { return view_rows_; }
  size_t cols() const { return view_cols_; }
  size_t stride() const noexcept { return storage_->stride(); }

  // ===== Utility Functions =====

  size_t size() const noexcept { return view_rows_ * view_cols_; }

  //Booleans
  bool empty() const noexcept { return view_rows_ == 0 || view_cols_ == 0; }
  // Check if matrix is square
  bool is_square() const { return view_rows_ == view_cols_; }
  bool is_view() const noexcept { return is_view_; }
  // Whether two handles address the same buffer
  bool shares_storage_with(const Matrix& other) const noexcept {
    return storage_ == other.storage_;
  }

  bool is_symmetric(real_type tol = ScalarTraits<T>::tolerance()) const
    requires Tolerant<T>
  {
    if (!is_square())
      return false;

    for (size_t i = 0; i < view_rows_; ++i)
      for (size_t j = i + 1; j < view_cols_; ++j)
        if (ScalarTraits<T>::magnitude(operator()(i, j) - operator()(j, i)) >
            tol)
          return false;

    return true;
  }

  bool is_zero(real_type tol = ScalarTraits<T>::tolerance()) const
    requires Tolerant<T>
  {
    for (size_t i = 0; i < rows(); i++) {
      for (size_t j = 0; j < cols(); j++) {
        if (ScalarTraits<T>::magnitude(operator()(i, j)) > tol) {
          return false;
        }
      }
    }
    return true;
  }

  bool is_upper_triangular(real_type tol = ScalarTraits<T>::tolerance()) const
    requires Tolerant<T>
  {
    for (size_t j = 0; j < view_cols_; ++j) {
      for (size_t i = j + 1; i < view_rows_; ++i) {
        if (ScalarTraits<T>::magnitude(operator()(i, j)) > tol)
          return false;
      }
    }
    return true;
  }

  // ===== Element Access =====

  T& operator()(size_t row, size_t col) {
    assert(row < view_rows_ && col < view_cols_ &&
           "Matrix index out of bounds");
    return storage_->get(view_row_start_ + row, view_col_start_ + col);
  }

  const T& operator()(size_t row, size_t col) const {
    assert(row < view_rows_ && col < view_cols_ &&
           "Matrix index out of bounds");
    return storage_->get(view_row_start_ + row, view_col_start_ + col);
  }

  void validateIndexes(size_t row, size_t col) const {
    if (row >= view_rows_)
      DENSELA_THROW(row_outbound, "Row index out of range");
    if (col >= view_cols_)
      DENSELA_THROW(col_outbound, "Column index out of range");
  }

  T& at(size_t row, size_t col) {
    validateIndexes(row, col);
    return operator()(row, col);
  }

  const T& at(size_t row, size_t col) const {
    validateIndexes(row, col);
    return operator()(row, col);
  }

  void set(size_t row, size_t col, const T& value) { at(row, col) = value; }

  // Access entire row as std::span
  std::span<T> row_span(size_t row) {
    if (row >= view_rows_)
      DENSELA_THROW(row_outbound, "Row index out of range");
    return std::span<T>(&storage_->get(view_row_start_ + row, view_col_start_),
                        view_cols_);
  }

  std::span<const T> row_span(size_t row) const {
    if (row >= view_rows_)
      DENSELA_THROW(row_outbound, "Row index out of range");
    return std::span<const T>(
        &storage_->get(view_row_start_ + row, view_col_start_), view_cols_);
  }

  // Copies of a row or column
  Vector<T> row_vector(size_t row) const { return row_view(row).to_vector(); }
  Vector<T> column_vector(size_t col) const {
    return col_view(col).to_vector();
  }

  void set_row(size_t row, const Vector<T>& values) {
    row_view(row).assign(values);
  }
  void set_column(size_t col, const Vector<T>& values) {
    col_view(col).assign(values);
  }

  // ===== Views =====

  // Create a view of a submatrix
  Matrix view(size_t row_start, size_t col_start, size_t rows,
              size_t cols) const {
    if (row_start > view_rows_ || rows > view_rows_ - row_start ||
        col_start > view_cols_ || cols > view_cols_ - col_start)
      DENSELA_THROW(bad_view, "View exceeds matrix dimensions");

    return Matrix(storage_, view_row_start_ + row_start,
                  view_col_start_ + col_start, rows, cols);
  }

  LineView<T> row_view(size_t row) const {
    if (row >= view_rows_)
      DENSELA_THROW(bad_view, "Row view index out of range");
    return make_line(row, 0, 0, 1, view_cols_, ViewKind::Row, row);
  }

  LineView<T> col_view(size_t col) const {
    if (col >= view_cols_)
      DENSELA_THROW(bad_view, "Column view index out of range");
    return make_line(0, col, 1, 0, view_rows_, ViewKind::Column, col);
  }

  LineView<T> diagonal_view() const {
    return make_line(0, 0, 1, 1, std::min(view_rows_, view_cols_),
                     ViewKind::Diagonal, 0);
  }

  LineView<T> sub_diagonal_view() const {
    const size_t n = std::min(view_rows_, view_cols_);
    return make_line(n ? 1 : 0, 0, 1, 1, n ? n - 1 : 0, ViewKind::SubDiagonal,
                     0);
  }

  LineView<T> super_diagonal_view() const {
    const size_t n = std::min(view_rows_, view_cols_);
    return make_line(0, n ? 1 : 0, 1, 1, n ? n - 1 : 0,
                     ViewKind::SuperDiagonal, 0);
  }

  LineView<T> sub_row_view(size_t row, size_t start, size_t length) const {
    if (row >= view_rows_ || start > view_cols_ ||
        length > view_cols_ - start)
      DENSELA_THROW(bad_view, "Row range exceeds matrix dimensions");
    return make_line(row, start, 0, 1, length, ViewKind::SubRow, row);
  }

  LineView<T> sub_col_view(size_t col, size_t start, size_t length) const {
    if (col >= view_cols_ || start > view_rows_ ||
        length > view_rows_ - start)
      DENSELA_THROW(bad_view, "Column range exceeds matrix dimensions");
    return make_line(start, col, 1, 0, length, ViewKind::SubCol, col);
  }

  //return a copy of the selected submatrix of existing matrix
  Matrix sub_matrix(size_t row_start, size_t col_start, size_t rows,
                    size_t cols) const {
    return view(row_start, col_start, rows, cols).clone();
  }

  void set_block(size_t row_start, size_t col_start, const Matrix& block) {
    auto target = view(row_start, col_start, block.rows(), block.cols());
    target = block;  // Copies data into the target view
  }

  Matrix minor_matrix(const size_t row, const size_t column) const {
    validateIndexes(row, column);

    Matrix result(view_rows_ - 1, view_cols_ - 1);

    for (size_t i = 0, r = 0; i < view_rows_; ++i) {
      if (i == row)
        continue;

      for (size_t j = 0, c = 0; j < view_cols_; ++j) {
        if (j == column)
          continue;

        result(r, c) = operator()(i, j);
        ++c;
      }
      ++r;
    }

    return result;
  }

  // [this | other]
  Matrix augmented(const Matrix& other) const {
    if (other.rows() != view_rows_)
      DENSELA_THROW(incompatible_size,
                    "Augmenting block must have the same row count");

    Matrix result(view_rows_, view_cols_ + other.cols());
    for (size_t i = 0; i < view_rows_; ++i) {
      for (size_t j = 0; j < view_cols_; ++j) {
        result(i, j) = operator()(i, j);
      }
      for (size_t j = 0; j < other.cols(); ++j) {
        result(i, view_cols_ + j) = other(i, j);
      }
    }
    return result;
  }

  // ===== Row / Column Exchange =====

  Matrix& swap_rows(size_t r1, size_t r2) {
    if (std::max(r1, r2) >= view_rows_)
      DENSELA_THROW(row_outbound, "Row index out of bounds");
    if (r1 == r2)
      return *this;

    auto first = row_span(r1);
    auto second = row_span(r2);
    std::swap_ranges(first.begin(), first.end(), second.begin());
    return *this;
  }

  Matrix& swap_columns(size_t c1, size_t c2) {
    if (std::max(c1, c2) >= view_cols_)
      DENSELA_THROW(col_outbound, "Column index out of bounds");
    if (c1 == c2)
      return *this;

    for (size_t row = 0; row < view_rows_; row++) {
      std::swap(operator()(row, c1), operator()(row, c2));
    }
    return *this;
  }

  // ===== Basic Matrix Operations =====

  // Physically transposed copy
  Matrix transposed() const {
    Matrix result(view_cols_, view_rows_);
    for_each_row(view_rows_, size(), [&](size_t i) {
      for (size_t j = 0; j < view_cols_; ++j) {
        result(j, i) = operator()(i, j);
      }
    });
    return result;
  }

  Matrix operator+(const Matrix& rhs) const {
    if (view_rows_ != rhs.view_rows_ || view_cols_ != rhs.view_cols_)
      DENSELA_THROW(incompatible_size, "Matrix dimensions mismatch");

    Matrix result(view_rows_, view_cols_);
    for_each_row(view_rows_, size(), [&](size_t i) {
      for (size_t j = 0; j < view_cols_; ++j) {
        result(i, j) = operator()(i, j) + rhs(i, j);
      }
    });
    return result;
  }

  Matrix operator-(const Matrix& rhs) const {
    if (view_rows_ != rhs.view_rows_ || view_cols_ != rhs.view_cols_)
      DENSELA_THROW(incompatible_size, "Matrix dimensions mismatch");

    Matrix result(view_rows_, view_cols_);
    for_each_row(view_rows_, size(), [&](size_t i) {
      for (size_t j = 0; j < view_cols_; ++j) {
        result(i, j) = operator()(i, j) - rhs(i, j);
      }
    });
    return result;
  }

  Matrix operator*(const Matrix& rhs) const {
    if (view_cols_ != rhs.view_rows_) {
      DENSELA_THROW(incompatible_size,
                    "Matrix dimensions incompatible for multiplication");
    }

    Matrix result(view_rows_, rhs.view_cols_, T{0});
    for_each_row(view_rows_, view_rows_ * view_cols_ * rhs.view_cols_,
                 [&](size_t i) {
                   for (size_t k = 0; k < view_cols_; ++k) {
                     const T a = operator()(i, k);
                     for (size_t j = 0; j < rhs.view_cols_; ++j) {
                       result(i, j) = result(i, j) + a * rhs(k, j);
                     }
                   }
                 });
    return result;
  }

  Vector<T> operator*(const Vector<T>& v) const {
    if (view_cols_ != v.size())
      DENSELA_THROW(incompatible_size,
                    "Vector length incompatible for multiplication");

    Vector<T> result(view_rows_);
    for (size_t i = 0; i < view_rows_; ++i) {
      T sum = T{0};
      for (size_t j = 0; j < view_cols_; ++j)
        sum = sum + operator()(i, j) * v[j];
      result[i] = sum;
    }
    return result;
  }

  Matrix operator*(const T& scalar) const {
    Matrix result(view_rows_, view_cols_);
    for_each_row(view_rows_, size(), [&](size_t i) {
      for (size_t j = 0; j < view_cols_; ++j) {
        result(i, j) = operator()(i, j) * scalar;
      }
    });
    return result;
  }

  Matrix operator-() const {
    return map([](T x) { return -x; });
  }

  Matrix& operator+=(const Matrix& rhs) {
    if (view_rows_ != rhs.view_rows_ || view_cols_ != rhs.view_cols_)
      DENSELA_THROW(incompatible_size, "Matrix dimensions mismatch");
    for (size_t i = 0; i < view_rows_; ++i)
      for (size_t j = 0; j < view_cols_; ++j)
        operator()(i, j) = operator()(i, j) + rhs(i, j);
    return *this;
  }

  Matrix& operator-=(const Matrix& rhs) {
    if (view_rows_ != rhs.view_rows_ || view_cols_ != rhs.view_cols_)
      DENSELA_THROW(incompatible_size, "Matrix dimensions mismatch");
    for (size_t i = 0; i < view_rows_; ++i)
      for (size_t j = 0; j < view_cols_; ++j)
        operator()(i, j) = operator()(i, j) - rhs(i, j);
    return *this;
  }

  Matrix& operator*=(const T& scalar) {
    return apply([&](T x) { return x * scalar; });
  }

  // The one in-place element-wise primitive; map() applies it to a copy
  // Serial, so exceptions thrown by func reach the caller
  Matrix& apply(std::function<T(T)> func) {
    for (size_t i = 0; i < view_rows_; ++i)
      for (size_t j = 0; j < view_cols_; ++j)
        operator()(i, j) = func(operator()(i, j));
    return *this;
  }

  Matrix map(std::function<T(T)> func) const { return clone().apply(func); }

  void fill(const T& value) {
    apply([&](T) { return value; });
  }

  bool operator==(const Matrix& other) const {
    if (view_rows_ != other.view_rows_ || view_cols_ != other.view_cols_)
      return false;
    for (size_t i = 0; i < view_rows_; ++i)
      for (size_t j = 0; j < view_cols_; ++j)
        if (!(operator()(i, j) == other(i, j)))
          return false;
    return true;
  }

  bool is_approx(const Matrix& other,
                 real_type tol = ScalarTraits<T>::tolerance()) const
    requires Tolerant<T>
  {
    if (view_rows_ != other.view_rows_ || view_cols_ != other.view_cols_)
      return false;
    for (size_t i = 0; i < view_rows_; ++i)
      for (size_t j = 0; j < view_cols_; ++j)
        if (ScalarTraits<T>::magnitude(operator()(i, j) - other(i, j)) > tol)
          return false;
    return true;
  }

  // Trace (sum of diagonal elements)
  T trace() const {
    if (!is_square())
      DENSELA_THROW(not_square, "Trace requires square matrix");
    return diagonal_view().sum();
  }

  real_type frobenius_norm() const
    requires Tolerant<T>
  {
    real_type sum_squares{0};
    for (size_t i = 0; i < rows(); ++i) {
      for (size_t j = 0; j < cols(); ++j) {
        const real_type m = ScalarTraits<T>::magnitude(operator()(i, j));
        sum_squares += m * m;
      }
    }
    return std::sqrt(sum_squares);
  }

  // Alias for frobenius_norm for compatibility
  real_type norm() const
    requires Tolerant<T>
  {
    return frobenius_norm();
  }

  // ===== Factories =====

  static Matrix zeros(size_t rows, size_t cols) {
    return Matrix(rows, cols, T{0});
  }

  static Matrix identity(size_t n) {
    Matrix result(n, n, T{0});
    result.diagonal_view().fill(T{1});
    return result;
  }

  static Matrix from_diagonal(const Vector<T>& values) {
    Matrix result(values.size(), values.size(), T{0});
    result.diagonal_view().assign(values);
    return result;
  }

  //end of class
};

// ==================== Free Functions ====================

// Output stream operator for matrices
template <Ring T, typename StoragePolicy>
std::ostream& operator<<(std::ostream& os, const Matrix<T, StoragePolicy>& m) {
  os << "[";
  for (size_t i = 0; i < m.rows(); ++i) {
    os << (i == 0 ? "[" : " [");
    for (size_t j = 0; j < m.cols(); ++j) {
      os << m(i, j);
      if (j + 1 < m.cols())
        os << ", ";
    }
    os << "]";
    if (i + 1 < m.rows())
      os << ",\n";
  }
  os << "]";
  return os;
}

// Scalar multiplication (scalar on left side)
template <Ring T, typename StoragePolicy>
Matrix<T, StoragePolicy> operator*(const T& scalar,
                                   const Matrix<T, StoragePolicy>& m) {
  return m * scalar;
}

}  // namespace densela
#endif  // DENSELA_MATRIX_HPP
