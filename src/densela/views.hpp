#ifndef DENSELA_VIEWS_HPP
#define DENSELA_VIEWS_HPP

#include <cassert>
#include <iostream>
#include <memory>
#include "StoragePolicy.hpp"
#include "matrix_error.hpp"
#include "types.hpp"
#include "vector.hpp"

namespace densela {

enum class ViewKind {
  Row,
  Column,
  Diagonal,
  SubDiagonal,    // (i+1, i)
  SuperDiagonal,  // (i, i+1)
  SubRow,         // contiguous range of one row
  SubCol          // contiguous range of one column
};

// ==================== Line View ====================
// One-dimensional window into a matrix buffer: a starting cell, a step in
// (row, col) and a length. Reads and writes go straight to the owner's
// storage. Only Matrix creates these, after validating the request.
template <Ring T>
class LineView {
 private:
  std::shared_ptr<StorageInterface<T>> storage_;
  size_t row0_;
  size_t col0_;
  size_t row_step_;
  size_t col_step_;
  size_t length_;
  ViewKind kind_;
  size_t index_;

  LineView(std::shared_ptr<StorageInterface<T>> storage, size_t row0,
           size_t col0, size_t row_step, size_t col_step, size_t length,
           ViewKind kind, size_t index)
      : storage_(std::move(storage)),
        row0_(row0),
        col0_(col0),
        row_step_(row_step),
        col_step_(col_step),
        length_(length),
        kind_(kind),
        index_(index) {}

  template <Ring U, typename SP>
  friend class Matrix;

 public:
  using value_type = T;

  ViewKind kind() const noexcept { return kind_; }
  // Row or column index for row/column views, 0 for diagonals
  size_t index() const noexcept { return index_; }
  size_t size() const noexcept { return length_; }
  bool empty() const noexcept { return length_ == 0; }

  T& operator[](size_t k) {
    assert(k < length_ && "View index out of bounds");
    return storage_->get(row0_ + k * row_step_, col0_ + k * col_step_);
  }

  const T& operator[](size_t k) const {
    assert(k < length_ && "View index out of bounds");
    return storage_->get(row0_ + k * row_step_, col0_ + k * col_step_);
  }

  T& at(size_t k) {
    if (k >= length_)
      DENSELA_THROW(out_of_range, "View index out of range");
    return operator[](k);
  }

  const T& at(size_t k) const {
    if (k >= length_)
      DENSELA_THROW(out_of_range, "View index out of range");
    return operator[](k);
  }

  void set(size_t k, const T& value) { at(k) = value; }

  void fill(const T& value) {
    for (size_t k = 0; k < length_; ++k)
      operator[](k) = value;
  }

  // Write the values of v into the viewed cells
  void assign(const Vector<T>& v) {
    if (v.size() != length_)
      DENSELA_THROW(incompatible_size, "Vector length does not match view");
    for (size_t k = 0; k < length_; ++k)
      operator[](k) = v[k];
  }

  Vector<T> to_vector() const {
    Vector<T> result(length_);
    for (size_t k = 0; k < length_; ++k)
      result[k] = operator[](k);
    return result;
  }

  T sum() const {
    T total = T{0};
    for (size_t k = 0; k < length_; ++k)
      total = total + operator[](k);
    return total;
  }
};

template <Ring T>
std::ostream& operator<<(std::ostream& os, const LineView<T>& view) {
  os << "[";
  for (size_t k = 0; k < view.size(); ++k) {
    os << view[k];
    if (k + 1 < view.size())
      os << ", ";
  }
  os << "]";
  return os;
}

}  // namespace densela
#endif  // DENSELA_VIEWS_HPP
