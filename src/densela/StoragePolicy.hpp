#ifndef DENSELA_STORAGE_POLICY_HPP
#define DENSELA_STORAGE_POLICY_HPP

#include <memory>
#include <vector>
#include "matrix_error.hpp"
#include "types.hpp"

namespace densela {

// ==================== Storage Policies ====================
// Base storage interface. Storage is row-major with a row pitch (stride)
// that may exceed the logical column count.
template <Ring T>
class StorageInterface {
 public:
  virtual ~StorageInterface() = default;

  virtual T& get(size_t row, size_t col) = 0;
  virtual const T& get(size_t row, size_t col) const = 0;

  virtual size_t rows() const noexcept = 0;
  virtual size_t cols() const noexcept = 0;
  virtual size_t stride() const noexcept = 0;

  virtual T* data() noexcept = 0;
  virtual const T* data() const noexcept = 0;

  // Whether this storage owns its buffer
  virtual bool owning() const noexcept = 0;
};

// Standard in-memory storage (row-major), optionally padded
template <Ring T>
class InMemoryStorage : public StorageInterface<T> {
 private:
  std::vector<T> data_;
  size_t rows_;
  size_t cols_;
  size_t stride_;  // For potential padding

 public:
  InMemoryStorage(size_t rows, size_t cols, T init_val = T{},
                  size_t stride = 0)
      : rows_(rows), cols_(cols), stride_(stride ? stride : cols) {
    if (stride_ < cols_)
      DENSELA_THROW(bad_argument, "Stride must not be smaller than cols");
    data_.assign(rows_ * stride_, init_val);
  }

  // Take over an existing buffer
  InMemoryStorage(std::vector<T> buffer, size_t rows, size_t cols,
                  size_t stride = 0)
      : data_(std::move(buffer)),
        rows_(rows),
        cols_(cols),
        stride_(stride ? stride : cols) {
    if (stride_ < cols_)
      DENSELA_THROW(bad_argument, "Stride must not be smaller than cols");
    if (data_.size() < rows_ * stride_)
      DENSELA_THROW(bad_size, "Buffer is smaller than rows * stride");
  }

  T& get(size_t row, size_t col) override { return data_[row * stride_ + col]; }

  const T& get(size_t row, size_t col) const override {
    return data_[row * stride_ + col];
  }

  size_t rows() const noexcept override { return rows_; }
  size_t cols() const noexcept override { return cols_; }
  size_t stride() const noexcept override { return stride_; }

  T* data() noexcept override { return data_.data(); }
  const T* data() const noexcept override { return data_.data(); }

  bool owning() const noexcept override { return true; }
};

// Borrowed buffer; the caller keeps the memory alive
template <Ring T>
class ViewStorage : public StorageInterface<T> {
 private:
  T* data_;
  size_t rows_;
  size_t cols_;
  size_t stride_;

 public:
  ViewStorage(T* data, size_t rows, size_t cols, size_t stride)
      : data_(data), rows_(rows), cols_(cols), stride_(stride) {
    if (stride_ < cols_)
      DENSELA_THROW(bad_argument, "Stride must not be smaller than cols");
  }

  T& get(size_t row, size_t col) override { return data_[row * stride_ + col]; }

  const T& get(size_t row, size_t col) const override {
    return data_[row * stride_ + col];
  }

  size_t rows() const noexcept override { return rows_; }
  size_t cols() const noexcept override { return cols_; }
  size_t stride() const noexcept override { return stride_; }

  T* data() noexcept override { return data_; }
  const T* data() const noexcept override { return data_; }

  bool owning() const noexcept override { return false; }
};

}  // namespace densela
#endif  // DENSELA_STORAGE_POLICY_HPP
