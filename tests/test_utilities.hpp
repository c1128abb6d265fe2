#ifndef DENSELA_TEST_UTILITIES_HPP
#define DENSELA_TEST_UTILITIES_HPP

#include <gtest/gtest.h>
#include "densela/densela.hpp"

using Matrix = densela::Matrix<double>;
using Vector = densela::Vector<double>;
const double tol = 1e-6;

// Helper function to compare two matrices element-wise
inline void assert_matrix_near(const Matrix& actual, const Matrix& expected,
                               double abs_error = tol) {
  ASSERT_EQ(actual.rows(), expected.rows());
  ASSERT_EQ(actual.cols(), expected.cols());

  for (size_t i = 0; i < actual.rows(); ++i) {
    for (size_t j = 0; j < actual.cols(); ++j) {
      EXPECT_NEAR(actual(i, j), expected(i, j), abs_error)
          << "Mismatch at position (" << i << ", " << j << ")";
    }
  }
}

inline void assert_vector_near(const Vector& actual, const Vector& expected,
                               double abs_error = tol) {
  ASSERT_EQ(actual.size(), expected.size());
  for (size_t i = 0; i < actual.size(); ++i) {
    EXPECT_NEAR(actual[i], expected[i], abs_error)
        << "Mismatch at index " << i;
  }
}

// ||A v - lambda v||
inline double eigen_residual(const Matrix& a, double lambda, const Vector& v) {
  return (a * v - v * lambda).norm();
}

// ||A - Q R||_F
inline double qr_residual(const Matrix& a, const Matrix& q, const Matrix& r) {
  return (a - q * r).frobenius_norm();
}

#endif  // DENSELA_TEST_UTILITIES_HPP
