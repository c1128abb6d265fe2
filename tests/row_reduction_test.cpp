#include <gtest/gtest.h>
#include <algorithm>
#include <complex>
#include <limits>
#include <vector>
#include "test_utilities.hpp"

TEST(RowReductionTest, ReducedRowEchelonForm) {
  Matrix m({{1.0, 2.0, 3.0, 7.0}, {1.0, 1.0, 1.0, 2.0}, {2.0, 3.0, 3.0, 5.0}});

  Matrix r = densela::rref(m);
  assert_matrix_near(r, Matrix({{1.0, 0.0, 0.0, 1.0},
                                {0.0, 1.0, 0.0, -3.0},
                                {0.0, 0.0, 1.0, 4.0}}),
                     1e-12);

  // Input untouched
  EXPECT_DOUBLE_EQ(m(0, 3), 7.0);
}

TEST(RowReductionTest, RowEchelonKeepsPivotValues) {
  Matrix m({{1.0, 2.0}, {3.0, 4.0}});
  Matrix e = densela::row_echelon(m);

  // Largest pivot is moved up, entries below it are exact zeros
  EXPECT_DOUBLE_EQ(e(0, 0), 3.0);
  EXPECT_DOUBLE_EQ(e(0, 1), 4.0);
  EXPECT_EQ(e(1, 0), 0.0);
  EXPECT_NEAR(e(1, 1), 2.0 - 4.0 / 3.0, 1e-12);
}

TEST(RowReductionTest, EliminationBookkeeping) {
  Matrix m({{0.0, 1.0}, {1.0, 0.0}});
  auto result = densela::eliminate(m, densela::EchelonForm::Echelon);

  EXPECT_EQ(result.swaps, size_t(1));
  EXPECT_EQ(result.sign, -1);
  EXPECT_DOUBLE_EQ(result.pivot_product, 1.0);
  EXPECT_EQ(result.pivot_columns, (std::vector<size_t>{0, 1}));
  EXPECT_EQ(result.rank(), size_t(2));
  EXPECT_TRUE(result.complete);
  assert_matrix_near(m, Matrix::identity(2));
}

TEST(RowReductionTest, TiesPickTheFirstRow) {
  Matrix m({{2.0, 1.0}, {-2.0, 3.0}});
  auto result = densela::eliminate(m, densela::EchelonForm::Echelon);
  EXPECT_EQ(result.swaps, size_t(0));
  EXPECT_DOUBLE_EQ(m(1, 1), 4.0);
}

TEST(RowReductionTest, MissingPivotSkipsColumn) {
  Matrix m({{1.0, 2.0, 3.0}, {2.0, 4.0, 7.0}});
  EXPECT_EQ(densela::pivot_columns(m), (std::vector<size_t>{0, 2}));

  Matrix r = densela::rref(m);
  assert_matrix_near(r, Matrix({{1.0, 2.0, 0.0}, {0.0, 0.0, 1.0}}), 1e-12);
}

TEST(RowReductionTest, StopAtMissingPivot) {
  Matrix m({{1.0, 2.0}, {2.0, 4.0}});
  auto result =
      densela::eliminate(m, densela::EchelonForm::Echelon, 1e-12,
                         std::numeric_limits<size_t>::max(), true);
  EXPECT_FALSE(result.complete);
  EXPECT_EQ(result.rank(), size_t(1));
}

TEST(RowReductionTest, ColumnLimitRestrictsPivots) {
  // Gauss-Jordan on [A | I] with pivots only in A
  Matrix aug({{2.0, 1.0, 1.0, 0.0}, {1.0, 1.0, 0.0, 1.0}});
  auto result =
      densela::eliminate(aug, densela::EchelonForm::Reduced, 1e-12, 2);

  EXPECT_EQ(result.rank(), size_t(2));
  assert_matrix_near(aug.sub_matrix(0, 2, 2, 2),
                     Matrix({{1.0, -1.0}, {-1.0, 2.0}}), 1e-12);
}

TEST(RowReductionTest, InPlaceOnView) {
  Matrix big({{9.0, 9.0, 9.0}, {9.0, 0.0, 1.0}, {9.0, 1.0, 0.0}});
  Matrix block = big.view(1, 1, 2, 2);

  auto result = densela::rref_in_place(block);
  EXPECT_EQ(result.rank(), size_t(2));
  assert_matrix_near(big, Matrix({{9.0, 9.0, 9.0},
                                  {9.0, 1.0, 0.0},
                                  {9.0, 0.0, 1.0}}));
}

TEST(RowReductionTest, MatrixRank) {
  Matrix m1({{1.0, 0.0}, {0.0, 1.0}});
  EXPECT_EQ(densela::rank(m1), size_t(2));

  // Second row is a multiple of first
  Matrix m2({{1.0, 2.0}, {3.0, 6.0}});
  EXPECT_EQ(densela::rank(m2), size_t(1));

  Matrix m3 = Matrix::zeros(size_t(3), size_t(3));
  EXPECT_EQ(densela::rank(m3), size_t(0));

  Matrix m4({{1.0, 0.0, 2.0}, {0.0, 1.0, 3.0}, {2.0, 3.0, 13.0}});
  EXPECT_EQ(densela::rank(m4), size_t(2));

  EXPECT_EQ(densela::rank(Matrix::identity(5)), size_t(5));
  EXPECT_EQ(densela::rank(Matrix()), size_t(0));
}

TEST(RowReductionTest, RankOfRectangularMatrices) {
  Matrix wide({{1.0, 2.0, 3.0, 4.0}, {2.0, 4.0, 6.0, 8.0}});
  EXPECT_EQ(densela::rank(wide), size_t(1));

  Matrix tall({{1.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}, {2.0, 3.0}});
  EXPECT_EQ(densela::rank(tall), size_t(2));

  Matrix generated(size_t(4), size_t(6), [](size_t i, size_t j) {
    return static_cast<double>((i + 1) * (j + 2) % 7);
  });
  EXPECT_LE(densela::rank(generated),
            std::min(generated.rows(), generated.cols()));
}

TEST(RowReductionTest, ToleranceControlsRank) {
  Matrix m({{1.0, 1.0}, {1.0, 1.0 + 1e-10}});
  EXPECT_EQ(densela::rank(m), size_t(2));
  EXPECT_EQ(densela::rank(m, 1e-8), size_t(1));
}

TEST(RowReductionTest, ComplexRank) {
  using C = std::complex<double>;
  densela::Matrix<C> singular({{C(1.0, 0.0), C(0.0, 1.0)},
                               {C(0.0, 1.0), C(-1.0, 0.0)}});
  EXPECT_EQ(densela::rank(singular), size_t(1));

  densela::Matrix<C> regular({{C(1.0, 0.0), C(0.0, 1.0)},
                              {C(0.0, 1.0), C(1.0, 0.0)}});
  EXPECT_EQ(densela::rank(regular), size_t(2));
}
