#include <gtest/gtest.h>
#include <limits>
#include <sstream>
#include <vector>
#include "test_utilities.hpp"

class LineViewTest : public ::testing::Test {
 protected:
  Matrix m{{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}, {7.0, 8.0, 9.0}};
};

TEST_F(LineViewTest, RowAndColumnViews) {
  auto row = m.row_view(1);
  EXPECT_EQ(row.kind(), densela::ViewKind::Row);
  EXPECT_EQ(row.index(), size_t(1));
  ASSERT_EQ(row.size(), size_t(3));
  EXPECT_DOUBLE_EQ(row[0], 4.0);
  EXPECT_DOUBLE_EQ(row[2], 6.0);

  auto col = m.col_view(2);
  EXPECT_EQ(col.kind(), densela::ViewKind::Column);
  EXPECT_EQ(col.to_vector().to_std_vector(),
            (std::vector<double>{3.0, 6.0, 9.0}));

  EXPECT_THROW(m.row_view(3), densela::bad_view);
  EXPECT_THROW(m.col_view(3), densela::bad_view);
}

TEST_F(LineViewTest, WritesReachTheOwner) {
  auto row = m.row_view(0);
  row[1] = 20.0;
  EXPECT_DOUBLE_EQ(m(0, 1), 20.0);

  m.col_view(0).fill(0.0);
  EXPECT_DOUBLE_EQ(m(2, 0), 0.0);

  m.diagonal_view().assign(Vector{-1.0, -2.0, -3.0});
  EXPECT_DOUBLE_EQ(m(1, 1), -2.0);
  EXPECT_DOUBLE_EQ(m(2, 2), -3.0);

  m.row_view(2).set(1, 80.0);
  EXPECT_DOUBLE_EQ(m(2, 1), 80.0);
  EXPECT_THROW(m.row_view(2).set(3, 0.0), densela::out_of_range);
  EXPECT_THROW(m.row_view(0).assign(Vector{1.0}), densela::incompatible_size);
}

TEST_F(LineViewTest, Diagonals) {
  auto diag = m.diagonal_view();
  EXPECT_EQ(diag.size(), size_t(3));
  EXPECT_DOUBLE_EQ(diag.sum(), 15.0);

  auto sub = m.sub_diagonal_view();
  EXPECT_EQ(sub.kind(), densela::ViewKind::SubDiagonal);
  EXPECT_EQ(sub.to_vector().to_std_vector(), (std::vector<double>{4.0, 8.0}));

  auto super = m.super_diagonal_view();
  EXPECT_EQ(super.kind(), densela::ViewKind::SuperDiagonal);
  EXPECT_EQ(super.to_vector().to_std_vector(), (std::vector<double>{2.0, 6.0}));
}

TEST_F(LineViewTest, DiagonalsOfRectangularAndEmpty) {
  Matrix wide({{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}});
  EXPECT_EQ(wide.diagonal_view().size(), size_t(2));
  EXPECT_EQ(wide.sub_diagonal_view().size(), size_t(1));
  EXPECT_DOUBLE_EQ(wide.sub_diagonal_view()[0], 4.0);

  Matrix empty;
  EXPECT_TRUE(empty.diagonal_view().empty());
  EXPECT_EQ(empty.sub_diagonal_view().size(), size_t(0));
  EXPECT_EQ(empty.super_diagonal_view().size(), size_t(0));
}

TEST_F(LineViewTest, SubRowAndSubColumn) {
  auto sub_row = m.sub_row_view(2, 1, 2);
  EXPECT_EQ(sub_row.kind(), densela::ViewKind::SubRow);
  EXPECT_EQ(sub_row.to_vector().to_std_vector(),
            (std::vector<double>{8.0, 9.0}));

  auto sub_col = m.sub_col_view(0, 1, 2);
  EXPECT_EQ(sub_col.kind(), densela::ViewKind::SubCol);
  sub_col[1] = 70.0;
  EXPECT_DOUBLE_EQ(m(2, 0), 70.0);

  EXPECT_THROW(m.sub_row_view(0, 2, 2), densela::bad_view);
  EXPECT_THROW(m.sub_col_view(3, 0, 1), densela::bad_view);

  const size_t huge = std::numeric_limits<size_t>::max();
  EXPECT_THROW(m.sub_row_view(0, 1, huge), densela::bad_view);
  EXPECT_THROW(m.sub_col_view(0, 2, huge), densela::bad_view);
  EXPECT_THROW(m.sub_row_view(0, 4, 0), densela::bad_view);
}

TEST_F(LineViewTest, ViewsOfSubMatrixViews) {
  Matrix block = m.view(1, 1, 2, 2);
  auto row = block.row_view(0);
  EXPECT_DOUBLE_EQ(row[0], 5.0);
  EXPECT_DOUBLE_EQ(row[1], 6.0);

  block.diagonal_view().fill(0.0);
  EXPECT_DOUBLE_EQ(m(1, 1), 0.0);
  EXPECT_DOUBLE_EQ(m(2, 2), 0.0);
  EXPECT_DOUBLE_EQ(m(0, 0), 1.0);
}

TEST_F(LineViewTest, ViewOutlivesHandle) {
  densela::LineView<double> row = [] {
    Matrix temporary({{1.0, 2.0}, {3.0, 4.0}});
    return temporary.row_view(1);
  }();
  EXPECT_DOUBLE_EQ(row[0], 3.0);
  EXPECT_DOUBLE_EQ(row[1], 4.0);
}

TEST_F(LineViewTest, RowAndColumnCopies) {
  Vector r = m.row_vector(0);
  r[0] = 100.0;
  EXPECT_DOUBLE_EQ(m(0, 0), 1.0);

  m.set_column(1, Vector{0.0, 0.0, 0.0});
  EXPECT_TRUE(m.column_vector(1) == Vector(size_t(3)));
  m.set_row(0, Vector{1.0, 1.0, 1.0});
  EXPECT_DOUBLE_EQ(m(0, 2), 1.0);

  std::ostringstream oss;
  oss << m.row_view(0);
  EXPECT_EQ(oss.str(), "[1, 1, 1]");
}

TEST(TransposeViewTest, SwapsAddressing) {
  Matrix a({{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}});
  auto t = densela::transpose(a);

  EXPECT_EQ(t.rows(), size_t(3));
  EXPECT_EQ(t.cols(), size_t(2));
  EXPECT_DOUBLE_EQ(t(0, 1), 4.0);
  EXPECT_DOUBLE_EQ(t(2, 0), 3.0);

  t(2, 1) = 60.0;
  EXPECT_DOUBLE_EQ(a(1, 2), 60.0);

  t.set(0, 0, 10.0);
  EXPECT_DOUBLE_EQ(a(0, 0), 10.0);
  EXPECT_THROW(t.at(3, 0), densela::row_outbound);
  EXPECT_THROW(t.at(0, 2), densela::col_outbound);
}

TEST(TransposeViewTest, DoubleTransposeIsIdentity) {
  Matrix a({{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}});
  Matrix& back = densela::transpose(densela::transpose(a));
  EXPECT_EQ(&back, &a);
}

TEST(TransposeViewTest, Materialize) {
  Matrix a({{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}});
  auto t = densela::transpose(a);
  Matrix owned = densela::materialize(t);

  EXPECT_EQ(owned.rows(), a.cols());
  EXPECT_EQ(owned.cols(), a.rows());
  EXPECT_FALSE(owned.shares_storage_with(a));
  assert_matrix_near(owned, Matrix({{1.0, 4.0}, {2.0, 5.0}, {3.0, 6.0}}));

  owned(0, 0) = -1.0;
  EXPECT_DOUBLE_EQ(a(0, 0), 1.0);
}

TEST(TransposeViewTest, RowOperationsForwardToColumns) {
  Matrix a({{1.0, 2.0}, {3.0, 4.0}});
  auto t = densela::transpose(a);

  // Swapping rows of the transpose swaps columns of a
  t.swap_rows(0, 1);
  assert_matrix_near(a, Matrix({{2.0, 1.0}, {4.0, 3.0}}));

  t.swap_columns(0, 1);
  assert_matrix_near(a, Matrix({{4.0, 3.0}, {2.0, 1.0}}));
}

TEST(TransposeViewTest, LineViewsOfTranspose) {
  Matrix a({{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}});
  auto t = densela::transpose(a);

  EXPECT_EQ(t.row_view(2).to_vector().to_std_vector(),
            (std::vector<double>{3.0, 6.0}));
  EXPECT_EQ(t.col_view(0).to_vector().to_std_vector(),
            (std::vector<double>{1.0, 2.0, 3.0}));
  EXPECT_DOUBLE_EQ(t.diagonal_view().sum(), 6.0);
}
