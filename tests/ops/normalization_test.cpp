#include <gtest/gtest.h>

#include <vector>

#include "ratinggraph_preprocess/ops/normalization.h"

namespace ratinggraph::ops {
namespace {

SparseMatrix Dense(int64_t rows, int64_t cols, const std::vector<float>& values) {
  std::vector<Triplet> triplets;
  for (int64_t r = 0; r < rows; ++r) {
    for (int64_t c = 0; c < cols; ++c) {
      const float v = values[static_cast<size_t>(r * cols + c)];
      if (v != 0.0f) {
        triplets.emplace_back(r, c, v);
      }
    }
  }
  SparseMatrix m(rows, cols);
  m.setFromTriplets(triplets.begin(), triplets.end());
  return m;
}

TEST(NormalizeFeaturesTest, RowsSumToOne) {
  auto out = NormalizeFeatures(Dense(3, 2, {2, 2, 0, 0, 1, 3}));
  EXPECT_FLOAT_EQ(out.coeff(0, 0), 0.5f);
  EXPECT_FLOAT_EQ(out.coeff(0, 1), 0.5f);
  EXPECT_FLOAT_EQ(out.coeff(1, 0), 0.0f);
  EXPECT_FLOAT_EQ(out.coeff(1, 1), 0.0f);
  EXPECT_FLOAT_EQ(out.coeff(2, 0), 0.25f);
  EXPECT_FLOAT_EQ(out.coeff(2, 1), 0.75f);
  EXPECT_EQ(out.nonZeros(), 4);
}

TEST(NormalizeFeaturesTest, AllZeroMatrixThrows) {
  EXPECT_THROW(NormalizeFeatures(SparseMatrix(3, 4)), std::runtime_error);
}

TEST(NormalizeFeaturesTest, RowStochasticInputIsUnchanged) {
  // Row 1 is empty and stays empty.
  const auto input = Dense(4, 2, {0.25f, 0.75f, 0, 0, 1, 0, 0.5f, 0.5f});
  const auto out = NormalizeFeatures(input);
  ASSERT_EQ(out.rows(), input.rows());
  ASSERT_EQ(out.cols(), input.cols());
  EXPECT_EQ(out.nonZeros(), input.nonZeros());
  for (int64_t r = 0; r < input.rows(); ++r) {
    for (int64_t c = 0; c < input.cols(); ++c) {
      EXPECT_FLOAT_EQ(out.coeff(r, c), input.coeff(r, c)) << "at (" << r << ", " << c << ")";
    }
  }
}

TEST(GlobalNormalizationTest, SymmetricUsesBothDegrees) {
  auto out = GloballyNormalizeBipartiteAdjacency({Dense(2, 2, {1, 1, 1, 1})});
  ASSERT_EQ(out.size(), 1u);
  for (int r = 0; r < 2; ++r) {
    for (int c = 0; c < 2; ++c) {
      EXPECT_FLOAT_EQ(out[0].coeff(r, c), 0.5f);
    }
  }
}

TEST(GlobalNormalizationTest, DegreesComeFromTheSumOfAllClasses) {
  // Class 0 and class 1 each hold one edge per user; degrees are 2 on both sides.
  auto out = GloballyNormalizeBipartiteAdjacency(
      {Dense(2, 2, {1, 0, 0, 1}), Dense(2, 2, {0, 1, 1, 0})});
  ASSERT_EQ(out.size(), 2u);
  EXPECT_FLOAT_EQ(out[0].coeff(0, 0), 0.5f);
  EXPECT_FLOAT_EQ(out[0].coeff(0, 1), 0.0f);
  EXPECT_FLOAT_EQ(out[1].coeff(0, 1), 0.5f);
}

TEST(GlobalNormalizationTest, RowNormalizedSumIsRowStochastic) {
  auto out = GloballyNormalizeBipartiteAdjacency(
      {Dense(2, 3, {1, 1, 0, 0, 2, 0}), Dense(2, 3, {0, 0, 2, 0, 0, 2})}, false);
  SparseMatrix total = out[0] + out[1];
  for (int r = 0; r < 2; ++r) {
    float sum = 0.0f;
    for (int c = 0; c < 3; ++c) {
      sum += total.coeff(r, c);
    }
    EXPECT_FLOAT_EQ(sum, 1.0f);
  }
  EXPECT_FLOAT_EQ(out[0].coeff(0, 0), 0.25f);
  EXPECT_FLOAT_EQ(out[1].coeff(1, 2), 0.5f);
}

TEST(GlobalNormalizationTest, IsolatedNodesStayZero) {
  auto out = GloballyNormalizeBipartiteAdjacency({Dense(3, 2, {1, 0, 0, 0, 0, 1})});
  EXPECT_FLOAT_EQ(out[0].coeff(0, 0), 1.0f);
  EXPECT_FLOAT_EQ(out[0].coeff(1, 0), 0.0f);
  EXPECT_FLOAT_EQ(out[0].coeff(2, 1), 1.0f);
}

TEST(GlobalNormalizationTest, ShapeMismatchThrows) {
  EXPECT_THROW(GloballyNormalizeBipartiteAdjacency({SparseMatrix(2, 2), SparseMatrix(2, 3)}),
               std::invalid_argument);
  EXPECT_TRUE(GloballyNormalizeBipartiteAdjacency({}).empty());
}

TEST(StackUserItemFeaturesTest, PadsIntoSharedColumnSpace) {
  auto stacked = StackUserItemFeatures(Dense(3, 2, {1, 0, 0, 2, 3, 0}),
                                       Dense(4, 3, {0, 0, 4, 5, 0, 0, 0, 6, 0, 0, 0, 7}));
  EXPECT_EQ(stacked.user_features.rows(), 3);
  EXPECT_EQ(stacked.user_features.cols(), 5);
  EXPECT_EQ(stacked.item_features.rows(), 4);
  EXPECT_EQ(stacked.item_features.cols(), 5);

  EXPECT_FLOAT_EQ(stacked.user_features.coeff(1, 1), 2.0f);
  EXPECT_FLOAT_EQ(stacked.item_features.coeff(0, 4), 4.0f);
  EXPECT_FLOAT_EQ(stacked.item_features.coeff(1, 2), 5.0f);
  EXPECT_FLOAT_EQ(stacked.item_features.coeff(3, 4), 7.0f);
  EXPECT_EQ(stacked.user_features.nonZeros(), 3);
  EXPECT_EQ(stacked.item_features.nonZeros(), 4);
}

TEST(SparseTupleTest, RowMajorCoordinates) {
  auto tuple = SparseToTuple(Dense(2, 3, {0, 1, 0, 2, 0, 3}));
  EXPECT_EQ(tuple.shape, (std::pair<int64_t, int64_t>{2, 3}));
  ASSERT_EQ(tuple.coords.size(), 3u);
  EXPECT_EQ(tuple.coords[0], (std::pair<int64_t, int64_t>{0, 1}));
  EXPECT_EQ(tuple.coords[1], (std::pair<int64_t, int64_t>{1, 0}));
  EXPECT_EQ(tuple.coords[2], (std::pair<int64_t, int64_t>{1, 2}));
  EXPECT_EQ(tuple.values, (std::vector<float>{1, 2, 3}));

  auto back = TupleToSparse(tuple);
  EXPECT_FLOAT_EQ(back.coeff(1, 2), 3.0f);
  EXPECT_EQ(back.nonZeros(), 3);
}

TEST(SparseTupleTest, MalformedTuplesThrow) {
  SparseTuple tuple;
  tuple.shape = {2, 2};
  tuple.coords = {{0, 0}};
  EXPECT_THROW(TupleToSparse(tuple), std::invalid_argument);
  tuple.values = {1.0f};
  tuple.coords = {{2, 0}};
  EXPECT_THROW(TupleToSparse(tuple), std::out_of_range);
}

}  // namespace
}  // namespace ratinggraph::ops
