#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "ratinggraph_preprocess/features/category_index.h"

namespace ratinggraph::features {
namespace {

TEST(CategoryIndexTest, OffsetsColumnsByStart) {
  const std::vector<std::string> values = {"writer", "doctor", "writer", "artist"};
  auto index = CategoryIndex<std::string>::FromValues(values, 2);
  EXPECT_EQ(index.Start(), 2);
  EXPECT_EQ(index.End(), 5);
  EXPECT_EQ(index.size(), 3);
  EXPECT_EQ(index.Column("writer"), 2);
  EXPECT_EQ(index.Column("doctor"), 3);
  EXPECT_EQ(index.Column("artist"), 4);
  EXPECT_FALSE(index.Column("lawyer").has_value());
}

TEST(CategoryIndexTest, ConsecutiveBlocksDoNotOverlap) {
  auto gender = CategoryIndex<std::string>::FromValues(std::vector<std::string>{"F", "M"});
  auto age = CategoryIndex<std::string>::FromValues(std::vector<std::string>{"1", "18", "25"},
                                                    gender.End());
  EXPECT_EQ(age.Column("1"), 2);
  EXPECT_EQ(age.End(), 5);
}

TEST(ScaleByMaxTest, DividesByMaximum) {
  auto out = ScaleByMax({10.0, 20.0, 40.0});
  EXPECT_EQ(out, (std::vector<float>{0.25f, 0.5f, 1.0f}));
}

TEST(ScaleByMaxTest, ZeroMaximumLeavesZeros) {
  EXPECT_EQ(ScaleByMax({0.0, 0.0}), (std::vector<float>{0.0f, 0.0f}));
  EXPECT_TRUE(ScaleByMax({}).empty());
}

}  // namespace
}  // namespace ratinggraph::features
