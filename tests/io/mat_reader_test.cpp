#include <gtest/gtest.h>

#include "ratinggraph_preprocess/io/mat_reader.h"
#include "fixtures/mat_file_writer.h"
#include "test_utils.h"

namespace ratinggraph::io {
namespace {

using ratinggraph::testing::MatFileWriter;
using ratinggraph::testing::TempDir;
using ratinggraph::testing::WriteFile;

TEST(MatReaderTest, ReadsDenseFieldInMatlabOrientation) {
  TempDir dir;
  const auto path = dir.File("dense.mat");
  {
    MatFileWriter writer(path);
    ASSERT_TRUE(writer.ok());
    // [[1, 0, 2],
    //  [0, 3, 0]]
    writer.WriteDense("M", 2, 3, {1, 0, 0, 3, 2, 0});
  }

  MatReader reader(path);
  EXPECT_TRUE(reader.HasField("M"));
  EXPECT_FALSE(reader.HasField("Otest"));
  auto m = reader.ReadField("M");
  EXPECT_EQ(m.rows(), 2);
  EXPECT_EQ(m.cols(), 3);
  EXPECT_EQ(m.nonZeros(), 3);
  EXPECT_FLOAT_EQ(m.coeff(0, 0), 1.0f);
  EXPECT_FLOAT_EQ(m.coeff(0, 2), 2.0f);
  EXPECT_FLOAT_EQ(m.coeff(1, 1), 3.0f);
}

TEST(MatReaderTest, ReadsSparseFieldWithTrailingEmptyRows) {
  TempDir dir;
  const auto path = dir.File("sparse.mat");
  {
    MatFileWriter writer(path);
    ASSERT_TRUE(writer.ok());
    // 4 x 3 with entries (0,0)=5, (2,0)=1, (1,2)=4; row 3 is empty.
    writer.WriteSparse("Otraining", 4, {0, 2, 2, 3}, {0, 2, 1}, {5, 1, 4});
  }

  auto m = MatReader(path).ReadField("Otraining");
  EXPECT_EQ(m.rows(), 4);
  EXPECT_EQ(m.cols(), 3);
  EXPECT_EQ(m.nonZeros(), 3);
  EXPECT_FLOAT_EQ(m.coeff(0, 0), 5.0f);
  EXPECT_FLOAT_EQ(m.coeff(2, 0), 1.0f);
  EXPECT_FLOAT_EQ(m.coeff(1, 2), 4.0f);
}

TEST(MatReaderTest, RejectsMissingFilesAndFields) {
  TempDir dir;
  EXPECT_THROW(MatReader(dir.File("none.mat")), std::runtime_error);

  const auto text_path = dir.File("legacy.mat");
  WriteFile(text_path, "MATLAB 5.0 MAT-file");
  EXPECT_THROW(MatReader{text_path}, std::runtime_error);

  const auto path = dir.File("empty.mat");
  { MatFileWriter writer(path); }
  MatReader reader(path);
  EXPECT_THROW(reader.ReadField("M"), std::runtime_error);
}

}  // namespace
}  // namespace ratinggraph::io
