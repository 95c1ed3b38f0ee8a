#include "ringframe/sample_array.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace ringframe {
namespace {

class SampleArrayTest : public ::testing::Test {
protected:
    /// 4 rows x 2 columns: row r holds {10r, 10r + 1}.
    static SampleArray<float> make_stereo() {
        return SampleArray<float>(std::vector<float>{0, 1, 10, 11, 20, 21, 30, 31}, 2);
    }
};

TEST_F(SampleArrayTest, ShapeConstructorZeroFills) {
    SampleArray<float> array{3, 2};
    EXPECT_EQ(array.shape(), (Shape{3, 2}));
    for (const float v : array.values()) {
        EXPECT_FLOAT_EQ(v, 0.0f);
    }
}

TEST_F(SampleArrayTest, RejectsZeroColumns) {
    EXPECT_THROW((SampleArray<float>{3, 0}), std::invalid_argument);
}

TEST_F(SampleArrayTest, RejectsRaggedInterleavedValues) {
    EXPECT_THROW((SampleArray<float>(std::vector<float>{1, 2, 3}, 2)), std::invalid_argument);
}

TEST_F(SampleArrayTest, RowAccessIsRowMajor) {
    const auto array = make_stereo();
    EXPECT_EQ(array.rows(), 4);
    EXPECT_FLOAT_EQ(array(2, 1), 21.0f);
    EXPECT_FLOAT_EQ(array.row(3)[0], 30.0f);
}

TEST_F(SampleArrayTest, GatherWrappedRowsKeepsOrder) {
    const auto array = make_stereo();
    const auto out = array.gather(map_indices(3, 3, 4));
    EXPECT_EQ(out, SampleArray<float>(std::vector<float>{30, 31, 0, 1, 10, 11}, 2));
}

TEST_F(SampleArrayTest, ScatterWritesIntoWrappedRows) {
    SampleArray<float> array{4, 1};
    const SampleArray<float> source(std::vector<float>{7, 8, 9}, 1);

    array.scatter(map_indices(2, 3, 4), source);

    EXPECT_EQ(array, SampleArray<float>(std::vector<float>{9, 0, 7, 8}, 1));
}

TEST_F(SampleArrayTest, ScatterFromOffsetRow) {
    SampleArray<float> array{2, 1};
    const SampleArray<float> source(std::vector<float>{1, 2, 3, 4}, 1);

    array.scatter(IndexSet::contiguous(0, 2), source, 2);

    EXPECT_EQ(array, SampleArray<float>(std::vector<float>{3, 4}, 1));
}

TEST_F(SampleArrayTest, ScatterRejectsColumnMismatch) {
    SampleArray<float> array{4, 1};
    EXPECT_THROW(array.scatter(IndexSet::contiguous(0, 4), make_stereo()), std::invalid_argument);
}

TEST_F(SampleArrayTest, FillRowsZeroesOnlyNamedRows) {
    auto array = make_stereo();
    array.fill_rows(map_indices(3, 2, 4));
    EXPECT_EQ(array, SampleArray<float>(std::vector<float>{0, 0, 10, 11, 20, 21, 0, 0}, 2));
}

TEST_F(SampleArrayTest, AstypeCastsEverySample) {
    const SampleArray<float> array(std::vector<float>{1.75f, -2.5f}, 1);
    const auto converted = array.astype<std::int16_t>();
    EXPECT_EQ(converted, SampleArray<std::int16_t>(std::vector<std::int16_t>{1, -2}, 1));
}

TEST_F(SampleArrayTest, VstackConcatenatesRows) {
    const SampleArray<int> top(std::vector<int>{1, 2}, 1);
    const SampleArray<int> bottom(std::vector<int>{3}, 1);
    EXPECT_EQ(SampleArray<int>::vstack(top, bottom), SampleArray<int>(std::vector<int>{1, 2, 3}, 1));
}

TEST_F(SampleArrayTest, VstackRejectsColumnMismatch) {
    EXPECT_THROW((void)SampleArray<float>::vstack(make_stereo(), SampleArray<float>{1, 1}),
                 std::invalid_argument);
}

}  // namespace
}  // namespace ringframe
