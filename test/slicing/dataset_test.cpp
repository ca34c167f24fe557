#include <gtest/gtest.h>

#include <stdexcept>

#include "../../src/data_io/dataset.h"
#include "../../src/data_io/dataset_reader.h"
#include "../../src/data_io/dataset_writer.h"
#include "../../src/slicing/optimization_gate.h"
#include "../test_helpers.h"

using namespace chunkslice;

class DatasetTest : public ::testing::Test {
protected:
    void SetUp() override {
        spec_.shape = Coords{30, 40};
        spec_.chunk_shape = Coords{16, 16};
        spec_.block_shape = Coords{4, 8};
        spec_.dtype = DType::UINT32;
        array_ = make_counting_array(spec_.shape, 4);

        auto writer = DatasetWriter::create_new(file_.path(), spec_);
        ASSERT_TRUE(writer.has_value()) << writer.error();
        ASSERT_TRUE((*writer)->write_array(array_).has_value());
        ASSERT_TRUE((*writer)->flush().has_value());
    }

    ScopedTestFile file_;
    optimization::ScopedOptimization enabled_{true};
    DatasetSpec spec_;
    memory::byte_vector array_;
};

TEST_F(DatasetTest, ReadsSelectionsFromFile) {
    auto dataset = Dataset::open(file_.path());
    ASSERT_TRUE(dataset.has_value()) << dataset.error();
    EXPECT_EQ(dataset->strategy(), ReadStrategy::Optimized);
    EXPECT_EQ(dataset->descriptor(), spec_.descriptor());

    auto result = dataset->read(Selection{Slice::range(10, 20), Slice::range(5, 35)});
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ(result->shape, (Coords{10, 30}));
    EXPECT_EQ(result->dtype, DType::UINT32);
    EXPECT_EQ(result->element_size, 4u);
    EXPECT_EQ(result->num_elements(), 300);
    EXPECT_EQ(result->data, extract_region(array_, spec_.shape, Region(Coords{10, 5}, Coords{20, 35}), 4));
    EXPECT_EQ(result->as<uint32_t>()[0], 405u);

    ASSERT_NE(dataset->statistics(), nullptr);
    EXPECT_EQ(dataset->statistics()->optimized_reads.load(), 1u);
}

TEST_F(DatasetTest, IndexedRowAndStrides) {
    auto dataset = Dataset::open(file_.path());
    ASSERT_TRUE(dataset.has_value());

    auto row = dataset->read(Selection{Index{17}});
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->shape, Coords{40});
    EXPECT_EQ(row->as<uint32_t>()[39], 17u * 40u + 39u);

    auto strided = dataset->read(Selection{Slice::range(0, 30, 7), Index{-1}});
    ASSERT_TRUE(strided.has_value());
    EXPECT_EQ(strided->shape, Coords{5});
    const auto values = strided->as<uint32_t>();
    for (size_t i = 0; i < values.size(); ++i) {
        EXPECT_EQ(values[i], static_cast<uint32_t>(i * 7 * 40 + 39));
    }
    EXPECT_EQ(dataset->statistics()->fallback_reads.load(), 1u);
}

TEST_F(DatasetTest, ReadAllAndStrategySwitch) {
    auto dataset = Dataset::open(file_.path(), ReadStrategy::FilterPipeline);
    ASSERT_TRUE(dataset.has_value());
    EXPECT_EQ(dataset->statistics(), nullptr);

    auto all = dataset->read_all();
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all->data, array_);

    dataset->set_strategy(ReadStrategy::Optimized);
    EXPECT_EQ(dataset->strategy(), ReadStrategy::Optimized);
    all = dataset->read_all();
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all->data, array_);
    ASSERT_NE(dataset->statistics(), nullptr);
}

TEST_F(DatasetTest, ReadIntoCallerBuffer) {
    auto dataset = Dataset::open(file_.path());
    ASSERT_TRUE(dataset.has_value());

    const Selection selection{Slice::range(28, 30)};
    memory::byte_vector out(2 * 40 * 4);
    ASSERT_TRUE(dataset->read_into(selection, out).has_value());
    EXPECT_EQ(out, extract_region(array_, spec_.shape, Region(Coords{28, 0}, Coords{30, 40}), 4));

    memory::byte_vector small(10);
    const auto res = dataset->read_into(selection, small);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind(), ReadErrorKind::InvalidOutputBuffer);
}

TEST_F(DatasetTest, InvalidSelectionIsReported) {
    auto dataset = Dataset::open(file_.path());
    ASSERT_TRUE(dataset.has_value());
    const auto res = dataset->read(Selection{Index{30}});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind(), ReadErrorKind::InvalidSelection);
}

TEST_F(DatasetTest, OpenMissingFileFails) {
    const auto dataset = Dataset::open(generate_unique_test_filepath());
    EXPECT_FALSE(dataset.has_value());
}

TEST_F(DatasetTest, NullStoreThrows) {
    EXPECT_THROW((void)Dataset(nullptr), std::invalid_argument);
}
