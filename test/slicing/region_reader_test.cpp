#include <gtest/gtest.h>

#include <atomic>
#include <cstdlib>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "../../src/data_io/dataset_reader.h"
#include "../../src/data_io/dataset_writer.h"
#include "../../src/geometry/grid.h"
#include "../../src/slicing/optimization_gate.h"
#include "../../src/slicing/region_reader.h"
#include "../test_helpers.h"

using namespace chunkslice;

namespace {

std::shared_ptr<DatasetReader> open_dataset(const DatasetSpec& spec, std::span<const std::byte> array) {
    auto backend = write_in_memory_dataset(spec, array);
    if (!backend) {
        return nullptr;
    }
    auto reader = DatasetReader::open_in_memory(std::move(backend));
    EXPECT_TRUE(reader.has_value()) << (reader ? "" : reader.error());
    return reader ? std::shared_ptr<DatasetReader>(std::move(*reader)) : nullptr;
}

// Reference hyperslab extraction, one element at a time.
memory::byte_vector extract_strided(std::span<const std::byte> array, const Coords& shape, const SliceRequest& request,
                                    const size_t element_size) {
    const auto out_shape = request.output_shape();
    memory::byte_vector out;
    for (const auto& index : geometry::GridRange(Coords(out_shape.size()), out_shape)) {
        Coords source(index.size());
        for (size_t i = 0; i < index.size(); ++i) {
            source[i] = request.region.start[i] + index[i] * request.step[i];
        }
        const auto offset = static_cast<size_t>(geometry::linear_index(source, shape)) * element_size;
        out.insert(out.end(), array.begin() + static_cast<std::ptrdiff_t>(offset),
                   array.begin() + static_cast<std::ptrdiff_t>(offset + element_size));
    }
    return out;
}

/// Counts store calls and can be told to fail chunk fetches.
class ObservedStore final : public IDatasetStore {
public:
    explicit ObservedStore(std::shared_ptr<IDatasetStore> inner) : inner_(std::move(inner)), descriptor_(inner_->descriptor()) {}

    [[nodiscard]] const DatasetDescriptor& descriptor() const override { return descriptor_; }
    DatasetDescriptor& mutable_descriptor() { return descriptor_; }

    std::expected<ChunkLayout, StoreError> get_chunk_layout(const Coords& chunk_index) override {
        return inner_->get_chunk_layout(chunk_index);
    }

    std::expected<memory::byte_vector, StoreError> get_raw_chunk_bytes(const Coords& chunk_index) override {
        ++raw_fetches;
        if (fail_fetches) {
            return std::unexpected(StoreError("disk on fire"));
        }
        return inner_->get_raw_chunk_bytes(chunk_index);
    }

    std::atomic<int> raw_fetches{0};
    bool fail_fetches = false;

private:
    std::shared_ptr<IDatasetStore> inner_;
    DatasetDescriptor descriptor_;
};

struct ReadCase {
    std::string name;
    Coords shape;
    Coords chunk_shape;
    Coords block_shape;
    DType dtype;
    size_t element_size;
    Coords start;
    Coords stop;
    Coords step;
    bool record_block_shape = true;
    ChunkCodec codec = ChunkCodec::BLOCKED_ZSTD;
    bool foreign_byte_order = false;
};

void PrintTo(const ReadCase& c, std::ostream* os) { *os << c.name; }

} // namespace

class RegionReaderOracleTest : public ::testing::TestWithParam<ReadCase> {
protected:
    void SetUp() override { unsetenv(optimization::FORCE_FILTER_ENV); }

    optimization::ScopedOptimization enabled_{true};
};

TEST_P(RegionReaderOracleTest, BothStrategiesMatchReferenceExtraction) {
    const auto& c = GetParam();
    DatasetSpec spec;
    spec.shape = c.shape;
    spec.chunk_shape = c.chunk_shape;
    spec.block_shape = c.block_shape;
    spec.dtype = c.dtype;
    spec.element_size = c.element_size;
    spec.codec = c.codec;
    spec.record_block_shape = c.record_block_shape;
    if (c.foreign_byte_order) {
        spec.byte_order = native_byte_order() == ByteOrder::LITTLE ? ByteOrder::BIG : ByteOrder::LITTLE;
    }

    const auto array = make_counting_array(c.shape, c.element_size);
    auto store = open_dataset(spec, array);
    ASSERT_NE(store, nullptr);

    const SliceRequest request(Region(c.start, c.stop), c.step);
    const auto expected = extract_strided(array, c.shape, request, c.element_size);

    OptimizedRegionReader optimized(store);
    memory::byte_vector out_optimized(expected.size());
    auto res = optimized.read_region(request, out_optimized);
    ASSERT_TRUE(res.has_value()) << res.error().to_string();
    EXPECT_EQ(out_optimized, expected);

    FilterPipelineRegionReader pipeline(store);
    memory::byte_vector out_pipeline(expected.size());
    res = pipeline.read_region(request, out_pipeline);
    ASSERT_TRUE(res.has_value()) << res.error().to_string();
    EXPECT_EQ(out_pipeline, expected);

    const auto& stats = optimized.statistics();
    if (request.empty()) {
        EXPECT_EQ(stats.optimized_reads.load() + stats.fallback_reads.load(), 0u);
        return;
    }
    const bool block_path = request.unit_step() && !c.foreign_byte_order && c.codec != ChunkCodec::ZSTD &&
                            (c.record_block_shape || c.shape.size() == 1);
    EXPECT_EQ(stats.optimized_reads.load(), block_path ? 1u : 0u);
    EXPECT_EQ(stats.fallback_reads.load(), block_path ? 0u : 1u);
    EXPECT_EQ(stats.codec_fallbacks.load(), 0u);
}

INSTANTIATE_TEST_SUITE_P(
    Layouts, RegionReaderOracleTest,
    ::testing::Values(
        ReadCase{"OneDimCrossingChunks", Coords{100}, Coords{40}, Coords{10}, DType::INT32, 4, Coords{35}, Coords{45}, Coords{1}},
        ReadCase{"OneDimWholeDataset", Coords{100}, Coords{40}, Coords{10}, DType::INT32, 4, Coords{0}, Coords{100}, Coords{1}},
        ReadCase{"OneDimNoRecordedShape", Coords{90}, Coords{32}, Coords{8}, DType::FLOAT64, 8, Coords{3}, Coords{77}, Coords{1}, false},
        ReadCase{"TwoDimRaggedBlocks", Coords{37, 29}, Coords{16, 12}, Coords{5, 7}, DType::UINT16, 2, Coords{4, 3}, Coords{33, 27}, Coords{1, 1}},
        ReadCase{"ThreeDimSmallBox", Coords{20, 18, 16}, Coords{8, 8, 8}, Coords{4, 4, 4}, DType::FLOAT32, 4, Coords{6, 7, 3}, Coords{11, 9, 14}, Coords{1, 1, 1}},
        ReadCase{"OpaqueRecords", Coords{24, 10}, Coords{10, 10}, Coords{3, 4}, DType::OPAQUE, 12, Coords{5, 2}, Coords{21, 9}, Coords{1, 1}},
        ReadCase{"UncompressedBlocks", Coords{50, 50}, Coords{20, 20}, Coords{5, 5}, DType::INT64, 8, Coords{17, 1}, Coords{44, 26}, Coords{1, 1}, true, ChunkCodec::BLOCKED_NONE},
        ReadCase{"SingleBlockChunks", Coords{30, 30}, Coords{10, 10}, Coords{10, 10}, DType::INT8, 1, Coords{0, 9}, Coords{30, 21}, Coords{1, 1}},
        ReadCase{"EmptyRegion", Coords{30, 30}, Coords{10, 10}, Coords{5, 5}, DType::INT32, 4, Coords{12, 4}, Coords{12, 20}, Coords{1, 1}},
        ReadCase{"SteppedTwoDim", Coords{41, 33}, Coords{16, 16}, Coords{4, 4}, DType::INT32, 4, Coords{1, 2}, Coords{40, 31}, Coords{3, 5}},
        ReadCase{"SteppedLargerThanChunk", Coords{100}, Coords{10}, Coords{5}, DType::INT32, 4, Coords{3}, Coords{98}, Coords{25}},
        ReadCase{"MaximalStep", Coords{20, 30}, Coords{8, 8}, Coords{4, 4}, DType::INT32, 4, Coords{3, 5}, Coords{20, 30},
                 Coords{std::numeric_limits<int64_t>::max(), 7}},
        ReadCase{"PlainZstdCodec", Coords{60, 20}, Coords{25, 20}, Coords{5, 5}, DType::INT32, 4, Coords{10, 2}, Coords{55, 11}, Coords{1, 1}, true, ChunkCodec::ZSTD},
        ReadCase{"ForeignByteOrder", Coords{64}, Coords{16}, Coords{4}, DType::INT32, 4, Coords{5}, Coords{50}, Coords{1}, true, ChunkCodec::BLOCKED_ZSTD, true},
        ReadCase{"MultiDimNoRecordedShape", Coords{20, 20}, Coords{10, 10}, Coords{5, 5}, DType::INT32, 4, Coords{2, 3}, Coords{17, 19}, Coords{1, 1}, false}),
    [](const ::testing::TestParamInfo<ReadCase>& info) { return info.param.name; });

class RegionReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv(optimization::FORCE_FILTER_ENV);
        spec_.shape = Coords{64, 48};
        spec_.chunk_shape = Coords{32, 24};
        spec_.block_shape = Coords{8, 8};
        spec_.dtype = DType::INT32;
        array_ = make_counting_array(spec_.shape, 4);
        reader_ = open_dataset(spec_, array_);
        ASSERT_NE(reader_, nullptr);
    }

    optimization::ScopedOptimization enabled_{true};
    DatasetSpec spec_;
    memory::byte_vector array_;
    std::shared_ptr<DatasetReader> reader_;
};

TEST_F(RegionReaderTest, DecompressesOnlyIntersectingBlocks) {
    OptimizedRegionReader reader(reader_);
    const Region region(Coords{30, 20}, Coords{34, 26});
    memory::byte_vector out(static_cast<size_t>(region.num_elements()) * 4);
    ASSERT_TRUE(reader.read_region(SliceRequest::contiguous(region), out).has_value());
    EXPECT_EQ(out, extract_region(array_, spec_.shape, region, 4));

    // Rows 30..34 hit one block row in each of two chunk rows, columns 20..26 one block column per chunk column.
    EXPECT_EQ(reader.statistics().blocks_decompressed.load(), 4u);
    EXPECT_EQ(reader.statistics().optimized_reads.load(), 1u);

    reader.reset_statistics();
    EXPECT_EQ(reader.statistics().blocks_decompressed.load(), 0u);
    EXPECT_EQ(reader.statistics().optimized_reads.load(), 0u);
}

TEST_F(RegionReaderTest, FetchesEachChunkOnce) {
    auto store = std::make_shared<ObservedStore>(reader_);
    OptimizedRegionReader reader(store);
    const Region region(Coords{3, 5}, Coords{60, 40});
    memory::byte_vector out(static_cast<size_t>(region.num_elements()) * 4);
    ASSERT_TRUE(reader.read_region(SliceRequest::contiguous(region), out).has_value());
    EXPECT_EQ(store->raw_fetches.load(), 4);
    EXPECT_EQ(out, extract_region(array_, spec_.shape, region, 4));
}

TEST_F(RegionReaderTest, DisabledSwitchUsesWholeChunks) {
    OptimizedRegionReader reader(reader_);
    const Region region(Coords{1, 1}, Coords{9, 9});
    memory::byte_vector out(static_cast<size_t>(region.num_elements()) * 4);
    {
        optimization::ScopedOptimization off(false);
        ASSERT_TRUE(reader.read_region(SliceRequest::contiguous(region), out).has_value());
    }
    EXPECT_EQ(out, extract_region(array_, spec_.shape, region, 4));
    EXPECT_EQ(reader.statistics().fallback_reads.load(), 1u);
    EXPECT_EQ(reader.statistics().optimized_reads.load(), 0u);
    EXPECT_EQ(reader.statistics().blocks_decompressed.load(), 0u);
}

TEST_F(RegionReaderTest, EnvironmentOverrideUsesWholeChunks) {
    setenv(optimization::FORCE_FILTER_ENV, "1", 1);
    OptimizedRegionReader reader(reader_);
    const Region region(Coords{1, 1}, Coords{9, 9});
    memory::byte_vector out(static_cast<size_t>(region.num_elements()) * 4);
    const auto res = reader.read_region(SliceRequest::contiguous(region), out);
    unsetenv(optimization::FORCE_FILTER_ENV);

    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(out, extract_region(array_, spec_.shape, region, 4));
    EXPECT_EQ(reader.statistics().fallback_reads.load(), 1u);
}

TEST_F(RegionReaderTest, CodecErrorFallsBackToWholeChunks) {
    // Frames record 8x8 blocks while the descriptor claims 4x4: block access is refused.
    auto store = std::make_shared<ObservedStore>(reader_);
    store->mutable_descriptor().block_shape = Coords{4, 4};
    OptimizedRegionReader reader(store);

    const Region region(Coords{10, 10}, Coords{40, 30});
    memory::byte_vector out(static_cast<size_t>(region.num_elements()) * 4);
    const auto res = reader.read_region(SliceRequest::contiguous(region), out);
    ASSERT_TRUE(res.has_value()) << res.error().to_string();
    EXPECT_EQ(out, extract_region(array_, spec_.shape, region, 4));

    EXPECT_EQ(reader.statistics().codec_fallbacks.load(), 1u);
    EXPECT_EQ(reader.statistics().fallback_reads.load(), 1u);
    EXPECT_EQ(reader.statistics().optimized_reads.load(), 0u);
}

TEST_F(RegionReaderTest, StoreFailureIsReturnedWithoutFallback) {
    auto store = std::make_shared<ObservedStore>(reader_);
    store->fail_fetches = true;
    OptimizedRegionReader reader(store);

    const Region region(Coords{0, 0}, Coords{8, 8});
    memory::byte_vector out(static_cast<size_t>(region.num_elements()) * 4);
    const auto res = reader.read_region(SliceRequest::contiguous(region), out);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind(), ReadErrorKind::StoreFailure);
    EXPECT_NE(res.error().message().find("disk on fire"), std::string::npos);
    EXPECT_EQ(store->raw_fetches.load(), 1);
    EXPECT_EQ(reader.statistics().fallback_reads.load(), 0u);

    FilterPipelineRegionReader pipeline(store);
    const auto pipeline_res = pipeline.read_region(SliceRequest::contiguous(region), out);
    ASSERT_FALSE(pipeline_res.has_value());
    EXPECT_EQ(pipeline_res.error().kind(), ReadErrorKind::StoreFailure);
}

TEST_F(RegionReaderTest, RejectsInvalidRequests) {
    OptimizedRegionReader reader(reader_);
    memory::byte_vector out(16 * 4);

    auto res = reader.read_region(SliceRequest::contiguous(Region(Coords{60, 0}, Coords{68, 2})), out);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind(), ReadErrorKind::InvalidSelection);

    res = reader.read_region(SliceRequest::contiguous(Region(Coords{0}, Coords{16})), out);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind(), ReadErrorKind::InvalidSelection);

    res = reader.read_region(SliceRequest(Region(Coords{0, 0}, Coords{4, 4}), Coords{0, 1}), out);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind(), ReadErrorKind::InvalidSelection);

    res = reader.read_region(SliceRequest::contiguous(Region(Coords{0, 0}, Coords{4, 5})), out);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind(), ReadErrorKind::InvalidOutputBuffer);
}

TEST_F(RegionReaderTest, ConcurrentReadsAgree) {
    OptimizedRegionReader reader(reader_);
    std::vector<std::thread> threads;
    std::atomic<int> mismatches{0};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 10; ++i) {
                const Region region(Coords{t * 5, i}, Coords{t * 5 + 30, i + 20});
                memory::byte_vector out(static_cast<size_t>(region.num_elements()) * 4);
                const auto res = reader.read_region(SliceRequest::contiguous(region), out);
                if (!res || out != extract_region(array_, spec_.shape, region, 4)) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(reader.statistics().optimized_reads.load(), 40u);
}
