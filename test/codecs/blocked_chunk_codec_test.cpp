#include "../../src/codecs/blocked_chunk_codec.h"
#include "../../src/geometry/grid.h"
#include "../test_helpers.h"
#include <gtest/gtest.h>
#include <tuple>

using namespace chunkslice;

namespace {

struct CodecCase {
    const char* name;
    ChunkCodec codec;
    ChunkGeometry geometry;
    bool record_dimensions;
};

class BlockedChunkCodecTest : public ::testing::TestWithParam<CodecCase> {};

} // namespace

TEST_P(BlockedChunkCodecTest, DecodeChunkRestoresData) {
    const auto& param = GetParam();
    BlockedChunkCodec codec;
    const auto chunk = generate_random_data(param.geometry.chunk_nbytes());

    auto encoded = codec.encode_chunk(chunk, param.codec, param.geometry, param.record_dimensions);
    ASSERT_TRUE(encoded.has_value()) << encoded.error().to_string();

    auto decoded = codec.decode_chunk(*encoded, param.codec, param.geometry);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().to_string();
    EXPECT_EQ(*decoded, chunk);
}

TEST_P(BlockedChunkCodecTest, EveryBlockDecodesToItsSubBox) {
    const auto& param = GetParam();
    if (!codec_supports_block_access(param.codec)) {
        GTEST_SKIP();
    }
    const auto& geometry = param.geometry;
    BlockedChunkCodec codec;
    const auto chunk = make_counting_array(geometry.chunk_shape, geometry.element_size);
    auto encoded = codec.encode_chunk(chunk, param.codec, geometry, param.record_dimensions);
    ASSERT_TRUE(encoded.has_value()) << encoded.error().to_string();

    auto info = BlockedChunkCodec::read_frame_info(*encoded);
    ASSERT_TRUE(info.has_value()) << info.error().to_string();
    EXPECT_EQ(info->has_dimensions(), param.record_dimensions);
    ASSERT_TRUE(BlockedChunkCodec::check_frame_geometry(*info, geometry).has_value());

    const auto grid = geometry::block_grid(geometry.chunk_shape, geometry.block_shape);
    for (const auto& block_index : geometry::GridRange(Coords(grid.size(), 0), grid)) {
        const auto extent = geometry::block_extent(block_index, geometry.block_shape, geometry.chunk_shape);
        memory::byte_vector block(geometry.block_nbytes(block_index));
        auto res = codec.decompress_block_into(*encoded, *info, geometry::linear_index(block_index, grid), block);
        ASSERT_TRUE(res.has_value()) << res.error().to_string();
        EXPECT_EQ(block, extract_region(chunk, geometry.chunk_shape, extent, geometry.element_size))
            << "block " << block_index.to_string();
    }
}

INSTANTIATE_TEST_SUITE_P(
    Geometries,
    BlockedChunkCodecTest,
    ::testing::Values(
        CodecCase{"Zstd1D", ChunkCodec::BLOCKED_ZSTD, {Coords{40}, Coords{10}, 4}, true},
        CodecCase{"Zstd1DNoDims", ChunkCodec::BLOCKED_ZSTD, {Coords{40}, Coords{10}, 8}, false},
        CodecCase{"Zstd2DRagged", ChunkCodec::BLOCKED_ZSTD, {Coords{7, 9}, Coords{3, 4}, 4}, true},
        CodecCase{"None3D", ChunkCodec::BLOCKED_NONE, {Coords{4, 5, 6}, Coords{2, 5, 4}, 2}, true},
        CodecCase{"Opaque12Bytes", ChunkCodec::BLOCKED_ZSTD, {Coords{6, 6}, Coords{4, 4}, 12}, true},
        CodecCase{"SingleBlock", ChunkCodec::BLOCKED_NONE, {Coords{5, 5}, Coords{5, 5}, 1}, true},
        CodecCase{"PlainZstd", ChunkCodec::ZSTD, {Coords{8, 8}, Coords{4, 4}, 4}, true}),
    [](const ::testing::TestParamInfo<CodecCase>& info) {
        return std::string(info.param.name);
    }
);

TEST(BlockedChunkCodecErrors, RejectsWrongChunkSize) {
    BlockedChunkCodec codec;
    const ChunkGeometry geometry{Coords{10}, Coords{5}, 4};
    const auto chunk = generate_random_data(39);
    auto encoded = codec.encode_chunk(chunk, ChunkCodec::BLOCKED_ZSTD, geometry);
    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error().code(), ErrorCode::InvalidDataSize);
}

TEST(BlockedChunkCodecErrors, RejectsBlockLargerThanChunk) {
    BlockedChunkCodec codec;
    const ChunkGeometry geometry{Coords{10}, Coords{11}, 4};
    const auto chunk = generate_random_data(40);
    auto encoded = codec.encode_chunk(chunk, ChunkCodec::BLOCKED_ZSTD, geometry);
    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error().code(), ErrorCode::InvalidBlockShape);
}

TEST(BlockedChunkCodecErrors, BlockIndexOutOfRange) {
    BlockedChunkCodec codec;
    const ChunkGeometry geometry{Coords{10}, Coords{5}, 4};
    const auto chunk = generate_random_data(40);
    auto encoded = codec.encode_chunk(chunk, ChunkCodec::BLOCKED_ZSTD, geometry);
    ASSERT_TRUE(encoded.has_value());
    auto info = BlockedChunkCodec::read_frame_info(*encoded);
    ASSERT_TRUE(info.has_value());

    memory::byte_vector block(20);
    auto res = codec.decompress_block_into(*encoded, *info, 2, block);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code(), ErrorCode::BlockIndexOutOfRange);
    EXPECT_FALSE(codec.decompress_block_into(*encoded, *info, -1, block).has_value());
}

TEST(BlockedChunkCodecErrors, FrameGeometryMismatchIsReported) {
    BlockedChunkCodec codec;
    const ChunkGeometry written{Coords{8, 8}, Coords{4, 4}, 4};
    const auto chunk = generate_random_data(written.chunk_nbytes());
    auto encoded = codec.encode_chunk(chunk, ChunkCodec::BLOCKED_ZSTD, written);
    ASSERT_TRUE(encoded.has_value());
    auto info = BlockedChunkCodec::read_frame_info(*encoded);
    ASSERT_TRUE(info.has_value());

    const ChunkGeometry expected{Coords{8, 8}, Coords{2, 8}, 4};
    auto res = BlockedChunkCodec::check_frame_geometry(*info, expected);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code(), ErrorCode::InvalidBlockShape);

    // Whole-chunk decoding follows the frame's own block shape
    auto decoded = codec.decode_chunk(*encoded, ChunkCodec::BLOCKED_ZSTD, expected);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().to_string();
    EXPECT_EQ(*decoded, chunk);
}

TEST(BlockedChunkCodecErrors, CorruptBlockPayloadFailsDecompression) {
    BlockedChunkCodec codec;
    const ChunkGeometry geometry{Coords{64}, Coords{32}, 4};
    const auto chunk = make_counting_array(geometry.chunk_shape, geometry.element_size);
    auto encoded = codec.encode_chunk(chunk, ChunkCodec::BLOCKED_ZSTD, geometry);
    ASSERT_TRUE(encoded.has_value());
    // Clobber the tail of the last block
    for (size_t i = encoded->size() - 4; i < encoded->size(); ++i) {
        (*encoded)[i] = std::byte{0xFF};
    }
    auto decoded = codec.decode_chunk(*encoded, ChunkCodec::BLOCKED_ZSTD, geometry);
    EXPECT_FALSE(decoded.has_value());
}
