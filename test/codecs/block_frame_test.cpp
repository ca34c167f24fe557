#include "../../src/codecs/block_frame.h"
#include <gtest/gtest.h>

using namespace chunkslice;

namespace {

BlockFrameInfo make_info(bool with_dims) {
    BlockFrameInfo info;
    info.compressor = BlockCompressor::ZSTD;
    info.typesize = 4;
    info.nblocks = 4;
    info.chunk_nbytes = 160;
    info.block_nbytes = 40;
    if (with_dims) {
        info.chunk_shape = Coords{40};
        info.block_shape = Coords{10};
    }
    return info;
}

// Header plus a zeroed offset table, enough for the bounds checks.
memory::byte_vector make_frame(const BlockFrameInfo& info) {
    memory::byte_vector frame;
    write_block_frame_header(info, frame);
    frame.resize(frame.size() + (info.nblocks + 1) * sizeof(uint64_t));
    return frame;
}

} // namespace

TEST(BlockFrameTest, HeaderWithDimensionsParses) {
    const auto frame = make_frame(make_info(true));
    auto parsed = parse_block_frame_header(frame, frame.size());
    ASSERT_TRUE(parsed.has_value()) << parsed.error().to_string();
    EXPECT_TRUE(parsed->has_dimensions());
    EXPECT_EQ(*parsed->chunk_shape, (Coords{40}));
    EXPECT_EQ(*parsed->block_shape, (Coords{10}));
    EXPECT_EQ(parsed->table_offset, BLOCK_FRAME_FIXED_HEADER_SIZE + 2 * sizeof(int64_t));
}

TEST(BlockFrameTest, HeaderWithoutDimensionsParses) {
    const auto frame = make_frame(make_info(false));
    auto parsed = parse_block_frame_header(frame, frame.size());
    ASSERT_TRUE(parsed.has_value()) << parsed.error().to_string();
    EXPECT_FALSE(parsed->has_dimensions());
    EXPECT_EQ(parsed->table_offset, BLOCK_FRAME_FIXED_HEADER_SIZE);
}

TEST(BlockFrameTest, TruncatedHeaderIsRejected) {
    const auto frame = make_frame(make_info(true));
    for (size_t len : {size_t{0}, size_t{3}, size_t{10}, BLOCK_FRAME_FIXED_HEADER_SIZE - 1, BLOCK_FRAME_FIXED_HEADER_SIZE + 4}) {
        auto parsed = parse_block_frame_header(std::span(frame).first(len), frame.size());
        ASSERT_FALSE(parsed.has_value()) << "prefix of " << len << " bytes";
        EXPECT_EQ(parsed.error().code(), ErrorCode::InvalidFrameHeader);
    }
}

TEST(BlockFrameTest, OffsetTableMustFitTheFrame) {
    const auto frame = make_frame(make_info(false));
    auto parsed = parse_block_frame_header(frame, frame.size() - 1);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code(), ErrorCode::InvalidFrameHeader);
}

TEST(BlockFrameTest, BadMagicAndVersion) {
    auto frame = make_frame(make_info(false));
    frame[0] = std::byte{0};
    EXPECT_EQ(parse_block_frame_header(frame, frame.size()).error().code(), ErrorCode::InvalidFrameHeader);

    frame = make_frame(make_info(false));
    frame[4] = std::byte{BLOCK_FRAME_VERSION + 1};
    EXPECT_EQ(parse_block_frame_header(frame, frame.size()).error().code(), ErrorCode::UnsupportedFrameVersion);
}

TEST(BlockFrameTest, RecordedBlockShapeMustFitTheChunk) {
    auto info = make_info(true);
    info.block_shape = Coords{41};
    const auto frame = make_frame(info);
    auto parsed = parse_block_frame_header(frame, frame.size());
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code(), ErrorCode::InvalidBlockShape);
}

TEST(BlockFrameTest, SizesMustBeMultiplesOfTypesize) {
    auto info = make_info(false);
    info.block_nbytes = 42;
    const auto frame = make_frame(info);
    auto parsed = parse_block_frame_header(frame, frame.size());
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code(), ErrorCode::InvalidDataSize);
}

TEST(BlockFrameTest, FrameBlockShapeUsesRecordedDimensions) {
    auto shape = frame_block_shape(make_info(true), 4, 1);
    ASSERT_TRUE(shape.has_value());
    ASSERT_TRUE(shape->has_value());
    EXPECT_EQ(**shape, (Coords{10}));
}

TEST(BlockFrameTest, FrameBlockShapeInOneDimensionComesFromByteSizes) {
    // 8-byte elements: the block holds 40 / 8 = 5 elements, not 40
    auto info = make_info(false);
    info.typesize = 8;
    auto shape = frame_block_shape(info, 8, 1);
    ASSERT_TRUE(shape.has_value());
    ASSERT_TRUE(shape->has_value());
    EXPECT_EQ(**shape, (Coords{5}));
}

TEST(BlockFrameTest, FrameBlockShapeUnknownInSeveralDimensions) {
    auto shape = frame_block_shape(make_info(false), 4, 2);
    ASSERT_TRUE(shape.has_value());
    EXPECT_FALSE(shape->has_value());
}

TEST(BlockFrameTest, FrameBlockShapeChecksTypesize) {
    auto shape = frame_block_shape(make_info(true), 8, 1);
    ASSERT_FALSE(shape.has_value());
    EXPECT_EQ(shape.error().code(), ErrorCode::InvalidDataSize);
}
