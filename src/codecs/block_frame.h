#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>

#include "../data_io/codec_error.h"
#include "../geometry/coords.h"
#include "../memory/allocator.h"

namespace chunkslice {

constexpr uint32_t BLOCK_FRAME_MAGIC = 0x4B4C4243; // "CBLK" on disk
constexpr uint8_t BLOCK_FRAME_VERSION = 1;

enum class BlockCompressor : uint16_t {
    NONE = 0,
    ZSTD = 1
};

enum BlockFrameFlags : uint8_t {
    HAS_DIMENSIONS = 1 << 0
};

/**
 * @brief Decoded header of a blocked chunk frame.
 *
 * Layout (host byte order):
 *   u32 magic | u8 version | u8 flags | u16 compressor | u32 typesize | u32 nblocks
 *   | u64 chunk_nbytes | u32 block_nbytes | u8 ndim
 *   | [i64 chunk_shape[ndim] | i64 block_shape[ndim]]  (when HAS_DIMENSIONS)
 *   | u64 block_offsets[nblocks + 1]                    (relative to the frame start)
 *   | block payloads
 *
 * Block payloads hold the row-major elements of the block clipped to the chunk.
 */
struct BlockFrameInfo {
    uint8_t version = BLOCK_FRAME_VERSION;
    BlockCompressor compressor = BlockCompressor::NONE;
    uint32_t typesize = 0;
    uint32_t nblocks = 0;
    uint64_t chunk_nbytes = 0;
    // Bytes of a full (unclipped) block
    uint32_t block_nbytes = 0;
    std::optional<Coords> chunk_shape;
    std::optional<Coords> block_shape;
    // Position of the offset table inside the frame
    uint64_t table_offset = 0;

    [[nodiscard]] bool has_dimensions() const { return chunk_shape.has_value(); }
};

/** @brief Size of the fixed part of the header, before the optional dimensions. */
constexpr size_t BLOCK_FRAME_FIXED_HEADER_SIZE = 4 + 1 + 1 + 2 + 4 + 4 + 8 + 4 + 1;

/**
 * @brief Parses and sanity checks a frame header and its offset table bounds.
 *
 * Only the header is inspected, so a prefix of the frame long enough to hold it is enough
 * as long as `frame_size` gives the full frame length.
 */
[[nodiscard]] std::expected<BlockFrameInfo, CodecError> parse_block_frame_header(std::span<const std::byte> header_bytes,
                                                                                uint64_t frame_size);

/** @brief Appends a serialized header, without the offset table, to `out`. */
void write_block_frame_header(const BlockFrameInfo& info, memory::byte_vector& out);

/**
 * @brief The frame's block shape: the recorded one, or for 1-D frames without dimensions
 * `block_nbytes / element_size`. Empty when it cannot be known from the frame alone.
 */
[[nodiscard]] std::expected<std::optional<Coords>, CodecError> frame_block_shape(const BlockFrameInfo& info,
                                                                               size_t element_size, size_t ndim);

} // namespace chunkslice
