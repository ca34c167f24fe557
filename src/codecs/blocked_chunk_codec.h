#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>

#include "../data_io/codec_error.h"
#include "../file_format/dataset_format.h"
#include "../geometry/coords.h"
#include "../memory/allocator.h"
#include "block_frame.h"
#include "zstd_compressor.h"

namespace chunkslice {

/// Nominal chunk and block shapes of a chunk payload, in elements of `element_size` bytes.
struct ChunkGeometry {
    Coords chunk_shape;
    Coords block_shape;
    size_t element_size = 0;

    [[nodiscard]] size_t chunk_nbytes() const { return static_cast<size_t>(chunk_shape.product()) * element_size; }
    [[nodiscard]] size_t full_block_nbytes() const { return static_cast<size_t>(block_shape.product()) * element_size; }
    /** @brief Decoded size of a block after clipping it to the chunk. */
    [[nodiscard]] size_t block_nbytes(const Coords& block_index) const;
};

/**
 * @brief Encodes and decodes chunk payloads for every ChunkCodec.
 *
 * Blocked codecs produce a block frame (see block_frame.h) whose blocks can be
 * decompressed one at a time. Owns zstd contexts, so an instance must not be
 * shared between threads.
 */
class BlockedChunkCodec {
public:
    explicit BlockedChunkCodec(int zstd_level = ZstdCompressor::DEFAULT_COMPRESSION_LEVEL);

    /**
     * @brief Encodes one chunk of exactly `geometry.chunk_nbytes()` bytes.
     * @param record_dimensions Whether the frame header carries the chunk and block shapes.
     */
    std::expected<memory::byte_vector, CodecError> encode_chunk(std::span<const std::byte> chunk, ChunkCodec codec,
                                                                const ChunkGeometry& geometry, bool record_dimensions = true);

    /**
     * @brief Decodes a whole chunk.
     *
     * Blocked frames are decoded with their recorded block shape when they carry one, so a
     * frame written with a different block shape than `geometry` still decodes correctly.
     */
    std::expected<memory::byte_vector, CodecError> decode_chunk(std::span<const std::byte> payload, ChunkCodec codec,
                                                                const ChunkGeometry& geometry);

    static std::expected<BlockFrameInfo, CodecError> read_frame_info(std::span<const std::byte> frame);

    /**
     * @brief Checks that a frame was encoded with exactly `geometry`.
     *
     * 1-D frames without dimensions are checked through their byte sizes.
     */
    static std::expected<void, CodecError> check_frame_geometry(const BlockFrameInfo& info, const ChunkGeometry& geometry);

    /**
     * @brief Decompresses block `block_index` (row-major within the chunk) into `out`.
     *
     * Only that block's compressed bytes are touched. `out` must have the block's clipped size.
     */
    std::expected<void, CodecError> decompress_block_into(std::span<const std::byte> frame, const BlockFrameInfo& info,
                                                          int64_t block_index, std::span<std::byte> out);

private:
    std::expected<memory::byte_vector, CodecError> encode_blocked(std::span<const std::byte> chunk, BlockCompressor compressor,
                                                                  const ChunkGeometry& geometry, bool record_dimensions);
    std::expected<memory::byte_vector, CodecError> decode_blocked(std::span<const std::byte> frame, const ChunkGeometry& geometry);

    ZstdCompressor zstd_;
    memory::byte_vector scratch_;
};

} // namespace chunkslice
