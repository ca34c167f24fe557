#pragma once

#include <cstdint>
#include <expected>
#include <span>

#include "../codecs/blocked_chunk_codec.h"
#include "../data_io/codec_error.h"
#include "../data_io/dataset_store.h"
#include "../file_format/dataset_metadata.h"
#include "../geometry/coords.h"
#include "../memory/allocator.h"

namespace chunkslice {

/**
 * @brief Decompresses single blocks out of raw chunk payloads of one dataset.
 *
 * Every frame is checked against the dataset geometry before a block is extracted, so
 * a chunk written with another layout is reported instead of being misread. The returned
 * view points into a scratch buffer reused by the next call. Not thread-safe.
 */
class BlockDecompressor {
public:
    explicit BlockDecompressor(const DatasetDescriptor& descriptor);

    /** @brief Parses the chunk's frame header and checks it against its layout and the dataset geometry. */
    std::expected<BlockFrameInfo, CodecError> validate_chunk(std::span<const std::byte> raw_chunk_bytes,
                                                             const ChunkLayout& layout);

    /**
     * @brief Decompresses block `block_index` (chunk-local multi-index) of a chunk whose
     * header `frame` was returned by validate_chunk() for the same bytes.
     * @return Exactly the block's clipped element count times the element size.
     */
    std::expected<std::span<const std::byte>, CodecError> decompress_block(std::span<const std::byte> raw_chunk_bytes,
                                                                           const BlockFrameInfo& frame,
                                                                           const Coords& block_index);

    /** @brief validate_chunk() followed by decompress_block() for a single block. */
    std::expected<std::span<const std::byte>, CodecError> decompress_block(std::span<const std::byte> raw_chunk_bytes,
                                                                           const ChunkLayout& layout,
                                                                           const Coords& block_index);

    [[nodiscard]] uint64_t blocks_decompressed() const { return blocks_decompressed_; }
    [[nodiscard]] uint64_t chunks_validated() const { return chunks_validated_; }

private:

    ChunkGeometry geometry_;
    Coords block_grid_;
    BlockedChunkCodec codec_;
    memory::byte_vector scratch_;
    uint64_t blocks_decompressed_ = 0;
    uint64_t chunks_validated_ = 0;
};

} // namespace chunkslice
