#include "block_decompressor.h"

#include "../geometry/grid.h"

#include <format>

namespace chunkslice {

BlockDecompressor::BlockDecompressor(const DatasetDescriptor& descriptor)
    : geometry_{descriptor.chunk_shape, descriptor.block_shape, descriptor.element_size},
      block_grid_(geometry::block_grid(descriptor.chunk_shape, descriptor.block_shape)) {}

std::expected<BlockFrameInfo, CodecError> BlockDecompressor::validate_chunk(std::span<const std::byte> raw_chunk_bytes,
                                                                            const ChunkLayout& layout) {
    if (raw_chunk_bytes.size() != layout.byte_length) {
        return std::unexpected(CodecError{ErrorCode::InvalidDataSize,
                                          std::format("Chunk payload has {} bytes, its layout says {}.",
                                                      raw_chunk_bytes.size(), layout.byte_length)});
    }
    if (layout.recorded_block_shape && *layout.recorded_block_shape != geometry_.block_shape) {
        return std::unexpected(CodecError{ErrorCode::InvalidBlockShape,
                                          std::format("Chunk records block shape {}, dataset uses {}.",
                                                      *layout.recorded_block_shape, geometry_.block_shape)});
    }

    auto info = BlockedChunkCodec::read_frame_info(raw_chunk_bytes);
    if (!info) {
        return std::unexpected(info.error());
    }
    if (auto res = BlockedChunkCodec::check_frame_geometry(*info, geometry_); !res) {
        return std::unexpected(res.error());
    }
    ++chunks_validated_;
    return info;
}

std::expected<std::span<const std::byte>, CodecError> BlockDecompressor::decompress_block(std::span<const std::byte> raw_chunk_bytes,
                                                                                          const ChunkLayout& layout,
                                                                                          const Coords& block_index) {
    auto info = validate_chunk(raw_chunk_bytes, layout);
    if (!info) {
        return std::unexpected(info.error());
    }
    return decompress_block(raw_chunk_bytes, *info, block_index);
}

std::expected<std::span<const std::byte>, CodecError> BlockDecompressor::decompress_block(std::span<const std::byte> raw_chunk_bytes,
                                                                                          const BlockFrameInfo& frame,
                                                                                          const Coords& block_index) {
    if (block_index.size() != block_grid_.size()) {
        return std::unexpected(CodecError{ErrorCode::BlockIndexOutOfRange,
                                          std::format("Block index {} for block grid {}.", block_index, block_grid_)});
    }
    for (size_t i = 0; i < block_grid_.size(); ++i) {
        if (block_index[i] < 0 || block_index[i] >= block_grid_[i]) {
            return std::unexpected(CodecError{ErrorCode::BlockIndexOutOfRange,
                                              std::format("Block index {} for block grid {}.", block_index, block_grid_)});
        }
    }

    auto out = memory::reuse_scratch(scratch_, geometry_.block_nbytes(block_index));
    const auto linear = geometry::linear_index(block_index, block_grid_);
    if (auto res = codec_.decompress_block_into(raw_chunk_bytes, frame, linear, out); !res) {
        return std::unexpected(res.error());
    }
    ++blocks_decompressed_;
    return out;
}

} // namespace chunkslice
