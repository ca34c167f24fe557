#include "blocked_chunk_codec.h"
#include "../file_format/serialization_helpers.h"
#include "../geometry/grid.h"
#include "../geometry/strided_copy.h"

#include <cstring>
#include <format>
#include <limits>

namespace chunkslice {

namespace {

std::expected<void, CodecError> validate_geometry(const ChunkGeometry& geometry) {
    const auto& chunk_shape = geometry.chunk_shape;
    const auto& block_shape = geometry.block_shape;
    if (chunk_shape.empty() || chunk_shape.size() != block_shape.size()) {
        return std::unexpected(CodecError{ErrorCode::InvalidChunkShape,
                                          std::format("Chunk shape {} and block shape {} are incompatible.", chunk_shape, block_shape)});
    }
    for (size_t i = 0; i < chunk_shape.size(); ++i) {
        if (chunk_shape[i] < 1) {
            return std::unexpected(CodecError{ErrorCode::InvalidChunkShape, std::format("Chunk shape {}.", chunk_shape)});
        }
        if (block_shape[i] < 1 || block_shape[i] > chunk_shape[i]) {
            return std::unexpected(CodecError{ErrorCode::InvalidBlockShape,
                                              std::format("Block shape {} does not fit chunk shape {}.", block_shape, chunk_shape)});
        }
    }
    if (geometry.element_size == 0 || geometry.element_size > std::numeric_limits<uint32_t>::max()) {
        return std::unexpected(CodecError{ErrorCode::InvalidDataSize, std::format("Element size {}.", geometry.element_size)});
    }
    return {};
}

} // namespace

size_t ChunkGeometry::block_nbytes(const Coords& block_index) const {
    return static_cast<size_t>(geometry::block_extent(block_index, block_shape, chunk_shape).num_elements()) * element_size;
}

BlockedChunkCodec::BlockedChunkCodec(const int zstd_level) : zstd_(zstd_level) {}

std::expected<memory::byte_vector, CodecError> BlockedChunkCodec::encode_chunk(std::span<const std::byte> chunk,
                                                                               const ChunkCodec codec,
                                                                               const ChunkGeometry& geometry,
                                                                               const bool record_dimensions) {
    if (auto res = validate_geometry(geometry); !res) {
        return std::unexpected(res.error());
    }
    if (chunk.size() != geometry.chunk_nbytes()) {
        return std::unexpected(CodecError{ErrorCode::InvalidDataSize,
                                          std::format("Chunk holds {} bytes, shape {} needs {}.", chunk.size(),
                                                      geometry.chunk_shape, geometry.chunk_nbytes())});
    }

    switch (codec) {
        case ChunkCodec::BLOCKED_ZSTD:
            return encode_blocked(chunk, BlockCompressor::ZSTD, geometry, record_dimensions);
        case ChunkCodec::BLOCKED_NONE:
            return encode_blocked(chunk, BlockCompressor::NONE, geometry, record_dimensions);
        case ChunkCodec::ZSTD: {
            auto compressed = zstd_.compress(chunk);
            if (!compressed) {
                return std::unexpected(CodecError::from_string(compressed.error(), ErrorCode::CompressionFailure));
            }
            return std::move(*compressed);
        }
    }
    return std::unexpected(CodecError{ErrorCode::Unknown, std::format("Unknown chunk codec {}.", static_cast<int>(codec))});
}

std::expected<memory::byte_vector, CodecError> BlockedChunkCodec::decode_chunk(std::span<const std::byte> payload,
                                                                               const ChunkCodec codec,
                                                                               const ChunkGeometry& geometry) {
    if (auto res = validate_geometry(geometry); !res) {
        return std::unexpected(res.error());
    }

    switch (codec) {
        case ChunkCodec::BLOCKED_ZSTD:
        case ChunkCodec::BLOCKED_NONE:
            return decode_blocked(payload, geometry);
        case ChunkCodec::ZSTD: {
            memory::byte_vector chunk(geometry.chunk_nbytes());
            if (auto res = zstd_.decompress_into(payload, chunk); !res) {
                return std::unexpected(CodecError::from_string(res.error(), ErrorCode::DecompressionFailure));
            }
            return chunk;
        }
    }
    return std::unexpected(CodecError{ErrorCode::Unknown, std::format("Unknown chunk codec {}.", static_cast<int>(codec))});
}

std::expected<BlockFrameInfo, CodecError> BlockedChunkCodec::read_frame_info(std::span<const std::byte> frame) {
    return parse_block_frame_header(frame, frame.size());
}

std::expected<void, CodecError> BlockedChunkCodec::check_frame_geometry(const BlockFrameInfo& info,
                                                                        const ChunkGeometry& geometry) {
    const size_t ndim = geometry.chunk_shape.size();
    auto recorded_block_shape = frame_block_shape(info, geometry.element_size, ndim);
    if (!recorded_block_shape) {
        return std::unexpected(recorded_block_shape.error());
    }
    if (info.chunk_shape && *info.chunk_shape != geometry.chunk_shape) {
        return std::unexpected(CodecError{ErrorCode::InvalidChunkShape,
                                          std::format("Frame chunk shape {} differs from {}.", *info.chunk_shape, geometry.chunk_shape)});
    }
    if (*recorded_block_shape && **recorded_block_shape != geometry.block_shape) {
        return std::unexpected(CodecError{ErrorCode::InvalidBlockShape,
                                          std::format("Frame block shape {} differs from {}.", **recorded_block_shape, geometry.block_shape)});
    }
    if (info.chunk_nbytes != geometry.chunk_nbytes()) {
        return std::unexpected(CodecError{ErrorCode::InvalidChunkShape,
                                          std::format("Frame holds a {} byte chunk, shape {} needs {}.", info.chunk_nbytes,
                                                      geometry.chunk_shape, geometry.chunk_nbytes())});
    }
    if (info.block_nbytes != geometry.full_block_nbytes()) {
        return std::unexpected(CodecError{ErrorCode::InvalidBlockShape,
                                          std::format("Frame blocks hold {} bytes, block shape {} needs {}.", info.block_nbytes,
                                                      geometry.block_shape, geometry.full_block_nbytes())});
    }
    const auto nblocks = geometry::block_grid(geometry.chunk_shape, geometry.block_shape).product();
    if (static_cast<int64_t>(info.nblocks) != nblocks) {
        return std::unexpected(CodecError{ErrorCode::InvalidBlockShape,
                                          std::format("Frame has {} blocks, expected {}.", info.nblocks, nblocks)});
    }
    return {};
}

std::expected<void, CodecError> BlockedChunkCodec::decompress_block_into(std::span<const std::byte> frame,
                                                                         const BlockFrameInfo& info,
                                                                         const int64_t block_index,
                                                                         std::span<std::byte> out) {
    if (block_index < 0 || block_index >= static_cast<int64_t>(info.nblocks)) {
        return std::unexpected(CodecError{ErrorCode::BlockIndexOutOfRange,
                                          std::format("Block {} requested, frame has {}.", block_index, info.nblocks)});
    }
    if (out.size() > info.block_nbytes) {
        return std::unexpected(CodecError{ErrorCode::InvalidDataSize,
                                          std::format("Block buffer of {} bytes exceeds the frame block size {}.", out.size(), info.block_nbytes)});
    }

    size_t cursor = info.table_offset + static_cast<size_t>(block_index) * sizeof(uint64_t);
    auto begin = serialization::read_pod_at<uint64_t>(frame, cursor);
    auto end = serialization::read_pod_at<uint64_t>(frame, cursor);
    if (!begin || !end) {
        return std::unexpected(CodecError{ErrorCode::InvalidFrameHeader, "Offset table is truncated."});
    }
    const uint64_t data_start = info.table_offset + (static_cast<uint64_t>(info.nblocks) + 1) * sizeof(uint64_t);
    if (*begin < data_start || *end < *begin || *end > frame.size()) {
        return std::unexpected(CodecError{ErrorCode::InvalidFrameHeader,
                                          std::format("Block {} spans [{}, {}) outside the frame data [{}, {}).",
                                                      block_index, *begin, *end, data_start, frame.size())});
    }
    const auto compressed = frame.subspan(*begin, *end - *begin);

    if (info.compressor == BlockCompressor::NONE) {
        if (compressed.size() != out.size()) {
            return std::unexpected(CodecError{ErrorCode::InvalidDataSize,
                                              std::format("Stored block has {} bytes, expected {}.", compressed.size(), out.size())});
        }
        std::memcpy(out.data(), compressed.data(), out.size());
        return {};
    }

    if (auto res = zstd_.decompress_into(compressed, out); !res) {
        return std::unexpected(CodecError::from_string(res.error(), ErrorCode::DecompressionFailure));
    }
    return {};
}

std::expected<memory::byte_vector, CodecError> BlockedChunkCodec::encode_blocked(std::span<const std::byte> chunk,
                                                                                 const BlockCompressor compressor,
                                                                                 const ChunkGeometry& geometry,
                                                                                 const bool record_dimensions) {
    const auto grid = geometry::block_grid(geometry.chunk_shape, geometry.block_shape);
    const auto nblocks = grid.product();
    const auto block_nbytes = geometry.full_block_nbytes();
    if (nblocks > std::numeric_limits<uint32_t>::max() || block_nbytes > std::numeric_limits<uint32_t>::max()) {
        return std::unexpected(CodecError{ErrorCode::InvalidBlockShape,
                                          std::format("{} blocks of {} bytes do not fit a frame.", nblocks, block_nbytes)});
    }

    BlockFrameInfo info;
    info.compressor = compressor;
    info.typesize = static_cast<uint32_t>(geometry.element_size);
    info.nblocks = static_cast<uint32_t>(nblocks);
    info.chunk_nbytes = geometry.chunk_nbytes();
    info.block_nbytes = static_cast<uint32_t>(block_nbytes);
    if (record_dimensions) {
        info.chunk_shape = geometry.chunk_shape;
        info.block_shape = geometry.block_shape;
    }

    memory::byte_vector frame;
    frame.reserve(BLOCK_FRAME_FIXED_HEADER_SIZE + chunk.size() / 2);
    write_block_frame_header(info, frame);
    const size_t table_offset = frame.size();
    frame.resize(table_offset + (static_cast<size_t>(nblocks) + 1) * sizeof(uint64_t));

    auto write_offset = [&](const int64_t slot, const uint64_t value) {
        std::memcpy(frame.data() + table_offset + static_cast<size_t>(slot) * sizeof(uint64_t), &value, sizeof(value));
    };

    const geometry::GridRange blocks(Coords(grid.size(), 0), grid);
    int64_t slot = 0;
    for (const auto& block_index : blocks) {
        const auto extent = geometry::block_extent(block_index, geometry.block_shape, geometry.chunk_shape);
        const auto block_shape = extent.extent();
        auto block = memory::reuse_scratch(scratch_, static_cast<size_t>(block_shape.product()) * geometry.element_size);
        geometry::copy_strided(chunk, geometry::StridedView(geometry.chunk_shape, extent.start),
                               block, geometry::StridedView(block_shape, Coords(block_shape.size(), 0)),
                               block_shape, geometry.element_size);

        write_offset(slot++, frame.size());
        if (compressor == BlockCompressor::NONE) {
            frame.insert(frame.end(), block.begin(), block.end());
            continue;
        }
        auto compressed = zstd_.compress(block);
        if (!compressed) {
            return std::unexpected(CodecError::from_string(compressed.error(), ErrorCode::CompressionFailure));
        }
        frame.insert(frame.end(), compressed->begin(), compressed->end());
    }
    write_offset(slot, frame.size());
    return frame;
}

std::expected<memory::byte_vector, CodecError> BlockedChunkCodec::decode_blocked(std::span<const std::byte> frame,
                                                                                 const ChunkGeometry& geometry) {
    auto info = read_frame_info(frame);
    if (!info) {
        return std::unexpected(info.error());
    }

    // Prefer the frame's own block shape; fall back to the caller's when the frame has none.
    ChunkGeometry frame_geometry = geometry;
    auto recorded = frame_block_shape(*info, geometry.element_size, geometry.chunk_shape.size());
    if (!recorded) {
        return std::unexpected(recorded.error());
    }
    if (*recorded) {
        frame_geometry.block_shape = **recorded;
    }
    if (auto res = validate_geometry(frame_geometry); !res) {
        return std::unexpected(res.error());
    }
    if (auto res = check_frame_geometry(*info, frame_geometry); !res) {
        return std::unexpected(res.error());
    }

    memory::byte_vector chunk(frame_geometry.chunk_nbytes());
    memory::byte_vector block_buffer;
    const auto grid = geometry::block_grid(frame_geometry.chunk_shape, frame_geometry.block_shape);
    const geometry::GridRange blocks(Coords(grid.size(), 0), grid);
    int64_t slot = 0;
    for (const auto& block_index : blocks) {
        const auto extent = geometry::block_extent(block_index, frame_geometry.block_shape, frame_geometry.chunk_shape);
        const auto block_shape = extent.extent();
        auto block = memory::reuse_scratch(block_buffer, static_cast<size_t>(block_shape.product()) * geometry.element_size);
        if (auto res = decompress_block_into(frame, *info, slot++, block); !res) {
            return std::unexpected(res.error());
        }
        geometry::copy_strided(block, geometry::StridedView(block_shape, Coords(block_shape.size(), 0)),
                               chunk, geometry::StridedView(frame_geometry.chunk_shape, extent.start),
                               block_shape, geometry.element_size);
    }
    return chunk;
}

} // namespace chunkslice
