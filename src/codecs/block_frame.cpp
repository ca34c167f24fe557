#include "block_frame.h"
#include "../file_format/serialization_helpers.h"

#include <format>

namespace chunkslice {

using serialization::append_pod;
using serialization::read_pod_at;

namespace {

CodecError header_error(const std::string& what) {
    return {ErrorCode::InvalidFrameHeader, what};
}

} // namespace

std::expected<BlockFrameInfo, CodecError> parse_block_frame_header(std::span<const std::byte> header_bytes,
                                                                  const uint64_t frame_size) {
    BlockFrameInfo info;
    size_t cursor = 0;

    auto magic = read_pod_at<uint32_t>(header_bytes, cursor);
    if (!magic) return std::unexpected(header_error(magic.error()));
    if (*magic != BLOCK_FRAME_MAGIC) {
        return std::unexpected(header_error(std::format("Unknown frame magic 0x{:08X}.", *magic)));
    }

    auto version = read_pod_at<uint8_t>(header_bytes, cursor);
    if (!version) return std::unexpected(header_error(version.error()));
    if (*version != BLOCK_FRAME_VERSION) {
        return std::unexpected(CodecError{ErrorCode::UnsupportedFrameVersion, std::format("Frame version {}.", *version)});
    }
    info.version = *version;

    auto flags = read_pod_at<uint8_t>(header_bytes, cursor);
    auto compressor = read_pod_at<uint16_t>(header_bytes, cursor);
    auto typesize = read_pod_at<uint32_t>(header_bytes, cursor);
    auto nblocks = read_pod_at<uint32_t>(header_bytes, cursor);
    auto chunk_nbytes = read_pod_at<uint64_t>(header_bytes, cursor);
    auto block_nbytes = read_pod_at<uint32_t>(header_bytes, cursor);
    auto ndim = read_pod_at<uint8_t>(header_bytes, cursor);
    if (!flags || !compressor || !typesize || !nblocks || !chunk_nbytes || !block_nbytes || !ndim) {
        return std::unexpected(header_error(std::format("Truncated frame header ({} bytes).", header_bytes.size())));
    }

    if (*compressor != static_cast<uint16_t>(BlockCompressor::NONE) &&
        *compressor != static_cast<uint16_t>(BlockCompressor::ZSTD)) {
        return std::unexpected(header_error(std::format("Unknown block compressor {}.", *compressor)));
    }
    info.compressor = static_cast<BlockCompressor>(*compressor);
    info.typesize = *typesize;
    info.nblocks = *nblocks;
    info.chunk_nbytes = *chunk_nbytes;
    info.block_nbytes = *block_nbytes;

    if (info.typesize == 0 || info.block_nbytes == 0 || info.nblocks == 0) {
        return std::unexpected(header_error("Zero typesize, block size or block count."));
    }
    if (info.block_nbytes % info.typesize != 0 || info.chunk_nbytes % info.typesize != 0) {
        return std::unexpected(CodecError{ErrorCode::InvalidDataSize,
                                          std::format("Block size {} or chunk size {} is not a multiple of typesize {}.",
                                                      info.block_nbytes, info.chunk_nbytes, info.typesize)});
    }

    if (*flags & HAS_DIMENSIONS) {
        if (*ndim == 0 || *ndim > MAX_DIMENSIONS) {
            return std::unexpected(header_error(std::format("Frame records {} dimensions.", *ndim)));
        }
        Coords chunk_shape(*ndim);
        Coords block_shape(*ndim);
        for (size_t i = 0; i < *ndim; ++i) {
            auto v = read_pod_at<int64_t>(header_bytes, cursor);
            if (!v) return std::unexpected(header_error(v.error()));
            chunk_shape[i] = *v;
        }
        for (size_t i = 0; i < *ndim; ++i) {
            auto v = read_pod_at<int64_t>(header_bytes, cursor);
            if (!v) return std::unexpected(header_error(v.error()));
            block_shape[i] = *v;
        }
        for (size_t i = 0; i < *ndim; ++i) {
            if (block_shape[i] < 1 || block_shape[i] > chunk_shape[i]) {
                return std::unexpected(CodecError{ErrorCode::InvalidBlockShape,
                                                  std::format("Recorded block shape {} does not fit chunk shape {}.",
                                                              block_shape, chunk_shape)});
            }
        }
        info.chunk_shape = chunk_shape;
        info.block_shape = block_shape;
    }

    info.table_offset = cursor;
    const uint64_t table_end = info.table_offset + (static_cast<uint64_t>(info.nblocks) + 1) * sizeof(uint64_t);
    if (table_end > frame_size) {
        return std::unexpected(header_error(std::format("Offset table ends at {} past the frame end {}.", table_end, frame_size)));
    }
    return info;
}

void write_block_frame_header(const BlockFrameInfo& info, memory::byte_vector& out) {
    append_pod(out, BLOCK_FRAME_MAGIC);
    append_pod(out, info.version);
    append_pod(out, static_cast<uint8_t>(info.has_dimensions() ? HAS_DIMENSIONS : 0));
    append_pod(out, static_cast<uint16_t>(info.compressor));
    append_pod(out, info.typesize);
    append_pod(out, info.nblocks);
    append_pod(out, info.chunk_nbytes);
    append_pod(out, info.block_nbytes);
    if (info.has_dimensions()) {
        append_pod(out, static_cast<uint8_t>(info.chunk_shape->size()));
        for (const auto v : *info.chunk_shape) append_pod(out, v);
        for (const auto v : *info.block_shape) append_pod(out, v);
    } else {
        append_pod(out, static_cast<uint8_t>(0));
    }
}

std::expected<std::optional<Coords>, CodecError> frame_block_shape(const BlockFrameInfo& info, const size_t element_size,
                                                                 const size_t ndim) {
    if (info.typesize != element_size) {
        return std::unexpected(CodecError{ErrorCode::InvalidDataSize,
                                          std::format("Frame typesize {} differs from element size {}.", info.typesize, element_size)});
    }
    if (info.has_dimensions()) {
        return info.block_shape;
    }
    if (ndim == 1) {
        return Coords{static_cast<int64_t>(info.block_nbytes / element_size)};
    }
    return std::optional<Coords>{};
}

} // namespace chunkslice
