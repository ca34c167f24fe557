#include "dataset_writer.h"

#include "../geometry/grid.h"
#include "../geometry/strided_copy.h"
#include "../logging/logger.h"
#include "../storage/file_backend.h"
#include "../storage/memory_backend.h"
#include "byte_order.h"

#include <algorithm>
#include <format>
#include <memory>
#include <stdexcept>

namespace chunkslice {

DatasetDescriptor DatasetSpec::descriptor() const {
    DatasetDescriptor d;
    d.shape = shape;
    d.chunk_shape = chunk_shape;
    d.block_shape = block_shape;
    d.dtype = dtype;
    d.element_size = element_size != 0 ? element_size : get_dtype_size(dtype);
    d.byte_order = byte_order;
    d.codec = codec;
    d.block_shape_recorded = record_block_shape;
    return d;
}

namespace {

std::expected<DatasetDescriptor, std::string> validated_descriptor(const DatasetSpec& spec) {
    auto descriptor = spec.descriptor();
    if (auto res = descriptor.validate(); !res) {
        return std::unexpected("Invalid dataset spec: " + res.error());
    }
    if (!ZstdCompressor::is_valid_level(spec.zstd_level)) {
        return std::unexpected(std::format("Invalid zstd level {}.", spec.zstd_level));
    }
    return descriptor;
}

} // namespace

DatasetWriter::DatasetWriter(Create, std::unique_ptr<IStorageBackend>&& backend, const DatasetDescriptor& descriptor,
                             const int zstd_level, std::span<const std::byte> user_metadata)
    : backend_(std::move(backend)), descriptor_(descriptor),
      index_(static_cast<size_t>(descriptor.num_chunks())), codec_(zstd_level) {
    if (auto res = write_header_and_index(user_metadata); !res) {
        throw std::runtime_error("Failed to initialize DatasetWriter: " + res.error());
    }
}

std::expected<void, std::string> DatasetWriter::write_header_and_index(std::span<const std::byte> user_metadata) {
    if (auto res = backend_->rewind(); !res) return res;

    auto internal_meta = metadata_compressor_.compress(serialize_descriptor(descriptor_));
    if (!internal_meta) return std::unexpected("Failed to compress internal metadata: " + internal_meta.error());
    file_header_.set_internal_metadata(std::move(*internal_meta));

    auto user_meta = metadata_compressor_.compress(user_metadata);
    if (!user_meta) return std::unexpected("Failed to compress user metadata: " + user_meta.error());
    file_header_.set_user_metadata(std::move(*user_meta));

    if (auto res = file_header_.write(*backend_); !res) return res;

    auto pos = backend_->tell();
    if (!pos) return std::unexpected(pos.error());
    index_offset_ = *pos;
    return index_.write(*backend_);
}

std::expected<std::unique_ptr<DatasetWriter>, std::string> DatasetWriter::create_new(const std::filesystem::path& filepath,
                                                                                     const DatasetSpec& spec,
                                                                                     std::span<const std::byte> user_metadata) {
    if (std::filesystem::exists(filepath)) {
        return std::unexpected("File already exists: " + filepath.string());
    }
    auto descriptor = validated_descriptor(spec);
    if (!descriptor) return std::unexpected(descriptor.error());
    try {
        auto backend = std::make_unique<storage::FileBackend>(filepath, std::ios_base::in | std::ios_base::out |
                                                                            std::ios_base::binary | std::ios_base::trunc);
        return std::make_unique<DatasetWriter>(Create{}, std::move(backend), *descriptor, spec.zstd_level, user_metadata);
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to create new file '{}': {}", filepath.string(), e.what()));
    }
}

std::expected<std::unique_ptr<DatasetWriter>, std::string> DatasetWriter::create_in_memory(const DatasetSpec& spec,
                                                                                           std::span<const std::byte> user_metadata) {
    auto descriptor = validated_descriptor(spec);
    if (!descriptor) return std::unexpected(descriptor.error());
    try {
        auto backend = std::make_unique<storage::MemoryBackend>();
        return std::make_unique<DatasetWriter>(Create{}, std::move(backend), *descriptor, spec.zstd_level, user_metadata);
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to create in-memory writer: {}", e.what()));
    }
}

std::expected<void, std::string> DatasetWriter::write_chunk(const Coords& chunk_index, std::span<const std::byte> chunk) {
    if (!backend_) {
        return std::unexpected("Writer backend was released.");
    }
    const auto grid = descriptor_.chunks();
    if (chunk_index.size() != grid.size()) {
        return std::unexpected(std::format("Chunk index {} has the wrong dimensionality for grid {}.", chunk_index, grid));
    }
    for (size_t i = 0; i < grid.size(); ++i) {
        if (chunk_index[i] < 0 || chunk_index[i] >= grid[i]) {
            return std::unexpected(std::format("Chunk index {} is outside the chunk grid {}.", chunk_index, grid));
        }
    }
    if (chunk.size() != descriptor_.chunk_nbytes()) {
        return std::unexpected(std::format("Chunk holds {} bytes, expected {}.", chunk.size(), descriptor_.chunk_nbytes()));
    }

    std::span<const std::byte> to_encode = chunk;
    memory::byte_vector swapped;
    if (needs_byte_swap(descriptor_.dtype, descriptor_.byte_order)) {
        swapped.assign(chunk.begin(), chunk.end());
        byteswap_elements(swapped, descriptor_.element_size);
        to_encode = swapped;
    }

    const ChunkGeometry geometry{descriptor_.chunk_shape, descriptor_.block_shape, descriptor_.element_size};
    auto payload = codec_.encode_chunk(to_encode, descriptor_.codec, geometry, descriptor_.block_shape_recorded);
    if (!payload) {
        return std::unexpected(std::format("Failed to encode chunk {}: {}", chunk_index, payload.error()));
    }

    uint64_t flags = descriptor_.byte_order == ByteOrder::BIG ? STORED_BIG_ENDIAN : STORED_LITTLE_ENDIAN;
    if (descriptor_.block_shape_recorded && codec_supports_block_access(descriptor_.codec)) {
        flags |= BLOCK_SHAPE_RECORDED;
    }

    ChunkRecord record;
    record.set_codec(descriptor_.codec);
    record.set_dtype(descriptor_.dtype);
    record.set_flags(flags);
    record.set_coords(memory::vector<int64_t>(chunk_index.begin(), chunk_index.end()));
    record.set_payload(std::move(*payload));

    auto end = backend_->size();
    if (!end) return std::unexpected(end.error());
    if (auto res = backend_->seek(*end); !res) return res;
    if (auto res = record.write(*backend_); !res) {
        return std::unexpected(std::format("Failed to write chunk {}: {}", chunk_index, res.error()));
    }

    const auto slot = static_cast<size_t>(geometry::linear_index(chunk_index, grid));
    if (index_.offset(slot) == 0) {
        ++chunks_written_;
    } else {
        log::logger()->debug("Chunk {} rewritten, previous record at {} is orphaned.", chunk_index.to_string(), index_.offset(slot));
    }
    index_.set_offset(slot, *end);
    return {};
}

std::expected<size_t, std::string> DatasetWriter::write_array(std::span<const std::byte> array) {
    const auto expected_size = static_cast<size_t>(descriptor_.shape.product()) * descriptor_.element_size;
    if (array.size() != expected_size) {
        return std::unexpected(std::format("Array holds {} bytes, shape {} needs {}.", array.size(), descriptor_.shape, expected_size));
    }

    const auto grid = descriptor_.chunks();
    const size_t ndim = descriptor_.ndim();
    memory::byte_vector chunk(descriptor_.chunk_nbytes());
    size_t written = 0;
    for (const auto& chunk_index : geometry::GridRange(Coords(ndim, 0), grid)) {
        const auto extent = geometry::chunk_extent(chunk_index, descriptor_.chunk_shape, descriptor_.shape);
        std::ranges::fill(chunk, std::byte{0});
        geometry::copy_strided(array, geometry::StridedView(descriptor_.shape, extent.start),
                               chunk, geometry::StridedView(descriptor_.chunk_shape, Coords(ndim, 0)),
                               extent.extent(), descriptor_.element_size);
        if (auto res = write_chunk(chunk_index, chunk); !res) {
            return std::unexpected(res.error());
        }
        ++written;
    }
    return written;
}

std::expected<void, std::string> DatasetWriter::set_user_metadata(std::span<const std::byte> user_metadata) {
    if (!backend_) {
        return std::unexpected("Writer backend was released.");
    }
    if (chunks_written_ > 0) {
        return std::unexpected("User metadata can only be set before any chunks are written.");
    }
    return write_header_and_index(user_metadata);
}

std::expected<void, std::string> DatasetWriter::flush() {
    if (!backend_) {
        return std::unexpected("Writer backend was released.");
    }
    if (auto res = backend_->seek(index_offset_); !res) return res;
    if (auto res = index_.write(*backend_); !res) return res;
    return backend_->flush();
}

std::expected<std::unique_ptr<storage::IStorageBackend>, std::string> DatasetWriter::release_backend() {
    if (auto res = flush(); !res) {
        backend_.reset();
        return std::unexpected(res.error());
    }
    return std::move(backend_);
}

} // namespace chunkslice
