#include "dataset_reader.h"

#include "../codecs/block_frame.h"
#include "../codecs/zstd_compressor.h"
#include "../geometry/grid.h"
#include "../logging/logger.h"
#include "../storage/file_backend.h"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace chunkslice {

namespace {

// Enough for the fixed frame header and the largest dimension arrays.
constexpr uint64_t FRAME_HEADER_PEEK_SIZE = BLOCK_FRAME_FIXED_HEADER_SIZE + 2 * MAX_DIMENSIONS * sizeof(int64_t);

} // namespace

DatasetReader::DatasetReader(Create, std::unique_ptr<IStorageBackend>&& backend) : backend_(std::move(backend)) {
    auto init = [this]() -> std::expected<void, std::string> {
        if (auto res = backend_->rewind(); !res) return res;
        if (auto res = file_header_.read(*backend_); !res) return res;

        ZstdCompressor compressor;
        auto internal_meta = compressor.decompress(file_header_.internal_metadata());
        if (!internal_meta) return std::unexpected("Failed to decompress internal metadata: " + internal_meta.error());
        auto descriptor = parse_descriptor(*internal_meta);
        if (!descriptor) return std::unexpected(descriptor.error());
        descriptor_ = std::move(*descriptor);

        auto user_meta = compressor.decompress(file_header_.user_metadata());
        if (!user_meta) return std::unexpected("Failed to decompress user metadata: " + user_meta.error());
        user_metadata_ = std::move(*user_meta);

        auto pos = backend_->tell();
        if (!pos) return std::unexpected(pos.error());
        index_offset_ = *pos;
        if (auto res = index_.read(*backend_); !res) return res;
        if (index_.num_chunks() != static_cast<size_t>(descriptor_.num_chunks())) {
            return std::unexpected(std::format("Chunk index has {} entries, the chunk grid {} needs {}.",
                                               index_.num_chunks(), descriptor_.chunks(), descriptor_.num_chunks()));
        }
        return {};
    }();

    if (!init) {
        throw std::runtime_error(init.error());
    }
}

std::expected<std::unique_ptr<DatasetReader>, std::string> DatasetReader::open(const std::filesystem::path& filepath) {
    if (!std::filesystem::exists(filepath)) {
        return std::unexpected("File does not exist: " + filepath.string());
    }
    try {
        auto backend = std::make_unique<storage::FileBackend>(filepath, std::ios_base::in | std::ios_base::binary);
        return std::make_unique<DatasetReader>(Create{}, std::move(backend));
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to open file '{}': {}", filepath.string(), e.what()));
    }
}

std::expected<std::unique_ptr<DatasetReader>, std::string> DatasetReader::open_in_memory(std::unique_ptr<IStorageBackend> backend) {
    if (!backend) {
        return std::unexpected("Provided backend is null.");
    }
    try {
        return std::make_unique<DatasetReader>(Create{}, std::move(backend));
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to open in-memory reader: {}", e.what()));
    }
}

size_t DatasetReader::num_chunks_written() const {
    return static_cast<size_t>(std::ranges::count_if(index_.offsets(), [](const uint64_t offset) { return offset != 0; }));
}

bool DatasetReader::has_chunk(const Coords& chunk_index) const {
    return record_offset(chunk_index).has_value();
}

std::expected<uint64_t, StoreError> DatasetReader::record_offset(const Coords& chunk_index) const {
    const auto grid = descriptor_.chunks();
    if (chunk_index.size() != grid.size()) {
        return std::unexpected(StoreError(std::format("Chunk index {} has the wrong dimensionality for grid {}.", chunk_index, grid)));
    }
    for (size_t i = 0; i < grid.size(); ++i) {
        if (chunk_index[i] < 0 || chunk_index[i] >= grid[i]) {
            return std::unexpected(StoreError(std::format("Chunk index {} is outside the chunk grid {}.", chunk_index, grid)));
        }
    }
    const auto offset = index_.offset(static_cast<size_t>(geometry::linear_index(chunk_index, grid)));
    if (offset == 0) {
        return std::unexpected(StoreError(std::format("Chunk {} was never written.", chunk_index)));
    }
    return offset;
}

std::expected<ChunkRecord, StoreError> DatasetReader::read_record_header_locked(const Coords& chunk_index, const uint64_t offset) {
    if (auto res = backend_->seek(offset); !res) {
        return std::unexpected(StoreError(std::format("Failed to seek to chunk {}: {}", chunk_index, res.error())));
    }
    ChunkRecord record;
    if (auto res = record.read_header(*backend_); !res) {
        return std::unexpected(StoreError(std::format("Failed to read chunk {} record: {}", chunk_index, res.error())));
    }
    if (!std::ranges::equal(record.coords(), chunk_index.span())) {
        return std::unexpected(StoreError(std::format("Record at offset {} does not belong to chunk {}.", offset, chunk_index)));
    }
    if (record.codec() != descriptor_.codec) {
        return std::unexpected(StoreError(std::format("Chunk {} uses codec {} instead of the dataset codec {}.", chunk_index,
                                                      static_cast<int>(record.codec()), static_cast<int>(descriptor_.codec))));
    }
    return record;
}

std::expected<ChunkLayout, StoreError> DatasetReader::get_chunk_layout(const Coords& chunk_index) {
    auto offset = record_offset(chunk_index);
    if (!offset) return std::unexpected(offset.error());

    std::lock_guard lock(backend_mutex_);
    auto record = read_record_header_locked(chunk_index, *offset);
    if (!record) return std::unexpected(record.error());

    ChunkLayout layout;
    layout.byte_offset = *offset + ChunkRecord::header_size(record->coords().size());
    layout.byte_length = record->payload_size();

    if (codec_supports_block_access(descriptor_.codec)) {
        memory::byte_vector peek(std::min(FRAME_HEADER_PEEK_SIZE, layout.byte_length));
        if (auto res = backend_->read_exact_at(layout.byte_offset, peek); !res) {
            return std::unexpected(StoreError(std::format("Failed to read chunk {} frame header: {}", chunk_index, res.error())));
        }
        // A frame that does not parse is reported by the codec when it is decoded.
        if (auto info = parse_block_frame_header(peek, layout.byte_length); info && info->has_dimensions()) {
            layout.recorded_block_shape = info->block_shape;
        }
    }
    return layout;
}

std::expected<ChunkRecord, StoreError> DatasetReader::get_chunk_record(const Coords& chunk_index) {
    auto offset = record_offset(chunk_index);
    if (!offset) return std::unexpected(offset.error());

    ChunkRecord record;
    {
        std::lock_guard lock(backend_mutex_);
        if (auto res = read_record_header_locked(chunk_index, *offset); !res) {
            return std::unexpected(res.error());
        }
        if (auto res = backend_->seek(*offset); !res) {
            return std::unexpected(StoreError(res.error()));
        }
        if (auto res = record.read(*backend_); !res) {
            return std::unexpected(StoreError(std::format("Failed to read chunk {}: {}", chunk_index, res.error())));
        }
    }

    if (!record.verify_hash()) {
        log::logger()->error("Chunk {} failed its integrity check.", chunk_index.to_string());
        return std::unexpected(StoreError(std::format("Chunk {} payload hash mismatch.", chunk_index)));
    }
    return record;
}

std::expected<memory::byte_vector, StoreError> DatasetReader::get_raw_chunk_bytes(const Coords& chunk_index) {
    auto record = get_chunk_record(chunk_index);
    if (!record) return std::unexpected(record.error());
    return std::move(record->payload());
}

} // namespace chunkslice
