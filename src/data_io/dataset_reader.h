#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "../file_format/dataset_format.h"
#include "../file_format/dataset_metadata.h"
#include "../storage/i_storage_backend.h"
#include "dataset_store.h"

namespace chunkslice {

/**
 * @brief Dataset store over a file written by DatasetWriter.
 *
 * Backend access is serialized, so one reader can serve concurrent read requests.
 */
class DatasetReader final : public IDatasetStore {
    using IStorageBackend = storage::IStorageBackend;

    std::unique_ptr<IStorageBackend> backend_;
    FileHeader file_header_;
    DatasetDescriptor descriptor_;
    ChunkIndexBlock index_;
    memory::byte_vector user_metadata_;
    uint64_t index_offset_ = 0;
    std::mutex backend_mutex_;

    std::expected<uint64_t, StoreError> record_offset(const Coords& chunk_index) const;
    std::expected<ChunkRecord, StoreError> read_record_header_locked(const Coords& chunk_index, uint64_t offset);

public:
    struct Create {
    private:
        Create() = default;
        friend class DatasetReader;
    };

    /** @throws std::runtime_error if the header, metadata or chunk index is invalid. */
    DatasetReader(Create, std::unique_ptr<IStorageBackend>&& backend);

    static std::expected<std::unique_ptr<DatasetReader>, std::string> open(const std::filesystem::path& filepath);
    static std::expected<std::unique_ptr<DatasetReader>, std::string> open_in_memory(std::unique_ptr<IStorageBackend> backend);

    [[nodiscard]] const DatasetDescriptor& descriptor() const override { return descriptor_; }
    [[nodiscard]] const FileHeader& file_header() const { return file_header_; }
    /** @brief The user metadata, decompressed. */
    [[nodiscard]] const memory::byte_vector& user_metadata() const { return user_metadata_; }
    [[nodiscard]] uint64_t index_offset() const { return index_offset_; }
    [[nodiscard]] size_t num_chunks_written() const;
    [[nodiscard]] bool has_chunk(const Coords& chunk_index) const;

    std::expected<ChunkLayout, StoreError> get_chunk_layout(const Coords& chunk_index) override;
    std::expected<memory::byte_vector, StoreError> get_raw_chunk_bytes(const Coords& chunk_index) override;

    /** @brief The full record of a chunk, payload included and hash verified. */
    std::expected<ChunkRecord, StoreError> get_chunk_record(const Coords& chunk_index);
};

} // namespace chunkslice
