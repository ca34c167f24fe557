#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

#include "../codecs/blocked_chunk_codec.h"
#include "../codecs/zstd_compressor.h"
#include "../file_format/dataset_format.h"
#include "../file_format/dataset_metadata.h"
#include "../storage/i_storage_backend.h"

namespace chunkslice {

/**
 * @brief Everything needed to lay out a new dataset.
 *
 * `element_size` may stay 0 for numeric dtypes, it is then taken from the dtype.
 */
struct DatasetSpec {
    Coords shape;
    Coords chunk_shape;
    Coords block_shape;
    DType dtype = DType::FLOAT32;
    size_t element_size = 0;
    ByteOrder byte_order = native_byte_order();
    ChunkCodec codec = ChunkCodec::BLOCKED_ZSTD;
    // Write chunk and block shapes into every frame header
    bool record_block_shape = true;
    int zstd_level = ZstdCompressor::DEFAULT_COMPRESSION_LEVEL;

    [[nodiscard]] DatasetDescriptor descriptor() const;
};

/**
 * @brief Writes a chunked dataset: header, fixed chunk index, then one record per chunk.
 *
 * Input data is always in native byte order; it is swapped when the dataset stores
 * the other order. Rewriting a chunk appends a new record and repoints the index.
 */
class DatasetWriter {
    using IStorageBackend = storage::IStorageBackend;

    std::unique_ptr<IStorageBackend> backend_;
    FileHeader file_header_;
    DatasetDescriptor descriptor_;
    ChunkIndexBlock index_;
    uint64_t index_offset_ = 0;
    size_t chunks_written_ = 0;
    BlockedChunkCodec codec_;
    ZstdCompressor metadata_compressor_;

    std::expected<void, std::string> write_header_and_index(std::span<const std::byte> user_metadata);

public:
    struct Create {
    private:
        Create() = default;
        friend class DatasetWriter;
    };

    /** @throws std::runtime_error if the header cannot be written, std::invalid_argument for an invalid zstd level. */
    DatasetWriter(Create, std::unique_ptr<IStorageBackend>&& backend, const DatasetDescriptor& descriptor, int zstd_level,
                  std::span<const std::byte> user_metadata);

    /** @brief Creates a new dataset file. Fails if the file already exists or the spec is invalid. */
    static std::expected<std::unique_ptr<DatasetWriter>, std::string> create_new(const std::filesystem::path& filepath,
                                                                                 const DatasetSpec& spec,
                                                                                 std::span<const std::byte> user_metadata = {});

    static std::expected<std::unique_ptr<DatasetWriter>, std::string> create_in_memory(const DatasetSpec& spec,
                                                                                       std::span<const std::byte> user_metadata = {});

    [[nodiscard]] const DatasetDescriptor& descriptor() const { return descriptor_; }

    /**
     * @brief Encodes and stores one chunk.
     * @param chunk The chunk at its nominal chunk shape, row-major, edge chunks zero padded.
     */
    std::expected<void, std::string> write_chunk(const Coords& chunk_index, std::span<const std::byte> chunk);

    /**
     * @brief Splits a whole row-major array into chunks and writes all of them.
     * @return The number of chunks written.
     */
    std::expected<size_t, std::string> write_array(std::span<const std::byte> array);

    /** @brief Replaces the user metadata; only possible before any chunk is written. */
    std::expected<void, std::string> set_user_metadata(std::span<const std::byte> user_metadata);

    /** @brief Persists the chunk index and flushes the backend. */
    std::expected<void, std::string> flush();

    /** @brief Flushes and hands the backend over, e.g. to open a reader on an in-memory dataset. */
    [[nodiscard]] std::expected<std::unique_ptr<IStorageBackend>, std::string> release_backend();

    [[nodiscard]] size_t num_chunks_written() const { return chunks_written_; }
};

} // namespace chunkslice
