#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

#include "../memory/allocator.h"
#include "../storage/i_storage_backend.h"
#include "blake3_stream_hasher.h"

namespace chunkslice {

// --- Constants and Enums ---

constexpr uint32_t CSL_MAGIC = 0x43534C44; // "DLSC" on disk
constexpr uint16_t CSL_VERSION = 1;

/**
 * @brief How a chunk payload is encoded.
 *
 * The blocked codecs split each chunk into independently decodable blocks, the
 * plain ZSTD codec stores one zstd frame per chunk.
 */
enum class ChunkCodec : uint16_t {
    BLOCKED_ZSTD = 1,
    BLOCKED_NONE = 2,
    ZSTD = 3
};

enum class DType : uint16_t {
    FLOAT16 = 0,
    FLOAT32 = 1,
    FLOAT64 = 2,
    INT8 = 3,
    UINT8 = 4,
    INT16 = 5,
    UINT16 = 6,
    INT32 = 7,
    UINT32 = 8,
    INT64 = 9,
    UINT64 = 10,
    BFLOAT16 = 11,
    // Fixed-size records, element size comes from the dataset metadata
    OPAQUE = 12
};

enum class ByteOrder : uint8_t {
    LITTLE = 0,
    BIG = 1
};

enum ChunkFlags : uint64_t {
    NONE = 0,
    STORED_LITTLE_ENDIAN = 1 << 0,
    STORED_BIG_ENDIAN = 1 << 1,
    BLOCK_SHAPE_RECORDED = 1 << 2,
    RESERVED = 1ULL << 63
};

/**
 * @brief Gets the size of a DType in bytes.
 * @return The size in bytes, 0 for OPAQUE whose size is dataset defined.
 */
constexpr size_t get_dtype_size(const DType dtype) {
    switch (dtype) {
        case DType::FLOAT16: case DType::BFLOAT16: return 2;
        case DType::FLOAT32: return 4;
        case DType::FLOAT64: return 8;
        case DType::INT8: case DType::UINT8: return 1;
        case DType::INT16: case DType::UINT16: return 2;
        case DType::INT32: case DType::UINT32: return 4;
        case DType::INT64: case DType::UINT64: return 8;
        case DType::OPAQUE: return 0;
    }
    return 0;
}

constexpr ByteOrder native_byte_order() {
    return std::endian::native == std::endian::big ? ByteOrder::BIG : ByteOrder::LITTLE;
}

constexpr bool codec_supports_block_access(const ChunkCodec codec) {
    return codec == ChunkCodec::BLOCKED_ZSTD || codec == ChunkCodec::BLOCKED_NONE;
}

// --- File Format Structures ---

/**
 * @brief The main header of a dataset file: magic, version, and two metadata blobs.
 *
 * The internal metadata holds the JSON dataset description, the user metadata is opaque.
 */
class FileHeader {
    using IStorageBackend = storage::IStorageBackend;
public:
    [[nodiscard]] uint32_t magic() const { return magic_; }
    [[nodiscard]] uint16_t version() const { return version_; }
    [[nodiscard]] const memory::byte_vector& internal_metadata() const { return internal_metadata_; }
    [[nodiscard]] const memory::byte_vector& user_metadata() const { return user_metadata_; }

    void set_internal_metadata(memory::byte_vector metadata) { internal_metadata_ = std::move(metadata); }
    void set_user_metadata(memory::byte_vector metadata) { user_metadata_ = std::move(metadata); }

    std::expected<void, std::string> write(IStorageBackend& backend) const;
    std::expected<void, std::string> read(IStorageBackend& backend);

private:
    uint32_t magic_ = CSL_MAGIC;
    uint16_t version_ = CSL_VERSION;
    memory::byte_vector internal_metadata_;
    memory::byte_vector user_metadata_;
};

/**
 * @brief Fixed-size table with one record offset per chunk, in row-major chunk order.
 *
 * An offset of 0 marks a chunk that was never written. The table is written right
 * after the header and rewritten in place on flush, so its size never changes.
 */
class ChunkIndexBlock {
    using IStorageBackend = storage::IStorageBackend;
public:
    ChunkIndexBlock() = default;
    explicit ChunkIndexBlock(size_t num_chunks) : offsets_(num_chunks, 0) {}

    [[nodiscard]] static uint64_t serialized_size(size_t num_chunks) {
        return sizeof(blake3_hash256_t) + sizeof(uint32_t) + num_chunks * sizeof(uint64_t);
    }

    [[nodiscard]] size_t num_chunks() const { return offsets_.size(); }
    [[nodiscard]] uint64_t offset(size_t chunk) const { return offsets_.at(chunk); }
    void set_offset(size_t chunk, uint64_t record_offset) { offsets_.at(chunk) = record_offset; }
    [[nodiscard]] const memory::vector<uint64_t>& offsets() const { return offsets_; }
    [[nodiscard]] const blake3_hash256_t& hash() const { return hash_; }

    /** @brief Writes the table, hashing the current offsets. */
    std::expected<void, std::string> write(IStorageBackend& backend);
    /** @brief Reads the table and verifies its hash. */
    std::expected<void, std::string> read(IStorageBackend& backend);

private:
    blake3_hash256_t hash_{};
    memory::vector<uint64_t> offsets_;
};

/**
 * @brief One stored chunk: fixed fields, the chunk grid coordinates, and the encoded payload.
 */
class ChunkRecord {
    using IStorageBackend = storage::IStorageBackend;
public:
    /** @brief Bytes preceding the payload for a record with `ndim` coordinates. */
    [[nodiscard]] static uint64_t header_size(size_t ndim);

    [[nodiscard]] uint64_t size() const { return size_; }
    [[nodiscard]] ChunkCodec codec() const { return codec_; }
    [[nodiscard]] DType dtype() const { return dtype_; }
    [[nodiscard]] const blake3_hash256_t& hash() const { return hash_; }
    [[nodiscard]] uint64_t flags() const { return flags_; }
    [[nodiscard]] const memory::vector<int64_t>& coords() const { return coords_; }
    [[nodiscard]] const memory::byte_vector& payload() const { return payload_; }
    [[nodiscard]] memory::byte_vector& payload() { return payload_; }
    /** @brief Length of the payload, also known after read_header(). */
    [[nodiscard]] uint64_t payload_size() const { return payload_size_; }

    void set_codec(ChunkCodec codec) { codec_ = codec; }
    void set_dtype(DType dtype) { dtype_ = dtype; }
    void set_flags(uint64_t flags) { flags_ = flags; }
    void set_coords(memory::vector<int64_t> coords) { coords_ = std::move(coords); }
    /** @brief Sets the payload and recomputes the record size and payload hash. */
    void set_payload(memory::byte_vector payload);

    [[nodiscard]] bool verify_hash() const;

    std::expected<void, std::string> write(IStorageBackend& backend) const;
    /** @brief Reads the whole record, payload included. */
    std::expected<void, std::string> read(IStorageBackend& backend);
    /** @brief Reads the fields before the payload and leaves the backend at the payload start. */
    std::expected<void, std::string> read_header(IStorageBackend& backend);

private:
    uint64_t size_{};
    ChunkCodec codec_{ChunkCodec::BLOCKED_ZSTD};
    DType dtype_{};
    blake3_hash256_t hash_{};
    uint64_t flags_{};
    memory::vector<int64_t> coords_;
    uint64_t payload_size_{};
    memory::byte_vector payload_;
};

} // namespace chunkslice
