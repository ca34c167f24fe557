#include "dataset_format.h"
#include "serialization_helpers.h"

#include <format>

namespace chunkslice {

using namespace serialization;

// --- FileHeader ---

std::expected<void, std::string> FileHeader::write(IStorageBackend& backend) const {
    if (auto res = write_pod(backend, magic_); !res) return std::unexpected(res.error());
    if (auto res = write_pod(backend, version_); !res) return std::unexpected(res.error());
    if (auto res = write_blob(backend, internal_metadata_); !res) return std::unexpected(res.error());
    if (auto res = write_blob(backend, user_metadata_); !res) return std::unexpected(res.error());
    return {};
}

std::expected<void, std::string> FileHeader::read(IStorageBackend& backend) {
    auto magic_res = read_pod<uint32_t>(backend);
    if (!magic_res) return std::unexpected(magic_res.error());
    magic_ = *magic_res;
    if (magic_ != CSL_MAGIC) {
        return std::unexpected("Invalid dataset file magic.");
    }

    auto version_res = read_pod<uint16_t>(backend);
    if (!version_res) return std::unexpected(version_res.error());
    version_ = *version_res;
    if (version_ != CSL_VERSION) {
        return std::unexpected(std::format("Unsupported dataset file version {}.", version_));
    }

    auto internal_meta_res = read_blob(backend);
    if (!internal_meta_res) return std::unexpected(internal_meta_res.error());
    internal_metadata_ = std::move(*internal_meta_res);

    auto user_meta_res = read_blob(backend);
    if (!user_meta_res) return std::unexpected(user_meta_res.error());
    user_metadata_ = std::move(*user_meta_res);
    return {};
}

// --- ChunkIndexBlock ---

std::expected<void, std::string> ChunkIndexBlock::write(IStorageBackend& backend) {
    hash_ = calculate_blake3_hash256(std::as_bytes(std::span(offsets_)));
    if (auto res = write_pod(backend, hash_); !res) return std::unexpected(res.error());
    if (auto res = write_vector_pod(backend, std::span<const uint64_t>(offsets_)); !res) return std::unexpected(res.error());
    return {};
}

std::expected<void, std::string> ChunkIndexBlock::read(IStorageBackend& backend) {
    if (auto res = read_pod<blake3_hash256_t>(backend); res) hash_ = *res; else return std::unexpected(res.error());
    if (auto res = read_vector_pod<uint64_t>(backend); res) offsets_ = std::move(*res); else return std::unexpected(res.error());

    if (calculate_blake3_hash256(std::as_bytes(std::span(offsets_))) != hash_) {
        return std::unexpected("Chunk index hash mismatch.");
    }
    return {};
}

// --- ChunkRecord ---

uint64_t ChunkRecord::header_size(const size_t ndim) {
    return sizeof(uint64_t)                       // size
           + sizeof(uint16_t) + sizeof(uint16_t)  // codec, dtype
           + sizeof(blake3_hash256_t)
           + sizeof(uint64_t)                     // flags
           + sizeof(uint32_t) + ndim * sizeof(int64_t)
           + sizeof(uint64_t);                    // payload length
}

void ChunkRecord::set_payload(memory::byte_vector payload) {
    payload_ = std::move(payload);
    payload_size_ = payload_.size();
    hash_ = calculate_blake3_hash256(payload_);
    size_ = header_size(coords_.size()) + payload_size_;
}

bool ChunkRecord::verify_hash() const {
    return calculate_blake3_hash256(payload_) == hash_;
}

std::expected<void, std::string> ChunkRecord::write(IStorageBackend& backend) const {
    if (size_ != header_size(coords_.size()) + payload_.size()) {
        return std::unexpected("Chunk record size is stale, set the payload after the coordinates.");
    }

    size_t bytes_written = 0;
    if (auto res = write_pod(backend, size_); res) bytes_written += *res; else return std::unexpected(res.error());
    if (auto res = write_pod(backend, static_cast<uint16_t>(codec_)); res) bytes_written += *res; else return std::unexpected(res.error());
    if (auto res = write_pod(backend, static_cast<uint16_t>(dtype_)); res) bytes_written += *res; else return std::unexpected(res.error());
    if (auto res = write_pod(backend, hash_); res) bytes_written += *res; else return std::unexpected(res.error());
    if (auto res = write_pod(backend, flags_); res) bytes_written += *res; else return std::unexpected(res.error());
    if (auto res = write_vector_pod(backend, std::span<const int64_t>(coords_)); res) bytes_written += *res; else return std::unexpected(res.error());
    if (auto res = write_blob(backend, payload_); res) bytes_written += *res; else return std::unexpected(res.error());

    if (bytes_written != size_) {
        return std::unexpected("Chunk record size mismatch during write.");
    }
    return {};
}

std::expected<void, std::string> ChunkRecord::read_header(IStorageBackend& backend) {
    if (auto res = read_pod<uint64_t>(backend); res) size_ = *res; else return std::unexpected(res.error());
    if (auto res = read_pod<uint16_t>(backend); res) codec_ = static_cast<ChunkCodec>(*res); else return std::unexpected(res.error());
    if (auto res = read_pod<uint16_t>(backend); res) dtype_ = static_cast<DType>(*res); else return std::unexpected(res.error());
    if (auto res = read_pod<blake3_hash256_t>(backend); res) hash_ = *res; else return std::unexpected(res.error());
    if (auto res = read_pod<uint64_t>(backend); res) flags_ = *res; else return std::unexpected(res.error());
    if (auto res = read_vector_pod<int64_t>(backend); res) coords_ = std::move(*res); else return std::unexpected(res.error());
    if (auto res = read_pod<uint64_t>(backend); res) payload_size_ = *res; else return std::unexpected(res.error());

    if (size_ != header_size(coords_.size()) + payload_size_) {
        return std::unexpected(std::format("Chunk record size mismatch: header says {}, fields add up to {}.",
                                           size_, header_size(coords_.size()) + payload_size_));
    }
    return {};
}

std::expected<void, std::string> ChunkRecord::read(IStorageBackend& backend) {
    if (auto res = read_header(backend); !res) return res;

    payload_.resize(payload_size_);
    if (payload_size_ > 0) {
        auto read_res = backend.read(payload_);
        if (!read_res) return std::unexpected(read_res.error());
        if (*read_res != payload_size_) {
            return std::unexpected("Failed to read complete chunk payload.");
        }
    }
    return {};
}

} // namespace chunkslice
