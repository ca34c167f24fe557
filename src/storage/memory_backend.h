#pragma once

#include "i_storage_backend.h"
#include "../memory/allocator.h"

namespace chunkslice::storage {

// In-memory storage backend
class MemoryBackend final : public IStorageBackend {
private:
    memory::byte_vector buffer_;
    uint64_t current_pos_ = 0;

public:
    explicit MemoryBackend(size_t initial_capacity = 0);
    /** @brief Wraps existing bytes, positioned at the start. */
    explicit MemoryBackend(memory::byte_vector contents);

    std::expected<size_t, std::string> read(std::span<std::byte> buffer) override;
    std::expected<size_t, std::string> write(std::span<const std::byte> data) override;
    std::expected<void, std::string> seek(uint64_t offset) override;
    std::expected<uint64_t, std::string> tell() override;
    std::expected<void, std::string> flush() override;
    std::expected<void, std::string> rewind() override;
    [[nodiscard]] std::expected<uint64_t, std::string> size() override;

    [[nodiscard]] std::span<const std::byte> contents() const { return buffer_; }
    /** @brief Mutable access to the stored bytes, used to simulate on-disk corruption. */
    [[nodiscard]] std::span<std::byte> mutable_contents() { return buffer_; }
};

} // namespace chunkslice::storage
