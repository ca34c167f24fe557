#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <span>
#include <string>

namespace chunkslice::storage {

// Interface for storage backends
class IStorageBackend {
public:
    virtual ~IStorageBackend() = default;

    /** @return The number of bytes read on success. Short reads only happen at the end of storage. */
    virtual std::expected<size_t, std::string> read(std::span<std::byte> buffer) = 0;

    /** @return The number of bytes written on success. */
    virtual std::expected<size_t, std::string> write(std::span<const std::byte> data) = 0;

    /** @return Void on success. */
    virtual std::expected<void, std::string> seek(uint64_t offset) = 0;

    /** @return The current position on success. */
    virtual std::expected<uint64_t, std::string> tell() = 0;

    /** @return Void on success. */
    virtual std::expected<void, std::string> flush() = 0;

    /** @return Void on success. */
    virtual std::expected<void, std::string> rewind() = 0;

    /** @return The total size of the storage on success. */
    [[nodiscard]] virtual std::expected<uint64_t, std::string> size() = 0;

    /**
     * @brief Positioned read of exactly `buffer.size()` bytes.
     *
     * Not atomic: callers sharing a backend between threads must serialize access.
     */
    std::expected<void, std::string> read_exact_at(const uint64_t offset, std::span<std::byte> buffer) {
        if (auto res = seek(offset); !res) {
            return std::unexpected(res.error());
        }
        auto read_res = read(buffer);
        if (!read_res) {
            return std::unexpected(read_res.error());
        }
        if (*read_res != buffer.size()) {
            return std::unexpected(std::format("Short read at offset {}: expected {} bytes, got {}.",
                                               offset, buffer.size(), *read_res));
        }
        return {};
    }
};

} // namespace chunkslice::storage
