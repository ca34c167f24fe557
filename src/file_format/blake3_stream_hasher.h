#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>

namespace chunkslice
{

    using blake3_hash256_t = std::array<uint64_t, 4>;

    /**
     * @brief A stateful C++ wrapper for the blake3 streaming hash API.
     */
    class Blake3StreamHasher
    {
    public:
        Blake3StreamHasher();
        ~Blake3StreamHasher();
        Blake3StreamHasher(Blake3StreamHasher&&) noexcept;
        Blake3StreamHasher& operator=(Blake3StreamHasher&&) noexcept;

        // Resets the hasher to its initial state, allowing it to be reused.
        void reset();

        template <typename T>
        void update(std::span<const T> data)
        {
            update_bytes({reinterpret_cast<const std::byte*>(data.data()), data.size_bytes()});
        }

        void update_bytes(std::span<const std::byte> data);

        /** @brief Finalizes the hash into 256 bits. The hasher can keep receiving data afterwards. */
        [[nodiscard]] blake3_hash256_t finalize_256() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> pimpl_;
    };

    /** @brief One-shot 256-bit BLAKE3 hash of a byte range. */
    [[nodiscard]] blake3_hash256_t calculate_blake3_hash256(std::span<const std::byte> data);

} // namespace chunkslice
