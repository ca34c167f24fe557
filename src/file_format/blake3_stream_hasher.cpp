#include "blake3_stream_hasher.h"
#include <blake3.h>

namespace chunkslice {

struct Blake3StreamHasher::Impl {
    blake3_hasher hasher_{};

    Impl() { blake3_hasher_init(&hasher_); }
};

Blake3StreamHasher::Blake3StreamHasher() : pimpl_(std::make_unique<Impl>()) {}

Blake3StreamHasher::~Blake3StreamHasher() = default;

Blake3StreamHasher::Blake3StreamHasher(Blake3StreamHasher&&) noexcept = default;

Blake3StreamHasher& Blake3StreamHasher::operator=(Blake3StreamHasher&&) noexcept = default;

void Blake3StreamHasher::reset() {
    blake3_hasher_reset(&pimpl_->hasher_);
}

void Blake3StreamHasher::update_bytes(std::span<const std::byte> data) {
    blake3_hasher_update(&pimpl_->hasher_, data.data(), data.size());
}

blake3_hash256_t Blake3StreamHasher::finalize_256() const {
    blake3_hash256_t hash_u64{};
    blake3_hasher_finalize(&pimpl_->hasher_, reinterpret_cast<uint8_t*>(hash_u64.data()), sizeof(hash_u64));
    return hash_u64;
}

blake3_hash256_t calculate_blake3_hash256(std::span<const std::byte> data) {
    Blake3StreamHasher hasher;
    hasher.update_bytes(data);
    return hasher.finalize_256();
}

} // namespace chunkslice
