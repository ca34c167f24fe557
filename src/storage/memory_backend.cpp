#include "memory_backend.h"
#include <algorithm>
#include <limits>

namespace chunkslice::storage {

namespace {
    constexpr auto MAX_MEMORY_OFFSET =
        static_cast<uint64_t>(std::numeric_limits<memory::byte_vector::difference_type>::max());
}

MemoryBackend::MemoryBackend(size_t initial_capacity) {
    buffer_.reserve(initial_capacity);
}

MemoryBackend::MemoryBackend(memory::byte_vector contents) : buffer_(std::move(contents)) {}

std::expected<size_t, std::string> MemoryBackend::read(std::span<std::byte> buffer) {
    if (current_pos_ >= buffer_.size()) {
        return 0;
    }
    if (current_pos_ > MAX_MEMORY_OFFSET) {
        return std::unexpected("Memory offset is too large.");
    }
    const size_t actual_bytes_to_read = std::min(buffer.size(), buffer_.size() - current_pos_);
    std::copy_n(buffer_.cbegin() + static_cast<ptrdiff_t>(current_pos_), actual_bytes_to_read, buffer.data());
    current_pos_ += actual_bytes_to_read;
    return actual_bytes_to_read;
}

std::expected<size_t, std::string> MemoryBackend::write(std::span<const std::byte> data) {
    if (current_pos_ > MAX_MEMORY_OFFSET) {
        return std::unexpected("Memory offset is too large.");
    }
    if (current_pos_ + data.size() > buffer_.size()) {
        buffer_.resize(current_pos_ + data.size());
    }
    std::ranges::copy(data, buffer_.begin() + static_cast<ptrdiff_t>(current_pos_));
    current_pos_ += data.size();
    return data.size();
}

std::expected<void, std::string> MemoryBackend::seek(const uint64_t offset) {
    if (offset > MAX_MEMORY_OFFSET) {
        return std::unexpected("Memory offset is too large.");
    }
    // Seeking past the end extends with zeros, like FileBackend does.
    if (offset > buffer_.size()) {
        buffer_.resize(offset);
    }
    current_pos_ = offset;
    return {};
}

std::expected<uint64_t, std::string> MemoryBackend::tell() {
    return current_pos_;
}

std::expected<void, std::string> MemoryBackend::flush() {
    return {};
}

std::expected<void, std::string> MemoryBackend::rewind() {
    current_pos_ = 0;
    return {};
}

std::expected<uint64_t, std::string> MemoryBackend::size() {
    return buffer_.size();
}

} // namespace chunkslice::storage
