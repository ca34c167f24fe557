#include "file_backend.h"
#include <limits>
#include <stdexcept>

namespace chunkslice::storage {

FileBackend::FileBackend(std::filesystem::path filepath, std::ios_base::openmode mode)
    : filepath_(std::move(filepath)), writable_((mode & std::ios::out) != 0) {

    // `std::fstream` with `std::ios::in` will not create a missing file.
    if (writable_ && !std::filesystem::exists(filepath_)) {
        std::ofstream creator(filepath_, std::ios::binary);
        if (!creator) {
            throw std::runtime_error("FileBackend: Failed to create file: " + filepath_.string());
        }
    }

    if (writable_ && !(mode & std::ios::in)) {
        mode |= std::ios::trunc;
    }

    file_.open(filepath_, mode);
    if (!file_.is_open()) {
        throw std::runtime_error("Failed to open file: " + filepath_.string());
    }
}

FileBackend::~FileBackend() {
    if (file_.is_open()) {
        file_.close();
    }
}

std::expected<size_t, std::string> FileBackend::read(std::span<std::byte> buffer) {
    if (file_.bad()) {
        return std::unexpected("File stream is in a bad state before read operation.");
    }
    if (buffer.size() > static_cast<size_t>(std::numeric_limits<std::streamsize>::max())) {
        return std::unexpected("Read buffer size is too large for fstream operation.");
    }
    // A previous short read leaves eof/fail set, which is not an error for us.
    file_.clear();
    file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (file_.bad()) {
        return std::unexpected("File stream is in a bad state after read operation.");
    }
    return static_cast<size_t>(file_.gcount());
}

std::expected<size_t, std::string> FileBackend::write(std::span<const std::byte> data) {
    if (!writable_) {
        return std::unexpected("File was opened read-only: " + filepath_.string());
    }
    if (file_.fail() || file_.bad()) {
        return std::unexpected("File stream is in a bad state before write operation.");
    }
    if (data.size() > static_cast<size_t>(std::numeric_limits<std::streamsize>::max())) {
        return std::unexpected("Write data size is too large for fstream operation.");
    }
    file_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file_.good()) {
        return std::unexpected("Failed to write data to file.");
    }
    return data.size();
}

std::expected<void, std::string> FileBackend::seek(uint64_t offset) {
    if (offset > static_cast<uint64_t>(std::numeric_limits<off_type>::max())) {
        return std::unexpected("File offset is too large for fstream.");
    }

    // Writers may seek past the end to reserve space (MemoryBackend does the same).
    if (writable_) {
        auto current_size_res = size();
        if (!current_size_res) {
            return std::unexpected("Failed to get current size before seek: " + current_size_res.error());
        }
        if (offset > *current_size_res) {
            std::error_code ec;
            std::filesystem::resize_file(filepath_, offset, ec);
            if (ec) {
                return std::unexpected("Failed to resize file on seek: " + ec.message());
            }
        }
    }

    file_.clear();
    const auto signed_offset = static_cast<off_type>(offset);
    file_.seekg(signed_offset);
    if (writable_) {
        file_.seekp(signed_offset);
    }
    if (!file_.good()) {
        return std::unexpected(std::format("Failed to seek to offset {}.", offset));
    }
    return {};
}

std::expected<uint64_t, std::string> FileBackend::tell() {
    auto pos = file_.tellg();
    if (pos == -1) {
        pos = file_.tellp();
        if (pos == -1) {
            return std::unexpected("Failed to get current file position from both get and put pointers.");
        }
    }
    return static_cast<uint64_t>(pos);
}

std::expected<void, std::string> FileBackend::flush() {
    file_.flush();
    if (!file_.good()) {
        return std::unexpected("Failed to flush file stream.");
    }
    return {};
}

std::expected<void, std::string> FileBackend::rewind() {
    file_.clear();
    file_.seekg(0);
    if (writable_) {
        file_.seekp(0);
    }
    if (!file_.good()) {
        return std::unexpected("Failed to rewind file stream.");
    }
    return {};
}

std::expected<uint64_t, std::string> FileBackend::size() {
    if (writable_) {
        // Pending writes must hit the disk before asking the filesystem.
        file_.flush();
        if (!file_.good()) {
            return std::unexpected("File stream in bad state before getting size.");
        }
    }

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(filepath_, ec);
    if (ec) {
        return std::unexpected("Failed to get file size: " + ec.message());
    }
    return file_size;
}

} // namespace chunkslice::storage
