#pragma once

#include "i_compressor.h"
#include <memory>
#include <span>

namespace chunkslice {

class ZstdCompressor final : public ICompressor {
public:
    static constexpr int DEFAULT_COMPRESSION_LEVEL = 1;

    explicit ZstdCompressor(int level = DEFAULT_COMPRESSION_LEVEL);
    ~ZstdCompressor() override;

    ZstdCompressor(const ZstdCompressor&) = delete;
    ZstdCompressor& operator=(const ZstdCompressor&) = delete;
    ZstdCompressor(ZstdCompressor&&) noexcept;
    ZstdCompressor& operator=(ZstdCompressor&&) noexcept;

    [[nodiscard]] int level() const;
    void set_level(int level);

    /** @brief Whether `level` is accepted by the linked zstd. */
    [[nodiscard]] static bool is_valid_level(int level);

protected:
    size_t do_get_compress_bound(std::span<const std::byte> uncompressed_data) override;
    std::expected<size_t, std::string> do_get_decompress_size(std::span<const std::byte> compressed_data) override;
    std::expected<size_t, std::string> do_compress_into(std::span<const std::byte> uncompressed, std::span<std::byte> compressed) override;
    std::expected<size_t, std::string> do_decompress_into(std::span<const std::byte> compressed, std::span<std::byte> decompressed) override;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace chunkslice
