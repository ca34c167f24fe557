#pragma once

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>

#include "../data_io/dataset_store.h"
#include "../data_io/read_errors.h"
#include "slice_request.h"

namespace chunkslice {

/// Counters of how requests were served, for diagnostics and tests.
struct ReadStatistics {
    std::atomic<uint64_t> optimized_reads{0};
    std::atomic<uint64_t> fallback_reads{0};
    // Optimized reads abandoned after a codec error
    std::atomic<uint64_t> codec_fallbacks{0};
    std::atomic<uint64_t> blocks_decompressed{0};

    void reset() {
        optimized_reads = 0;
        fallback_reads = 0;
        codec_fallbacks = 0;
        blocks_decompressed = 0;
    }
};

/**
 * @brief Strategy reading one request of a store into a caller buffer.
 *
 * `output` must hold the row-major array of `request.output_shape()`.
 */
class IRegionReader {
public:
    virtual ~IRegionReader() = default;

    virtual std::expected<void, ReadError> read_region(const SliceRequest& request, std::span<std::byte> output) = 0;
};

/** @brief Checks a request against the dataset shape and the output size. */
[[nodiscard]] std::expected<void, ReadError> validate_request(const DatasetDescriptor& descriptor, const SliceRequest& request,
                                                              std::span<const std::byte> output);

/// Always decodes whole chunks.
class FilterPipelineRegionReader final : public IRegionReader {
public:
    explicit FilterPipelineRegionReader(std::shared_ptr<IDatasetStore> store);

    std::expected<void, ReadError> read_region(const SliceRequest& request, std::span<std::byte> output) override;

private:
    std::shared_ptr<IDatasetStore> store_;
};

/**
 * @brief Reads through the block-level path whenever it applies.
 *
 * Declined requests and codec errors are served by whole-chunk decoding, so callers
 * only see store failures. Safe to use from several threads.
 */
class OptimizedRegionReader final : public IRegionReader {
public:
    explicit OptimizedRegionReader(std::shared_ptr<IDatasetStore> store);

    std::expected<void, ReadError> read_region(const SliceRequest& request, std::span<std::byte> output) override;

    [[nodiscard]] const ReadStatistics& statistics() const { return statistics_; }
    void reset_statistics() { statistics_.reset(); }

private:
    std::expected<void, ReadError> read_fallback(const SliceRequest& request, std::span<std::byte> output);

    std::shared_ptr<IDatasetStore> store_;
    ReadStatistics statistics_;
};

} // namespace chunkslice
