#include "region_reader.h"

#include "../logging/logger.h"
#include "block_decompressor.h"
#include "copy_engine.h"
#include "filter_pipeline_reader.h"
#include "optimization_gate.h"
#include "slice_planner.h"

#include <format>
#include <stdexcept>
#include <variant>

namespace chunkslice {

namespace {

ReadError to_read_error(const EngineError& error) {
    return std::visit([](const auto& e) { return ReadError::from(e); }, error);
}

} // namespace

std::expected<void, ReadError> validate_request(const DatasetDescriptor& descriptor, const SliceRequest& request,
                                                std::span<const std::byte> output) {
    const size_t ndim = descriptor.ndim();
    if (request.ndim() != ndim || request.step.size() != ndim) {
        return std::unexpected(ReadError(ReadErrorKind::InvalidSelection,
                                         std::format("Request {} is not {}-dimensional.", request.region, ndim)));
    }
    for (size_t i = 0; i < ndim; ++i) {
        const auto r = request.region.axis(i);
        if (r.start < 0 || r.stop < r.start || r.stop > descriptor.shape[i]) {
            return std::unexpected(ReadError(ReadErrorKind::InvalidSelection,
                                             std::format("Request {} exceeds the dataset shape {}.", request.region, descriptor.shape)));
        }
        if (request.step[i] < 1) {
            return std::unexpected(ReadError(ReadErrorKind::InvalidSelection,
                                             std::format("Step {} must be at least 1 on every axis.", request.step)));
        }
    }
    const auto nbytes = static_cast<size_t>(request.num_elements()) * descriptor.element_size;
    if (output.size() != nbytes) {
        return std::unexpected(ReadError(ReadErrorKind::InvalidOutputBuffer,
                                         std::format("Output buffer has {} bytes, {} are needed.", output.size(), nbytes)));
    }
    return {};
}

// --- FilterPipelineRegionReader ---

FilterPipelineRegionReader::FilterPipelineRegionReader(std::shared_ptr<IDatasetStore> store) : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("FilterPipelineRegionReader needs a store.");
    }
}

std::expected<void, ReadError> FilterPipelineRegionReader::read_region(const SliceRequest& request, std::span<std::byte> output) {
    if (auto res = validate_request(store_->descriptor(), request, output); !res) {
        return res;
    }
    if (auto res = read_via_filter_pipeline(*store_, request, output); !res) {
        return std::unexpected(to_read_error(res.error()));
    }
    return {};
}

// --- OptimizedRegionReader ---

OptimizedRegionReader::OptimizedRegionReader(std::shared_ptr<IDatasetStore> store) : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("OptimizedRegionReader needs a store.");
    }
}

std::expected<void, ReadError> OptimizedRegionReader::read_fallback(const SliceRequest& request, std::span<std::byte> output) {
    ++statistics_.fallback_reads;
    if (auto res = read_via_filter_pipeline(*store_, request, output); !res) {
        const auto error = to_read_error(res.error());
        if (std::holds_alternative<StoreError>(res.error())) {
            log::logger()->error("Reading {} failed: {}", request.region.to_string(), error.message());
        }
        return std::unexpected(error);
    }
    return {};
}

std::expected<void, ReadError> OptimizedRegionReader::read_region(const SliceRequest& request, std::span<std::byte> output) {
    const auto& descriptor = store_->descriptor();
    if (auto res = validate_request(descriptor, request, output); !res) {
        return res;
    }
    if (request.empty()) {
        return {};
    }

    if (auto gate = optimization::check_applicability(descriptor, request); !gate) {
        log::logger()->debug("Whole-chunk read of {}: {}", request.region.to_string(), gate.error().to_string());
        return read_fallback(request, output);
    }
    auto slice_plan = plan(descriptor, request);
    if (!slice_plan) {
        log::logger()->debug("Whole-chunk read of {}: {}", request.region.to_string(), slice_plan.error().to_string());
        return read_fallback(request, output);
    }

    BlockDecompressor adapter(descriptor);
    auto result = execute(*slice_plan, *store_, adapter, output);
    statistics_.blocks_decompressed += adapter.blocks_decompressed();
    if (result) {
        ++statistics_.optimized_reads;
        return {};
    }

    if (const auto* store_error = std::get_if<StoreError>(&result.error())) {
        log::logger()->error("Reading {} failed: {}", request.region.to_string(), store_error->message());
        return std::unexpected(ReadError::from(*store_error));
    }
    log::logger()->warn("Block read of {} failed, decoding whole chunks: {}", request.region.to_string(),
                        std::get<CodecError>(result.error()).to_string());
    ++statistics_.codec_fallbacks;
    return read_fallback(request, output);
}

} // namespace chunkslice
