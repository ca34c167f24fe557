#include <functional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

#include "csl_context.h"
#include "../logging/logger.h"
#include "operations/inspect_handler.h"
#include "operations/json_serialization.h"
#include "operations/operation_handler.h"
#include "operations/operation_types.h"
#include "operations/read_region_handler.h"
#include "operations/write_array_handler.h"

namespace chunkslice::ffi {

namespace {

std::expected<DatasetSpec, ExpectedError> to_dataset_spec(const DatasetConfig& cfg) {
    const auto make_coords = [](const std::vector<int64_t>& values, const char* name) -> std::expected<Coords, ExpectedError> {
        if (values.size() > MAX_DIMENSIONS) {
            return std::unexpected(ExpectedError(std::string(name) + " has too many dimensions.", ContextErrorKind::InvalidConfig));
        }
        return Coords(std::span<const int64_t>(values));
    };
    auto shape = make_coords(cfg.shape, "shape");
    if (!shape) return std::unexpected(shape.error());
    auto chunk_shape = make_coords(cfg.chunk_shape, "chunk_shape");
    if (!chunk_shape) return std::unexpected(chunk_shape.error());
    auto block_shape = make_coords(cfg.block_shape, "block_shape");
    if (!block_shape) return std::unexpected(block_shape.error());

    DatasetSpec spec;
    spec.shape = *shape;
    spec.chunk_shape = *chunk_shape;
    spec.block_shape = *block_shape;
    spec.dtype = cfg.dtype;
    spec.element_size = cfg.element_size;
    spec.byte_order = cfg.byte_order.value_or(native_byte_order());
    spec.codec = cfg.codec;
    spec.record_block_shape = cfg.record_block_shape;
    if (cfg.zstd_level) {
        spec.zstd_level = *cfg.zstd_level;
    }
    return spec;
}

} // namespace

CslContext::CslContext(
    ProtectedMarker,
    std::shared_ptr<DatasetReader> reader,
    const ReadStrategy strategy,
    std::unique_ptr<DatasetWriter>&& writer,
    std::string backend_type,
    std::string mode
) : reader_(std::move(reader)), writer_(std::move(writer)),
    backend_type_(std::move(backend_type)), mode_(std::move(mode)) {
    if (reader_) {
        dataset_ = std::make_unique<Dataset>(reader_, strategy);
    }
}

CslContext::~CslContext() {
    if (writer_) {
        if (auto flushed = writer_->flush(); !flushed)
        {
            log::logger()->error("Error flushing dataset: {}", flushed.error());
        }
    }
}

std::expected<std::unique_ptr<CslContext>, ExpectedError> CslContext::create(const nlohmann::json& config_json) {
    auto config_result = from_json<ContextConfig>(config_json);
    if (!config_result) {
        return std::unexpected(config_result.error());
    }
    const auto& config = *config_result;
    const auto& backend_config = config.backend;

    std::shared_ptr<DatasetReader> reader;
    std::unique_ptr<DatasetWriter> writer;

    if (backend_config.mode == "Read") {
        if (backend_config.type != "File") {
            return std::unexpected(ExpectedError("Read mode only supports the File backend.", ContextErrorKind::InvalidConfig));
        }
        if (!backend_config.path) {
            return std::unexpected(ExpectedError("File backend in Read mode requires a 'path'.", ContextErrorKind::InvalidConfig));
        }
        auto reader_result = DatasetReader::open(*backend_config.path);
        if (!reader_result) {
            return std::unexpected(ExpectedError(reader_result.error(), ContextErrorKind::ResourceUnavailable));
        }
        reader = std::move(*reader_result);
    } else if (backend_config.mode == "Write") {
        if (!config.dataset) {
            return std::unexpected(ExpectedError("Write mode requires a 'dataset' description.", ContextErrorKind::InvalidConfig));
        }
        auto spec = to_dataset_spec(*config.dataset);
        if (!spec) {
            return std::unexpected(spec.error());
        }
        const auto user_metadata = std::as_bytes(std::span(config.user_metadata));

        std::expected<std::unique_ptr<DatasetWriter>, std::string> writer_result;
        if (backend_config.type == "File") {
            if (!backend_config.path) {
                return std::unexpected(ExpectedError("File backend requires a 'path'.", ContextErrorKind::InvalidConfig));
            }
            writer_result = DatasetWriter::create_new(*backend_config.path, *spec, user_metadata);
        } else if (backend_config.type == "Memory") {
            writer_result = DatasetWriter::create_in_memory(*spec, user_metadata);
        } else {
            return std::unexpected(ExpectedError("Unsupported backend type for writing: " + backend_config.type,
                                                 ContextErrorKind::InvalidConfig));
        }

        if (!writer_result) {
            return std::unexpected(ExpectedError(writer_result.error(), ContextErrorKind::ResourceUnavailable));
        }
        writer = std::move(*writer_result);
    } else {
        return std::unexpected(ExpectedError("Unsupported mode: " + backend_config.mode, ContextErrorKind::InvalidConfig));
    }

    return std::make_unique<CslContext>(ProtectedMarker{}, std::move(reader), config.read_strategy, std::move(writer),
                                        backend_config.type, backend_config.mode);
}

std::expected<nlohmann::json, ExpectedError> CslContext::execute_operation(
    const nlohmann::json& op_request,
    std::span<const std::byte> input_data,
    std::span<std::byte> output_data)
{
    ConcurrencyGuard guard(in_use_);
    if (!guard) {
        return std::unexpected(ExpectedError("Concurrent operation detected on the same context handle. Contexts are not thread-safe."));
    }

    using HandlerFactory = std::function<std::unique_ptr<IOperationHandler>()>;
    static const std::unordered_map<std::string, HandlerFactory> op_handlers = {
        {"WriteArray", []() { return std::make_unique<WriteArrayHandler>(); }},
        {"ReadRegion", []() { return std::make_unique<ReadRegionHandler>(); }},
        {"Inspect",    []() { return std::make_unique<InspectHandler>(); }}
    };

    try {
        const std::string op_type = op_request.at("op_type").get<std::string>();

        auto it = op_handlers.find(op_type);
        if (it == op_handlers.end()) {
            return std::unexpected(ExpectedError("Unknown or unsupported op_type: " + op_type));
        }

        auto handler = it->second();
        return handler->execute(*this, op_request, input_data, output_data);

    } catch(const nlohmann::json::exception& e) {
        return std::unexpected(ExpectedError(std::string("JSON request error: ") + e.what(), ContextErrorKind::InvalidConfig));
    }
}

} // namespace chunkslice::ffi
