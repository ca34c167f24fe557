#define MAGIC_ENUM_ENABLE_HASH 1
#include <magic_enum/magic_enum.hpp>
#include <nlohmann/json.hpp>

#include "../operations/json_serialization.h"
#include "../operations/operation_types.h"

namespace chunkslice::ffi {

// ========================================================================
// Serialization Helpers
// ========================================================================

template<typename T>
static T get_required(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) {
        throw nlohmann::json::out_of_range::create(403, std::string("missing required key: '") + key + "'", &j);
    }
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw nlohmann::json::type_error::create(302, std::string("failed to parse key '") + key + "': " + e.what(), &j);
    }
}

template<typename E>
static E enum_from_json(const nlohmann::json& j) {
    const auto str = j.get<std::string>();
    if (auto val = magic_enum::enum_cast<E>(str); val.has_value()) {
        return val.value();
    }
    throw nlohmann::json::type_error::create(302, "invalid enum value '" + str + "' for type " + std::string(magic_enum::enum_type_name<E>()), &j);
}

template<typename E>
static E enum_from_json_or(const nlohmann::json& j, const char* key, const E fallback) {
    return j.contains(key) ? enum_from_json<E>(j.at(key)) : fallback;
}

template<typename T>
static void from_json_base(const nlohmann::json& j, T& base) {
    base.client_key = j.value<std::optional<std::string>>("client_key", std::nullopt);
}
template<typename T>
static void to_json_base(nlohmann::json& j, const T& base) {
    if (base.client_key) {
        j["client_key"] = *base.client_key;
    }
}

static std::optional<int64_t> optional_int(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<int64_t>();
}

// ========================================================================
// ADL Implementations for nlohmann::json
// ========================================================================

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(OperationMetadata, backend_type, mode, duration_us)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileHeaderInfo, version, index_offset, user_metadata)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(StatisticsInfo, optimized_reads, fallback_reads, codec_fallbacks, blocks_decompressed)

// --- Configuration ---
void from_json(const nlohmann::json& j, BackendConfig& cfg) {
    cfg.type = get_required<std::string>(j, "type");
    cfg.mode = get_required<std::string>(j, "mode");
    cfg.path = j.value<std::optional<std::string>>("path", std::nullopt);
}

void from_json(const nlohmann::json& j, DatasetConfig& cfg) {
    cfg.shape = get_required<std::vector<int64_t>>(j, "shape");
    cfg.chunk_shape = get_required<std::vector<int64_t>>(j, "chunk_shape");
    cfg.block_shape = get_required<std::vector<int64_t>>(j, "block_shape");
    cfg.dtype = enum_from_json<DType>(get_required<nlohmann::json>(j, "dtype"));
    cfg.element_size = j.value("element_size", size_t{0});
    if (j.contains("byte_order")) {
        cfg.byte_order = enum_from_json<ByteOrder>(j.at("byte_order"));
    }
    cfg.codec = enum_from_json_or(j, "codec", ChunkCodec::BLOCKED_ZSTD);
    cfg.record_block_shape = j.value("record_block_shape", true);
    cfg.zstd_level = j.value<std::optional<int>>("zstd_level", std::nullopt);
}

void from_json(const nlohmann::json& j, ContextConfig& cfg) {
    cfg.backend = get_required<BackendConfig>(j, "backend");
    if (j.contains("dataset")) {
        cfg.dataset = j.at("dataset").get<DatasetConfig>();
    }
    cfg.user_metadata = j.value("user_metadata", std::string{});
    cfg.read_strategy = enum_from_json_or(j, "read_strategy", ReadStrategy::Optimized);
}

// --- Selectors: integer, null, or {"start", "stop", "step"} ---
static Selector selector_from_json(const nlohmann::json& j) {
    if (j.is_number_integer()) {
        return Index{j.get<int64_t>()};
    }
    if (j.is_null()) {
        return Slice::all();
    }
    if (j.is_object()) {
        return Slice{optional_int(j, "start"), optional_int(j, "stop"), j.value("step", int64_t{1})};
    }
    throw nlohmann::json::type_error::create(302, "a selector must be an integer, null or an object", &j);
}

// --- WriteArray ---
void from_json(const nlohmann::json& j, WriteArrayRequest& req) { from_json_base(j, req); }
void to_json(nlohmann::json& j, const WriteArrayResponse& res) { to_json_base(j, res); j["chunks_written"] = res.chunks_written; j["total_original_bytes"] = res.total_original_bytes; j["metadata"] = res.metadata; }

// --- ReadRegion ---
void from_json(const nlohmann::json& j, ReadRegionRequest& req) {
    from_json_base(j, req);
    req.selection.clear();
    if (!j.contains("selection")) {
        return;
    }
    const auto& selection = j.at("selection");
    if (!selection.is_array()) {
        throw nlohmann::json::type_error::create(302, "'selection' must be an array", &j);
    }
    for (const auto& item : selection) {
        req.selection.push_back(selector_from_json(item));
    }
}
void to_json(nlohmann::json& j, const ReadRegionResponse& res) { to_json_base(j, res); j["shape"] = res.shape; j["bytes_written_to_output"] = res.bytes_written_to_output; j["strategy"] = res.strategy; j["metadata"] = res.metadata; }

// --- Inspect ---
void from_json(const nlohmann::json& j, InspectRequest& req) { from_json_base(j, req); }
void to_json(nlohmann::json& j, const InspectResponse& res) {
    to_json_base(j, res);
    j["file_header"] = res.file_header;
    j["descriptor"] = res.descriptor;
    j["total_chunks"] = res.total_chunks;
    j["chunks_written"] = res.chunks_written;
    j["optimization_enabled"] = res.optimization_enabled;
    if (res.statistics) j["statistics"] = *res.statistics;
    j["metadata"] = res.metadata;
}

// ========================================================================
// Generic Template Instantiations
// ========================================================================

template<typename T>
std::expected<T, ExpectedError> from_json(const nlohmann::json& j) {
    try {
        T value;
        from_json(j, value);
        return value;
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(ExpectedError(std::string("JSON request validation error: ") + e.what(),
                                             ContextErrorKind::InvalidConfig));
    }
}
#define INSTANTIATE_FROM_JSON(T) template std::expected<T, ExpectedError> from_json<T>(const nlohmann::json&);
INSTANTIATE_FROM_JSON(ContextConfig)
INSTANTIATE_FROM_JSON(WriteArrayRequest) INSTANTIATE_FROM_JSON(ReadRegionRequest) INSTANTIATE_FROM_JSON(InspectRequest)
#undef INSTANTIATE_FROM_JSON

template<typename T>
nlohmann::json to_json(const T& response) {
    nlohmann::json j;
    to_json(j, response);
    return j;
}
#define INSTANTIATE_TO_JSON(T) template nlohmann::json to_json<T>(const T&);
INSTANTIATE_TO_JSON(WriteArrayResponse) INSTANTIATE_TO_JSON(ReadRegionResponse) INSTANTIATE_TO_JSON(InspectResponse)
#undef INSTANTIATE_TO_JSON

} // namespace chunkslice::ffi
