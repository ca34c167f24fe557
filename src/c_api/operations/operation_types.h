#pragma once

#include "../../data_io/dataset.h"
#include "../../file_format/dataset_format.h"
#include "../../slicing/selection.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace chunkslice::ffi {

// ==========================================================================
// Base Structures & Metadata
// ==========================================================================

struct OperationRequestBase {
    std::optional<std::string> client_key;
};

struct OperationResponseBase {
    std::optional<std::string> client_key;
};

struct OperationMetadata {
    std::string backend_type;
    std::string mode;
    uint64_t duration_us;
};

// ==========================================================================
// Context Configuration
// ==========================================================================

struct BackendConfig {
    std::string type;  // "File" or "Memory"
    std::string mode;  // "Read" or "Write"
    std::optional<std::string> path;
};

struct DatasetConfig {
    std::vector<int64_t> shape;
    std::vector<int64_t> chunk_shape;
    std::vector<int64_t> block_shape;
    DType dtype = DType::FLOAT32;
    size_t element_size = 0;
    std::optional<ByteOrder> byte_order;
    ChunkCodec codec = ChunkCodec::BLOCKED_ZSTD;
    bool record_block_shape = true;
    std::optional<int> zstd_level;
};

struct ContextConfig {
    BackendConfig backend;
    std::optional<DatasetConfig> dataset;
    std::string user_metadata;
    ReadStrategy read_strategy = ReadStrategy::Optimized;
};

// ==========================================================================
// Operation-Specific Structures
// ==========================================================================

// --- WriteArray ---
struct WriteArrayRequest : OperationRequestBase {};

struct WriteArrayResponse : OperationResponseBase {
    size_t chunks_written;
    int64_t total_original_bytes;
    OperationMetadata metadata{};
};

// --- ReadRegion ---
struct ReadRegionRequest : OperationRequestBase {
    // One entry per leading axis: an integer index, null for the whole axis,
    // or an object with optional "start", "stop" and "step".
    Selection selection;
};

struct ReadRegionResponse : OperationResponseBase {
    std::vector<int64_t> shape;
    size_t bytes_written_to_output{};
    std::string strategy;
    OperationMetadata metadata{};
};

// --- Inspect ---
struct InspectRequest : OperationRequestBase {};

struct FileHeaderInfo {
    uint16_t version;
    uint64_t index_offset;
    std::string user_metadata;
};

struct StatisticsInfo {
    uint64_t optimized_reads;
    uint64_t fallback_reads;
    uint64_t codec_fallbacks;
    uint64_t blocks_decompressed;
};

struct InspectResponse : OperationResponseBase {
    FileHeaderInfo file_header;
    nlohmann::json descriptor;
    size_t total_chunks;
    size_t chunks_written;
    bool optimization_enabled;
    std::optional<StatisticsInfo> statistics;
    OperationMetadata metadata{};
};

} // namespace chunkslice::ffi
