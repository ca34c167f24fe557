#pragma once

#include "../csl_context.h" // For ExpectedError
#include <nlohmann/json_fwd.hpp>
#include <expected>

namespace chunkslice::ffi {

// Forward declare all request/response types so this header remains lightweight.
struct ContextConfig;
struct WriteArrayRequest; struct ReadRegionRequest; struct InspectRequest;
struct WriteArrayResponse; struct ReadRegionResponse; struct InspectResponse;

// Deserializes a JSON object into a request or configuration struct.
// Parsing and validation exceptions are converted to ExpectedError.
template<typename T>
std::expected<T, ExpectedError> from_json(const nlohmann::json& j);

template<typename T>
nlohmann::json to_json(const T& response);

} // namespace chunkslice::ffi
