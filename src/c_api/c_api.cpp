#include "chunkslice/c_api.h"
#include "c_api/csl_context.h"
#include "logging/logger.h"
#include "slicing/optimization_gate.h"

#include <nlohmann/json.hpp>
#include <unordered_map>
#include <mutex>
#include <atomic>
#include <cstring>
#include <string_view>
#include <memory>
#include <string>

namespace {
    std::mutex g_context_map_mutex;
    // Shared ownership keeps a context alive while an operation runs, even if its handle is destroyed meanwhile
    std::unordered_map<csl_handle_t, std::shared_ptr<chunkslice::ffi::CslContext>> g_contexts;
    std::atomic<csl_handle_t> g_next_handle{1}; // 0 is never a valid handle
}

static nlohmann::json create_error_json(int64_t code, const std::string& message) {
    nlohmann::json error_obj;
    error_obj["code_value"] = code;
    error_obj["code_name"] = csl_error_message(code);
    error_obj["message"] = message;

    nlohmann::json response;
    response["status"] = "Error";
    response["error"] = error_obj;
    return response;
}

static const char* error_code_to_message(int64_t code) {
    switch (code) {
        case CSL_SUCCESS: return "Operation completed successfully.";
        case CSL_ERROR_UNKNOWN: return "An unspecified internal error occurred.";
        case CSL_ERROR_INVALID_JSON: return "The provided JSON string was malformed or failed validation.";
        case CSL_ERROR_INVALID_HANDLE: return "The provided context handle is not valid or has been destroyed.";
        case CSL_ERROR_OPERATION_FAILED: return "The operation was valid but failed during execution.";
        case CSL_ERROR_RESPONSE_BUFFER_TOO_SMALL: return "The provided JSON response buffer is too small for the result.";
        case CSL_ERROR_INVALID_ARGUMENT: return "A function argument was invalid (e.g., null pointer).";
        case CSL_ERROR_RESOURCE_UNAVAILABLE: return "A required resource could not be accessed (e.g., file not found).";
        default: return "Unknown Error.";
    }
}

static int64_t error_kind_to_code(const chunkslice::ffi::ContextErrorKind kind) {
    switch (kind) {
        case chunkslice::ffi::ContextErrorKind::InvalidConfig: return CSL_ERROR_INVALID_JSON;
        case chunkslice::ffi::ContextErrorKind::ResourceUnavailable: return CSL_ERROR_RESOURCE_UNAVAILABLE;
        case chunkslice::ffi::ContextErrorKind::OperationFailed: return CSL_ERROR_OPERATION_FAILED;
    }
    return CSL_ERROR_UNKNOWN;
}

extern "C" {

CSL_API const char* csl_error_message(int64_t error_code) {
    return error_code_to_message(error_code);
}

CSL_API void csl_set_optimization_enabled(int enabled) {
    chunkslice::optimization::set_enabled(enabled != 0);
}

CSL_API int csl_is_optimization_enabled(void) {
    return chunkslice::optimization::is_enabled() ? 1 : 0;
}

CSL_API int64_t csl_context_create(const char* json_config, size_t config_len, csl_handle_t* out_handle) {
    if (!json_config || !out_handle) {
        return CSL_ERROR_INVALID_ARGUMENT;
    }

    try {
        auto config = nlohmann::json::parse(std::string_view(json_config, config_len));

        auto context_result = chunkslice::ffi::CslContext::create(config);
        if (!context_result) {
            chunkslice::log::logger()->error("Failed to create context: {}", context_result.error().message());
            return error_kind_to_code(context_result.error().kind());
        }

        csl_handle_t handle = g_next_handle.fetch_add(1);
        {
            std::lock_guard lock(g_context_map_mutex);
            g_contexts[handle] = std::move(*context_result);
        }
        *out_handle = handle;
        return CSL_SUCCESS;

    } catch (const nlohmann::json::parse_error& e) {
        chunkslice::log::logger()->error("Invalid context configuration: {}", e.what());
        return CSL_ERROR_INVALID_JSON;
    } catch (const std::exception& e) {
        chunkslice::log::logger()->error("Unexpected error creating context: {}", e.what());
        return CSL_ERROR_UNKNOWN;
    }
}

CSL_API int64_t csl_context_destroy(csl_handle_t handle) {
    if (handle == 0) {
        return CSL_ERROR_INVALID_HANDLE;
    }

    std::shared_ptr<chunkslice::ffi::CslContext> released;
    {
        std::lock_guard lock(g_context_map_mutex);
        auto it = g_contexts.find(handle);
        if (it == g_contexts.end()) {
            return CSL_ERROR_INVALID_HANDLE;
        }
        released = std::move(it->second);
        g_contexts.erase(it);
    }
    // The context (and its writer flush) is released outside the map lock
    released.reset();
    return CSL_SUCCESS;
}

CSL_API int64_t csl_execute_op(
    csl_handle_t handle,
    const char* json_op_request,
    size_t request_len,
    const void* input_data_ptr,
    int64_t input_data_bytes,
    void* output_data_ptr,
    int64_t max_output_data_bytes,
    char* json_op_response,
    size_t max_json_response_bytes)
{
    if (handle == 0 || !json_op_request || !json_op_response || max_json_response_bytes == 0) {
        return CSL_ERROR_INVALID_ARGUMENT;
    }
    if (input_data_bytes < 0 || max_output_data_bytes < 0 ||
        (input_data_bytes > 0 && !input_data_ptr) || (max_output_data_bytes > 0 && !output_data_ptr)) {
        return CSL_ERROR_INVALID_ARGUMENT;
    }

    int64_t final_status_code = CSL_ERROR_UNKNOWN;
    std::string response_str;

    try {
        nlohmann::json request_json = nlohmann::json::parse(std::string_view(json_op_request, request_len));

        std::shared_ptr<chunkslice::ffi::CslContext> context;
        {
            std::lock_guard lock(g_context_map_mutex);
            if (auto it = g_contexts.find(handle); it != g_contexts.end()) {
                context = it->second;
            }
        }

        if (!context) {
            response_str = create_error_json(CSL_ERROR_INVALID_HANDLE, csl_error_message(CSL_ERROR_INVALID_HANDLE)).dump();
            final_status_code = CSL_ERROR_INVALID_HANDLE;
        } else {
            auto op_result = context->execute_operation(
                request_json,
                {static_cast<const std::byte*>(input_data_ptr), static_cast<size_t>(input_data_bytes)},
                {static_cast<std::byte*>(output_data_ptr), static_cast<size_t>(max_output_data_bytes)}
            );

            nlohmann::json final_response;
            if (op_result) {
                final_response = {{"status", "Success"}, {"result", *op_result}};
                final_status_code = CSL_SUCCESS;
            } else {
                final_status_code = error_kind_to_code(op_result.error().kind());
                final_response = create_error_json(final_status_code, op_result.error().message());
            }
            response_str = final_response.dump();
        }
    } catch (const nlohmann::json::parse_error& e) {
        response_str = create_error_json(CSL_ERROR_INVALID_JSON, e.what()).dump();
        final_status_code = CSL_ERROR_INVALID_JSON;
    } catch (const std::exception& e) {
        response_str = create_error_json(CSL_ERROR_UNKNOWN, e.what()).dump();
        final_status_code = CSL_ERROR_UNKNOWN;
    }

    if (response_str.length() + 1 > max_json_response_bytes) {
        return CSL_ERROR_RESPONSE_BUFFER_TOO_SMALL;
    }

    std::memcpy(json_op_response, response_str.c_str(), response_str.length() + 1);

    return final_status_code;
}

} // extern "C"
