#pragma once

#include <stddef.h>
#include <stdint.h>
#ifdef SHARED_LIBRARY_BUILD
#include "chunkslice_shared_export.h"
#endif

#ifdef CHUNKSLICE_SHARED_EXPORT
#define CSL_API CHUNKSLICE_SHARED_EXPORT
#elif defined(_WIN32)
#ifdef CSL_DLL_EXPORTS
#define CSL_API __declspec(dllexport)
#else
#define CSL_API __declspec(dllimport)
#endif
#else
#define CSL_API __attribute__((visibility("default")))
#endif


#ifdef __cplusplus
extern "C" {
#endif

// Opaque handle to a dataset context.
typedef int64_t csl_handle_t;

// Error Codes
enum {
    CSL_SUCCESS = 0,
    CSL_ERROR_UNKNOWN = -1,
    CSL_ERROR_INVALID_JSON = -2,
    CSL_ERROR_INVALID_HANDLE = -3,
    CSL_ERROR_OPERATION_FAILED = -4,
    CSL_ERROR_RESPONSE_BUFFER_TOO_SMALL = -5,
    CSL_ERROR_INVALID_ARGUMENT = -6,
    CSL_ERROR_RESOURCE_UNAVAILABLE = -7,
};

/**
 * @brief Creates a context reading or writing one chunked dataset.
 *
 * The configuration selects the backend and mode, e.g.
 * `{"backend": {"type": "File", "mode": "Read", "path": "data.csl"}, "read_strategy": "Optimized"}`.
 * Write mode additionally takes a `"dataset"` object (shape, chunk_shape, block_shape, dtype, ...).
 *
 * @param json_config A UTF-8 encoded JSON string configuring the context.
 * @param config_len Length of the JSON string in bytes.
 * @param out_handle Receives a positive handle on success.
 * @return int64_t 0 on success, negative error code on failure.
 */
CSL_API int64_t csl_context_create(
    const char* json_config,
    size_t config_len,
    csl_handle_t* out_handle
);

/**
 * @brief Destroys a context and releases all associated resources.
 *
 * A writing context persists its chunk index before it is released.
 *
 * @param handle The context handle to destroy.
 * @return int64_t 0 on success, negative error code on failure.
 */
CSL_API int64_t csl_context_destroy(csl_handle_t handle);

/**
 * @brief Executes an operation ("WriteArray", "ReadRegion" or "Inspect") on a context.
 *
 * @param handle The context handle.
 * @param json_op_request A UTF-8 encoded JSON string describing the operation.
 * @param request_len Length of the JSON request string.
 * @param input_data_ptr Pointer to the source data buffer (used by "WriteArray").
 * @param input_data_bytes Size of the input data buffer in bytes.
 * @param output_data_ptr Pointer to the destination buffer (used by "ReadRegion").
 * @param max_output_data_bytes Capacity of the output buffer in bytes.
 * @param json_op_response Buffer to write the UTF-8 encoded JSON response into.
 * @param max_json_response_bytes Capacity of the JSON response buffer.
 * @return int64_t 0 on success, negative error code on failure. The details of the success or
 *         failure are written into the `json_op_response` buffer.
 */
CSL_API int64_t csl_execute_op(
    csl_handle_t handle,
    const char* json_op_request,
    size_t request_len,
    const void* input_data_ptr,
    int64_t input_data_bytes,
    void* output_data_ptr,
    int64_t max_output_data_bytes,
    char* json_op_response,
    size_t max_json_response_bytes
);

/**
 * @brief Turns block-level partial reads on or off for the whole process.
 *
 * @param enabled Non-zero enables the optimization, zero routes every read through
 *        whole-chunk decompression.
 */
CSL_API void csl_set_optimization_enabled(int enabled);

/** @brief Returns 1 when block-level partial reads are enabled, 0 otherwise. */
CSL_API int csl_is_optimization_enabled(void);

/**
 * @brief Translates an error code from the API into a human-readable string.
 *
 * @param error_code The negative error code returned by an API function.
 * @return const char* A static, null-terminated string describing the error. Returns "Unknown Error." for invalid codes.
 */
CSL_API const char* csl_error_message(int64_t error_code);

#ifdef __cplusplus
}
#endif
