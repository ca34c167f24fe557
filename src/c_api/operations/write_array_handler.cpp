#include "../operations/write_array_handler.h"
#include "../operations/json_serialization.h"
#include "../../data_io/dataset_writer.h"

#include <format>

namespace chunkslice::ffi {

std::expected<nlohmann::json, ExpectedError> WriteArrayHandler::execute(
    CslContext& context, const nlohmann::json& op_request, std::span<const std::byte> input_data, std::span<std::byte>)
{
    auto request_result = from_json<WriteArrayRequest>(op_request);
    if (!request_result) return std::unexpected(request_result.error());

    auto response_result = execute_typed(context, *request_result, input_data);
    if (!response_result) return std::unexpected(response_result.error());

    return to_json(*response_result);
}

std::expected<WriteArrayResponse, ExpectedError> WriteArrayHandler::execute_typed(
    CslContext& context, const WriteArrayRequest& request, std::span<const std::byte> input_data)
{
    const OperationTimer timer;
    DatasetWriter* writer = context.writer();
    if (!writer) return std::unexpected(ExpectedError("Context is not in a writable mode."));

    const auto& descriptor = writer->descriptor();
    const auto expected_bytes = static_cast<size_t>(descriptor.shape.product()) * descriptor.element_size;
    if (input_data.size() != expected_bytes) {
        return std::unexpected(ExpectedError(std::format(
            "Input data holds {} bytes, the dataset shape {} needs {}.", input_data.size(),
            descriptor.shape.to_string(), expected_bytes)));
    }

    auto written = writer->write_array(input_data);
    if (!written) return std::unexpected(ExpectedError(written.error()));
    if (auto flushed = writer->flush(); !flushed) return std::unexpected(ExpectedError(flushed.error()));

    WriteArrayResponse response;
    response.client_key = request.client_key;
    response.chunks_written = *written;
    response.total_original_bytes = static_cast<int64_t>(expected_bytes);
    response.metadata = timer.finish(context);
    return response;
}

} // namespace chunkslice::ffi
