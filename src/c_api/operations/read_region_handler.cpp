#include "../operations/read_region_handler.h"
#include "../operations/json_serialization.h"
#include "../../data_io/dataset.h"

#define MAGIC_ENUM_ENABLE_HASH 1
#include <magic_enum/magic_enum.hpp>

#include <format>

namespace chunkslice::ffi {

std::expected<nlohmann::json, ExpectedError> ReadRegionHandler::execute(
    CslContext& context, const nlohmann::json& op_request, std::span<const std::byte>, std::span<std::byte> output_data)
{
    auto request_result = from_json<ReadRegionRequest>(op_request);
    if (!request_result) return std::unexpected(request_result.error());

    auto response_result = execute_typed(context, *request_result, output_data);
    if (!response_result) return std::unexpected(response_result.error());

    return to_json(*response_result);
}

std::expected<ReadRegionResponse, ExpectedError> ReadRegionHandler::execute_typed(
    CslContext& context, const ReadRegionRequest& request, std::span<std::byte> output_data)
{
    const OperationTimer timer;
    Dataset* dataset = context.dataset();
    if (!dataset) return std::unexpected(ExpectedError("Context is not in a readable mode."));

    const auto& descriptor = dataset->descriptor();
    auto resolved = resolve_selection(request.selection, descriptor.shape);
    if (!resolved) return std::unexpected(ExpectedError(resolved.error().to_string()));

    const auto nbytes = static_cast<size_t>(resolved->request.num_elements()) * descriptor.element_size;
    if (output_data.size() < nbytes) {
        return std::unexpected(ExpectedError(std::format(
            "Output buffer too small: {} bytes provided, the selection needs {}.", output_data.size(), nbytes)));
    }

    if (auto res = dataset->region_reader().read_region(resolved->request, output_data.first(nbytes)); !res) {
        return std::unexpected(ExpectedError(res.error().to_string()));
    }

    ReadRegionResponse response;
    response.client_key = request.client_key;
    response.shape.assign(resolved->result_shape.begin(), resolved->result_shape.end());
    response.bytes_written_to_output = nbytes;
    response.strategy = std::string(magic_enum::enum_name(dataset->strategy()));
    response.metadata = timer.finish(context);
    return response;
}

} // namespace chunkslice::ffi
