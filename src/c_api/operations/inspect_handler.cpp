#include <nlohmann/json.hpp>

#include "../operations/inspect_handler.h"
#include "../operations/json_serialization.h"
#include "../../data_io/dataset_reader.h"
#include "../../file_format/dataset_metadata.h"
#include "../../slicing/optimization_gate.h"

namespace chunkslice::ffi {

namespace {

std::string bytes_to_string(std::span<const std::byte> bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

} // namespace

std::expected<nlohmann::json, ExpectedError> InspectHandler::execute(
    CslContext& context, const nlohmann::json& op_request, std::span<const std::byte>, std::span<std::byte>)
{
    auto request_result = from_json<InspectRequest>(op_request);
    if (!request_result) return std::unexpected(request_result.error());

    auto response_result = execute_typed(context, *request_result);
    if (!response_result) return std::unexpected(response_result.error());

    response_result->client_key = request_result->client_key;
    return to_json(*response_result);
}

std::expected<InspectResponse, ExpectedError> InspectHandler::execute_typed(
    CslContext& context, const InspectRequest& request)
{
    const OperationTimer timer;
    InspectResponse response;
    response.client_key = request.client_key;
    response.optimization_enabled = optimization::is_enabled();

    if (DatasetReader* reader = context.reader()) {
        const auto& descriptor = reader->descriptor();
        response.file_header = {
            .version = reader->file_header().version(),
            .index_offset = reader->index_offset(),
            .user_metadata = bytes_to_string(reader->user_metadata())
        };
        response.descriptor = nlohmann::json::parse(bytes_to_string(serialize_descriptor(descriptor)));
        response.total_chunks = static_cast<size_t>(descriptor.num_chunks());
        response.chunks_written = reader->num_chunks_written();
        if (const auto* stats = context.dataset()->statistics()) {
            response.statistics = StatisticsInfo{
                .optimized_reads = stats->optimized_reads.load(),
                .fallback_reads = stats->fallback_reads.load(),
                .codec_fallbacks = stats->codec_fallbacks.load(),
                .blocks_decompressed = stats->blocks_decompressed.load()
            };
        }
    } else if (DatasetWriter* writer = context.writer()) {
        const auto& descriptor = writer->descriptor();
        response.file_header = {.version = CSL_VERSION, .index_offset = 0, .user_metadata = {}};
        response.descriptor = nlohmann::json::parse(bytes_to_string(serialize_descriptor(descriptor)));
        response.total_chunks = static_cast<size_t>(descriptor.num_chunks());
        response.chunks_written = writer->num_chunks_written();
    } else {
        return std::unexpected(ExpectedError("Context has neither a reader nor a writer."));
    }

    response.metadata = timer.finish(context);
    return response;
}

} // namespace chunkslice::ffi
