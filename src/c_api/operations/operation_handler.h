#pragma once

#include <chrono>
#include <expected>
#include <nlohmann/json.hpp>
#include <span>
#include "../csl_context.h"
#include "operation_types.h"

namespace chunkslice::ffi
{

    class IOperationHandler
    {
    public:
        virtual ~IOperationHandler() = default;

        virtual std::expected<nlohmann::json, ExpectedError> execute(CslContext& context,
                                                                     const nlohmann::json& op_request,
                                                                     std::span<const std::byte> input_data,
                                                                     std::span<std::byte> output_data) = 0;
    };

    /// Times a handler and fills the metadata block common to all responses.
    class OperationTimer
    {
        std::chrono::steady_clock::time_point start_ = std::chrono::steady_clock::now();

    public:
        OperationMetadata finish(const CslContext& context) const
        {
            const auto elapsed = std::chrono::steady_clock::now() - start_;
            return OperationMetadata{
                .backend_type = std::string(context.backend_type()),
                .mode = std::string(context.mode()),
                .duration_us = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count())};
        }
    };

} // namespace chunkslice::ffi
