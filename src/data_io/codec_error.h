#pragma once

#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace chunkslice {

enum class ErrorCode {
    Unknown,
    DecompressionFailure,
    CompressionFailure,
    InvalidFrameHeader,
    UnsupportedFrameVersion,
    BlockIndexOutOfRange,
    InvalidChunkShape,
    InvalidBlockShape,
    InvalidDataSize,
    CodecInternalError,
};

[[nodiscard]] inline std::string_view to_string(const ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::DecompressionFailure: return "DecompressionFailure";
        case ErrorCode::CompressionFailure: return "CompressionFailure";
        case ErrorCode::InvalidFrameHeader: return "InvalidFrameHeader";
        case ErrorCode::UnsupportedFrameVersion: return "UnsupportedFrameVersion";
        case ErrorCode::BlockIndexOutOfRange: return "BlockIndexOutOfRange";
        case ErrorCode::InvalidChunkShape: return "InvalidChunkShape";
        case ErrorCode::InvalidBlockShape: return "InvalidBlockShape";
        case ErrorCode::InvalidDataSize: return "InvalidDataSize";
        case ErrorCode::CodecInternalError: return "CodecInternalError";
    }
    return "InvalidErrorCode";
}

/**
 * @brief Corrupt, unrecognized or inconsistent compressed data.
 *
 * Raised by the frame codec and the block adapter; the optimized read path
 * recovers from it by decoding whole chunks instead.
 */
class CodecError {
    ErrorCode code_ = ErrorCode::Unknown;
    std::optional<std::string> details_;

public:
    CodecError(ErrorCode code, std::optional<std::string> details)
        : code_(code), details_(std::move(details)) {}

    explicit CodecError(ErrorCode code) : code_(code) {}

    // Wraps an error string coming from a compression library
    static CodecError from_string(std::string_view err_str, const ErrorCode err_code = ErrorCode::CodecInternalError) {
        return {err_code, std::string(err_str)};
    }

    [[nodiscard]] ErrorCode code() const { return code_; }
    [[nodiscard]] const std::optional<std::string>& details() const { return details_; }

    [[nodiscard]] std::string to_string() const {
        if (details_) {
            return std::format("CodecError(code={}, details=\"{}\")", chunkslice::to_string(code_), *details_);
        }
        return std::format("CodecError(code={})", chunkslice::to_string(code_));
    }
};

} // namespace chunkslice

template <>
struct std::formatter<chunkslice::CodecError> {
    constexpr auto parse(std::format_parse_context& ctx) {
        auto it = ctx.begin(), end = ctx.end();
        if (it != end && *it != '}') {
            throw std::format_error("invalid format specifier for CodecError");
        }
        return it;
    }

    auto format(const chunkslice::CodecError& err, format_context& ctx) const {
        return std::format_to(ctx.out(), "{}", err.to_string());
    }
};
