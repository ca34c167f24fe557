#pragma once

#include <format>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "codec_error.h"

namespace chunkslice {

/**
 * @brief Failure of the dataset store: missing chunk, I/O failure or an integrity check.
 *
 * Never recovered by falling back, the fallback would read the same bytes.
 */
class StoreError {
    std::string message_;

public:
    explicit StoreError(std::string message) : message_(std::move(message)) {}

    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] std::string to_string() const { return std::format("StoreError(\"{}\")", message_); }
};

enum class NotApplicableReason {
    OptimizationDisabled,
    ForcedByEnvironment,
    NonUnitStep,
    ByteOrderMismatch,
    UnsupportedCodec,
    MissingBlockMetadata,
    InvalidGeometry,
};

[[nodiscard]] inline std::string_view to_string(const NotApplicableReason reason) {
    switch (reason) {
        case NotApplicableReason::OptimizationDisabled: return "OptimizationDisabled";
        case NotApplicableReason::ForcedByEnvironment: return "ForcedByEnvironment";
        case NotApplicableReason::NonUnitStep: return "NonUnitStep";
        case NotApplicableReason::ByteOrderMismatch: return "ByteOrderMismatch";
        case NotApplicableReason::UnsupportedCodec: return "UnsupportedCodec";
        case NotApplicableReason::MissingBlockMetadata: return "MissingBlockMetadata";
        case NotApplicableReason::InvalidGeometry: return "InvalidGeometry";
    }
    return "InvalidReason";
}

/// The optimized path declined a request; it is served by whole-chunk decoding instead.
class NotApplicable {
    NotApplicableReason reason_;
    std::string detail_;

public:
    explicit NotApplicable(NotApplicableReason reason, std::string detail = {})
        : reason_(reason), detail_(std::move(detail)) {}

    [[nodiscard]] NotApplicableReason reason() const { return reason_; }
    [[nodiscard]] const std::string& detail() const { return detail_; }

    [[nodiscard]] std::string to_string() const {
        if (detail_.empty()) {
            return std::format("NotApplicable({})", chunkslice::to_string(reason_));
        }
        return std::format("NotApplicable({}: {})", chunkslice::to_string(reason_), detail_);
    }
};

/// Errors stopping the copy engine; the first one aborts the run.
using EngineError = std::variant<CodecError, StoreError>;

enum class ReadErrorKind {
    InvalidSelection,
    InvalidOutputBuffer,
    StoreFailure,
    CodecFailure,
};

[[nodiscard]] inline std::string_view to_string(const ReadErrorKind kind) {
    switch (kind) {
        case ReadErrorKind::InvalidSelection: return "InvalidSelection";
        case ReadErrorKind::InvalidOutputBuffer: return "InvalidOutputBuffer";
        case ReadErrorKind::StoreFailure: return "StoreFailure";
        case ReadErrorKind::CodecFailure: return "CodecFailure";
    }
    return "InvalidReadErrorKind";
}

/// Error returned by the public read API.
class ReadError {
    ReadErrorKind kind_;
    std::string message_;

public:
    ReadError(ReadErrorKind kind, std::string message) : kind_(kind), message_(std::move(message)) {}

    static ReadError from(const StoreError& err) { return {ReadErrorKind::StoreFailure, err.message()}; }
    static ReadError from(const CodecError& err) { return {ReadErrorKind::CodecFailure, err.to_string()}; }

    [[nodiscard]] ReadErrorKind kind() const { return kind_; }
    [[nodiscard]] const std::string& message() const { return message_; }

    [[nodiscard]] std::string to_string() const {
        return std::format("ReadError({}: {})", chunkslice::to_string(kind_), message_);
    }
};

} // namespace chunkslice

template <>
struct std::formatter<chunkslice::StoreError> : std::formatter<std::string> {
    auto format(const chunkslice::StoreError& err, format_context& ctx) const {
        return std::formatter<std::string>::format(err.to_string(), ctx);
    }
};

template <>
struct std::formatter<chunkslice::NotApplicable> : std::formatter<std::string> {
    auto format(const chunkslice::NotApplicable& err, format_context& ctx) const {
        return std::formatter<std::string>::format(err.to_string(), ctx);
    }
};

template <>
struct std::formatter<chunkslice::ReadError> : std::formatter<std::string> {
    auto format(const chunkslice::ReadError& err, format_context& ctx) const {
        return std::formatter<std::string>::format(err.to_string(), ctx);
    }
};
