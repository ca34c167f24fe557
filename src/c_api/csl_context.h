#pragma once

#include <atomic>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <nlohmann/json_fwd.hpp>

#include "../data_io/dataset.h"
#include "../data_io/dataset_reader.h"
#include "../data_io/dataset_writer.h"

namespace chunkslice::ffi {

enum class ContextErrorKind {
    InvalidConfig,
    ResourceUnavailable,
    OperationFailed
};

class ExpectedError
{
    std::string m_message;
    ContextErrorKind m_kind;
public:
    explicit ExpectedError(std::string message, ContextErrorKind kind = ContextErrorKind::OperationFailed)
        : m_message(std::move(message)), m_kind(kind) {}
    const std::string& message() const { return m_message; }
    ContextErrorKind kind() const { return m_kind; }
};

// RAII guard rejecting concurrent use of one context
class [[nodiscard]] ConcurrencyGuard {
    std::atomic<bool>& in_use_flag_;
    bool is_locked_{false};
public:
    explicit ConcurrencyGuard(std::atomic<bool>& flag) : in_use_flag_(flag) {
        bool expected = false;
        is_locked_ = in_use_flag_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    }

    ~ConcurrencyGuard() {
        if (is_locked_) {
            in_use_flag_.store(false, std::memory_order_release);
        }
    }

    ConcurrencyGuard(const ConcurrencyGuard&) = delete;
    ConcurrencyGuard& operator=(const ConcurrencyGuard&) = delete;

    operator bool() const {
        return is_locked_;
    }
};

/**
 * @brief State behind one C API handle: either a dataset being written or a dataset being read.
 */
class CslContext {
public:
    static std::expected<std::unique_ptr<CslContext>, ExpectedError> create(const nlohmann::json& config);

    std::expected<nlohmann::json, ExpectedError> execute_operation(
        const nlohmann::json& op_request,
        std::span<const std::byte> input_data,
        std::span<std::byte> output_data
    );

    // Getters for handlers
    DatasetWriter* writer() { return writer_.get(); }
    DatasetReader* reader() { return reader_.get(); }
    Dataset* dataset() { return dataset_.get(); }

    std::string_view backend_type() const { return backend_type_; }
    std::string_view mode() const { return mode_; }

    CslContext(const CslContext&) = delete;
    CslContext& operator=(const CslContext&) = delete;
    ~CslContext();

private:
    struct ProtectedMarker{};

    std::shared_ptr<DatasetReader> reader_;
    std::unique_ptr<Dataset> dataset_;
    std::unique_ptr<DatasetWriter> writer_;
    std::string backend_type_;
    std::string mode_;

    std::atomic<bool> in_use_{false};

public:
    CslContext(ProtectedMarker, std::shared_ptr<DatasetReader> reader, ReadStrategy strategy,
               std::unique_ptr<DatasetWriter>&& writer, std::string backend_type, std::string mode);
};

} // namespace chunkslice::ffi
