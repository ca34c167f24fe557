#include "optimization_gate.h"

#include <atomic>
#include <charconv>
#include <cstdlib>
#include <format>
#include <string_view>

namespace chunkslice::optimization {

namespace {

std::atomic<bool> g_enabled{true};

int parse_force_filter(std::string_view value) {
    constexpr std::string_view whitespace = " \t\n\r\f\v";
    const auto first = value.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return 0;
    }
    value = value.substr(first, value.find_last_not_of(whitespace) - first + 1);
    if (value.starts_with('+')) {
        value.remove_prefix(1);
    }

    int parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return 0;
    }
    return parsed;
}

} // namespace

void enable() { g_enabled.store(true); }
void disable() { g_enabled.store(false); }
void set_enabled(const bool enabled) { g_enabled.store(enabled); }
bool is_enabled() { return g_enabled.load(); }

bool forced_by_environment() {
    const char* value = std::getenv(FORCE_FILTER_ENV);
    return value != nullptr && parse_force_filter(value) != 0;
}

ScopedOptimization::ScopedOptimization(const bool enabled) : previous_(g_enabled.exchange(enabled)) {}

ScopedOptimization::~ScopedOptimization() {
    g_enabled.store(previous_);
}

std::expected<void, NotApplicable> check_applicability(const DatasetDescriptor& descriptor, const SliceRequest& request) {
    if (!is_enabled()) {
        return std::unexpected(NotApplicable(NotApplicableReason::OptimizationDisabled));
    }
    if (forced_by_environment()) {
        return std::unexpected(NotApplicable(NotApplicableReason::ForcedByEnvironment, FORCE_FILTER_ENV));
    }
    if (!request.unit_step()) {
        return std::unexpected(NotApplicable(NotApplicableReason::NonUnitStep, std::format("step {}", request.step)));
    }
    if (descriptor.byte_order != native_byte_order()) {
        return std::unexpected(NotApplicable(NotApplicableReason::ByteOrderMismatch));
    }
    if (!codec_supports_block_access(descriptor.codec)) {
        return std::unexpected(NotApplicable(NotApplicableReason::UnsupportedCodec));
    }
    return {};
}

} // namespace chunkslice::optimization
