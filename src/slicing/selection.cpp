#include "selection.h"

#include <algorithm>
#include <array>
#include <format>

namespace chunkslice {

namespace {

int64_t clamp_bound(int64_t value, const int64_t extent) {
    if (value < 0) {
        value += extent;
    }
    return std::clamp<int64_t>(value, 0, extent);
}

} // namespace

std::expected<ResolvedSelection, ReadError> resolve_selection(std::span<const Selector> selection, const Coords& shape) {
    const size_t ndim = shape.size();
    if (selection.size() > ndim) {
        return std::unexpected(ReadError(ReadErrorKind::InvalidSelection,
                                         std::format("{} selectors given for a {}-dimensional dataset.", selection.size(), ndim)));
    }

    ResolvedSelection res;
    res.request = SliceRequest(Region(Coords(ndim), Coords(ndim)), Coords(ndim, 1));
    auto& region = res.request.region;
    auto& step = res.request.step;
    size_t result_ndim = 0;
    std::array<int64_t, MAX_DIMENSIONS> result_dims{};

    for (size_t axis = 0; axis < ndim; ++axis) {
        const int64_t extent = shape[axis];
        const Selector selector = axis < selection.size() ? selection[axis] : Selector{Slice::all()};

        if (const auto* index = std::get_if<Index>(&selector)) {
            const int64_t position = index->value < 0 ? index->value + extent : index->value;
            if (position < 0 || position >= extent) {
                return std::unexpected(ReadError(ReadErrorKind::InvalidSelection,
                                                 std::format("Index {} is out of range for axis {} of size {}.",
                                                             index->value, axis, extent)));
            }
            region.start[axis] = position;
            region.stop[axis] = position + 1;
            continue;
        }

        const auto& slice = std::get<Slice>(selector);
        if (slice.step < 1) {
            return std::unexpected(ReadError(ReadErrorKind::InvalidSelection,
                                             std::format("Slice step {} on axis {} must be at least 1.", slice.step, axis)));
        }
        const int64_t start = slice.start ? clamp_bound(*slice.start, extent) : 0;
        const int64_t stop = std::max(start, slice.stop ? clamp_bound(*slice.stop, extent) : extent);
        const int64_t count = stop > start ? 1 + (stop - start - 1) / slice.step : 0;

        region.start[axis] = start;
        // Tighten the bound to the last selected element so no extra chunk is visited.
        region.stop[axis] = count > 0 ? start + (count - 1) * slice.step + 1 : start;
        step[axis] = slice.step;
        result_dims[result_ndim++] = count;
    }

    res.result_shape = Coords(std::span<const int64_t>(result_dims.data(), result_ndim));
    return res;
}

} // namespace chunkslice
