#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <initializer_list>
#include <span>
#include <stdexcept>
#include <string>

namespace chunkslice {

/// Highest dimensionality the block codec can describe in its frame header.
constexpr size_t MAX_DIMENSIONS = 8;

/**
 * @brief A small fixed-capacity tuple of coordinates, one per axis.
 *
 * Used for shapes, multi-indices, offsets and extents alike. Never allocates.
 */
class Coords {
    std::array<int64_t, MAX_DIMENSIONS> values_{};
    size_t size_ = 0;

public:
    Coords() = default;

    explicit Coords(const size_t ndim, const int64_t fill = 0) : size_(ndim) {
        if (ndim > MAX_DIMENSIONS) {
            throw std::length_error(std::format("{} dimensions requested, at most {} are supported.", ndim, MAX_DIMENSIONS));
        }
        std::fill_n(values_.begin(), ndim, fill);
    }

    Coords(std::initializer_list<int64_t> values) : Coords(std::span<const int64_t>(values.begin(), values.size())) {}

    explicit Coords(std::span<const int64_t> values) : size_(values.size()) {
        if (values.size() > MAX_DIMENSIONS) {
            throw std::length_error(std::format("{} dimensions requested, at most {} are supported.", values.size(), MAX_DIMENSIONS));
        }
        std::ranges::copy(values, values_.begin());
    }

    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] bool empty() const { return size_ == 0; }

    int64_t& operator[](const size_t axis) { return values_[axis]; }
    int64_t operator[](const size_t axis) const { return values_[axis]; }

    [[nodiscard]] int64_t* begin() { return values_.data(); }
    [[nodiscard]] int64_t* end() { return values_.data() + size_; }
    [[nodiscard]] const int64_t* begin() const { return values_.data(); }
    [[nodiscard]] const int64_t* end() const { return values_.data() + size_; }

    [[nodiscard]] std::span<const int64_t> span() const { return {values_.data(), size_}; }

    /** @brief Product of all values; 1 for an empty tuple. */
    [[nodiscard]] int64_t product() const {
        int64_t res = 1;
        for (size_t i = 0; i < size_; ++i) {
            res *= values_[i];
        }
        return res;
    }

    friend bool operator==(const Coords& a, const Coords& b) {
        return std::ranges::equal(a.span(), b.span());
    }

    [[nodiscard]] std::string to_string() const {
        std::string out = "(";
        for (size_t i = 0; i < size_; ++i) {
            out += std::format(i == 0 ? "{}" : ", {}", values_[i]);
        }
        return out + ")";
    }
};

/// Half-open integer interval [start, stop).
struct Range {
    int64_t start = 0;
    int64_t stop = 0;

    [[nodiscard]] int64_t size() const { return stop > start ? stop - start : 0; }
    [[nodiscard]] bool empty() const { return stop <= start; }

    friend bool operator==(const Range&, const Range&) = default;
};

/// One half-open range per axis.
struct Region {
    Coords start;
    Coords stop;

    Region() = default;
    Region(Coords start_, Coords stop_) : start(start_), stop(stop_) {
        if (start.size() != stop.size()) {
            throw std::invalid_argument("Region start and stop must have the same dimensionality.");
        }
    }

    /** @brief The region [0, shape) covering a whole array. */
    static Region whole(const Coords& shape) { return {Coords(shape.size(), 0), shape}; }

    [[nodiscard]] size_t ndim() const { return start.size(); }
    [[nodiscard]] Range axis(const size_t i) const { return {start[i], stop[i]}; }

    [[nodiscard]] Coords extent() const {
        Coords res(start.size());
        for (size_t i = 0; i < start.size(); ++i) {
            res[i] = axis(i).size();
        }
        return res;
    }

    [[nodiscard]] bool empty() const {
        for (size_t i = 0; i < start.size(); ++i) {
            if (axis(i).empty()) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] int64_t num_elements() const { return empty() ? 0 : extent().product(); }

    [[nodiscard]] std::string to_string() const {
        std::string out = "[";
        for (size_t i = 0; i < start.size(); ++i) {
            out += std::format(i == 0 ? "{}:{}" : ", {}:{}", start[i], stop[i]);
        }
        return out + "]";
    }

    friend bool operator==(const Region&, const Region&) = default;
};

} // namespace chunkslice

template <>
struct std::formatter<chunkslice::Coords> : std::formatter<std::string> {
    auto format(const chunkslice::Coords& c, format_context& ctx) const {
        return std::formatter<std::string>::format(c.to_string(), ctx);
    }
};

template <>
struct std::formatter<chunkslice::Region> : std::formatter<std::string> {
    auto format(const chunkslice::Region& r, format_context& ctx) const {
        return std::formatter<std::string>::format(r.to_string(), ctx);
    }
};
