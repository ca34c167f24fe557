#include "dataset_metadata.h"

#include <format>
#include <limits>
#include <vector>

#include <magic_enum/magic_enum.hpp>
#include <nlohmann/json.hpp>

#include "../geometry/grid.h"

namespace chunkslice {

namespace {

constexpr auto FORMAT_NAME = "chunkslice";

template<typename E>
E enum_from_json(const nlohmann::json& j, const char* key) {
    const auto str = j.at(key).get<std::string>();
    if (auto val = magic_enum::enum_cast<E>(str); val.has_value()) {
        return *val;
    }
    throw nlohmann::json::type_error::create(302, std::format("invalid enum value '{}' for type {}", str, magic_enum::enum_type_name<E>()), &j);
}

Coords coords_from_json(const nlohmann::json& j, const char* key) {
    const auto values = j.at(key).get<std::vector<int64_t>>();
    if (values.size() > MAX_DIMENSIONS) {
        throw nlohmann::json::out_of_range::create(406, std::format("'{}' has {} dimensions, at most {} are supported", key, values.size(), MAX_DIMENSIONS), &j);
    }
    return Coords(std::span<const int64_t>(values));
}

std::vector<int64_t> coords_to_json(const Coords& c) {
    return {c.begin(), c.end()};
}

// Multiplies non-negative values; false when the result does not fit in int64_t.
bool checked_multiply(const int64_t a, const int64_t b, int64_t& out) {
    if (b != 0 && a > std::numeric_limits<int64_t>::max() / b) {
        return false;
    }
    out = a * b;
    return true;
}

} // namespace

Coords DatasetDescriptor::chunks() const {
    return geometry::chunk_grid(shape, chunk_shape);
}

std::expected<void, std::string> DatasetDescriptor::validate() const {
    if (shape.empty()) {
        return std::unexpected("Dataset must have at least one dimension.");
    }
    if (chunk_shape.size() != shape.size() || block_shape.size() != shape.size()) {
        return std::unexpected(std::format("Dimensionality mismatch: shape {}, chunk shape {}, block shape {}.",
                                           shape, chunk_shape, block_shape));
    }
    for (size_t i = 0; i < shape.size(); ++i) {
        if (shape[i] < 0) {
            return std::unexpected(std::format("Negative extent in shape {}.", shape));
        }
        if (chunk_shape[i] < 1) {
            return std::unexpected(std::format("Chunk shape {} must be positive on every axis.", chunk_shape));
        }
        if (block_shape[i] < 1 || block_shape[i] > chunk_shape[i]) {
            return std::unexpected(std::format("Block shape {} must satisfy 1 <= block <= chunk {} on every axis.",
                                               block_shape, chunk_shape));
        }
    }
    if (element_size == 0) {
        return std::unexpected("Element size must be positive.");
    }
    if (element_size > static_cast<size_t>(std::numeric_limits<int64_t>::max())) {
        return std::unexpected(std::format("Element size {} is too large.", element_size));
    }

    // Chunk count, chunk bytes and the padded array bytes must all be addressable.
    const auto item = static_cast<int64_t>(element_size);
    int64_t chunk_count = 1;
    int64_t chunk_nbytes = item;
    int64_t padded_nbytes = item;
    for (size_t i = 0; i < shape.size(); ++i) {
        const int64_t chunks_on_axis = shape[i] / chunk_shape[i] + (shape[i] % chunk_shape[i] > 0 ? 1 : 0);
        int64_t padded_extent = 0;
        if (!checked_multiply(chunk_count, chunks_on_axis, chunk_count) ||
            !checked_multiply(chunk_nbytes, chunk_shape[i], chunk_nbytes) ||
            !checked_multiply(chunks_on_axis, chunk_shape[i], padded_extent) ||
            !checked_multiply(padded_nbytes, padded_extent, padded_nbytes)) {
            return std::unexpected(std::format("Shape {} in chunks of {} with {}-byte elements exceeds the addressable size.",
                                               shape, chunk_shape, element_size));
        }
    }
    if (dtype != DType::OPAQUE && get_dtype_size(dtype) != element_size) {
        return std::unexpected(std::format("Element size {} does not match dtype {} ({} bytes).",
                                           element_size, magic_enum::enum_name(dtype), get_dtype_size(dtype)));
    }
    return {};
}

memory::byte_vector serialize_descriptor(const DatasetDescriptor& descriptor) {
    const nlohmann::json j = {
        {"format", FORMAT_NAME},
        {"shape", coords_to_json(descriptor.shape)},
        {"chunk_shape", coords_to_json(descriptor.chunk_shape)},
        {"block_shape", coords_to_json(descriptor.block_shape)},
        {"element_size", descriptor.element_size},
        {"dtype", magic_enum::enum_name(descriptor.dtype)},
        {"byte_order", magic_enum::enum_name(descriptor.byte_order)},
        {"codec", magic_enum::enum_name(descriptor.codec)},
        {"block_shape_recorded", descriptor.block_shape_recorded},
    };
    const auto text = j.dump();
    const auto bytes = std::as_bytes(std::span(text));
    return {bytes.begin(), bytes.end()};
}

std::expected<DatasetDescriptor, std::string> parse_descriptor(std::span<const std::byte> bytes) {
    DatasetDescriptor descriptor;
    try {
        const auto j = nlohmann::json::parse(reinterpret_cast<const char*>(bytes.data()),
                                             reinterpret_cast<const char*>(bytes.data() + bytes.size()));
        if (j.value("format", std::string{}) != FORMAT_NAME) {
            return std::unexpected("Dataset metadata is not a chunkslice descriptor.");
        }
        descriptor.shape = coords_from_json(j, "shape");
        descriptor.chunk_shape = coords_from_json(j, "chunk_shape");
        descriptor.block_shape = coords_from_json(j, "block_shape");
        descriptor.element_size = j.at("element_size").get<size_t>();
        descriptor.dtype = enum_from_json<DType>(j, "dtype");
        descriptor.byte_order = enum_from_json<ByteOrder>(j, "byte_order");
        descriptor.codec = enum_from_json<ChunkCodec>(j, "codec");
        descriptor.block_shape_recorded = j.value("block_shape_recorded", true);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::format("Invalid dataset metadata: {}", e.what()));
    }

    if (auto res = descriptor.validate(); !res) {
        return std::unexpected(res.error());
    }
    return descriptor;
}

} // namespace chunkslice
