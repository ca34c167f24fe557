#pragma once

#include <algorithm>
#include <cstddef>
#include <span>

#include "../file_format/dataset_format.h"

namespace chunkslice {

/** @brief Whether values of `dtype` stored in `order` must be swapped to be read natively. */
constexpr bool needs_byte_swap(const DType dtype, const ByteOrder order) {
    return dtype != DType::OPAQUE && get_dtype_size(dtype) > 1 && order != native_byte_order();
}

/** @brief Reverses the bytes of every `element_size`-byte element of `data` in place. */
inline void byteswap_elements(std::span<std::byte> data, const size_t element_size) {
    for (size_t pos = 0; pos + element_size <= data.size(); pos += element_size) {
        std::ranges::reverse(data.subspan(pos, element_size));
    }
}

} // namespace chunkslice
