// SPDX-License-Identifier: MIT
#pragma once

#include "tuckerkit/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <limits>
#include <span>

namespace tuckerkit {

/// Safely multiply two size_t values, detecting overflow via __int128
///
/// @param a First operand
/// @param b Second operand
/// @return Product if no overflow, OverflowError otherwise
[[nodiscard]] inline std::expected<size_t, OverflowError>
safe_multiply(size_t a, size_t b) noexcept {
    using uint128_t = unsigned __int128;

    uint128_t product = static_cast<uint128_t>(a) * static_cast<uint128_t>(b);

    if (product > std::numeric_limits<size_t>::max()) {
        return std::unexpected(OverflowError{a, b});
    }

    return static_cast<size_t>(product);
}

/// Safely compute the product of a list of extents
///
/// The empty product is 1 (a rank-0 tensor holds one element).
///
/// @param sizes Extents to multiply
/// @return Product if no overflow, OverflowError otherwise
[[nodiscard]] inline std::expected<size_t, OverflowError>
safe_product(std::span<const size_t> sizes) noexcept {
    std::expected<size_t, OverflowError> result{1};

    for (const auto& v : sizes) {
        result = result.and_then([v](size_t acc) {
            return safe_multiply(acc, v);
        });
        if (!result) return result;
    }

    return result;
}

/// Element count of a tensor shape, with overflow reported as a
/// StructuralError so it flows through the tensor API unchanged.
[[nodiscard]] inline std::expected<size_t, StructuralError>
shape_element_count(std::span<const size_t> shape) noexcept {
    return safe_product(shape).transform_error(
        [](const OverflowError& e) { return to_structural_error(e); });
}

}  // namespace tuckerkit
