// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <expected>
#include <ostream>
#include <string>

namespace tuckerkit {

/// Structural failure categories for tensors and Tucker decompositions
enum class StructuralErrorCode {
    TooFewFactors,        ///< Fewer factor matrices than a decomposition needs
    FactorCountMismatch,  ///< Factor count differs from the core's number of modes
    FactorRankMismatch,   ///< Factor's contracted dimension differs from the core extent
    InvalidMode,          ///< Mode or skip index is out of range
    DataSizeMismatch,     ///< Buffer length differs from the product of the shape
    ShapeOverflow         ///< Product of the shape does not fit in size_t
};

/// Detailed structural error
///
/// `index` locates the offending mode or factor; `expected` is the
/// dimension the invariant requires and `actual` the one that was given.
/// Codes that are not about a single mode leave `index` at 0.
struct StructuralError {
    StructuralErrorCode code;
    size_t index;
    size_t expected;
    size_t actual;

    StructuralError(StructuralErrorCode code,
                    size_t index = 0,
                    size_t expected = 0,
                    size_t actual = 0)
        : code(code), index(index), expected(expected), actual(actual) {}
};

/// Error for size arithmetic overflow
struct OverflowError {
    size_t operand_a;
    size_t operand_b;
};

/// Lift an overflow into the structural taxonomy
inline StructuralError to_structural_error(const OverflowError& err) {
    return StructuralError(StructuralErrorCode::ShapeOverflow, 0,
                           err.operand_a, err.operand_b);
}

[[nodiscard]] const char* to_string(StructuralErrorCode code) noexcept;

/// Human-readable description naming the index and both dimensions
[[nodiscard]] std::string to_string(const StructuralError& err);

std::ostream& operator<<(std::ostream& os, const StructuralError& err);

inline std::ostream& operator<<(std::ostream& os, const OverflowError& err) {
    os << "OverflowError{operand_a=" << err.operand_a
       << ", operand_b=" << err.operand_b << "}";
    return os;
}

}  // namespace tuckerkit
