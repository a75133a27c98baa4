// SPDX-License-Identifier: MIT
#pragma once

#include "tuckerkit/support/error_types.hpp"

#include <cstddef>
#include <expected>
#include <span>
#include <vector>

namespace tuckerkit {

/// Full shape and multilinear rank implied by a Tucker decomposition.
struct TuckerShape {
    std::vector<size_t> shape;  ///< shape[i] = factors[i].rows()
    std::vector<size_t> rank;   ///< rank[i] = factors[i].cols() = core.shape(i)
};

/// Dimensions of one factor matrix, (output_dim, rank).
struct FactorDims {
    size_t rows;
    size_t cols;
};

/// Structural validation of a Tucker decomposition given only its dimensions.
///
/// Checks, in order:
///   1. at least two factors                      -> TooFewFactors
///   2. one factor per core mode                  -> FactorCountMismatch
///   3. factors[i].cols() == core_shape[i] for all i -> FactorRankMismatch(i)
///
/// The first failing check is reported.
[[nodiscard]] std::expected<TuckerShape, StructuralError>
validate_tucker_dims(std::span<const size_t> core_shape,
                     std::span<const FactorDims> factors);

}  // namespace tuckerkit
