// SPDX-License-Identifier: MIT
#pragma once

#include "tuckerkit/math/tensor/dense_tensor.hpp"
#include "tuckerkit/support/error_types.hpp"
#include "tuckerkit/support/tuckerkit_trace.h"

#include <Eigen/Dense>
#include <unsupported/Eigen/KroneckerProduct>
#include <cstddef>
#include <expected>
#include <optional>
#include <vector>

namespace tuckerkit {

struct KroneckerOptions {
    /// Index of a matrix to leave out of the chain.
    std::optional<size_t> skip_matrix = std::nullopt;
    /// Use every matrix in transposed orientation.
    bool transpose = false;
};

/// Kronecker chain A0 (x) A1 (x) ... (x) A_{n-1}, left to right.
///
/// The leftmost factor varies slowest, matching the row-major unfolding
/// convention in unfold.hpp: for a Tucker tensor (G, U)
///
///     unfold(T, m)    = U[m] * unfold(G, m) * kronecker(U, {.skip_matrix = m})^T
///     tensor_to_vec(T) = kronecker(U) * tensor_to_vec(G)
///
/// The result has prod(rows) x prod(cols) entries, so this is a reference
/// path for small problems, not a way to reconstruct tensors.
template <typename Scalar>
[[nodiscard]] std::expected<Matrix<Scalar>, StructuralError>
kronecker(const std::vector<Matrix<Scalar>>& matrices,
          const KroneckerOptions& options = {}) {
    const size_t n = matrices.size();
    if (options.skip_matrix && *options.skip_matrix >= n) {
        TUCKERKIT_TRACE_VALIDATION_ERROR(MODULE_KRONECKER,
            static_cast<int>(StructuralErrorCode::InvalidMode),
            *options.skip_matrix, n, *options.skip_matrix);
        return std::unexpected(StructuralError(
            StructuralErrorCode::InvalidMode, *options.skip_matrix, n,
            *options.skip_matrix));
    }
    const size_t used = options.skip_matrix ? n - 1 : n;
    if (used == 0) {
        TUCKERKIT_TRACE_VALIDATION_ERROR(MODULE_KRONECKER,
            static_cast<int>(StructuralErrorCode::TooFewFactors), 0, 1, 0);
        return std::unexpected(
            StructuralError(StructuralErrorCode::TooFewFactors, 0, 1, 0));
    }

    TUCKERKIT_TRACE_ALGO_START(MODULE_KRONECKER, n,
        options.skip_matrix ? static_cast<long>(*options.skip_matrix) : -1L,
        options.transpose ? 1 : 0);

    std::optional<Matrix<Scalar>> result;
    for (size_t i = 0; i < n; ++i) {
        if (options.skip_matrix == i) continue;
        Matrix<Scalar> next = options.transpose
            ? Matrix<Scalar>(matrices[i].transpose())
            : matrices[i];
        if (!result) {
            result = std::move(next);
        } else {
            Matrix<Scalar> product = Eigen::kroneckerProduct(*result, next);
            result = std::move(product);
        }
    }

    TUCKERKIT_TRACE_ALGO_COMPLETE(MODULE_KRONECKER, used,
        static_cast<size_t>(result->size()));
    return std::move(*result);
}

}  // namespace tuckerkit
