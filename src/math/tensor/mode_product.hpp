// SPDX-License-Identifier: MIT
#pragma once

#include "tuckerkit/math/tensor/dense_tensor.hpp"
#include "tuckerkit/math/tensor/unfold.hpp"
#include "tuckerkit/support/error_types.hpp"
#include "tuckerkit/support/tuckerkit_trace.h"

#include <Eigen/Dense>
#include <cstddef>
#include <expected>
#include <optional>
#include <utility>
#include <vector>

namespace tuckerkit {

/// Options for multi_mode_dot.
struct ModeProductOptions {
    /// Mode left untouched; its extent is carried over from the input.
    std::optional<size_t> skip = std::nullopt;
    /// Contract against U^T instead of U on every contracted mode.
    bool transpose = false;
};

// ---------------------------------------------------------------------------
// mode_dot: n-mode product Y = X x_m U.
//
//   Y_(m) = U * X_(m)            (transpose = false, U is J x I_m)
//   Y_(m) = U^T * X_(m)          (transpose = true,  U is I_m x J)
//
// computed as one GEMM against the mode-m unfolding, then folded back with
// the mode-m extent replaced by J. Every other extent is unchanged.
// ---------------------------------------------------------------------------
template <typename Scalar>
[[nodiscard]] std::expected<DenseTensor<Scalar>, StructuralError>
mode_dot(const DenseTensor<Scalar>& tensor,
         const Matrix<Scalar>& U,
         size_t mode,
         bool transpose = false) {
    if (mode >= tensor.ndim()) {
        TUCKERKIT_TRACE_VALIDATION_ERROR(MODULE_MODE_PRODUCT,
            static_cast<int>(StructuralErrorCode::InvalidMode),
            mode, tensor.ndim(), mode);
        return std::unexpected(detail::invalid_mode(mode, tensor.ndim()));
    }

    const auto contracted = static_cast<size_t>(transpose ? U.rows() : U.cols());
    const auto produced = static_cast<size_t>(transpose ? U.cols() : U.rows());
    if (contracted != tensor.extent(mode)) {
        TUCKERKIT_TRACE_VALIDATION_ERROR(MODULE_MODE_PRODUCT,
            static_cast<int>(StructuralErrorCode::FactorRankMismatch),
            mode, tensor.extent(mode), contracted);
        return std::unexpected(StructuralError(
            StructuralErrorCode::FactorRankMismatch, mode,
            tensor.extent(mode), contracted));
    }

    auto X = mode_unfold(tensor, mode);
    if (!X) return std::unexpected(X.error());

    TUCKERKIT_TRACE_MODE_PRODUCT(mode, contracted, produced,
                                 static_cast<size_t>(X->cols()));

    Matrix<Scalar> Y(static_cast<Eigen::Index>(produced), X->cols());
    if (transpose) {
        Y.noalias() = U.transpose() * (*X);
    } else {
        Y.noalias() = U * (*X);
    }

    std::vector<size_t> shape = tensor.shape();
    shape[mode] = produced;
    return mode_fold(Y, mode, std::move(shape));
}

// ---------------------------------------------------------------------------
// multi_mode_dot: chain of n-mode products, one factor per mode.
//
// Applies mode_dot(X, factors[m], m) for m = 0, 1, ..., N-1 in ascending
// order, leaving out options.skip. n-mode products on distinct modes
// commute, so the order only affects floating-point rounding.
//
// factors.size() must equal X.ndim() even when a mode is skipped; the
// skipped entry is never read.
// ---------------------------------------------------------------------------
template <typename Scalar>
[[nodiscard]] std::expected<DenseTensor<Scalar>, StructuralError>
multi_mode_dot(const DenseTensor<Scalar>& X,
               const std::vector<Matrix<Scalar>>& factors,
               const ModeProductOptions& options = {}) {
    const size_t n_modes = X.ndim();
    if (factors.size() != n_modes) {
        TUCKERKIT_TRACE_VALIDATION_ERROR(MODULE_MODE_PRODUCT,
            static_cast<int>(StructuralErrorCode::FactorCountMismatch),
            0, n_modes, factors.size());
        return std::unexpected(StructuralError(
            StructuralErrorCode::FactorCountMismatch, 0, n_modes,
            factors.size()));
    }
    if (options.skip && *options.skip >= n_modes) {
        TUCKERKIT_TRACE_VALIDATION_ERROR(MODULE_MODE_PRODUCT,
            static_cast<int>(StructuralErrorCode::InvalidMode),
            *options.skip, n_modes, *options.skip);
        return std::unexpected(detail::invalid_mode(*options.skip, n_modes));
    }

    TUCKERKIT_TRACE_ALGO_START(MODULE_MODE_PRODUCT, n_modes,
        options.skip ? static_cast<long>(*options.skip) : -1L,
        options.transpose ? 1 : 0);

    // The input is only read; the first product allocates the working tensor.
    std::optional<DenseTensor<Scalar>> working;
    size_t n_products = 0;
    for (size_t mode = 0; mode < n_modes; ++mode) {
        if (options.skip == mode) continue;
        const DenseTensor<Scalar>& src = working ? *working : X;
        auto next = mode_dot(src, factors[mode], mode, options.transpose);
        if (!next) return std::unexpected(next.error());
        working = std::move(*next);
        ++n_products;
    }

    if (!working) {
        // Nothing to contract (every mode skipped): return an unchanged copy.
        working = X;
    }

    TUCKERKIT_TRACE_ALGO_COMPLETE(MODULE_MODE_PRODUCT, n_products,
                                  working->size());
    return std::move(*working);
}

}  // namespace tuckerkit
