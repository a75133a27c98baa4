// SPDX-License-Identifier: MIT
#pragma once

#include "tuckerkit/math/tensor/dense_tensor.hpp"
#include "tuckerkit/math/tensor/mode_product.hpp"
#include "tuckerkit/math/tensor/unfold.hpp"
#include "tuckerkit/math/tucker/tucker_validation.hpp"
#include "tuckerkit/support/error_types.hpp"
#include "tuckerkit/support/tuckerkit_trace.h"

#include <Eigen/Dense>
#include <cstddef>
#include <expected>
#include <optional>
#include <utility>
#include <vector>

namespace tuckerkit {

/// Tucker representation of an N-dimensional tensor: a core of shape
/// rank[0] x ... x rank[N-1] and one factor matrix of shape
/// shape[i] x rank[i] per mode.
template <typename Scalar>
struct TuckerTensor {
    DenseTensor<Scalar> core;
    std::vector<Matrix<Scalar>> factors;

    [[nodiscard]] size_t ndim() const noexcept { return core.ndim(); }

    /// Total number of stored scalars (core + all factor matrices).
    [[nodiscard]] size_t compressed_size() const noexcept {
        size_t total = core.size();
        for (const auto& U : factors)
            total += static_cast<size_t>(U.rows() * U.cols());
        return total;
    }
};

/// Options shared by the reconstruction functions.
struct TuckerReconstructOptions {
    /// Factor to leave out; that mode keeps the core's extent.
    std::optional<size_t> skip_factor = std::nullopt;
    /// Apply every factor as U^T (factors given as rank x shape).
    bool transpose_factors = false;
};

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

/// Check that (core, factors) is a well-formed Tucker decomposition and
/// return the full shape and multilinear rank it implies.
template <typename Scalar>
[[nodiscard]] std::expected<TuckerShape, StructuralError>
validate_tucker_tensor(const DenseTensor<Scalar>& core,
                       const std::vector<Matrix<Scalar>>& factors) {
    std::vector<FactorDims> dims;
    dims.reserve(factors.size());
    for (const auto& U : factors) {
        dims.push_back({static_cast<size_t>(U.rows()),
                        static_cast<size_t>(U.cols())});
    }
    return validate_tucker_dims(core.shape(), dims);
}

template <typename Scalar>
[[nodiscard]] std::expected<TuckerShape, StructuralError>
validate_tucker_tensor(const TuckerTensor<Scalar>& tucker) {
    return validate_tucker_tensor(tucker.core, tucker.factors);
}

// ---------------------------------------------------------------------------
// Reconstruction
//
// All three conversions run the same multi-mode product; the unfolded and
// vectorised forms are views of its result under the row-major convention
// documented in unfold.hpp.
// ---------------------------------------------------------------------------

/// Full tensor of shape (factors[0].rows(), ..., factors[N-1].rows()).
///
/// With skip_factor = k, mode k keeps core.shape(k). With
/// transpose_factors, factor i is read as rank x shape and the mode-i
/// extent of the result is factors[i].cols().
template <typename Scalar>
[[nodiscard]] std::expected<DenseTensor<Scalar>, StructuralError>
tucker_to_tensor(const DenseTensor<Scalar>& core,
                 const std::vector<Matrix<Scalar>>& factors,
                 const TuckerReconstructOptions& options = {}) {
    TUCKERKIT_TRACE_ALGO_START(MODULE_TUCKER_RECONSTRUCT, core.ndim(),
        options.skip_factor ? static_cast<long>(*options.skip_factor) : -1L,
        options.transpose_factors ? 1 : 0);

    auto full = multi_mode_dot(core, factors,
                               ModeProductOptions{.skip = options.skip_factor,
                                                  .transpose = options.transpose_factors});
    if (full) {
        TUCKERKIT_TRACE_ALGO_COMPLETE(MODULE_TUCKER_RECONSTRUCT,
                                      core.ndim(), full->size());
    }
    return full;
}

template <typename Scalar>
[[nodiscard]] std::expected<DenseTensor<Scalar>, StructuralError>
tucker_to_tensor(const TuckerTensor<Scalar>& tucker,
                 const TuckerReconstructOptions& options = {}) {
    return tucker_to_tensor(tucker.core, tucker.factors, options);
}

/// Mode-`mode` unfolding of the reconstructed tensor.
template <typename Scalar>
[[nodiscard]] std::expected<Matrix<Scalar>, StructuralError>
tucker_to_unfolded(const DenseTensor<Scalar>& core,
                   const std::vector<Matrix<Scalar>>& factors,
                   size_t mode = 0,
                   const TuckerReconstructOptions& options = {}) {
    return tucker_to_tensor(core, factors, options)
        .and_then([mode](const DenseTensor<Scalar>& full) {
            return mode_unfold(full, mode);
        });
}

template <typename Scalar>
[[nodiscard]] std::expected<Matrix<Scalar>, StructuralError>
tucker_to_unfolded(const TuckerTensor<Scalar>& tucker,
                   size_t mode = 0,
                   const TuckerReconstructOptions& options = {}) {
    return tucker_to_unfolded(tucker.core, tucker.factors, mode, options);
}

/// Row-major vectorisation of the reconstructed tensor.
///
/// Mathematically kronecker(factors) * tensor_to_vec(core), computed
/// without forming the Kronecker product.
template <typename Scalar>
[[nodiscard]] std::expected<Vector<Scalar>, StructuralError>
tucker_to_vec(const DenseTensor<Scalar>& core,
              const std::vector<Matrix<Scalar>>& factors,
              const TuckerReconstructOptions& options = {}) {
    return tucker_to_tensor(core, factors, options)
        .transform([](const DenseTensor<Scalar>& full) {
            return tensor_to_vec(full);
        });
}

template <typename Scalar>
[[nodiscard]] std::expected<Vector<Scalar>, StructuralError>
tucker_to_vec(const TuckerTensor<Scalar>& tucker,
              const TuckerReconstructOptions& options = {}) {
    return tucker_to_vec(tucker.core, tucker.factors, options);
}

// ---------------------------------------------------------------------------
// tucker_contract: full contraction with one coefficient vector per mode,
//
//     sum_{i0..iN-1} T[i0, ..., iN-1] * c0[i0] * ... * cN-1[iN-1]
//
// without reconstructing T. Each vector is first projected into rank space
// (p_d = U_d^T c_d), then the core is reduced one axis at a time starting
// from the last (contiguous) axis. With unit vectors this
// reads a single entry of the reconstructed tensor.
// ---------------------------------------------------------------------------
template <typename Scalar>
[[nodiscard]] std::expected<Scalar, StructuralError>
tucker_contract(const TuckerTensor<Scalar>& tucker,
                const std::vector<Vector<Scalar>>& coeffs) {
    auto dims = validate_tucker_tensor(tucker);
    if (!dims) return std::unexpected(dims.error());

    const size_t n_modes = tucker.ndim();
    if (coeffs.size() != n_modes) {
        return std::unexpected(StructuralError(
            StructuralErrorCode::FactorCountMismatch, 0, n_modes, coeffs.size()));
    }

    std::vector<Vector<Scalar>> projected(n_modes);
    for (size_t d = 0; d < n_modes; ++d) {
        const auto& U = tucker.factors[d];
        if (coeffs[d].size() != U.rows()) {
            return std::unexpected(StructuralError(
                StructuralErrorCode::FactorRankMismatch, d,
                static_cast<size_t>(U.rows()),
                static_cast<size_t>(coeffs[d].size())));
        }
        projected[d] = U.transpose() * coeffs[d];
    }

    // Row-major core viewed as (outer x rank[d]): reducing the last axis is
    // a matrix-vector product.
    Vector<Scalar> buf = tensor_to_vec(tucker.core);
    for (size_t d = n_modes; d-- > 0;) {
        const auto axis_len = static_cast<Eigen::Index>(dims->rank[d]);
        const Eigen::Index outer = axis_len == 0 ? 0 : buf.size() / axis_len;
        Eigen::Map<const RowMajorMatrix<Scalar>> slab(buf.data(), outer, axis_len);
        Vector<Scalar> next = slab * projected[d];
        buf = std::move(next);
    }
    return buf.size() == 0 ? Scalar(0) : buf(0);
}

}  // namespace tuckerkit
