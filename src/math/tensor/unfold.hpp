// SPDX-License-Identifier: MIT
#pragma once

#include "tuckerkit/math/safe_math.hpp"
#include "tuckerkit/math/tensor/dense_tensor.hpp"
#include "tuckerkit/support/error_types.hpp"
#include "tuckerkit/support/parallel.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <expected>
#include <span>
#include <utility>
#include <vector>

namespace tuckerkit {

// ---------------------------------------------------------------------------
// Unfolding convention
//
// Tensors are row-major (C-order): the last mode varies fastest. Viewing a
// tensor of shape [d0, ..., d_{N-1}] around mode m as a 3-way array
//
//     (L, I, R),  L = d0 * ... * d_{m-1},  I = d_m,  R = d_{m+1} * ... * d_{N-1}
//
// the mode-m unfolding is the I x (L * R) matrix
//
//     M(i, l * R + r) = T(l, i, r)
//
// i.e. row = subscript[m], column = the remaining subscripts in native mode
// order with the last mode fastest. For mode 0 this is a plain reshape, so
// tensor_to_vec(T) equals mode_unfold(T, 0) read row by row.
//
// Every component (mode products, Kronecker cross-checks, the Tucker API)
// relies on this one convention; the Kronecker chain A0 (x) A1 (x) ... is
// ordered to match it.
// ---------------------------------------------------------------------------

namespace detail {

/// (L, I, R) decomposition of a shape around one mode.
struct ModeSlabs {
    size_t outer;   ///< L: product of extents before the mode
    size_t extent;  ///< I: extent of the mode
    size_t inner;   ///< R: product of extents after the mode
};

[[nodiscard]] inline std::expected<ModeSlabs, StructuralError>
mode_slabs(std::span<const size_t> shape, size_t mode) {
    auto outer = shape_element_count(shape.first(mode));
    if (!outer) return std::unexpected(outer.error());
    auto inner = shape_element_count(shape.subspan(mode + 1));
    if (!inner) return std::unexpected(inner.error());
    return ModeSlabs{*outer, shape[mode], *inner};
}

[[nodiscard]] inline StructuralError invalid_mode(size_t mode, size_t ndim) {
    return StructuralError(StructuralErrorCode::InvalidMode, mode, ndim, mode);
}

}  // namespace detail

/// Mode-m unfolding (matricization) of a tensor, see the convention above.
///
/// Each of the L slabs is a contiguous row-major I x R block that lands in
/// columns [l*R, (l+1)*R) of the result, so the copy is L block assignments.
template <typename Scalar>
[[nodiscard]] std::expected<Matrix<Scalar>, StructuralError>
mode_unfold(const DenseTensor<Scalar>& tensor, size_t mode) {
    if (mode >= tensor.ndim()) {
        return std::unexpected(detail::invalid_mode(mode, tensor.ndim()));
    }
    auto slabs = detail::mode_slabs(tensor.shape(), mode);
    if (!slabs) return std::unexpected(slabs.error());

    const auto L = static_cast<Eigen::Index>(slabs->outer);
    const auto I = static_cast<Eigen::Index>(slabs->extent);
    const auto R = static_cast<Eigen::Index>(slabs->inner);

    Matrix<Scalar> M(I, L * R);
    const Scalar* src = tensor.data();

    TUCKERKIT_PRAGMA_PARALLEL_FOR_IF(L >= TUCKERKIT_PARALLEL_MIN_SLABS)
    for (Eigen::Index l = 0; l < L; ++l) {
        Eigen::Map<const RowMajorMatrix<Scalar>> slab(src + l * I * R, I, R);
        M.middleCols(l * R, R) = slab;
    }
    return M;
}

/// Inverse of mode_unfold: rebuild a tensor of the given shape from its
/// mode-m unfolding.
///
/// Fails with InvalidMode when mode >= shape.size() and with
/// DataSizeMismatch when the matrix does not have shape[mode] rows and
/// prod(other extents) columns.
template <typename Scalar>
[[nodiscard]] std::expected<DenseTensor<Scalar>, StructuralError>
mode_fold(const Matrix<Scalar>& M, size_t mode, std::vector<size_t> shape) {
    if (mode >= shape.size()) {
        return std::unexpected(detail::invalid_mode(mode, shape.size()));
    }
    auto slabs = detail::mode_slabs(shape, mode);
    if (!slabs) return std::unexpected(slabs.error());

    if (static_cast<size_t>(M.rows()) != slabs->extent) {
        return std::unexpected(StructuralError(
            StructuralErrorCode::DataSizeMismatch, mode,
            slabs->extent, static_cast<size_t>(M.rows())));
    }
    auto cols = safe_multiply(slabs->outer, slabs->inner);
    if (!cols) return std::unexpected(to_structural_error(cols.error()));
    if (static_cast<size_t>(M.cols()) != *cols) {
        return std::unexpected(StructuralError(
            StructuralErrorCode::DataSizeMismatch, mode,
            *cols, static_cast<size_t>(M.cols())));
    }

    auto tensor = DenseTensor<Scalar>::zeros(std::move(shape));
    if (!tensor) return std::unexpected(tensor.error());

    const auto L = static_cast<Eigen::Index>(slabs->outer);
    const auto I = static_cast<Eigen::Index>(slabs->extent);
    const auto R = static_cast<Eigen::Index>(slabs->inner);
    Scalar* dst = tensor->data();

    TUCKERKIT_PRAGMA_PARALLEL_FOR_IF(L >= TUCKERKIT_PARALLEL_MIN_SLABS)
    for (Eigen::Index l = 0; l < L; ++l) {
        Eigen::Map<RowMajorMatrix<Scalar>> slab(dst + l * I * R, I, R);
        slab = M.middleCols(l * R, R);
    }
    return tensor;
}

/// Row-major vectorisation: element k of the result is values()[k].
template <typename Scalar>
[[nodiscard]] Vector<Scalar> tensor_to_vec(const DenseTensor<Scalar>& tensor) {
    return Eigen::Map<const Vector<Scalar>>(
        tensor.data(), static_cast<Eigen::Index>(tensor.size()));
}

/// Inverse of tensor_to_vec.
template <typename Scalar>
[[nodiscard]] std::expected<DenseTensor<Scalar>, StructuralError>
vec_to_tensor(const Vector<Scalar>& vec, std::vector<size_t> shape) {
    std::vector<Scalar> values(vec.data(), vec.data() + vec.size());
    return DenseTensor<Scalar>::build(std::move(shape), std::move(values));
}

}  // namespace tuckerkit
