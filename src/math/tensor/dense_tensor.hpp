// SPDX-License-Identifier: MIT
#pragma once

#include "tuckerkit/math/safe_math.hpp"
#include "tuckerkit/support/error_types.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <expected>
#include <initializer_list>
#include <span>
#include <utility>
#include <vector>

namespace tuckerkit {

/// Column-major dense matrix used for factor matrices and unfoldings.
template <typename Scalar>
using Matrix = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;

/// Dense column vector used for vectorised tensors.
template <typename Scalar>
using Vector = Eigen::Matrix<Scalar, Eigen::Dynamic, 1>;

/// Row-major view type used to address a contiguous tensor slab as a matrix.
template <typename Scalar>
using RowMajorMatrix =
    Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Dense N-dimensional tensor with a runtime number of modes.
///
/// Values are stored contiguously in row-major (C) order: the last mode
/// varies fastest. A tensor with an empty shape is a scalar holding one
/// value. Extents may be zero, in which case the tensor holds no values.
///
/// Scalar is any type Eigen accepts as a matrix coefficient; double is the
/// production type, integer types give exact arithmetic.
template <typename Scalar>
class DenseTensor {
public:
    using value_type = Scalar;

    /// Wrap an existing row-major buffer.
    /// Fails when values.size() differs from the product of the shape.
    [[nodiscard]] static std::expected<DenseTensor, StructuralError>
    build(std::vector<size_t> shape, std::vector<Scalar> values) {
        auto count = shape_element_count(shape);
        if (!count) {
            return std::unexpected(count.error());
        }
        if (*count != values.size()) {
            return std::unexpected(StructuralError(
                StructuralErrorCode::DataSizeMismatch, 0, *count, values.size()));
        }
        return DenseTensor(std::move(shape), std::move(values));
    }

    /// Zero-filled tensor of the given shape.
    [[nodiscard]] static std::expected<DenseTensor, StructuralError>
    zeros(std::vector<size_t> shape) {
        auto count = shape_element_count(shape);
        if (!count) {
            return std::unexpected(count.error());
        }
        std::vector<Scalar> values(*count, Scalar(0));
        return DenseTensor(std::move(shape), std::move(values));
    }

    [[nodiscard]] size_t ndim() const noexcept { return shape_.size(); }
    [[nodiscard]] size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] const std::vector<size_t>& shape() const noexcept { return shape_; }
    [[nodiscard]] size_t extent(size_t mode) const { return shape_[mode]; }

    [[nodiscard]] std::span<const Scalar> values() const noexcept { return values_; }
    [[nodiscard]] std::span<Scalar> mutable_values() noexcept { return values_; }
    [[nodiscard]] const Scalar* data() const noexcept { return values_.data(); }
    [[nodiscard]] Scalar* data() noexcept { return values_.data(); }

    /// Row-major strides in elements.
    [[nodiscard]] std::vector<size_t> strides() const {
        std::vector<size_t> s(shape_.size(), 1);
        for (size_t d = shape_.size(); d-- > 1;) {
            s[d - 1] = s[d] * shape_[d];
        }
        return s;
    }

    /// Element access by multi-index. No bounds checking.
    [[nodiscard]] const Scalar& operator()(std::span<const size_t> idx) const {
        return values_[flat_index(idx)];
    }
    [[nodiscard]] Scalar& operator()(std::span<const size_t> idx) {
        return values_[flat_index(idx)];
    }

    [[nodiscard]] const Scalar& at(std::initializer_list<size_t> idx) const {
        return (*this)(std::span<const size_t>(idx.begin(), idx.size()));
    }

private:
    DenseTensor(std::vector<size_t> shape, std::vector<Scalar> values)
        : shape_(std::move(shape)), values_(std::move(values)) {}

    [[nodiscard]] size_t flat_index(std::span<const size_t> idx) const {
        size_t flat = 0;
        for (size_t d = 0; d < shape_.size(); ++d) {
            flat = flat * shape_[d] + idx[d];
        }
        return flat;
    }

    std::vector<size_t> shape_;
    std::vector<Scalar> values_;
};

}  // namespace tuckerkit
