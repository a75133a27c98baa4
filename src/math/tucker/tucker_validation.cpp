// SPDX-License-Identifier: MIT
#include "tuckerkit/math/tucker/tucker_validation.hpp"
#include "tuckerkit/support/tuckerkit_trace.h"

namespace tuckerkit {

namespace {

constexpr size_t kMinFactors = 2;

StructuralError reject(StructuralError err) {
    TUCKERKIT_TRACE_VALIDATION_ERROR(MODULE_TUCKER_VALIDATION,
        static_cast<int>(err.code), err.index, err.expected, err.actual);
    return err;
}

}  // namespace

std::expected<TuckerShape, StructuralError>
validate_tucker_dims(std::span<const size_t> core_shape,
                     std::span<const FactorDims> factors) {
    if (factors.size() < kMinFactors) {
        return std::unexpected(reject(StructuralError(
            StructuralErrorCode::TooFewFactors, 0, kMinFactors, factors.size())));
    }
    if (factors.size() != core_shape.size()) {
        return std::unexpected(reject(StructuralError(
            StructuralErrorCode::FactorCountMismatch, 0, core_shape.size(),
            factors.size())));
    }

    TuckerShape result;
    result.shape.reserve(factors.size());
    result.rank.reserve(factors.size());
    for (size_t i = 0; i < factors.size(); ++i) {
        if (factors[i].cols != core_shape[i]) {
            return std::unexpected(reject(StructuralError(
                StructuralErrorCode::FactorRankMismatch, i, core_shape[i],
                factors[i].cols)));
        }
        result.shape.push_back(factors[i].rows);
        result.rank.push_back(factors[i].cols);
    }
    return result;
}

}  // namespace tuckerkit
