// SPDX-License-Identifier: MIT
#include "tuckerkit/support/error_types.hpp"

#include <sstream>

namespace tuckerkit {

const char* to_string(StructuralErrorCode code) noexcept {
    switch (code) {
        case StructuralErrorCode::TooFewFactors:
            return "TooFewFactors";
        case StructuralErrorCode::FactorCountMismatch:
            return "FactorCountMismatch";
        case StructuralErrorCode::FactorRankMismatch:
            return "FactorRankMismatch";
        case StructuralErrorCode::InvalidMode:
            return "InvalidMode";
        case StructuralErrorCode::DataSizeMismatch:
            return "DataSizeMismatch";
        case StructuralErrorCode::ShapeOverflow:
            return "ShapeOverflow";
    }
    return "Unknown";
}

std::string to_string(const StructuralError& err) {
    std::ostringstream os;
    os << to_string(err.code) << ": ";
    switch (err.code) {
        case StructuralErrorCode::TooFewFactors:
            os << "a Tucker tensor needs a core and at least " << err.expected
               << " factors, got " << err.actual;
            break;
        case StructuralErrorCode::FactorCountMismatch:
            os << "one factor per core mode required, core has " << err.expected
               << " modes but " << err.actual << " factors were given";
            break;
        case StructuralErrorCode::FactorRankMismatch:
            os << "factors[" << err.index << "] contracts a dimension of "
               << err.actual << " but core.shape(" << err.index << ")="
               << err.expected;
            break;
        case StructuralErrorCode::InvalidMode:
            os << "mode " << err.actual << " out of range for a tensor with "
               << err.expected << " modes";
            break;
        case StructuralErrorCode::DataSizeMismatch:
            os << "shape holds " << err.expected << " elements but buffer has "
               << err.actual;
            break;
        case StructuralErrorCode::ShapeOverflow:
            os << "element count overflows size_t (" << err.expected << " * "
               << err.actual << ")";
            break;
    }
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const StructuralError& err) {
    return os << to_string(err);
}

}  // namespace tuckerkit
