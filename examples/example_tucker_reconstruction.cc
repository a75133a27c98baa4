/**
 * @file example_tucker_reconstruction.cc
 * @brief Validate a Tucker decomposition, reconstruct it, and show a rejected one
 */

#include "tuckerkit/math/tucker/tucker_tensor.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <numeric>

using namespace tuckerkit;

int main() {
    std::cout << "=== Tucker Reconstruction Example ===\n\n";

    // Core of shape (2, 3, 2) filled with 0, 1, ..., 11
    std::vector<double> values(12);
    std::iota(values.begin(), values.end(), 0.0);
    auto core = DenseTensor<double>::build({2, 3, 2}, values);
    if (!core) {
        std::cout << "✗ Failed to build core: " << core.error() << "\n";
        return 1;
    }

    std::vector<Matrix<double>> factors = {
        Matrix<double>::Constant(4, 2, 0.5),
        Matrix<double>::Identity(3, 3),
        Matrix<double>::Ones(5, 2),
    };
    TuckerTensor<double> tucker{std::move(*core), factors};

    // 1. Validation
    {
        std::cout << "1. Validation:\n";
        auto dims = validate_tucker_tensor(tucker);
        if (!dims) {
            std::cout << "   ✗ " << dims.error() << "\n";
            return 1;
        }
        std::cout << "   ✓ shape = (";
        for (size_t i = 0; i < dims->shape.size(); ++i)
            std::cout << (i ? ", " : "") << dims->shape[i];
        std::cout << "), rank = (";
        for (size_t i = 0; i < dims->rank.size(); ++i)
            std::cout << (i ? ", " : "") << dims->rank[i];
        std::cout << ")\n";
        std::cout << "   ✓ compressed size: " << tucker.compressed_size()
                  << " scalars\n\n";
    }

    // 2. Full reconstruction and mode-1 unfolding
    {
        std::cout << "2. Reconstruction:\n";
        auto full = tucker_to_tensor(tucker);
        if (!full) {
            std::cout << "   ✗ " << full.error() << "\n";
            return 1;
        }
        std::cout << "   ✓ full tensor holds " << full->size() << " values\n";

        auto unfolded = tucker_to_unfolded(tucker, 1);
        if (!unfolded) {
            std::cout << "   ✗ " << unfolded.error() << "\n";
            return 1;
        }
        std::cout << "   ✓ mode-1 unfolding (" << unfolded->rows() << " x "
                  << unfolded->cols() << "), first row:\n     ";
        std::cout << std::fixed << std::setprecision(1);
        for (Eigen::Index j = 0; j < std::min<Eigen::Index>(unfolded->cols(), 8); ++j)
            std::cout << (*unfolded)(0, j) << " ";
        std::cout << "...\n\n";
    }

    // 3. A malformed decomposition
    {
        std::cout << "3. Malformed decomposition (factor 2 has rank 3):\n";
        auto broken = tucker;
        broken.factors[2] = Matrix<double>::Ones(5, 3);
        auto dims = validate_tucker_tensor(broken);
        if (dims) {
            std::cout << "   ✗ unexpectedly accepted\n";
            return 1;
        }
        std::cout << "   ✓ rejected: " << dims.error() << "\n";
    }

    return 0;
}
