// SPDX-License-Identifier: MIT
/**
 * @file tucker_reconstruct_benchmark.cc
 * @brief Tucker reconstruction: chained mode products vs Kronecker reference
 *
 * Measures:
 * - tucker_to_tensor on cubic tensors of growing order (3, 4, 5 modes)
 * - tucker_to_unfolded for a middle mode (adds one unfold copy)
 * - kronecker(factors) * vec(core), the reference path, on small sizes only
 *   since its matrix has prod(shape) x prod(rank) entries
 */

#include <benchmark/benchmark.h>
#include "tuckerkit/math/tensor/kronecker.hpp"
#include "tuckerkit/math/tucker/tucker_tensor.hpp"

#include <cstdint>
#include <random>
#include <stdexcept>
#include <vector>

using namespace tuckerkit;

namespace {

TuckerTensor<double> make_tucker(size_t n_modes, size_t dim, size_t rank,
                                 uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> uniform(-1.0, 1.0);

    auto core = DenseTensor<double>::zeros(std::vector<size_t>(n_modes, rank));
    if (!core) throw std::runtime_error(to_string(core.error()));
    for (double& v : core->mutable_values()) v = uniform(rng);

    std::vector<Matrix<double>> factors;
    for (size_t m = 0; m < n_modes; ++m) {
        Matrix<double> U(static_cast<Eigen::Index>(dim),
                         static_cast<Eigen::Index>(rank));
        for (Eigen::Index j = 0; j < U.cols(); ++j)
            for (Eigen::Index i = 0; i < U.rows(); ++i)
                U(i, j) = uniform(rng);
        factors.push_back(std::move(U));
    }
    return TuckerTensor<double>{std::move(*core), std::move(factors)};
}

}  // namespace

// ============================================================================
// Mode-product path
// ============================================================================

static void BM_TuckerToTensor(benchmark::State& state) {
    const auto n_modes = static_cast<size_t>(state.range(0));
    const auto dim = static_cast<size_t>(state.range(1));
    const size_t rank = dim / 4 + 1;
    auto tucker = make_tucker(n_modes, dim, rank, 42);

    size_t n_out = 0;
    for (auto _ : state) {
        auto full = tucker_to_tensor(tucker);
        if (!full) {
            state.SkipWithError(to_string(full.error()).c_str());
            break;
        }
        n_out = full->size();
        benchmark::DoNotOptimize(full->data());
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n_out));
    state.counters["modes"] = static_cast<double>(n_modes);
    state.counters["rank"] = static_cast<double>(rank);
}

static void BM_TuckerToUnfoldedMiddleMode(benchmark::State& state) {
    const auto n_modes = static_cast<size_t>(state.range(0));
    const auto dim = static_cast<size_t>(state.range(1));
    auto tucker = make_tucker(n_modes, dim, dim / 4 + 1, 7);

    for (auto _ : state) {
        auto unfolded = tucker_to_unfolded(tucker, n_modes / 2);
        if (!unfolded) {
            state.SkipWithError(to_string(unfolded.error()).c_str());
            break;
        }
        benchmark::DoNotOptimize(unfolded->data());
    }
}

// ============================================================================
// Kronecker reference path
// ============================================================================

static void BM_KroneckerTimesCore(benchmark::State& state) {
    const auto n_modes = static_cast<size_t>(state.range(0));
    const auto dim = static_cast<size_t>(state.range(1));
    auto tucker = make_tucker(n_modes, dim, dim / 4 + 1, 42);
    Vector<double> core_vec = tensor_to_vec(tucker.core);

    for (auto _ : state) {
        auto K = kronecker(tucker.factors);
        if (!K) {
            state.SkipWithError(to_string(K.error()).c_str());
            break;
        }
        Vector<double> v = (*K) * core_vec;
        benchmark::DoNotOptimize(v.data());
    }
}

// ============================================================================
// Register Benchmarks
// ============================================================================

BENCHMARK(BM_TuckerToTensor)
    ->Args({3, 16})->Args({3, 64})->Args({4, 16})->Args({4, 32})->Args({5, 12})
    ->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_TuckerToUnfoldedMiddleMode)
    ->Args({3, 64})->Args({4, 32})
    ->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_KroneckerTimesCore)
    ->Args({3, 8})->Args({3, 16})->Args({4, 8})
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
