// SPDX-License-Identifier: MIT
#include "tuckerkit/math/tucker/tucker_tensor.hpp"
#include "tuckerkit/math/tensor/kronecker.hpp"
#include "tuckerkit/math/tensor/unfold.hpp"
#include "random_tucker.hpp"
#include <gtest/gtest.h>
#include <cstdint>

namespace tuckerkit {
namespace {

// Core of shape (4, 3, 5, 2) with output dims (2, 2, 3, 4)
TuckerTensor<double> four_mode_tucker(uint64_t seed) {
    return testutil::random_tucker({2, 2, 3, 4}, {4, 3, 5, 2}, seed);
}

std::vector<Matrix<double>> transposed(const std::vector<Matrix<double>>& factors) {
    std::vector<Matrix<double>> out;
    for (const auto& U : factors) out.push_back(U.transpose());
    return out;
}

TEST(TuckerToTensorTest, IntegerCoreAndRangeFactors) {
    // X[i][j][k] = 1 + i + 3j + 12k, shape (3, 4, 2)
    std::vector<int64_t> values;
    for (int64_t i = 0; i < 3; ++i)
        for (int64_t j = 0; j < 4; ++j)
            for (int64_t k = 0; k < 2; ++k)
                values.push_back(1 + i + 3 * j + 12 * k);
    auto X = DenseTensor<int64_t>::build({3, 4, 2}, values);
    ASSERT_TRUE(X.has_value());

    // U[m] = arange(R * s).reshape(R, s)
    const std::vector<Eigen::Index> ranks = {2, 3, 4};
    std::vector<Matrix<int64_t>> U;
    for (size_t m = 0; m < 3; ++m) {
        const Eigen::Index R = ranks[m];
        const auto s = static_cast<Eigen::Index>(X->extent(m));
        Matrix<int64_t> F(R, s);
        for (Eigen::Index r = 0; r < R; ++r)
            for (Eigen::Index c = 0; c < s; ++c)
                F(r, c) = r * s + c;
        U.push_back(F);
    }

    const int64_t expected[2][3][4] = {
        {{390, 1518, 2646, 3774},
         {1310, 4966, 8622, 12278},
         {2230, 8414, 14598, 20782}},
        {{1524, 5892, 10260, 14628},
         {5108, 19204, 33300, 47396},
         {8692, 32516, 56340, 80164}}};

    auto res = tucker_to_tensor(*X, U);
    ASSERT_TRUE(res.has_value()) << res.error();
    ASSERT_EQ(res->shape(), (std::vector<size_t>{2, 3, 4}));
    for (size_t a = 0; a < 2; ++a)
        for (size_t b = 0; b < 3; ++b)
            for (size_t c = 0; c < 4; ++c)
                EXPECT_EQ(res->at({a, b, c}), expected[a][b][c])
                    << "at (" << a << ", " << b << ", " << c << ")";
}

TEST(TuckerToTensorTest, ShapeFollowsFactorRows) {
    auto tucker = testutil::random_tucker({6, 5, 4}, {2, 3, 2}, 1);
    auto full = tucker_to_tensor(tucker);
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ(full->shape(), (std::vector<size_t>{6, 5, 4}));
}

TEST(TuckerToTensorTest, SkipFactorKeepsCoreExtent) {
    auto tucker = four_mode_tucker(3);
    for (size_t k = 0; k < 4; ++k) {
        auto full = tucker_to_tensor(tucker, {.skip_factor = k});
        ASSERT_TRUE(full.has_value()) << full.error();
        for (size_t i = 0; i < 4; ++i) {
            size_t want = i == k ? tucker.core.extent(i)
                                 : static_cast<size_t>(tucker.factors[i].rows());
            EXPECT_EQ(full->extent(i), want) << "skip " << k << " mode " << i;
        }
    }
}

TEST(TuckerToTensorTest, SkipFactorEqualsProductOverRemainingModes) {
    auto tucker = four_mode_tucker(4);
    auto skipped = tucker_to_tensor(tucker, {.skip_factor = 2});
    ASSERT_TRUE(skipped.has_value());

    // Replacing the skipped factor by the identity is the same operation
    auto factors = tucker.factors;
    factors[2] = Matrix<double>::Identity(5, 5);
    auto with_identity = tucker_to_tensor(tucker.core, factors);
    ASSERT_TRUE(with_identity.has_value());
    testutil::expect_tensor_near(*skipped, *with_identity, 1e-12);
}

TEST(TuckerToTensorTest, TransposedFactorsGiveSameTensor) {
    auto tucker = four_mode_tucker(5);
    auto full = tucker_to_tensor(tucker);
    auto via_t = tucker_to_tensor(tucker.core, transposed(tucker.factors),
                                  {.transpose_factors = true});
    ASSERT_TRUE(full.has_value());
    ASSERT_TRUE(via_t.has_value()) << via_t.error();
    testutil::expect_tensor_near(*via_t, *full, 1e-12);
}

TEST(TuckerToTensorTest, TransposeShapeFollowsFactorColumns) {
    auto core = testutil::random_tensor({2, 3}, 1);
    std::vector<Matrix<double>> Ut = {testutil::random_matrix(2, 7, 2),
                                      testutil::random_matrix(3, 4, 3)};
    auto full = tucker_to_tensor(core, Ut, {.transpose_factors = true});
    ASSERT_TRUE(full.has_value()) << full.error();
    EXPECT_EQ(full->shape(), (std::vector<size_t>{7, 4}));

    // Non-transposed orientation does not fit this core
    auto wrong = tucker_to_tensor(core, Ut);
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().code, StructuralErrorCode::FactorRankMismatch);
}

TEST(TuckerToTensorTest, SkipAndTransposeCompose) {
    auto tucker = four_mode_tucker(6);
    for (size_t k = 0; k < 4; ++k) {
        auto plain = tucker_to_tensor(tucker, {.skip_factor = k});
        auto both = tucker_to_tensor(tucker.core, transposed(tucker.factors),
                                     {.skip_factor = k, .transpose_factors = true});
        ASSERT_TRUE(plain.has_value());
        ASSERT_TRUE(both.has_value()) << both.error();
        EXPECT_EQ(both->extent(k), tucker.core.extent(k));
        testutil::expect_tensor_near(*both, *plain, 1e-12);
    }
}

TEST(TuckerToTensorTest, RankMismatchIsReported) {
    auto tucker = testutil::random_tucker({3, 4, 5}, {3, 2, 4}, 9);
    tucker.factors[1] = testutil::random_matrix(4, 3, 1);
    auto full = tucker_to_tensor(tucker);
    ASSERT_FALSE(full.has_value());
    EXPECT_EQ(full.error().code, StructuralErrorCode::FactorRankMismatch);
    EXPECT_EQ(full.error().index, 1u);
    EXPECT_EQ(full.error().expected, 2u);
    EXPECT_EQ(full.error().actual, 3u);
}

TEST(TuckerToUnfoldedTest, MatchesUnfoldOfFullTensor) {
    auto tucker = four_mode_tucker(7);
    auto full = tucker_to_tensor(tucker);
    ASSERT_TRUE(full.has_value());
    for (size_t mode = 0; mode < 4; ++mode) {
        auto unfolded = tucker_to_unfolded(tucker, mode);
        auto reference = mode_unfold(*full, mode);
        ASSERT_TRUE(unfolded.has_value()) << unfolded.error();
        ASSERT_TRUE(reference.has_value());
        testutil::expect_matrix_near(*unfolded, *reference, 1e-12);
    }
}

TEST(TuckerToUnfoldedTest, MatchesKroneckerFormula) {
    auto tucker = four_mode_tucker(8);
    for (size_t mode = 0; mode < 4; ++mode) {
        auto unfolded = tucker_to_unfolded(tucker.core, tucker.factors, mode);
        auto core_unfolded = mode_unfold(tucker.core, mode);
        auto K = kronecker(tucker.factors, {.skip_matrix = mode});
        ASSERT_TRUE(unfolded.has_value());
        ASSERT_TRUE(core_unfolded.has_value());
        ASSERT_TRUE(K.has_value());
        Matrix<double> expected =
            tucker.factors[mode] * (*core_unfolded) * K->transpose();
        testutil::expect_matrix_near(*unfolded, expected, 1e-10);
    }
}

TEST(TuckerToUnfoldedTest, DefaultModeIsZero) {
    auto tucker = four_mode_tucker(9);
    auto a = tucker_to_unfolded(tucker);
    auto b = tucker_to_unfolded(tucker, 0);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    testutil::expect_matrix_near(*a, *b, 0.0);
}

TEST(TuckerToUnfoldedTest, ModeOutOfRange) {
    auto tucker = four_mode_tucker(9);
    auto m = tucker_to_unfolded(tucker, 4);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, StructuralErrorCode::InvalidMode);
}

TEST(TuckerToVecTest, EqualsVectorisedFullTensor) {
    auto tucker = four_mode_tucker(10);
    auto vec = tucker_to_vec(tucker);
    auto full = tucker_to_tensor(tucker);
    ASSERT_TRUE(vec.has_value());
    ASSERT_TRUE(full.has_value());
    Vector<double> reference = tensor_to_vec(*full);
    ASSERT_EQ(vec->size(), reference.size());
    for (Eigen::Index i = 0; i < vec->size(); ++i)
        EXPECT_EQ((*vec)(i), reference(i));
}

TEST(TuckerToVecTest, MatchesKroneckerTimesCoreVector) {
    auto tucker = four_mode_tucker(11);
    auto vec = tucker_to_vec(tucker.core, tucker.factors);
    auto K = kronecker(tucker.factors);
    ASSERT_TRUE(vec.has_value());
    ASSERT_TRUE(K.has_value());
    Vector<double> expected = (*K) * tensor_to_vec(tucker.core);
    ASSERT_EQ(vec->size(), expected.size());
    for (Eigen::Index i = 0; i < vec->size(); ++i)
        EXPECT_NEAR((*vec)(i), expected(i), 1e-10);
}

TEST(TuckerToVecTest, TransposeMatchesTransposedKronecker) {
    auto tucker = four_mode_tucker(12);
    auto Ut = transposed(tucker.factors);
    auto vec = tucker_to_vec(tucker.core, Ut, {.transpose_factors = true});
    auto K = kronecker(Ut, {.transpose = true});
    ASSERT_TRUE(vec.has_value()) << vec.error();
    ASSERT_TRUE(K.has_value());
    Vector<double> expected = (*K) * tensor_to_vec(tucker.core);
    for (Eigen::Index i = 0; i < vec->size(); ++i)
        EXPECT_NEAR((*vec)(i), expected(i), 1e-10);
}

TEST(TuckerTensorTest, CompressedSize) {
    auto tucker = testutil::random_tucker({10, 8, 6}, {3, 2, 2}, 1);
    EXPECT_EQ(tucker.ndim(), 3u);
    EXPECT_EQ(tucker.compressed_size(), 3u * 2 * 2 + 10 * 3 + 8 * 2 + 6 * 2);
}

TEST(TuckerContractTest, MatchesContractionOfFullTensor) {
    auto tucker = testutil::random_tucker({5, 4, 3}, {2, 3, 2}, 21);
    auto full = tucker_to_tensor(tucker);
    ASSERT_TRUE(full.has_value());

    std::vector<Vector<double>> coeffs = {
        testutil::random_matrix(5, 1, 1), testutil::random_matrix(4, 1, 2),
        testutil::random_matrix(3, 1, 3)};

    double expected = 0.0;
    for (size_t i = 0; i < 5; ++i)
        for (size_t j = 0; j < 4; ++j)
            for (size_t k = 0; k < 3; ++k)
                expected += full->at({i, j, k}) * coeffs[0](i) * coeffs[1](j) *
                            coeffs[2](k);

    auto got = tucker_contract(tucker, coeffs);
    ASSERT_TRUE(got.has_value()) << got.error();
    EXPECT_NEAR(*got, expected, 1e-12);
}

TEST(TuckerContractTest, UnitVectorsReadOneEntry) {
    auto tucker = testutil::random_tucker({4, 3, 2}, {2, 2, 2}, 22);
    auto full = tucker_to_tensor(tucker);
    ASSERT_TRUE(full.has_value());

    std::vector<Vector<double>> coeffs = {Vector<double>::Unit(4, 2),
                                          Vector<double>::Unit(3, 1),
                                          Vector<double>::Unit(2, 0)};
    auto got = tucker_contract(tucker, coeffs);
    ASSERT_TRUE(got.has_value());
    EXPECT_NEAR(*got, full->at({2, 1, 0}), 1e-14);
}

TEST(TuckerContractTest, WrongCoefficientLength) {
    auto tucker = testutil::random_tucker({4, 3}, {2, 2}, 23);
    std::vector<Vector<double>> coeffs = {Vector<double>::Zero(4),
                                          Vector<double>::Zero(2)};
    auto got = tucker_contract(tucker, coeffs);
    ASSERT_FALSE(got.has_value());
    EXPECT_EQ(got.error().code, StructuralErrorCode::FactorRankMismatch);
    EXPECT_EQ(got.error().index, 1u);
    EXPECT_EQ(got.error().expected, 3u);
    EXPECT_EQ(got.error().actual, 2u);
}

TEST(TuckerContractTest, MalformedDecompositionIsRejected) {
    auto tucker = testutil::random_tucker({4, 3}, {2, 2}, 24);
    tucker.factors[0] = testutil::random_matrix(4, 3, 1);
    std::vector<Vector<double>> coeffs = {Vector<double>::Zero(4),
                                          Vector<double>::Zero(3)};
    auto got = tucker_contract(tucker, coeffs);
    ASSERT_FALSE(got.has_value());
    EXPECT_EQ(got.error().code, StructuralErrorCode::FactorRankMismatch);
    EXPECT_EQ(got.error().index, 0u);
}

}  // namespace
}  // namespace tuckerkit
