#include <gtest/gtest.h>
#include <stdexcept>
#include "embedding_vector.hpp"
#include "test_helpers.hpp"

using namespace fix_memory;
using fix_memory::testing::make_axis;
using fix_memory::testing::make_dense;

namespace {

SparseVector make_sparse(std::vector<std::uint32_t> indices, std::vector<float> values,
                         std::uint32_t width = kSparseMaxWidth) {
    SparseVector vec;
    vec.indices = std::move(indices);
    vec.values = std::move(values);
    vec.declared_width = width;
    return vec;
}

} // namespace

TEST(EmbeddingVectorTest, DenseCosineBasics) {
    auto a = make_dense(7);
    EXPECT_NEAR(similarity(a, a), 1.0f, 1e-5);

    EXPECT_NEAR(similarity(make_axis(0), make_axis(1)), 0.0f, 1e-6);

    DenseVector neg = make_axis(3);
    neg.values[3] = -1.0f;
    EXPECT_NEAR(similarity(make_axis(3), neg), -1.0f, 1e-6);
}

TEST(EmbeddingVectorTest, ZeroNormYieldsZero) {
    DenseVector zero;
    EXPECT_FLOAT_EQ(similarity(zero, make_dense(1)), 0.0f);
    EXPECT_FLOAT_EQ(similarity(zero, zero), 0.0f);

    SparseVector empty;
    EXPECT_FLOAT_EQ(similarity(empty, make_sparse({1}, {1.0f})), 0.0f);
}

TEST(EmbeddingVectorTest, SparseCosineMatchesHandComputedValue) {
    auto a = make_sparse({1, 5, 9}, {1.0f, 2.0f, 2.0f});   // norm 3
    auto b = make_sparse({5, 9, 40}, {3.0f, 0.0f, 4.0f});  // norm 5
    // dot = 2*3 = 6
    EXPECT_NEAR(similarity(a, b), 6.0f / 15.0f, 1e-6);
}

TEST(EmbeddingVectorTest, CrossVariantComparisonIsRejected) {
    EmbeddingVector dense = make_dense(3);
    EmbeddingVector sparse = make_sparse({2}, {1.0f});
    EXPECT_FALSE(comparable(dense, sparse));
    EXPECT_THROW(similarity(dense, sparse), std::invalid_argument);
    EXPECT_THROW(similarity(sparse, dense), std::invalid_argument);
}

TEST(EmbeddingVectorTest, SparseFeatureSpacesMustMatch) {
    EmbeddingVector a = make_sparse({2}, {1.0f}, 100);
    EmbeddingVector b = make_sparse({2}, {1.0f}, 64);
    EXPECT_FALSE(comparable(a, b));
    EXPECT_THROW(similarity(a, b), std::invalid_argument);
}

TEST(EmbeddingVectorTest, ValidateRejectsBrokenSparseVectors) {
    EXPECT_THROW(validate(make_sparse({3, 1}, {1.0f, 1.0f})), std::invalid_argument);
    EXPECT_THROW(validate(make_sparse({1, 1}, {1.0f, 1.0f})), std::invalid_argument);
    EXPECT_THROW(validate(make_sparse({100}, {1.0f})), std::invalid_argument);
    EXPECT_THROW(validate(make_sparse({1}, {1.0f, 2.0f})), std::invalid_argument);
    EXPECT_THROW(validate(make_sparse({1}, {1.0f}, 101)), std::invalid_argument);
    EXPECT_NO_THROW(validate(make_sparse({0, 99}, {0.5f, 0.5f})));
}

TEST(EmbeddingVectorTest, DenseBlobIsRawFloats) {
    auto vec = make_dense(11);
    auto bytes = serialize_dense(vec);
    ASSERT_EQ(bytes.size(), kDenseDimension * sizeof(float));

    auto restored = deserialize_dense(bytes.data(), bytes.size());
    EXPECT_EQ(restored.values, vec.values);

    EXPECT_THROW(deserialize_dense(bytes.data(), bytes.size() - 4), std::runtime_error);
}

TEST(EmbeddingVectorTest, SparseBlobIsSelfDescribing) {
    auto vec = make_sparse({4, 17, 63}, {0.25f, 0.5f, 0.75f}, 64);
    auto bytes = serialize_sparse(vec);

    auto restored = deserialize_sparse(bytes.data(), bytes.size());
    EXPECT_EQ(restored.declared_width, 64u);
    EXPECT_EQ(restored.indices, vec.indices);
    EXPECT_EQ(restored.values, vec.values);

    std::vector<std::uint8_t> garbage = {0xff, 0x00, 0x13};
    EXPECT_THROW(deserialize_sparse(garbage.data(), garbage.size()), std::runtime_error);
    EXPECT_THROW(deserialize_sparse(nullptr, 0), std::runtime_error);
}

TEST(EmbeddingVectorTest, KindNames) {
    EXPECT_EQ(kind_of(make_dense(1)), EmbeddingKind::Dense);
    EXPECT_EQ(kind_of(make_sparse({}, {})), EmbeddingKind::Sparse);
    EXPECT_EQ(to_string(EmbeddingKind::Dense), "dense");
    EXPECT_EQ(to_string(EmbeddingKind::Sparse), "sparse");
}
