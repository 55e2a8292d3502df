#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>
#include "ClipClassifier.hpp"

namespace revPrompt {
namespace {

TEST(EmbeddingSimilarityTest, DotProductOfMatchingDimensions) {
    std::vector<float> a{0.6f, 0.8f};
    std::vector<float> b{0.8f, 0.6f};
    EXPECT_NEAR(embeddingSimilarity(a, b), 0.96f, 1e-6f);
    EXPECT_NEAR(embeddingSimilarity(a, a), 1.0f, 1e-6f);
}

TEST(EmbeddingSimilarityTest, MismatchedDimensionsThrow) {
    std::vector<float> image(768, 0.036f);
    std::vector<float> text(512, 0.044f);
    EXPECT_THROW(embeddingSimilarity(image, text), std::invalid_argument);
    EXPECT_THROW(embeddingSimilarity({}, {}), std::invalid_argument);
}

TEST(PoolEmbeddingTest, ProjectedOutputIsNormalized) {
    std::vector<float> data{3.0f, 4.0f};
    std::vector<float> e = poolEmbedding(data.data(), {1, 2});
    ASSERT_EQ(e.size(), 2u);
    EXPECT_NEAR(e[0], 0.6f, 1e-5f);
    EXPECT_NEAR(e[1], 0.8f, 1e-5f);
}

TEST(PoolEmbeddingTest, SequenceOutputIgnoresPaddedPositions) {
    // Two real tokens followed by two padding rows that point elsewhere
    std::vector<float> data{
        1.0f, 0.0f,
        1.0f, 0.0f,
        0.0f, 9.0f,
        0.0f, 9.0f};
    std::vector<float> e = poolEmbedding(data.data(), {1, 4, 2}, {1, 1, 0, 0});
    ASSERT_EQ(e.size(), 2u);
    EXPECT_NEAR(e[0], 1.0f, 1e-5f);
    EXPECT_NEAR(e[1], 0.0f, 1e-5f);
}

TEST(PoolEmbeddingTest, SequenceOutputNeedsMatchingMask) {
    std::vector<float> data(8, 1.0f);
    EXPECT_THROW(poolEmbedding(data.data(), {1, 4, 2}), std::runtime_error);
    EXPECT_THROW(poolEmbedding(data.data(), {1, 4, 2}, {1, 1}), std::runtime_error);
    EXPECT_THROW(poolEmbedding(data.data(), {1, 4, 2}, {0, 0, 0, 0}), std::runtime_error);
}

TEST(PoolEmbeddingTest, UnexpectedShapesThrow) {
    std::vector<float> data(8, 1.0f);
    EXPECT_THROW(poolEmbedding(data.data(), {1, 0}), std::runtime_error);
    EXPECT_THROW(poolEmbedding(data.data(), {1, 2, 2, 2}), std::runtime_error);
}

} // namespace
} // namespace revPrompt
