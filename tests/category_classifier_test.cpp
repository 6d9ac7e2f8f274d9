#include <gtest/gtest.h>
#include "core/category_classifier.hpp"

class CategoryClassifierTest : public ::testing::Test
{
protected:
    CategoryClassifier classifier_;
};

TEST_F(CategoryClassifierTest, DefaultBandBoundaries)
{
    EXPECT_EQ(classifier_.categorize(100.0), "Likely Manipulated");
    EXPECT_EQ(classifier_.categorize(80.0), "Likely Manipulated");
    EXPECT_EQ(classifier_.categorize(79.9), "Potentially Manipulated");
    EXPECT_EQ(classifier_.categorize(60.0), "Potentially Manipulated");
    EXPECT_EQ(classifier_.categorize(59.9), "Uncertain");
    EXPECT_EQ(classifier_.categorize(40.0), "Uncertain");
    EXPECT_EQ(classifier_.categorize(39.9), "Likely Authentic");
    EXPECT_EQ(classifier_.categorize(0.0), "Likely Authentic");
}

TEST_F(CategoryClassifierTest, DeepfakeFlagThreshold)
{
    EXPECT_TRUE(classifier_.isDeepfake(60.0));
    EXPECT_TRUE(classifier_.isDeepfake(95.5));
    EXPECT_FALSE(classifier_.isDeepfake(59.9));
    EXPECT_FALSE(classifier_.isDeepfake(0.0));
}

TEST_F(CategoryClassifierTest, CategoryDependsOnlyOnScore)
{
    for (double score = 0.0; score <= 100.0; score += 0.5)
    {
        EXPECT_EQ(classifier_.categorize(score), classifier_.categorize(score));
        EXPECT_EQ(classifier_.isDeepfake(score), score >= 60.0);
    }
}

TEST_F(CategoryClassifierTest, CustomPolicy)
{
    CategoryPolicy policy;
    policy.bands = {{90.0, "Fake"}, {50.0, "Suspicious"}, {0.0, "Real"}};
    policy.deepfake_threshold = 90.0;
    CategoryClassifier classifier(policy);

    EXPECT_EQ(classifier.categorize(91.0), "Fake");
    EXPECT_EQ(classifier.categorize(89.9), "Suspicious");
    EXPECT_EQ(classifier.categorize(10.0), "Real");
    EXPECT_FALSE(classifier.isDeepfake(89.9));
    EXPECT_TRUE(classifier.isDeepfake(90.0));
}

TEST_F(CategoryClassifierTest, InvalidPolicyFallsBackToDefaults)
{
    CategoryPolicy unordered;
    unordered.bands = {{40.0, "Low"}, {80.0, "High"}};
    EXPECT_FALSE(unordered.isValid());
    EXPECT_FALSE(CategoryPolicy().isValid());

    CategoryClassifier classifier(unordered);
    EXPECT_EQ(classifier.policy().bands.size(), 4u);
    EXPECT_EQ(classifier.categorize(85.0), "Likely Manipulated");
}

TEST_F(CategoryClassifierTest, ScoresBelowLowestBandUseLastLabel)
{
    CategoryPolicy policy;
    policy.bands = {{70.0, "High"}, {30.0, "Low"}};
    CategoryClassifier classifier(policy);
    EXPECT_EQ(classifier.categorize(10.0), "Low");
}
