#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <map>
#include <stdexcept>
#include "Errors.hpp"
#include "MockModels.hpp"
#include "TagResolver.hpp"

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::Eq;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using ::testing::Truly;

namespace revPrompt {
namespace {

using test::MockDemographicClassifier;
using test::MockFaceLocator;
using test::MockGeneralClassifier;
using test::makeDemographics;
using test::makeRegion;

class TagResolverTest : public ::testing::Test {
protected:
    TagResolverTest()
        : image_(120, 160, CV_8UC3, cv::Scalar(40, 80, 120)),
          locator_(std::make_shared<NiceMock<MockFaceLocator>>()),
          demographic_(std::make_shared<NiceMock<MockDemographicClassifier>>()),
          general_(std::make_shared<NiceMock<MockGeneralClassifier>>()),
          taxonomy_(Taxonomy::defaults()) {
        // Categories a test does not pin down fall through to the default answer
        EXPECT_CALL(*general_, classify(_, _)).Times(AnyNumber());
    }

    const std::vector<std::string>& candidates(AttributeCategory category) const {
        return taxonomy_.candidates(category);
    }

    ModelContext makeContext(bool withLocator = true, bool withDemographic = true) {
        return ModelContext(withLocator ? locator_ : nullptr,
                            withDemographic ? demographic_ : nullptr,
                            general_, taxonomy_);
    }

    cv::Mat image_;
    std::shared_ptr<NiceMock<MockFaceLocator>> locator_;
    std::shared_ptr<NiceMock<MockDemographicClassifier>> demographic_;
    std::shared_ptr<NiceMock<MockGeneralClassifier>> general_;
    Taxonomy taxonomy_;
};

TEST_F(TagResolverTest, DetectedFaceResolvesRaceAndGenderFromDemographicPath) {
    EXPECT_CALL(*locator_, locate(_))
        .WillOnce(Return(std::vector<FaceRegion>{makeRegion(10, 10, 60, 70, 0.9f)}));
    EXPECT_CALL(*demographic_, classify(_))
        .WillOnce(Return(DemographicResult(makeDemographics("white", "male"))));

    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Race)))).Times(0);
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Gender)))).Times(0);
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Setting)))).WillOnce(Return("hospital"));
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Lighting)))).WillOnce(Return("bright light"));
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::PeopleCount)))).WillOnce(Return("one person"));

    ModelContext context = makeContext();
    Resolution resolution = TagResolver(context).resolve(image_);

    EXPECT_EQ(resolution.tags.get(AttributeCategory::Race), "white");
    EXPECT_EQ(resolution.tags.get(AttributeCategory::Gender), "male");
    EXPECT_EQ(resolution.tags.get(AttributeCategory::Setting), "hospital");
    EXPECT_EQ(resolution.tags.get(AttributeCategory::Lighting), "bright light");
    EXPECT_EQ(resolution.tags.get(AttributeCategory::PeopleCount), "one person");
    EXPECT_TRUE(resolution.tags.isComplete());

    EXPECT_EQ(resolution.trace.sources.at(AttributeCategory::Race), TagSource::Demographic);
    EXPECT_EQ(resolution.trace.sources.at(AttributeCategory::Gender), TagSource::Demographic);
    EXPECT_EQ(resolution.trace.sources.at(AttributeCategory::Setting), TagSource::General);
    EXPECT_EQ(resolution.trace.facesFound, 1u);
    ASSERT_TRUE(resolution.trace.primaryFace.has_value());
    EXPECT_FLOAT_EQ(resolution.trace.primaryFace->confidence, 0.9f);

    std::vector<ResolveStage> expected = {
        ResolveStage::Init, ResolveStage::FaceSearch, ResolveStage::DemographicAttempt,
        ResolveStage::DemographicAccepted, ResolveStage::GeneralFill, ResolveStage::Complete
    };
    EXPECT_EQ(resolution.trace.stages, expected);
}

TEST_F(TagResolverTest, NoFaceNeverInvokesDemographicClassifier) {
    EXPECT_CALL(*locator_, locate(_)).WillOnce(Return(std::vector<FaceRegion>{}));
    EXPECT_CALL(*demographic_, classify(_)).Times(0);
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Race)))).WillOnce(Return("asian"));
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Gender)))).WillOnce(Return("female"));

    ModelContext context = makeContext();
    Resolution resolution = TagResolver(context).resolve(image_);

    EXPECT_EQ(resolution.tags.get(AttributeCategory::Race), "asian");
    EXPECT_EQ(resolution.tags.get(AttributeCategory::Gender), "female");
    EXPECT_EQ(resolution.trace.sources.at(AttributeCategory::Race), TagSource::General);
    EXPECT_EQ(resolution.trace.sources.at(AttributeCategory::Gender), TagSource::General);
    EXPECT_EQ(resolution.trace.facesFound, 0u);
    EXPECT_FALSE(resolution.trace.primaryFace.has_value());

    std::vector<ResolveStage> expected = {
        ResolveStage::Init, ResolveStage::FaceSearch, ResolveStage::GeneralFill, ResolveStage::Complete
    };
    EXPECT_EQ(resolution.trace.stages, expected);
}

TEST_F(TagResolverTest, SentinelLabelsAreAcceptedWithoutFallback) {
    EXPECT_CALL(*locator_, locate(_))
        .WillOnce(Return(std::vector<FaceRegion>{makeRegion(0, 0, 50, 50, 0.7f)}));
    EXPECT_CALL(*demographic_, classify(_))
        .WillOnce(Return(DemographicResult(makeDemographics(kUnknownRace, kUnknownGender))));
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Race)))).Times(0);
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Gender)))).Times(0);

    ModelContext context = makeContext();
    Resolution resolution = TagResolver(context).resolve(image_);

    EXPECT_EQ(resolution.tags.get(AttributeCategory::Race), "unknown race");
    EXPECT_EQ(resolution.tags.get(AttributeCategory::Gender), "unknown gender");
    EXPECT_EQ(resolution.trace.sources.at(AttributeCategory::Race), TagSource::Demographic);
}

TEST_F(TagResolverTest, UnavailableDemographicsFallBackForRaceAndGender) {
    EXPECT_CALL(*locator_, locate(_))
        .WillOnce(Return(std::vector<FaceRegion>{makeRegion(0, 0, 50, 50, 0.8f)}));
    EXPECT_CALL(*demographic_, classify(_)).WillOnce(Return(DemographicResult()));
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Race)))).WillOnce(Return("black"));
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Gender)))).WillOnce(Return("male"));

    ModelContext context = makeContext();
    Resolution resolution = TagResolver(context).resolve(image_);

    EXPECT_EQ(resolution.tags.get(AttributeCategory::Race), "black");
    EXPECT_EQ(resolution.tags.get(AttributeCategory::Gender), "male");
    EXPECT_EQ(resolution.trace.sources.at(AttributeCategory::Race), TagSource::General);
    EXPECT_FALSE(resolution.trace.demographics.has_value());
    EXPECT_EQ(resolution.trace.stages.at(3), ResolveStage::DemographicFallback);
}

TEST_F(TagResolverTest, DemographicExceptionIsRecoveredAsFallback) {
    EXPECT_CALL(*locator_, locate(_))
        .WillOnce(Return(std::vector<FaceRegion>{makeRegion(0, 0, 50, 50, 0.8f)}));
    EXPECT_CALL(*demographic_, classify(_)).WillOnce(Throw(std::runtime_error("inference exploded")));
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Race)))).Times(1);
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Gender)))).Times(1);

    ModelContext context = makeContext();
    Resolution resolution;
    ASSERT_NO_THROW(resolution = TagResolver(context).resolve(image_));
    EXPECT_TRUE(resolution.tags.isComplete());
    EXPECT_EQ(resolution.trace.sources.at(AttributeCategory::Gender), TagSource::General);
}

TEST_F(TagResolverTest, MissingDemographicBackingFallsBack) {
    EXPECT_CALL(*locator_, locate(_))
        .WillOnce(Return(std::vector<FaceRegion>{makeRegion(0, 0, 50, 50, 0.8f)}));
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Race)))).Times(1);
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Gender)))).Times(1);

    ModelContext context = makeContext(true, false);
    Resolution resolution = TagResolver(context).resolve(image_);

    std::vector<ResolveStage> expected = {
        ResolveStage::Init, ResolveStage::FaceSearch, ResolveStage::DemographicAttempt,
        ResolveStage::DemographicFallback, ResolveStage::GeneralFill, ResolveStage::Complete
    };
    EXPECT_EQ(resolution.trace.stages, expected);
    EXPECT_TRUE(resolution.tags.isComplete());
}

TEST_F(TagResolverTest, MissingLocatorSkipsDemographicAttempt) {
    EXPECT_CALL(*demographic_, classify(_)).Times(0);

    ModelContext context = makeContext(false, true);
    Resolution resolution = TagResolver(context).resolve(image_);

    EXPECT_EQ(resolution.trace.facesFound, 0u);
    EXPECT_EQ(resolution.tags.get(AttributeCategory::Race), candidates(AttributeCategory::Race).front());
    EXPECT_TRUE(resolution.tags.isComplete());
}

TEST_F(TagResolverTest, GeneralClassifierFailureIsFatal) {
    EXPECT_CALL(*locator_, locate(_)).WillOnce(Return(std::vector<FaceRegion>{}));
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Race))))
        .WillOnce(Throw(ClassifierError("backing down")));

    ModelContext context = makeContext();
    EXPECT_THROW(TagResolver(context).resolve(image_), ClassifierError);
}

TEST_F(TagResolverTest, HighestConfidenceRegionIsClassified) {
    // Scan order puts the weaker face first
    EXPECT_CALL(*locator_, locate(_))
        .WillOnce(Return(std::vector<FaceRegion>{
            makeRegion(0, 0, 20, 20, 0.6f),
            makeRegion(30, 30, 100, 90, 0.95f)
        }));
    EXPECT_CALL(*demographic_, classify(Truly([](const cv::Mat& crop) {
            return crop.cols == 70 && crop.rows == 60;
        })))
        .WillOnce(Return(DemographicResult(makeDemographics("indian", "female"))));

    ModelContext context = makeContext();
    Resolution resolution = TagResolver(context, FaceSelectionPolicy::HighestConfidence).resolve(image_);

    EXPECT_EQ(resolution.trace.facesFound, 2u);
    EXPECT_FLOAT_EQ(resolution.trace.primaryFace->confidence, 0.95f);
    EXPECT_EQ(resolution.tags.get(AttributeCategory::Race), "indian");
}

TEST_F(TagResolverTest, FirstReturnedPolicyKeepsLocatorOrder) {
    EXPECT_CALL(*locator_, locate(_))
        .WillOnce(Return(std::vector<FaceRegion>{
            makeRegion(0, 0, 20, 20, 0.6f),
            makeRegion(30, 30, 100, 90, 0.95f)
        }));
    EXPECT_CALL(*demographic_, classify(Truly([](const cv::Mat& crop) {
            return crop.cols == 20 && crop.rows == 20;
        })))
        .WillOnce(Return(DemographicResult(makeDemographics("white", "female"))));

    ModelContext context = makeContext();
    Resolution resolution = TagResolver(context, FaceSelectionPolicy::FirstReturned).resolve(image_);

    EXPECT_FLOAT_EQ(resolution.trace.primaryFace->confidence, 0.6f);
}

TEST_F(TagResolverTest, RegionOutsideImageIsTreatedAsUnavailable) {
    EXPECT_CALL(*locator_, locate(_))
        .WillOnce(Return(std::vector<FaceRegion>{makeRegion(500, 500, 600, 600, 0.9f)}));
    EXPECT_CALL(*demographic_, classify(_)).Times(0);
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Race)))).Times(1);

    ModelContext context = makeContext();
    Resolution resolution = TagResolver(context).resolve(image_);

    EXPECT_EQ(resolution.trace.stages.at(3), ResolveStage::DemographicFallback);
}

TEST_F(TagResolverTest, EmptyDemographicLabelDefersToGeneralTier) {
    EXPECT_CALL(*locator_, locate(_))
        .WillOnce(Return(std::vector<FaceRegion>{makeRegion(0, 0, 50, 50, 0.9f)}));
    EXPECT_CALL(*demographic_, classify(_))
        .WillOnce(Return(DemographicResult(makeDemographics("latino", ""))));
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Race)))).Times(0);
    EXPECT_CALL(*general_, classify(_, Eq(candidates(AttributeCategory::Gender)))).WillOnce(Return("female"));

    ModelContext context = makeContext();
    Resolution resolution = TagResolver(context).resolve(image_);

    EXPECT_EQ(resolution.tags.get(AttributeCategory::Race), "latino");
    EXPECT_EQ(resolution.tags.get(AttributeCategory::Gender), "female");
    EXPECT_EQ(resolution.trace.sources.at(AttributeCategory::Gender), TagSource::General);
}

TEST(DemographicTierTest, DefersOutsideRaceAndGender) {
    DemographicTier tier(makeDemographics("white", "male"));
    EXPECT_EQ(tier.attempt(AttributeCategory::Race), "white");
    EXPECT_EQ(tier.attempt(AttributeCategory::Gender), "male");
    EXPECT_FALSE(tier.attempt(AttributeCategory::Setting).has_value());
    EXPECT_FALSE(tier.attempt(AttributeCategory::PeopleCount).has_value());
}

TEST(DemographicTierTest, DefersEverythingWhenUnavailable) {
    DemographicTier tier{DemographicResult()};
    EXPECT_FALSE(tier.attempt(AttributeCategory::Race).has_value());
    EXPECT_FALSE(tier.attempt(AttributeCategory::Gender).has_value());
}

// Answers from a fixed table and defers every other category
class TableTier : public ResolutionTier {
public:
    TableTier(TagSource source, std::map<AttributeCategory, std::string> answers)
        : source_(source), answers_(std::move(answers)) {}

    TagSource source() const override { return source_; }

    std::optional<std::string> attempt(AttributeCategory category) override {
        ++calls;
        auto it = answers_.find(category);
        if (it == answers_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    int calls = 0;

private:
    TagSource source_;
    std::map<AttributeCategory, std::string> answers_;
};

TEST(ResolveCategoriesTest, CompletenessPassFillsDeferredCategories) {
    std::vector<std::unique_ptr<ResolutionTier>> tiers;
    tiers.push_back(std::make_unique<DemographicTier>(makeDemographics("asian", "female")));
    tiers.push_back(std::make_unique<TableTier>(TagSource::General,
        std::map<AttributeCategory, std::string>{{AttributeCategory::Setting, "office"}}));
    TableTier completion(TagSource::General, {
        {AttributeCategory::Lighting, "dim light"},
        {AttributeCategory::PeopleCount, "two people"},
        {AttributeCategory::Race, "white"}});

    TagSet tags;
    ResolutionTrace trace;
    resolveCategories(tiers, completion, tags, trace);

    EXPECT_TRUE(tags.isComplete());
    EXPECT_EQ(tags.get(AttributeCategory::Race), "asian");
    EXPECT_EQ(tags.get(AttributeCategory::Setting), "office");
    EXPECT_EQ(tags.get(AttributeCategory::Lighting), "dim light");
    EXPECT_EQ(trace.sources.at(AttributeCategory::Race), TagSource::Demographic);
    EXPECT_EQ(trace.sources.at(AttributeCategory::Setting), TagSource::General);
    EXPECT_EQ(trace.sources.at(AttributeCategory::Lighting), TagSource::Completion);
    EXPECT_EQ(trace.sources.at(AttributeCategory::PeopleCount), TagSource::Completion);
    EXPECT_EQ(completion.calls, 2);
}

TEST(ResolveCategoriesTest, CompletionThatDefersIsAFailure) {
    std::vector<std::unique_ptr<ResolutionTier>> tiers;
    tiers.push_back(std::make_unique<DemographicTier>(makeDemographics("black", "male")));
    TableTier completion(TagSource::General, {{AttributeCategory::Setting, "home"}});

    TagSet tags;
    ResolutionTrace trace;
    EXPECT_THROW(resolveCategories(tiers, completion, tags, trace), ClassifierError);
}

TEST(StageNameTest, MatchesStateMachineNames) {
    EXPECT_EQ(stageName(ResolveStage::DemographicFallback), "DEMOGRAPHIC_FALLBACK");
    EXPECT_EQ(stageName(ResolveStage::GeneralFill), "GENERAL_FILL");
    EXPECT_EQ(sourceName(TagSource::Demographic), "demographic");
    EXPECT_EQ(sourceName(TagSource::Completion), "completion");
}

} // namespace
} // namespace revPrompt
