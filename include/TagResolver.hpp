#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "AttributeCategory.hpp"
#include "DemographicClassifier.hpp"
#include "FaceLocator.hpp"
#include "ModelContext.hpp"
#include "TagSet.hpp"

namespace revPrompt {

enum class ResolveStage {
    Init,
    FaceSearch,
    DemographicAttempt,
    DemographicAccepted,
    DemographicFallback,
    GeneralFill,
    Complete
};

// Which tier produced a tag
enum class TagSource {
    Demographic,
    General,
    Completion
};

std::string stageName(ResolveStage stage);
std::string sourceName(TagSource source);

// Diagnostics for one resolved image
struct ResolutionTrace {
    std::vector<ResolveStage> stages;
    std::size_t facesFound = 0;
    std::optional<FaceRegion> primaryFace;
    std::optional<Demographics> demographics;
    std::map<AttributeCategory, TagSource> sources;
};

struct Resolution {
    TagSet tags;
    ResolutionTrace trace;
};

// One step of the fallback chain: resolves a category or defers (std::nullopt)
class ResolutionTier {
public:
    virtual ~ResolutionTier() = default;

    virtual TagSource source() const = 0;
    virtual std::optional<std::string> attempt(AttributeCategory category) = 0;
};

// Race and gender from an accepted demographic estimate; defers everything else
class DemographicTier : public ResolutionTier {
public:
    explicit DemographicTier(std::optional<Demographics> demographics);

    TagSource source() const override { return TagSource::Demographic; }
    std::optional<std::string> attempt(AttributeCategory category) override;

private:
    std::optional<Demographics> demographics_;
};

// Zero-shot classification over the category's full candidate set. Never
// defers; failures propagate as ClassifierError.
class GeneralTier : public ResolutionTier {
public:
    GeneralTier(const cv::Mat& image, GeneralClassifier& classifier, const Taxonomy& taxonomy);

    TagSource source() const override { return TagSource::General; }
    std::optional<std::string> attempt(AttributeCategory category) override;

private:
    const cv::Mat& image_;
    GeneralClassifier& classifier_;
    const Taxonomy& taxonomy_;
};

// Evaluates the tiers in order for every category; the first tier that
// answers wins. Categories every tier deferred are then asked of completion
// unconditionally; if it defers too, ClassifierError is thrown.
void resolveCategories(const std::vector<std::unique_ptr<ResolutionTier>>& tiers,
                       ResolutionTier& completion, TagSet& tags, ResolutionTrace& trace);

// Decides per category whether the demographic path or the general
// classifier is authoritative and guarantees every category gets a label.
class TagResolver {
public:
    explicit TagResolver(const ModelContext& context,
                         FaceSelectionPolicy policy = FaceSelectionPolicy::HighestConfidence);

    // Throws ClassifierError when the general classifier fails
    Resolution resolve(const cv::Mat& image) const;

private:
    DemographicResult classifyFace(const cv::Mat& image, const FaceRegion& region) const;

    const ModelContext& context_;
    FaceSelectionPolicy policy_;
};

} // namespace revPrompt
