#include "TagResolver.hpp"
#include "Errors.hpp"
#include <iostream>

namespace revPrompt {

std::string stageName(ResolveStage stage) {
    switch (stage) {
        case ResolveStage::Init:
            return "INIT";
        case ResolveStage::FaceSearch:
            return "FACE_SEARCH";
        case ResolveStage::DemographicAttempt:
            return "DEMOGRAPHIC_ATTEMPT";
        case ResolveStage::DemographicAccepted:
            return "DEMOGRAPHIC_ACCEPTED";
        case ResolveStage::DemographicFallback:
            return "DEMOGRAPHIC_FALLBACK";
        case ResolveStage::GeneralFill:
            return "GENERAL_FILL";
        case ResolveStage::Complete:
            return "COMPLETE";
    }
    return "UNKNOWN";
}

std::string sourceName(TagSource source) {
    switch (source) {
        case TagSource::Demographic:
            return "demographic";
        case TagSource::General:
            return "general";
        case TagSource::Completion:
            return "completion";
    }
    return "unknown";
}

DemographicTier::DemographicTier(std::optional<Demographics> demographics)
    : demographics_(std::move(demographics)) {
}

std::optional<std::string> DemographicTier::attempt(AttributeCategory category) {
    if (!demographics_) {
        return std::nullopt;
    }

    const std::string* label = nullptr;
    if (category == AttributeCategory::Race) {
        label = &demographics_->race;
    } else if (category == AttributeCategory::Gender) {
        label = &demographics_->gender;
    }

    if (label == nullptr || label->empty()) {
        return std::nullopt;
    }
    return *label;
}

GeneralTier::GeneralTier(const cv::Mat& image, GeneralClassifier& classifier, const Taxonomy& taxonomy)
    : image_(image), classifier_(classifier), taxonomy_(taxonomy) {
}

std::optional<std::string> GeneralTier::attempt(AttributeCategory category) {
    std::string label = classifier_.classify(image_, taxonomy_.candidates(category));
    if (label.empty()) {
        throw ClassifierError("General classifier returned an empty label for '" + categoryName(category) + "'");
    }
    return label;
}

void resolveCategories(const std::vector<std::unique_ptr<ResolutionTier>>& tiers,
                       ResolutionTier& completion, TagSet& tags, ResolutionTrace& trace) {
    for (AttributeCategory category : allCategories()) {
        for (const auto& tier : tiers) {
            std::optional<std::string> label = tier->attempt(category);
            if (label && !label->empty()) {
                tags.set(category, *label);
                trace.sources[category] = tier->source();
                break;
            }
        }
    }

    // Completeness pass
    for (AttributeCategory category : allCategories()) {
        if (tags.has(category)) {
            continue;
        }
        std::optional<std::string> label = completion.attempt(category);
        if (!label || label->empty()) {
            throw ClassifierError("No label for '" + categoryName(category) + "' after the completeness pass");
        }
        tags.set(category, *label);
        trace.sources[category] = TagSource::Completion;
    }
}

TagResolver::TagResolver(const ModelContext& context, FaceSelectionPolicy policy)
    : context_(context), policy_(policy) {
}

DemographicResult TagResolver::classifyFace(const cv::Mat& image, const FaceRegion& region) const {
    DemographicClassifier* classifier = context_.demographicClassifier();
    if (classifier == nullptr) {
        return std::nullopt;
    }

    cv::Rect crop = region.rect() & cv::Rect(0, 0, image.cols, image.rows);
    if (crop.area() <= 0) {
        std::cerr << "[TagResolver] Face region lies outside the image, skipping demographic classifier" << std::endl;
        return std::nullopt;
    }

    // Recovered locally: a failing demographic classifier only means fallback
    try {
        return classifier->classify(image(crop));
    } catch (const std::exception& e) {
        std::cerr << "[TagResolver] Demographic classifier failed, falling back: " << e.what() << std::endl;
    }
    return std::nullopt;
}

Resolution TagResolver::resolve(const cv::Mat& image) const {
    Resolution result;
    ResolutionTrace& trace = result.trace;
    TagSet& tags = result.tags;

    trace.stages.push_back(ResolveStage::Init);

    trace.stages.push_back(ResolveStage::FaceSearch);
    std::vector<FaceRegion> regions;
    if (FaceLocator* locator = context_.faceLocator()) {
        regions = locator->locate(image);
    }
    trace.facesFound = regions.size();

    if (!regions.empty()) {
        const FaceRegion& primary = regions[static_cast<std::size_t>(selectPrimaryFace(regions, policy_))];
        trace.primaryFace = primary;

        trace.stages.push_back(ResolveStage::DemographicAttempt);
        trace.demographics = classifyFace(image, primary);
        trace.stages.push_back(trace.demographics ? ResolveStage::DemographicAccepted
                                                  : ResolveStage::DemographicFallback);
    }

    trace.stages.push_back(ResolveStage::GeneralFill);
    auto general = std::make_unique<GeneralTier>(image, context_.generalClassifier(), context_.taxonomy());
    GeneralTier& completion = *general;
    std::vector<std::unique_ptr<ResolutionTier>> tiers;
    tiers.push_back(std::make_unique<DemographicTier>(trace.demographics));
    tiers.push_back(std::move(general));

    resolveCategories(tiers, completion, tags, trace);

    trace.stages.push_back(ResolveStage::Complete);
    return result;
}

} // namespace revPrompt
