#include "ModelContext.hpp"
#include "CaffeFaceLocator.hpp"
#include "ClipClassifier.hpp"
#include "Errors.hpp"
#include "FairFaceClassifier.hpp"
#include <iostream>

namespace revPrompt {

ModelContext::ModelContext(std::shared_ptr<FaceLocator> faceLocator,
                           std::shared_ptr<DemographicClassifier> demographicClassifier,
                           std::shared_ptr<GeneralClassifier> generalClassifier,
                           Taxonomy taxonomy)
    : faceLocator_(std::move(faceLocator)),
      demographicClassifier_(std::move(demographicClassifier)),
      generalClassifier_(std::move(generalClassifier)),
      taxonomy_(std::move(taxonomy)) {
    if (!generalClassifier_) {
        throw StartupError("A general classifier is required");
    }
}

std::shared_ptr<const ModelContext> ModelContext::load(const Config& cfg) {
    std::shared_ptr<FaceLocator> faceLocator;
    if (cfg.faceLocatorEnabled) {
        auto locator = std::make_shared<CaffeFaceLocator>(cfg.faceThreshold);
        if (locator->loadModel(cfg.resolvedFaceModelPath())) {
            faceLocator = locator;
            std::cout << "Successfully loaded face locator" << std::endl;
        } else {
            std::cerr << "Face locator unavailable, demographic tags will come from the general classifier" << std::endl;
        }
    }

    std::shared_ptr<DemographicClassifier> demographicClassifier;
    if (cfg.demographicEnabled) {
        auto classifier = std::make_shared<FairFaceClassifier>();
        if (classifier->loadModel(cfg.resolvedDemographicModelPath())) {
            demographicClassifier = classifier;
            std::cout << "Successfully loaded demographic classifier" << std::endl;
        } else {
            std::cerr << "Demographic classifier unavailable, demographic tags will come from the general classifier" << std::endl;
        }
    }

    auto generalClassifier = std::make_shared<ClipClassifier>(
        cfg.hypothesisTemplate.empty() ? std::string(kDefaultHypothesisTemplate) : cfg.hypothesisTemplate);
    if (!generalClassifier->loadModel(cfg.resolvedGeneralModelPath())) {
        throw StartupError("Failed to load general classifier from " + cfg.resolvedGeneralModelPath());
    }
    std::cout << "Successfully loaded general classifier" << std::endl;

    return std::make_shared<const ModelContext>(faceLocator, demographicClassifier,
                                                generalClassifier, cfg.taxonomy);
}

} // namespace revPrompt
