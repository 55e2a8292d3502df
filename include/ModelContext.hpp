#pragma once

#include <memory>
#include "AttributeCategory.hpp"
#include "Config.hpp"
#include "DemographicClassifier.hpp"
#include "FaceLocator.hpp"
#include "GeneralClassifier.hpp"

namespace revPrompt {

// Process-wide model backings and candidate taxonomy. Loaded once before any
// image is processed and never modified afterwards, so one context can be
// shared by concurrent invocations on different images.
class ModelContext {
public:
    // faceLocator and demographicClassifier may be null (feature disabled);
    // generalClassifier is mandatory
    ModelContext(std::shared_ptr<FaceLocator> faceLocator,
                 std::shared_ptr<DemographicClassifier> demographicClassifier,
                 std::shared_ptr<GeneralClassifier> generalClassifier,
                 Taxonomy taxonomy = Taxonomy::defaults());

    // Loads every configured backing. Optional backings that fail to load are
    // logged and left out; a general classifier that fails throws StartupError.
    static std::shared_ptr<const ModelContext> load(const Config& cfg);

    FaceLocator* faceLocator() const { return faceLocator_.get(); }
    DemographicClassifier* demographicClassifier() const { return demographicClassifier_.get(); }
    GeneralClassifier& generalClassifier() const { return *generalClassifier_; }
    const Taxonomy& taxonomy() const { return taxonomy_; }

private:
    ModelContext(const ModelContext&) = delete;
    ModelContext& operator=(const ModelContext&) = delete;

    std::shared_ptr<FaceLocator> faceLocator_;
    std::shared_ptr<DemographicClassifier> demographicClassifier_;
    std::shared_ptr<GeneralClassifier> generalClassifier_;
    const Taxonomy taxonomy_;
};

} // namespace revPrompt
