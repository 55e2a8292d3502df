#pragma once

#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "FaceLocator.hpp"  // For BaseModel

namespace revPrompt {

// Valid but uninformative answers. They are accepted as-is and never trigger fallback.
extern const char* const kUnknownRace;
extern const char* const kUnknownGender;

struct Demographics {
    std::string race;
    std::string gender;
    float raceConfidence = 0.0f;
    float genderConfidence = 0.0f;
};

// std::nullopt means "unavailable": the backing is missing or inference failed
using DemographicResult = std::optional<Demographics>;

// Native FairFace taxonomies, in score vector order
const std::vector<std::string>& nativeRaceLabels();
const std::vector<std::string>& nativeGenderLabels();

// Alias table lookups onto the published taxonomy; labels missing from the
// table map to kUnknownRace / kUnknownGender
std::string mapNativeRace(const std::string& nativeLabel);
std::string mapNativeGender(const std::string& nativeLabel);

// Splits one score vector into its race segment (leading) and gender segment
// (trailing) and takes the arg-max of each. Returns std::nullopt when the
// vector is too short to hold both segments.
DemographicResult decodeDemographicScores(const std::vector<float>& scores,
                                          const std::vector<std::string>& raceLabels = nativeRaceLabels(),
                                          const std::vector<std::string>& genderLabels = nativeGenderLabels());

class DemographicClassifier : public BaseModel {
public:
    virtual ~DemographicClassifier() = default;

    virtual DemographicResult classify(const cv::Mat& faceImage) = 0;
    virtual bool loadModel(const std::string& modelPath) = 0;
};

} // namespace revPrompt
