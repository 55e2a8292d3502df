#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include "ModelContext.hpp"
#include "PromptSynthesizer.hpp"
#include "TagResolver.hpp"

namespace revPrompt {

struct PipelineResult {
    std::string imagePath;
    std::string prompt;
    TagSet tags;
    ResolutionTrace trace;
};

// Decodes a local image as 3-channel BGR. Throws InputError when the file is
// missing or cannot be decoded.
cv::Mat loadImage(const std::string& path);

// image -> tags -> prompt for one image at a time
class PromptPipeline {
public:
    explicit PromptPipeline(const ModelContext& context,
                            FaceSelectionPolicy policy = FaceSelectionPolicy::HighestConfidence);

    // Throws InputError or ClassifierError; nothing is produced on failure
    PipelineResult describe(const std::string& imagePath) const;
    PipelineResult describe(const cv::Mat& image) const;

private:
    TagResolver resolver_;
    PromptSynthesizer synthesizer_;
};

nlohmann::json toJson(const PipelineResult& result);

} // namespace revPrompt
