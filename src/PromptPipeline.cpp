#include "PromptPipeline.hpp"
#include "Errors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <filesystem>

namespace fs = std::filesystem;

namespace revPrompt {

cv::Mat loadImage(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec)) {
        throw InputError("Image not found: " + path);
    }

    cv::Mat image;
    try {
        image = cv::imread(path, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw InputError("Failed to decode image " + path + ": " + e.what());
    }

    if (image.empty() || image.channels() != 3) {
        throw InputError("Failed to decode image: " + path);
    }
    return image;
}

PromptPipeline::PromptPipeline(const ModelContext& context, FaceSelectionPolicy policy)
    : resolver_(context, policy) {
}

PipelineResult PromptPipeline::describe(const std::string& imagePath) const {
    cv::Mat image = loadImage(imagePath);
    PipelineResult result = describe(image);
    result.imagePath = imagePath;
    return result;
}

PipelineResult PromptPipeline::describe(const cv::Mat& image) const {
    if (image.empty() || image.channels() != 3) {
        throw InputError("Expected a non-empty 3-channel image");
    }

    Resolution resolution = resolver_.resolve(image);

    PipelineResult result;
    result.prompt = synthesizer_.render(resolution.tags);
    result.tags = std::move(resolution.tags);
    result.trace = std::move(resolution.trace);
    return result;
}

nlohmann::json toJson(const PipelineResult& result) {
    nlohmann::json tags = nlohmann::json::object();
    for (const auto& entry : result.tags.labels()) {
        tags[categoryName(entry.first)] = entry.second;
    }

    nlohmann::json stages = nlohmann::json::array();
    for (ResolveStage stage : result.trace.stages) {
        stages.push_back(stageName(stage));
    }

    nlohmann::json sources = nlohmann::json::object();
    for (const auto& entry : result.trace.sources) {
        sources[categoryName(entry.first)] = sourceName(entry.second);
    }

    nlohmann::json trace = {
        {"stages", stages},
        {"faces_found", result.trace.facesFound},
        {"sources", sources}
    };

    if (result.trace.primaryFace) {
        const FaceRegion& face = *result.trace.primaryFace;
        trace["primary_face"] = {
            {"x1", face.x1}, {"y1", face.y1}, {"x2", face.x2}, {"y2", face.y2},
            {"confidence", face.confidence}
        };
    }
    if (result.trace.demographics) {
        const Demographics& d = *result.trace.demographics;
        trace["demographics"] = {
            {"race", d.race}, {"race_confidence", d.raceConfidence},
            {"gender", d.gender}, {"gender_confidence", d.genderConfidence}
        };
    }

    return {
        {"image", result.imagePath},
        {"prompt", result.prompt},
        {"tags", tags},
        {"trace", trace}
    };
}

} // namespace revPrompt
