#include "GeneralClassifier.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>

namespace revPrompt {

const char* const kDefaultHypothesisTemplate = "a photo of {label}";

namespace {
const std::string kPlaceholder = "{label}";
}

std::vector<float> softmax(const std::vector<float>& logits) {
    std::vector<float> result(logits.size());
    if (logits.empty()) {
        return result;
    }

    float maxLogit = *std::max_element(logits.begin(), logits.end());
    double sum = 0.0;
    for (std::size_t i = 0; i < logits.size(); ++i) {
        double e = std::exp(static_cast<double>(logits[i] - maxLogit));
        result[i] = static_cast<float>(e);
        sum += e;
    }
    for (auto& p : result) {
        p = static_cast<float>(p / sum);
    }
    return result;
}

GeneralClassifier::GeneralClassifier(std::string hypothesisTemplate)
    : hypothesisTemplate_(std::move(hypothesisTemplate)) {
    if (hypothesisTemplate_.find(kPlaceholder) == std::string::npos) {
        throw ConfigError("Hypothesis template must contain " + kPlaceholder + ": '" + hypothesisTemplate_ + "'");
    }
}

std::string GeneralClassifier::hypothesisFor(const std::string& label) const {
    std::string hypothesis = hypothesisTemplate_;
    std::size_t pos = 0;
    while ((pos = hypothesis.find(kPlaceholder, pos)) != std::string::npos) {
        hypothesis.replace(pos, kPlaceholder.size(), label);
        pos += label.size();
    }
    return hypothesis;
}

std::vector<float> GeneralClassifier::probabilities(const cv::Mat& image,
                                                    const std::vector<std::string>& candidates) {
    if (candidates.empty()) {
        throw ClassifierError("No candidate labels to classify against");
    }
    if (image.empty()) {
        throw ClassifierError("Cannot classify an empty image");
    }

    std::vector<std::string> hypotheses;
    hypotheses.reserve(candidates.size());
    for (const auto& label : candidates) {
        hypotheses.push_back(hypothesisFor(label));
    }

    std::vector<float> scores;
    try {
        scores = scoreHypotheses(image, hypotheses);
    } catch (const ClassifierError&) {
        throw;
    } catch (const std::exception& e) {
        throw ClassifierError(std::string("General classifier failed: ") + e.what());
    }

    if (scores.size() != candidates.size()) {
        throw ClassifierError("General classifier returned " + std::to_string(scores.size()) +
                              " scores for " + std::to_string(candidates.size()) + " hypotheses");
    }
    for (float s : scores) {
        if (!std::isfinite(s)) {
            throw ClassifierError("General classifier returned a non-finite score");
        }
    }

    return softmax(scores);
}

std::string GeneralClassifier::classify(const cv::Mat& image, const std::vector<std::string>& candidates) {
    std::vector<float> probs = probabilities(image, candidates);
    auto best = std::max_element(probs.begin(), probs.end());
    return candidates[static_cast<std::size_t>(best - probs.begin())];
}

} // namespace revPrompt
