#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "FaceLocator.hpp"  // For BaseModel

namespace revPrompt {

extern const char* const kDefaultHypothesisTemplate;

// Numerically stable softmax
std::vector<float> softmax(const std::vector<float>& logits);

// Zero-shot classifier: every candidate label becomes a textual hypothesis and
// the backing scores image-vs-hypothesis compatibility. There is no fallback
// behind it, so every failure is reported as ClassifierError.
class GeneralClassifier : public BaseModel {
public:
    explicit GeneralClassifier(std::string hypothesisTemplate = kDefaultHypothesisTemplate);
    virtual ~GeneralClassifier() = default;

    virtual bool loadModel(const std::string& modelPath) = 0;

    // Best candidate; the first one wins ties
    virtual std::string classify(const cv::Mat& image, const std::vector<std::string>& candidates);

    // Substitutes the label for "{label}" in the phrasing template
    std::string hypothesisFor(const std::string& label) const;

protected:
    // One raw compatibility score (logit) per hypothesis
    virtual std::vector<float> scoreHypotheses(const cv::Mat& image,
                                               const std::vector<std::string>& hypotheses) = 0;

private:
    std::vector<float> probabilities(const cv::Mat& image, const std::vector<std::string>& candidates);

    std::string hypothesisTemplate_;
};

} // namespace revPrompt
