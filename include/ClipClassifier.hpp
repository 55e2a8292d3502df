#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "GeneralClassifier.hpp"

namespace revPrompt {

// Dot product of two L2-normalized embeddings. Throws std::invalid_argument
// when the dimensions differ.
float embeddingSimilarity(const std::vector<float>& a, const std::vector<float>& b);

// Pools an encoder output of shape [dim], [1, dim] or [1, seq, dim] into one
// L2-normalized embedding. Sequence outputs are averaged over the positions
// where mask is non-zero and need a mask of length seq.
std::vector<float> poolEmbedding(const float* data, const std::vector<int64_t>& shape,
                                 const std::vector<int64_t>& mask = {});

// CLIP-style zero-shot classifier over ONNX image and text encoders.
// The model directory holds clip_image.onnx, clip_text.onnx and, for text
// encoders taking token ids, the tokenizer files vocab.json and merges.txt.
class ClipClassifier : public GeneralClassifier {
public:
    explicit ClipClassifier(std::string hypothesisTemplate = kDefaultHypothesisTemplate,
                            float logitScale = 100.0f);
    ~ClipClassifier() override;

    bool loadModel(const std::string& modelPath) override;
    bool isLoaded() const override;

protected:
    std::vector<float> scoreHypotheses(const cv::Mat& image,
                                       const std::vector<std::string>& hypotheses) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace revPrompt
