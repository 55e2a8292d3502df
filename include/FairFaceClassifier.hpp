#pragma once

#include <mutex>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include "DemographicClassifier.hpp"

namespace revPrompt {

class FairFaceClassifier : public DemographicClassifier {
public:
    FairFaceClassifier();
    ~FairFaceClassifier() override;

    bool loadModel(const std::string& modelPath) override;
    DemographicResult classify(const cv::Mat& faceImage) override;
    bool isLoaded() const override { return modelLoaded_; }

private:
    cv::dnn::Net net_;
    std::mutex netMutex_;
    bool modelLoaded_;

    const int inputSize_ = 224;
    // ImageNet statistics, RGB order
    const float mean_[3] = {0.485f, 0.456f, 0.406f};
    const float std_[3] = {0.229f, 0.224f, 0.225f};

    // Pre-process a face crop for the network
    cv::Mat preprocess(const cv::Mat& faceImage) const;
};

} // namespace revPrompt
