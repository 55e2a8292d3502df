#pragma once

#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "FaceLocator.hpp"

namespace revPrompt {

// Turns the SSD output block (N x 7 rows of [image, label, conf, x1, y1, x2, y2],
// normalized coordinates) into clamped face regions above the threshold.
std::vector<FaceRegion> decodeFaceDetections(const cv::Mat& detectionMat,
                                             const cv::Size& imageSize,
                                             float confThreshold);

class CaffeFaceLocator : public FaceLocator {
public:
    explicit CaffeFaceLocator(float confThreshold = 0.5f);
    ~CaffeFaceLocator() override;

    std::vector<FaceRegion> locate(const cv::Mat& image) override;
    bool loadModel(const std::string& modelPath) override;
    bool isLoaded() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace revPrompt
