#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace revPrompt {

// Axis-aligned face box in image pixel space. 0 <= x1 < x2 <= width, 0 <= y1 < y2 <= height.
struct FaceRegion {
    int x1;
    int y1;
    int x2;
    int y2;
    float confidence;

    cv::Rect rect() const { return cv::Rect(x1, y1, x2 - x1, y2 - y1); }
    int area() const { return (x2 - x1) * (y2 - y1); }
};

// How the primary face is picked among the located regions
enum class FaceSelectionPolicy {
    FirstReturned,      // position 0 of the locator output
    HighestConfidence,  // earliest region on ties
    LargestArea         // earliest region on ties
};

std::string policyName(FaceSelectionPolicy policy);
bool policyFromName(const std::string& name, FaceSelectionPolicy& policy);

// Index of the primary region, or -1 when there are none
int selectPrimaryFace(const std::vector<FaceRegion>& regions, FaceSelectionPolicy policy);

class BaseModel {
public:
    virtual ~BaseModel() = default;
    virtual bool isLoaded() const = 0;
};

class FaceLocator : public BaseModel {
public:
    virtual ~FaceLocator() = default;

    // Regions sorted by descending confidence. Empty when nothing clears the
    // threshold or no network is loaded.
    virtual std::vector<FaceRegion> locate(const cv::Mat& image) = 0;
    virtual bool loadModel(const std::string& modelPath) = 0;
};

} // namespace revPrompt
