#include "FaceLocator.hpp"

namespace revPrompt {

std::string policyName(FaceSelectionPolicy policy) {
    switch (policy) {
        case FaceSelectionPolicy::FirstReturned:
            return "first";
        case FaceSelectionPolicy::HighestConfidence:
            return "confidence";
        case FaceSelectionPolicy::LargestArea:
            return "area";
    }
    return "confidence";
}

bool policyFromName(const std::string& name, FaceSelectionPolicy& policy) {
    if (name == "first") {
        policy = FaceSelectionPolicy::FirstReturned;
    } else if (name == "confidence") {
        policy = FaceSelectionPolicy::HighestConfidence;
    } else if (name == "area") {
        policy = FaceSelectionPolicy::LargestArea;
    } else {
        return false;
    }
    return true;
}

int selectPrimaryFace(const std::vector<FaceRegion>& regions, FaceSelectionPolicy policy) {
    if (regions.empty()) {
        return -1;
    }

    int best = 0;
    for (int i = 1; i < static_cast<int>(regions.size()); ++i) {
        const FaceRegion& candidate = regions[i];
        const FaceRegion& current = regions[best];
        switch (policy) {
            case FaceSelectionPolicy::FirstReturned:
                return 0;
            case FaceSelectionPolicy::HighestConfidence:
                if (candidate.confidence > current.confidence) {
                    best = i;
                }
                break;
            case FaceSelectionPolicy::LargestArea:
                if (candidate.area() > current.area()) {
                    best = i;
                }
                break;
        }
    }
    return best;
}

} // namespace revPrompt
