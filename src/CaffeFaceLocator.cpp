#include "CaffeFaceLocator.hpp"
#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/core/cuda.hpp>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <mutex>

namespace fs = std::filesystem;

namespace revPrompt {

std::vector<FaceRegion> decodeFaceDetections(const cv::Mat& detectionMat,
                                             const cv::Size& imageSize,
                                             float confThreshold) {
    std::vector<FaceRegion> regions;
    if (detectionMat.empty() || detectionMat.cols < 7) {
        return regions;
    }

    for (int i = 0; i < detectionMat.rows; i++) {
        float confidence = detectionMat.at<float>(i, 2);
        if (confidence < confThreshold) {
            continue;
        }

        int x1 = static_cast<int>(detectionMat.at<float>(i, 3) * imageSize.width);
        int y1 = static_cast<int>(detectionMat.at<float>(i, 4) * imageSize.height);
        int x2 = static_cast<int>(detectionMat.at<float>(i, 5) * imageSize.width);
        int y2 = static_cast<int>(detectionMat.at<float>(i, 6) * imageSize.height);

        // Ensure box is within image boundaries
        x1 = std::max(0, std::min(x1, imageSize.width));
        y1 = std::max(0, std::min(y1, imageSize.height));
        x2 = std::max(0, std::min(x2, imageSize.width));
        y2 = std::max(0, std::min(y2, imageSize.height));

        // Nothing left after clamping
        if (x1 >= x2 || y1 >= y2) {
            continue;
        }

        FaceRegion region;
        region.x1 = x1;
        region.y1 = y1;
        region.x2 = x2;
        region.y2 = y2;
        region.confidence = std::min(1.0f, confidence);
        regions.push_back(region);
    }

    // Most confident first, scan order kept among equal scores
    std::stable_sort(regions.begin(), regions.end(),
                     [](const FaceRegion& a, const FaceRegion& b) {
                         return a.confidence > b.confidence;
                     });
    return regions;
}

class CaffeFaceLocator::Impl {
public:
    cv::dnn::Net net;
    std::mutex netMutex;
    bool loaded = false;
    float confThreshold = 0.5f;
    int inputWidth = 300;
    int inputHeight = 300;
    float meanValues[3] = {104.0f, 177.0f, 123.0f};
};

CaffeFaceLocator::CaffeFaceLocator(float confThreshold) : pImpl_(std::make_unique<Impl>()) {
    pImpl_->confThreshold = confThreshold;
}

CaffeFaceLocator::~CaffeFaceLocator() = default;

bool CaffeFaceLocator::loadModel(const std::string& modelPath) {
    try {
        // Either the .prototxt itself or the directory holding deploy.prototxt.
        // The weights sit next to it with the .caffemodel extension.
        fs::path prototxtPath = fs::path(modelPath);
        if (fs::is_directory(prototxtPath)) {
            prototxtPath /= "deploy.prototxt";
        }
        fs::path caffemodelPath = prototxtPath.parent_path() / (prototxtPath.stem().string() + ".caffemodel");

        if (!fs::exists(prototxtPath) || !fs::exists(caffemodelPath)) {
            std::cerr << "[FaceLocator] Model files not found: " << prototxtPath << " or " << caffemodelPath << std::endl;
            return false;
        }

        cv::dnn::Net net = cv::dnn::readNetFromCaffe(prototxtPath.string(), caffemodelPath.string());
        if (net.empty()) {
            std::cerr << "[FaceLocator] Failed to read network from: " << prototxtPath << std::endl;
            return false;
        }

        if (cv::cuda::getCudaEnabledDeviceCount() > 0) {
            net.setPreferableBackend(cv::dnn::DNN_BACKEND_CUDA);
            net.setPreferableTarget(cv::dnn::DNN_TARGET_CUDA);
            std::cout << "[FaceLocator] Using CUDA backend for face detection" << std::endl;
        } else {
            net.setPreferableBackend(cv::dnn::DNN_BACKEND_DEFAULT);
            net.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
            std::cout << "[FaceLocator] CUDA not available for face detection, using CPU" << std::endl;
        }

        std::lock_guard<std::mutex> lock(pImpl_->netMutex);
        pImpl_->net = net;
        pImpl_->loaded = true;
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "[FaceLocator] Error loading face detection model: " << e.what() << std::endl;
        return false;
    }
}

bool CaffeFaceLocator::isLoaded() const {
    return pImpl_->loaded;
}

std::vector<FaceRegion> CaffeFaceLocator::locate(const cv::Mat& image) {
    if (!pImpl_->loaded || image.empty()) {
        return {};
    }

    try {
        // Prepare input blob and set input
        cv::Mat inputBlob = cv::dnn::blobFromImage(
            image, 1.0,
            cv::Size(pImpl_->inputWidth, pImpl_->inputHeight),
            cv::Scalar(pImpl_->meanValues[0], pImpl_->meanValues[1], pImpl_->meanValues[2]),
            false, false);

        cv::Mat detection;
        {
            std::lock_guard<std::mutex> lock(pImpl_->netMutex);
            pImpl_->net.setInput(inputBlob);
            detection = pImpl_->net.forward();
        }

        // Output blob is 1 x 1 x N x 7
        cv::Mat detectionMat(detection.size[2], detection.size[3], CV_32F, detection.ptr<float>());
        return decodeFaceDetections(detectionMat, image.size(), pImpl_->confThreshold);
    }
    catch (const std::exception& e) {
        std::cerr << "[FaceLocator] Error during face detection: " << e.what() << std::endl;
    }

    return {};
}

} // namespace revPrompt
