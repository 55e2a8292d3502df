#include "FairFaceClassifier.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/core/cuda.hpp>
#include <iostream>
#include <filesystem>

namespace fs = std::filesystem;

namespace revPrompt {

FairFaceClassifier::FairFaceClassifier() : modelLoaded_(false) {
}

FairFaceClassifier::~FairFaceClassifier() {
}

bool FairFaceClassifier::loadModel(const std::string& modelPath) {
    try {
        if (!fs::exists(modelPath)) {
            std::cerr << "[DemographicClassifier] Model path does not exist: " << modelPath << std::endl;
            return false;
        }

        // Accept either the .onnx file or the directory holding fairface.onnx
        fs::path onnxPath = fs::path(modelPath);
        if (fs::is_directory(onnxPath)) {
            onnxPath /= "fairface.onnx";
        }
        if (!fs::exists(onnxPath)) {
            std::cerr << "[DemographicClassifier] Model file not found: " << onnxPath << std::endl;
            return false;
        }

        cv::dnn::Net net = cv::dnn::readNetFromONNX(onnxPath.string());
        if (net.empty()) {
            std::cerr << "[DemographicClassifier] Failed to load model from: " << onnxPath << std::endl;
            return false;
        }

        if (cv::cuda::getCudaEnabledDeviceCount() > 0) {
            net.setPreferableBackend(cv::dnn::DNN_BACKEND_CUDA);
            net.setPreferableTarget(cv::dnn::DNN_TARGET_CUDA);
            std::cout << "[DemographicClassifier] Using CUDA backend" << std::endl;
        } else {
            net.setPreferableBackend(cv::dnn::DNN_BACKEND_DEFAULT);
            net.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
            std::cout << "[DemographicClassifier] Using CPU backend" << std::endl;
        }

        std::lock_guard<std::mutex> lock(netMutex_);
        net_ = net;
        modelLoaded_ = true;
        std::cout << "[DemographicClassifier] Successfully loaded " << onnxPath.filename() << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[DemographicClassifier] Error loading model: " << e.what() << std::endl;
        return false;
    }
}

cv::Mat FairFaceClassifier::preprocess(const cv::Mat& faceImage) const {
    cv::Mat face;
    cv::resize(faceImage, face, cv::Size(inputSize_, inputSize_));
    cv::cvtColor(face, face, cv::COLOR_BGR2RGB);

    // Scale to [0,1] and normalize each channel
    face.convertTo(face, CV_32FC3, 1.0 / 255.0);
    std::vector<cv::Mat> channels(3);
    cv::split(face, channels);
    for (int c = 0; c < 3; ++c) {
        channels[c] = (channels[c] - mean_[c]) / std_[c];
    }
    cv::merge(channels, face);

    return cv::dnn::blobFromImage(face, 1.0, cv::Size(inputSize_, inputSize_),
                                  cv::Scalar(), false, false);
}

DemographicResult FairFaceClassifier::classify(const cv::Mat& faceImage) {
    if (!modelLoaded_) {
        std::cerr << "[DemographicClassifier] Model not loaded" << std::endl;
        return std::nullopt;
    }

    if (faceImage.empty()) {
        return std::nullopt;
    }

    try {
        cv::Mat blob = preprocess(faceImage);

        cv::Mat output;
        {
            std::lock_guard<std::mutex> lock(netMutex_);
            net_.setInput(blob);
            output = net_.forward();
        }

        cv::Mat flat = output.reshape(1, 1);
        std::vector<float> scores(flat.begin<float>(), flat.end<float>());

        DemographicResult result = decodeDemographicScores(scores);
        if (!result) {
            std::cerr << "[DemographicClassifier] Unexpected output size: " << scores.size() << std::endl;
        }
        return result;
    } catch (const cv::Exception& e) {
        std::cerr << "[DemographicClassifier] OpenCV error during inference: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[DemographicClassifier] Error during inference: " << e.what() << std::endl;
    }

    return std::nullopt;
}

} // namespace revPrompt
