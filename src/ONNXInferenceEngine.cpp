#include "ONNXInferenceEngine.hpp"
#include <iostream>
#include <stdexcept>

namespace revPrompt {

namespace {

TensorInfo describeTensor(const std::string& name, const Ort::TypeInfo& typeInfo) {
    TensorInfo info;
    info.name = name;
    if (typeInfo.GetONNXType() == ONNX_TYPE_TENSOR) {
        auto tensorInfo = typeInfo.GetTensorTypeAndShapeInfo();
        info.shape = tensorInfo.GetShape();
        info.type = tensorInfo.GetElementType();
    }
    return info;
}

} // namespace

ONNXInferenceEngine::ONNXInferenceEngine(const std::string& logId)
    : logId_(logId),
      env_(std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, logId.c_str())),
      memoryInfo_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)) {
}

ONNXInferenceEngine::~ONNXInferenceEngine() = default;

bool ONNXInferenceEngine::loadModel(const std::string& modelPath) {
    try {
        session_ = std::make_unique<Ort::Session>(*env_, modelPath.c_str(), sessionOptions());
        readModelInfo();
        std::cout << "[" << logId_ << "] Loaded " << modelPath << " (" << inputs_.size()
                  << " inputs, " << outputs_.size() << " outputs)" << std::endl;
        return true;
    } catch (const Ort::Exception& e) {
        std::cerr << "[" << logId_ << "] ONNX Runtime error loading " << modelPath << ": " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[" << logId_ << "] Error loading " << modelPath << ": " << e.what() << std::endl;
    }
    session_.reset();
    inputs_.clear();
    outputs_.clear();
    return false;
}

Ort::SessionOptions ONNXInferenceEngine::sessionOptions() {
    Ort::SessionOptions options;
    options.SetIntraOpNumThreads(1);
    options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

    const bool useCuda = cudaProviderAvailable();
    if (useCuda) {
        OrtCUDAProviderOptions cudaOptions;
        options.AppendExecutionProvider_CUDA(cudaOptions);
    }
    std::cout << "[" << logId_ << "] Using " << (useCuda ? "CUDA" : "CPU") << " provider" << std::endl;
    return options;
}

bool ONNXInferenceEngine::cudaProviderAvailable() {
    for (const auto& provider : Ort::GetAvailableProviders()) {
        if (provider == "CUDAExecutionProvider") {
            return true;
        }
    }
    return false;
}

void ONNXInferenceEngine::readModelInfo() {
    Ort::AllocatorWithDefaultOptions allocator;

    inputs_.clear();
    for (size_t i = 0; i < session_->GetInputCount(); ++i) {
        auto name = session_->GetInputNameAllocated(i, allocator);
        inputs_.push_back(describeTensor(name.get(), session_->GetInputTypeInfo(i)));
    }

    outputs_.clear();
    for (size_t i = 0; i < session_->GetOutputCount(); ++i) {
        auto name = session_->GetOutputNameAllocated(i, allocator);
        outputs_.push_back(describeTensor(name.get(), session_->GetOutputTypeInfo(i)));
    }

    // Names are pointed into inputs_/outputs_, which are not resized again
    inputNames_.clear();
    for (const auto& input : inputs_) {
        inputNames_.push_back(input.name.c_str());
    }
    outputNames_.clear();
    for (const auto& output : outputs_) {
        outputNames_.push_back(output.name.c_str());
    }
}

std::vector<Ort::Value> ONNXInferenceEngine::run(std::vector<Ort::Value>& inputs) {
    if (!session_) {
        throw std::runtime_error(logId_ + ": model not loaded");
    }
    if (inputs.size() != inputs_.size()) {
        throw std::runtime_error(logId_ + ": model expects " + std::to_string(inputs_.size()) +
                                 " inputs, got " + std::to_string(inputs.size()));
    }

    std::lock_guard<std::mutex> lock(runMutex_);
    return session_->Run(Ort::RunOptions{nullptr},
                         inputNames_.data(), inputs.data(), inputs.size(),
                         outputNames_.data(), outputNames_.size());
}

} // namespace revPrompt
