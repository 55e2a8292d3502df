#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <onnxruntime_cxx_api.h>

namespace revPrompt {

// Name, shape and element type of one model input or output
struct TensorInfo {
    std::string name;
    std::vector<int64_t> shape;
    ONNXTensorElementDataType type = ONNX_TENSOR_ELEMENT_DATA_TYPE_UNDEFINED;
};

// One ONNX Runtime session plus the metadata of its inputs and outputs.
// run() may be called from several threads; calls are serialized.
class ONNXInferenceEngine {
public:
    explicit ONNXInferenceEngine(const std::string& logId);
    ~ONNXInferenceEngine();

    bool loadModel(const std::string& modelPath);
    bool isLoaded() const { return session_ != nullptr; }

    // Inputs in model input order; returns every output in model output order
    std::vector<Ort::Value> run(std::vector<Ort::Value>& inputs);

    const Ort::MemoryInfo& memoryInfo() const { return memoryInfo_; }
    std::size_t inputCount() const { return inputs_.size(); }
    const std::vector<int64_t>& inputShape(std::size_t index) const { return inputs_.at(index).shape; }
    ONNXTensorElementDataType inputElementType(std::size_t index) const { return inputs_.at(index).type; }

private:
    ONNXInferenceEngine(const ONNXInferenceEngine&) = delete;
    ONNXInferenceEngine& operator=(const ONNXInferenceEngine&) = delete;

    Ort::SessionOptions sessionOptions();
    static bool cudaProviderAvailable();
    void readModelInfo();

    std::string logId_;
    std::unique_ptr<Ort::Env> env_;
    std::unique_ptr<Ort::Session> session_;
    std::mutex runMutex_;
    Ort::MemoryInfo memoryInfo_{nullptr};

    std::vector<TensorInfo> inputs_;
    std::vector<TensorInfo> outputs_;
    std::vector<const char*> inputNames_;
    std::vector<const char*> outputNames_;
};

} // namespace revPrompt
