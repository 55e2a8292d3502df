#include "ClipClassifier.hpp"
#include "ClipTokenizer.hpp"
#include "ONNXInferenceEngine.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace revPrompt {

namespace {

const char* const kImageOnnxName = "clip_image.onnx";
const char* const kTextOnnxName = "clip_text.onnx";
const char* const kVocabJsonName = "vocab.json";
const char* const kMergesTxtName = "merges.txt";

const int kDefaultImageSize = 224;
const int64_t kMaxEmbeddingDim = 4096;

using Embedding = std::vector<float>;

void l2Normalize(Embedding& e) {
    double n = 0.0;
    for (float v : e) n += static_cast<double>(v) * v;
    n = std::sqrt(n) + 1e-12;
    for (auto& v : e) v = static_cast<float>(v / n);
}

Embedding toEmbedding(Ort::Value& output, const std::vector<int64_t>& mask = {}) {
    return poolEmbedding(output.GetTensorMutableData<float>(),
                         output.GetTensorTypeAndShapeInfo().GetShape(), mask);
}

} // namespace

float embeddingSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || a.size() != b.size()) {
        throw std::invalid_argument("Embedding dimensions differ: " + std::to_string(a.size()) +
                                    " vs " + std::to_string(b.size()));
    }
    double sum = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) sum += static_cast<double>(a[i]) * b[i];
    return static_cast<float>(sum);
}

std::vector<float> poolEmbedding(const float* data, const std::vector<int64_t>& shape,
                                 const std::vector<int64_t>& mask) {
    Embedding e;
    if (shape.size() == 1 || shape.size() == 2) {
        int64_t dim = shape.back();
        if (dim <= 0 || dim > kMaxEmbeddingDim) {
            throw std::runtime_error("Unexpected embedding dimension");
        }
        e.assign(data, data + dim);
    } else if (shape.size() == 3) {
        int64_t seq = shape[1];
        int64_t dim = shape[2];
        if (seq <= 0 || dim <= 0 || dim > kMaxEmbeddingDim) {
            throw std::runtime_error("Unexpected sequence output shape");
        }
        // Padding positions would dominate an unmasked mean
        if (mask.size() != static_cast<std::size_t>(seq)) {
            throw std::runtime_error("Sequence output of length " + std::to_string(seq) +
                                     " needs a matching attention mask");
        }
        e.assign(static_cast<std::size_t>(dim), 0.0f);
        int64_t used = 0;
        for (int64_t t = 0; t < seq; ++t) {
            if (mask[static_cast<std::size_t>(t)] == 0) continue;
            const float* row = data + t * dim;
            for (int64_t j = 0; j < dim; ++j) e[static_cast<std::size_t>(j)] += row[j];
            ++used;
        }
        if (used == 0) {
            throw std::runtime_error("Attention mask selects no positions");
        }
        for (float& v : e) v /= static_cast<float>(used);
    } else {
        throw std::runtime_error("Unexpected embedding output rank");
    }

    l2Normalize(e);
    return e;
}

class ClipClassifier::Impl {
public:
    Impl() : imageEngine("clip_image"), textEngine("clip_text") {}

    bool loadModel(const std::string& modelPath) {
        fs::path baseDir = fs::path(modelPath);
        if (!fs::is_directory(baseDir)) {
            baseDir = baseDir.parent_path();
        }

        fs::path imagePath = baseDir / kImageOnnxName;
        fs::path textPath = baseDir / kTextOnnxName;
        if (!fs::exists(imagePath) || !fs::exists(textPath)) {
            std::cerr << "[GeneralClassifier] Encoder models not found in: " << baseDir << std::endl;
            return false;
        }

        if (!imageEngine.loadModel(imagePath.string()) || !textEngine.loadModel(textPath.string())) {
            std::cerr << "[GeneralClassifier] Failed to load CLIP encoders from: " << baseDir << std::endl;
            return false;
        }

        if (imageEngine.inputCount() != 1 || textEngine.inputCount() < 1) {
            std::cerr << "[GeneralClassifier] Unexpected encoder inputs" << std::endl;
            return false;
        }

        // Exported text encoders take either raw strings or token ids
        textTakesStrings = textEngine.inputElementType(0) == ONNX_TENSOR_ELEMENT_DATA_TYPE_STRING;
        if (!textTakesStrings) {
            try {
                tokenizer.load((baseDir / kVocabJsonName).string(), (baseDir / kMergesTxtName).string());
            } catch (const std::exception& e) {
                std::cerr << "[GeneralClassifier] Error loading tokenizer: " << e.what() << std::endl;
                return false;
            }
        }

        imageSize = resolveImageSize(imageEngine.inputShape(0));
        loaded = true;
        std::cout << "[GeneralClassifier] Loaded CLIP encoders from " << baseDir
                  << " (input " << imageSize.width << "x" << imageSize.height << ")" << std::endl;
        return true;
    }

    Embedding encodeImage(const cv::Mat& bgr) {
        cv::Mat chw = preprocess(bgr);

        std::vector<int64_t> shape = {1, 3, imageSize.height, imageSize.width};
        std::vector<float> data(chw.ptr<float>(0), chw.ptr<float>(0) + chw.total());

        std::vector<Ort::Value> inputs;
        inputs.push_back(Ort::Value::CreateTensor<float>(imageEngine.memoryInfo(), data.data(), data.size(),
                                                         shape.data(), shape.size()));
        auto outputs = imageEngine.run(inputs);
        return toEmbedding(outputs.front());
    }

    Embedding encodeText(const std::string& hypothesis) {
        std::vector<Ort::Value> inputs;

        if (textTakesStrings) {
            std::vector<int64_t> shape = {1};
            Ort::AllocatorWithDefaultOptions allocator;
            Ort::Value input = Ort::Value::CreateTensor(allocator, shape.data(), shape.size(),
                                                        ONNX_TENSOR_ELEMENT_DATA_TYPE_STRING);
            const char* s = hypothesis.c_str();
            input.FillStringTensor(&s, 1);
            inputs.push_back(std::move(input));
            auto outputs = textEngine.run(inputs);
            return toEmbedding(outputs.front());
        }

        std::vector<int64_t> ids;
        std::vector<int64_t> mask;
        tokenizer.encode(hypothesis, ClipTokenizer::kContextLength, ids, mask);
        std::vector<int64_t> shape = {1, static_cast<int64_t>(ids.size())};

        // Some exports use int32 ids
        std::vector<int32_t> ids32(ids.begin(), ids.end());
        std::vector<int32_t> mask32(mask.begin(), mask.end());

        auto makeTensor = [&](std::size_t index, std::vector<int64_t>& v64, std::vector<int32_t>& v32) {
            if (textEngine.inputElementType(index) == ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32) {
                return Ort::Value::CreateTensor<int32_t>(textEngine.memoryInfo(), v32.data(), v32.size(),
                                                         shape.data(), shape.size());
            }
            return Ort::Value::CreateTensor<int64_t>(textEngine.memoryInfo(), v64.data(), v64.size(),
                                                     shape.data(), shape.size());
        };

        inputs.push_back(makeTensor(0, ids, ids32));
        if (textEngine.inputCount() >= 2) {
            inputs.push_back(makeTensor(1, mask, mask32));
        }
        auto outputs = textEngine.run(inputs);
        return toEmbedding(outputs.front(), mask);
    }

    ONNXInferenceEngine imageEngine;
    ONNXInferenceEngine textEngine;
    ClipTokenizer tokenizer;
    bool textTakesStrings = false;
    bool loaded = false;
    cv::Size imageSize{kDefaultImageSize, kDefaultImageSize};
    float logitScale = 100.0f;

private:
    static cv::Size resolveImageSize(const std::vector<int64_t>& shape) {
        // NCHW; dynamic spatial dims fall back to 224x224
        if (shape.size() == 4 && shape[2] > 0 && shape[3] > 0) {
            return cv::Size(static_cast<int>(shape[3]), static_cast<int>(shape[2]));
        }
        return cv::Size(kDefaultImageSize, kDefaultImageSize);
    }

    // Shortest-side resize, center crop, CLIP mean/std, planar CHW float
    cv::Mat preprocess(const cv::Mat& bgr) const {
        cv::Mat rgb;
        cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);

        const int W = imageSize.width;
        const int H = imageSize.height;
        const float scale = static_cast<float>(std::min(W, H)) / static_cast<float>(std::min(rgb.cols, rgb.rows));
        cv::Mat resized;
        cv::resize(rgb, resized,
                   cv::Size(std::max(W, static_cast<int>(std::round(rgb.cols * scale))),
                            std::max(H, static_cast<int>(std::round(rgb.rows * scale)))),
                   0, 0, cv::INTER_CUBIC);
        cv::Rect roi((resized.cols - W) / 2, (resized.rows - H) / 2, W, H);
        cv::Mat crop = resized(roi).clone();

        crop.convertTo(crop, CV_32FC3, 1.0 / 255.0);
        std::vector<cv::Mat> channels(3);
        cv::split(crop, channels);
        const float mean[3] = {0.48145466f, 0.4578275f, 0.40821073f};
        const float stdv[3] = {0.26862954f, 0.26130258f, 0.27577711f};
        for (int c = 0; c < 3; ++c) {
            channels[c] = (channels[c] - mean[c]) / stdv[c];
        }
        cv::Mat chw;
        cv::vconcat(channels, chw);  // 3H x W, contiguous
        return chw;
    }
};

ClipClassifier::ClipClassifier(std::string hypothesisTemplate, float logitScale)
    : GeneralClassifier(std::move(hypothesisTemplate)), pImpl_(std::make_unique<Impl>()) {
    pImpl_->logitScale = logitScale;
}

ClipClassifier::~ClipClassifier() = default;

bool ClipClassifier::loadModel(const std::string& modelPath) {
    try {
        return pImpl_->loadModel(modelPath);
    } catch (const std::exception& e) {
        std::cerr << "[GeneralClassifier] Error loading model: " << e.what() << std::endl;
        return false;
    }
}

bool ClipClassifier::isLoaded() const {
    return pImpl_->loaded;
}

std::vector<float> ClipClassifier::scoreHypotheses(const cv::Mat& image,
                                                   const std::vector<std::string>& hypotheses) {
    if (!pImpl_->loaded) {
        throw std::runtime_error("CLIP encoders not loaded");
    }

    Embedding imageEmbedding = pImpl_->encodeImage(image);

    std::vector<float> logits;
    logits.reserve(hypotheses.size());
    for (const auto& hypothesis : hypotheses) {
        Embedding textEmbedding = pImpl_->encodeText(hypothesis);
        logits.push_back(pImpl_->logitScale * embeddingSimilarity(imageEmbedding, textEmbedding));
    }
    return logits;
}

} // namespace revPrompt
