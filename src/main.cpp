#include "Config.hpp"
#include "Errors.hpp"
#include "ModelContext.hpp"
#include "PromptPipeline.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <opencv2/core.hpp>
#include <opencv2/core/cuda.hpp>
#include <opencv2/core/utils/logger.hpp>

namespace {

enum ExitCode {
    kOk = 0,
    kConfigError = 1,
    kInputError = 2,
    kClassifierError = 3,
    kStartupError = 4
};

// Sends informational std::cout output elsewhere for the lifetime of the guard
class CoutRedirect {
public:
    explicit CoutRedirect(std::streambuf* target)
        : previous_(target ? std::cout.rdbuf(target) : nullptr) {}
    ~CoutRedirect() {
        if (previous_) {
            std::cout.rdbuf(previous_);
        }
    }

private:
    std::streambuf* previous_;
};

} // namespace

int main(int argc, char** argv) {
    cv::utils::logging::setLogLevel(cv::utils::logging::LOG_LEVEL_ERROR);

    revPrompt::Config cfg;
    try {
        cfg = revPrompt::parseArgs(argc, argv);
    }
    catch (const revPrompt::ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << revPrompt::usage(argv[0]);
        return kConfigError;
    }

    if (cfg.showHelp) {
        std::cout << revPrompt::usage(argv[0]);
        return kOk;
    }

    // Progress output must not end up in the result on stdout
    std::ostringstream discarded;
    std::streambuf* logTarget = nullptr;
    if (cfg.quiet) {
        logTarget = discarded.rdbuf();
    } else if (cfg.output == revPrompt::OutputFormat::Json) {
        logTarget = std::cerr.rdbuf();
    }

    revPrompt::PipelineResult result;
    try {
        CoutRedirect redirect(logTarget);

        std::cout << "OpenCV Version: " << CV_VERSION << std::endl;
        int cudaDeviceCount = cv::cuda::getCudaEnabledDeviceCount();
        std::cout << "OpenCV CUDA Support: " << cudaDeviceCount << " CUDA device(s) found" << std::endl;
        std::cout << "Looking for models in: " << cfg.modelsDir << std::endl;

        std::shared_ptr<const revPrompt::ModelContext> context = revPrompt::ModelContext::load(cfg);
        revPrompt::PromptPipeline pipeline(*context, cfg.facePolicy);

        std::cout << "Describing " << cfg.imagePath << std::endl;
        result = pipeline.describe(cfg.imagePath);
    }
    catch (const revPrompt::StartupError& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return kStartupError;
    }
    catch (const revPrompt::ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kConfigError;
    }
    catch (const revPrompt::InputError& e) {
        std::cerr << "Input error: " << e.what() << std::endl;
        return kInputError;
    }
    catch (const revPrompt::ClassifierError& e) {
        std::cerr << "Pipeline failure: " << e.what() << std::endl;
        return kClassifierError;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kConfigError;
    }

    if (cfg.output == revPrompt::OutputFormat::Json) {
        std::cout << revPrompt::toJson(result).dump(2) << std::endl;
    } else {
        std::cout << result.prompt << std::endl;
    }

    return kOk;
}
