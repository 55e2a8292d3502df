#include "Config.hpp"
#include "Errors.hpp"
#include "GeneralClassifier.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace revPrompt {

namespace {

bool argEq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool validThreshold(float threshold) {
    return std::isfinite(threshold) && threshold >= 0.0f && threshold <= 1.0f;
}

float parseThreshold(const std::string& value) {
    float threshold = 0.0f;
    try {
        std::size_t used = 0;
        threshold = std::stof(value, &used);
        if (used != value.size()) {
            throw ConfigError("Invalid face threshold: '" + value + "'");
        }
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid face threshold: '" + value + "'");
    }
    if (!validThreshold(threshold)) {
        throw ConfigError("Face threshold must lie in [0,1]: " + value);
    }
    return threshold;
}

FaceSelectionPolicy parsePolicy(const std::string& value) {
    FaceSelectionPolicy policy;
    if (!policyFromName(value, policy)) {
        throw ConfigError("Unknown face policy '" + value + "' (expected first, confidence or area)");
    }
    return policy;
}

OutputFormat parseOutput(const std::string& value) {
    if (value == "text") return OutputFormat::Text;
    if (value == "json") return OutputFormat::Json;
    throw ConfigError("Unknown output format '" + value + "' (expected text or json)");
}

} // namespace

std::string Config::resolvedFaceModelPath() const {
    if (!faceModelPath.empty()) return faceModelPath;
    return (fs::path(modelsDir) / "face_detection" / "deploy.prototxt").string();
}

std::string Config::resolvedDemographicModelPath() const {
    if (!demographicModelPath.empty()) return demographicModelPath;
    return (fs::path(modelsDir) / "fairface").string();
}

std::string Config::resolvedGeneralModelPath() const {
    if (!generalModelPath.empty()) return generalModelPath;
    return (fs::path(modelsDir) / "clip").string();
}

void applyEnvironment(Config& cfg) {
    if (const char* env = std::getenv("REVPROMPT_MODELS_DIR")) cfg.modelsDir = env;
    if (const char* env = std::getenv("REVPROMPT_FACE_THRESHOLD")) cfg.faceThreshold = parseThreshold(env);
    if (const char* env = std::getenv("REVPROMPT_FACE_POLICY")) cfg.facePolicy = parsePolicy(env);
}

void applyConfigJson(Config& cfg, const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    try {
        if (j.contains("models_dir")) cfg.modelsDir = j.at("models_dir").get<std::string>();
        if (j.contains("face_model")) cfg.faceModelPath = j.at("face_model").get<std::string>();
        if (j.contains("demographic_model")) cfg.demographicModelPath = j.at("demographic_model").get<std::string>();
        if (j.contains("clip_model")) cfg.generalModelPath = j.at("clip_model").get<std::string>();
        if (j.contains("face_locator")) cfg.faceLocatorEnabled = j.at("face_locator").get<bool>();
        if (j.contains("demographic")) cfg.demographicEnabled = j.at("demographic").get<bool>();
        if (j.contains("hypothesis_template")) cfg.hypothesisTemplate = j.at("hypothesis_template").get<std::string>();
        if (j.contains("quiet")) cfg.quiet = j.at("quiet").get<bool>();

        if (j.contains("face_threshold")) {
            float threshold = j.at("face_threshold").get<float>();
            if (!validThreshold(threshold)) {
                throw ConfigError("face_threshold must lie in [0,1]");
            }
            cfg.faceThreshold = threshold;
        }
        if (j.contains("face_policy")) cfg.facePolicy = parsePolicy(j.at("face_policy").get<std::string>());
        if (j.contains("output")) cfg.output = parseOutput(j.at("output").get<std::string>());

        if (j.contains("candidates")) {
            const auto& candidates = j.at("candidates");
            if (!candidates.is_object()) {
                throw ConfigError("'candidates' must map category names to label lists");
            }
            for (auto it = candidates.begin(); it != candidates.end(); ++it) {
                AttributeCategory category;
                if (!categoryFromName(it.key(), category)) {
                    throw ConfigError("Unknown category in 'candidates': " + it.key());
                }
                cfg.taxonomy.setCandidates(category, it.value().get<std::vector<std::string>>());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid config value: ") + e.what());
    }
}

void applyConfigFile(Config& cfg, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed config file " + path + ": " + e.what());
    }
    applyConfigJson(cfg, j);
}

Config parseArgs(int argc, char** argv) {
    Config cfg;
    applyEnvironment(cfg);

    // The config file sits below the command line, so load it first
    for (int i = 1; i + 1 < argc; ++i) {
        if (argEq(argv[i], "--config")) {
            applyConfigFile(cfg, argv[i + 1]);
        }
    }

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&]() -> const char* {
            if (i + 1 < argc) return argv[++i];
            throw ConfigError(std::string("Missing value for ") + arg);
        };

        if (argEq(arg, "-h") || argEq(arg, "--help")) {
            cfg.showHelp = true;
        } else if (argEq(arg, "--config")) {
            next();
        } else if (argEq(arg, "--models")) {
            cfg.modelsDir = next();
        } else if (argEq(arg, "--face-model")) {
            cfg.faceModelPath = next();
        } else if (argEq(arg, "--demographic-model")) {
            cfg.demographicModelPath = next();
        } else if (argEq(arg, "--clip-model")) {
            cfg.generalModelPath = next();
        } else if (argEq(arg, "--no-face")) {
            cfg.faceLocatorEnabled = false;
        } else if (argEq(arg, "--no-demographic")) {
            cfg.demographicEnabled = false;
        } else if (argEq(arg, "--face-threshold")) {
            cfg.faceThreshold = parseThreshold(next());
        } else if (argEq(arg, "--face-policy")) {
            cfg.facePolicy = parsePolicy(next());
        } else if (argEq(arg, "--template")) {
            cfg.hypothesisTemplate = next();
        } else if (argEq(arg, "--json")) {
            cfg.output = OutputFormat::Json;
        } else if (argEq(arg, "--quiet") || argEq(arg, "-q")) {
            cfg.quiet = true;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            throw ConfigError(std::string("Unknown option: ") + arg);
        } else if (cfg.imagePath.empty()) {
            cfg.imagePath = arg;
        } else {
            throw ConfigError(std::string("Unexpected argument: ") + arg);
        }
    }

    if (cfg.hypothesisTemplate.empty()) {
        cfg.hypothesisTemplate = kDefaultHypothesisTemplate;
    }
    if (!cfg.showHelp && cfg.imagePath.empty()) {
        throw ConfigError("No image path given");
    }
    return cfg;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options] <image>\n"
        << "\n"
        << "Options:\n"
        << "  --models DIR              model root (default: models, env REVPROMPT_MODELS_DIR)\n"
        << "  --face-model PATH         face detector .prototxt (default: DIR/face_detection/deploy.prototxt)\n"
        << "  --demographic-model PATH  demographic classifier .onnx or directory (default: DIR/fairface)\n"
        << "  --clip-model DIR          CLIP encoders and tokenizer (default: DIR/clip)\n"
        << "  --no-face                 skip face localization\n"
        << "  --no-demographic          skip the demographic classifier\n"
        << "  --face-threshold F        minimum face confidence (default: 0.5)\n"
        << "  --face-policy P           first | confidence | area (default: confidence)\n"
        << "  --template T              hypothesis phrasing containing {label}\n"
        << "  --config FILE             JSON config file\n"
        << "  --json                    print prompt, tags and trace as JSON\n"
        << "  -q, --quiet               only print the result\n"
        << "  -h, --help                show this help\n";
    return out.str();
}

} // namespace revPrompt
