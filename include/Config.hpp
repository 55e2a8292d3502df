#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "AttributeCategory.hpp"
#include "FaceLocator.hpp"

namespace revPrompt {

enum class OutputFormat {
    Text,
    Json
};

struct Config {
    std::string imagePath;

    // Model locations; empty per-model paths resolve under modelsDir
    std::string modelsDir = "models";
    std::string faceModelPath;
    std::string demographicModelPath;
    std::string generalModelPath;

    // Optional backings can be switched off
    bool faceLocatorEnabled = true;
    bool demographicEnabled = true;

    float faceThreshold = 0.5f;
    FaceSelectionPolicy facePolicy = FaceSelectionPolicy::HighestConfidence;
    std::string hypothesisTemplate;
    Taxonomy taxonomy = Taxonomy::defaults();

    OutputFormat output = OutputFormat::Text;
    bool quiet = false;
    bool showHelp = false;

    std::string resolvedFaceModelPath() const;
    std::string resolvedDemographicModelPath() const;
    std::string resolvedGeneralModelPath() const;
};

// Defaults, then REVPROMPT_* environment variables, then the --config file,
// then command-line flags. Throws ConfigError on invalid input.
Config parseArgs(int argc, char** argv);

void applyEnvironment(Config& cfg);
void applyConfigFile(Config& cfg, const std::string& path);
void applyConfigJson(Config& cfg, const nlohmann::json& j);

std::string usage(const std::string& program);

} // namespace revPrompt
