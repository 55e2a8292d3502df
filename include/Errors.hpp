#pragma once

#include <stdexcept>
#include <string>

namespace revPrompt {

// Base class for failures that abort processing of an image
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& what) : std::runtime_error(what) {}
};

// Missing or undecodable input image
class InputError : public PipelineError {
public:
    explicit InputError(const std::string& what) : PipelineError(what) {}
};

// The general classifier could not produce a label
class ClassifierError : public PipelineError {
public:
    explicit ClassifierError(const std::string& what) : PipelineError(what) {}
};

// A mandatory model backing could not be loaded
class StartupError : public PipelineError {
public:
    explicit StartupError(const std::string& what) : PipelineError(what) {}
};

// Invalid command line, environment or config file value
class ConfigError : public PipelineError {
public:
    explicit ConfigError(const std::string& what) : PipelineError(what) {}
};

} // namespace revPrompt
