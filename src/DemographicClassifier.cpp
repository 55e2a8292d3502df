#include "DemographicClassifier.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace revPrompt {

const char* const kUnknownRace = "unknown race";
const char* const kUnknownGender = "unknown gender";

namespace {

const std::unordered_map<std::string, std::string>& raceAliases() {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"White", "white"},
        {"Black", "black"},
        {"Latino_Hispanic", "latino"},
        {"East Asian", "asian"},
        {"Southeast Asian", "asian"},
        {"Asian", "asian"},
        {"Indian", "indian"},
        {"Middle Eastern", "middle eastern"}
    };
    return aliases;
}

const std::unordered_map<std::string, std::string>& genderAliases() {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"Male", "male"},
        {"Female", "female"}
    };
    return aliases;
}

// Arg-max of scores[begin, begin + count) and its softmax probability
std::size_t argmaxSegment(const std::vector<float>& scores, std::size_t begin, std::size_t count,
                          float& probability) {
    auto first = scores.begin() + static_cast<std::ptrdiff_t>(begin);
    auto last = first + static_cast<std::ptrdiff_t>(count);
    auto best = std::max_element(first, last);

    double sum = 0.0;
    for (auto it = first; it != last; ++it) {
        sum += std::exp(static_cast<double>(*it - *best));
    }
    probability = static_cast<float>(1.0 / sum);
    return static_cast<std::size_t>(best - first);
}

} // namespace

const std::vector<std::string>& nativeRaceLabels() {
    static const std::vector<std::string> labels = {
        "White", "Black", "Latino_Hispanic", "East Asian",
        "Southeast Asian", "Indian", "Middle Eastern"
    };
    return labels;
}

const std::vector<std::string>& nativeGenderLabels() {
    static const std::vector<std::string> labels = {"Male", "Female"};
    return labels;
}

std::string mapNativeRace(const std::string& nativeLabel) {
    auto it = raceAliases().find(nativeLabel);
    return it != raceAliases().end() ? it->second : kUnknownRace;
}

std::string mapNativeGender(const std::string& nativeLabel) {
    auto it = genderAliases().find(nativeLabel);
    return it != genderAliases().end() ? it->second : kUnknownGender;
}

DemographicResult decodeDemographicScores(const std::vector<float>& scores,
                                          const std::vector<std::string>& raceLabels,
                                          const std::vector<std::string>& genderLabels) {
    if (raceLabels.empty() || genderLabels.empty() ||
        scores.size() < raceLabels.size() + genderLabels.size()) {
        return std::nullopt;
    }

    Demographics result;
    std::size_t raceIdx = argmaxSegment(scores, 0, raceLabels.size(), result.raceConfidence);
    std::size_t genderIdx = argmaxSegment(scores, raceLabels.size(), genderLabels.size(),
                                          result.genderConfidence);

    result.race = mapNativeRace(raceLabels[raceIdx]);
    result.gender = mapNativeGender(genderLabels[genderIdx]);
    return result;
}

} // namespace revPrompt
