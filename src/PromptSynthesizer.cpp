#include "PromptSynthesizer.hpp"
#include <sstream>

namespace revPrompt {

const char* const PromptSynthesizer::kDefaultRace = "person";

std::string PromptSynthesizer::render(const TagSet& tags) const {
    auto labelOr = [&tags](AttributeCategory category, const std::string& fallback) {
        std::optional<std::string> label = tags.get(category);
        return label && !label->empty() ? *label : fallback;
    };

    const std::string race = labelOr(AttributeCategory::Race, kDefaultRace);
    const std::string gender = labelOr(AttributeCategory::Gender, "");

    std::ostringstream prompt;
    prompt << "A " << race;
    if (!gender.empty()) {
        prompt << " " << gender;
    }
    prompt << " in a " << labelOr(AttributeCategory::Setting, "")
           << " setting, under " << labelOr(AttributeCategory::Lighting, "")
           << " conditions, with " << labelOr(AttributeCategory::PeopleCount, "")
           << " in frame.";
    return prompt.str();
}

} // namespace revPrompt
