#pragma once

#include <map>
#include <string>
#include <vector>

namespace revPrompt {

enum class AttributeCategory {
    Race,
    Gender,
    Setting,
    Lighting,
    PeopleCount
};

// Declared categories in resolution order
const std::vector<AttributeCategory>& allCategories();

std::string categoryName(AttributeCategory category);
bool categoryFromName(const std::string& name, AttributeCategory& category);

// Candidate label sets per category. Built once at startup and only read afterwards.
class Taxonomy {
public:
    static Taxonomy defaults();

    const std::vector<std::string>& candidates(AttributeCategory category) const;

    // Throws ConfigError on an empty list or an empty label
    void setCandidates(AttributeCategory category, std::vector<std::string> labels);

private:
    std::map<AttributeCategory, std::vector<std::string>> labels_;
};

} // namespace revPrompt
