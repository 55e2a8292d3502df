#include "AttributeCategory.hpp"
#include "Errors.hpp"

namespace revPrompt {

const std::vector<AttributeCategory>& allCategories() {
    static const std::vector<AttributeCategory> categories = {
        AttributeCategory::Race,
        AttributeCategory::Gender,
        AttributeCategory::Setting,
        AttributeCategory::Lighting,
        AttributeCategory::PeopleCount
    };
    return categories;
}

std::string categoryName(AttributeCategory category) {
    switch (category) {
        case AttributeCategory::Race:
            return "race";
        case AttributeCategory::Gender:
            return "gender";
        case AttributeCategory::Setting:
            return "setting";
        case AttributeCategory::Lighting:
            return "lighting";
        case AttributeCategory::PeopleCount:
            return "people";
    }
    return "unknown";
}

bool categoryFromName(const std::string& name, AttributeCategory& category) {
    for (AttributeCategory candidate : allCategories()) {
        if (categoryName(candidate) == name) {
            category = candidate;
            return true;
        }
    }
    return false;
}

Taxonomy Taxonomy::defaults() {
    Taxonomy taxonomy;
    taxonomy.labels_[AttributeCategory::Race] = {
        "white", "black", "asian", "indian", "latino", "middle eastern"
    };
    taxonomy.labels_[AttributeCategory::Gender] = {"male", "female"};
    taxonomy.labels_[AttributeCategory::Setting] = {
        "hospital", "office", "home", "street", "park", "classroom",
        "restaurant", "studio", "beach", "forest"
    };
    taxonomy.labels_[AttributeCategory::Lighting] = {
        "bright light", "dim light", "natural light", "studio lighting",
        "low light", "backlit"
    };
    taxonomy.labels_[AttributeCategory::PeopleCount] = {
        "no people", "one person", "two people", "a small group of people", "a crowd"
    };
    return taxonomy;
}

const std::vector<std::string>& Taxonomy::candidates(AttributeCategory category) const {
    auto it = labels_.find(category);
    if (it == labels_.end()) {
        throw ConfigError("No candidate labels declared for category '" + categoryName(category) + "'");
    }
    return it->second;
}

void Taxonomy::setCandidates(AttributeCategory category, std::vector<std::string> labels) {
    if (labels.empty()) {
        throw ConfigError("Candidate list for '" + categoryName(category) + "' is empty");
    }
    for (const auto& label : labels) {
        if (label.empty()) {
            throw ConfigError("Candidate list for '" + categoryName(category) + "' contains an empty label");
        }
    }
    labels_[category] = std::move(labels);
}

} // namespace revPrompt
