#include "TagSet.hpp"

namespace revPrompt {

void TagSet::set(AttributeCategory category, const std::string& label) {
    labels_[category] = label;
}

void TagSet::erase(AttributeCategory category) {
    labels_.erase(category);
}

bool TagSet::has(AttributeCategory category) const {
    auto it = labels_.find(category);
    return it != labels_.end() && !it->second.empty();
}

std::optional<std::string> TagSet::get(AttributeCategory category) const {
    auto it = labels_.find(category);
    if (it == labels_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TagSet::isComplete() const {
    for (AttributeCategory category : allCategories()) {
        if (!has(category)) {
            return false;
        }
    }
    return true;
}

} // namespace revPrompt
