#pragma once

#include <map>
#include <optional>
#include <string>
#include "AttributeCategory.hpp"

namespace revPrompt {

// One chosen label per attribute category
class TagSet {
public:
    void set(AttributeCategory category, const std::string& label);
    void erase(AttributeCategory category);

    bool has(AttributeCategory category) const;
    std::optional<std::string> get(AttributeCategory category) const;

    // True when every declared category carries a non-empty label
    bool isComplete() const;
    std::size_t size() const { return labels_.size(); }

    const std::map<AttributeCategory, std::string>& labels() const { return labels_; }

private:
    std::map<AttributeCategory, std::string> labels_;
};

} // namespace revPrompt
