#pragma once

#include <string>
#include "TagSet.hpp"

namespace revPrompt {

// Renders
//   "A {race}{ gender} in a {setting} setting, under {lighting} conditions, with {people} in frame."
// A missing race becomes "person", a missing gender is dropped together with its leading space.
class PromptSynthesizer {
public:
    static const char* const kDefaultRace;

    std::string render(const TagSet& tags) const;
};

} // namespace revPrompt
