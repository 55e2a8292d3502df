#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace revPrompt {

// CLIP byte-level BPE tokenizer (vocab.json + merges.txt)
class ClipTokenizer {
public:
    static constexpr int kContextLength = 77;

    // Throws std::runtime_error when a file is missing or malformed
    void load(const std::string& vocabPath, const std::string& mergesPath);
    bool isLoaded() const { return !vocab_.empty(); }

    // Token ids wrapped in start/end tokens, padded (or truncated) to contextLength
    void encode(const std::string& text, int contextLength,
                std::vector<int64_t>& ids, std::vector<int64_t>& mask) const;

    // BPE pieces of one pre-tokenized word, last piece carrying the </w> marker
    std::vector<std::string> bpe(const std::string& word) const;

    // Lower-cased, whitespace-collapsed pre-tokens
    static std::vector<std::string> splitWords(const std::string& text);

private:
    std::unordered_map<std::string, int64_t> vocab_;
    std::map<std::pair<std::string, std::string>, int> bpeRanks_;
    int64_t startId_ = -1;
    int64_t endId_ = -1;
    int64_t padId_ = 0;
};

} // namespace revPrompt
