#include "ClipTokenizer.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <climits>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace revPrompt {

namespace {

const char* const kStartToken = "<|startoftext|>";
const char* const kEndToken = "<|endoftext|>";
const char* const kWordEnd = "</w>";

std::string encodeUtf8(int codepoint) {
    std::string out;
    if (codepoint < 0x80) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
    return out;
}

// Reversible byte -> printable unicode table shared by GPT-2 and CLIP
const std::vector<std::string>& byteEncoder() {
    static const std::vector<std::string> table = [] {
        std::vector<int> printable;
        for (int b = '!'; b <= '~'; ++b) printable.push_back(b);
        for (int b = 0xA1; b <= 0xAC; ++b) printable.push_back(b);
        for (int b = 0xAE; b <= 0xFF; ++b) printable.push_back(b);

        std::vector<std::string> result(256);
        int next = 0;
        for (int b = 0; b < 256; ++b) {
            bool direct = std::find(printable.begin(), printable.end(), b) != printable.end();
            result[b] = encodeUtf8(direct ? b : 256 + next++);
        }
        return result;
    }();
    return table;
}

std::set<std::pair<std::string, std::string>> getPairs(const std::vector<std::string>& symbols) {
    std::set<std::pair<std::string, std::string>> pairs;
    for (std::size_t i = 0; i + 1 < symbols.size(); ++i) {
        pairs.emplace(symbols[i], symbols[i + 1]);
    }
    return pairs;
}

} // namespace

void ClipTokenizer::load(const std::string& vocabPath, const std::string& mergesPath) {
    std::ifstream vocabFile(vocabPath);
    if (!vocabFile) {
        throw std::runtime_error("Cannot open vocabulary file: " + vocabPath);
    }
    json vocabJson;
    vocabFile >> vocabJson;

    std::unordered_map<std::string, int64_t> vocab;
    for (auto it = vocabJson.begin(); it != vocabJson.end(); ++it) {
        vocab[it.key()] = it.value().get<int64_t>();
    }
    if (vocab.count(kStartToken) == 0 || vocab.count(kEndToken) == 0) {
        throw std::runtime_error("Vocabulary lacks start/end tokens: " + vocabPath);
    }

    std::ifstream mergesFile(mergesPath);
    if (!mergesFile) {
        throw std::runtime_error("Cannot open merges file: " + mergesPath);
    }
    std::map<std::pair<std::string, std::string>, int> ranks;
    std::string line;
    int rank = 0;
    while (std::getline(mergesFile, line)) {
        // "#version: 0.2" header
        if (line.empty() || line[0] == '#') {
            continue;
        }
        std::istringstream iss(line);
        std::string first, second;
        if (iss >> first >> second) {
            ranks.emplace(std::make_pair(first, second), rank++);
        }
    }

    vocab_ = std::move(vocab);
    bpeRanks_ = std::move(ranks);
    startId_ = vocab_.at(kStartToken);
    endId_ = vocab_.at(kEndToken);
}

std::vector<std::string> ClipTokenizer::splitWords(const std::string& text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    static const std::regex pattern(
        R"(<\|startoftext\|>|<\|endoftext\|>|'s|'t|'re|'ve|'m|'ll|'d|[a-z]+|[0-9]|[^\sa-z0-9]+)");

    std::vector<std::string> words;
    for (auto it = std::sregex_iterator(lowered.begin(), lowered.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        words.push_back(it->str());
    }
    return words;
}

std::vector<std::string> ClipTokenizer::bpe(const std::string& word) const {
    if (word.empty()) {
        return {};
    }

    std::vector<std::string> symbols;
    for (unsigned char byte : word) {
        symbols.push_back(byteEncoder()[byte]);
    }
    symbols.back() += kWordEnd;

    auto pairs = getPairs(symbols);
    while (!pairs.empty()) {
        int minRank = INT_MAX;
        std::pair<std::string, std::string> bigram;
        for (const auto& pair : pairs) {
            auto it = bpeRanks_.find(pair);
            if (it != bpeRanks_.end() && it->second < minRank) {
                minRank = it->second;
                bigram = pair;
            }
        }
        if (minRank == INT_MAX) {
            break;
        }

        std::vector<std::string> merged;
        for (std::size_t i = 0; i < symbols.size();) {
            if (i + 1 < symbols.size() && symbols[i] == bigram.first && symbols[i + 1] == bigram.second) {
                merged.push_back(symbols[i] + symbols[i + 1]);
                i += 2;
            } else {
                merged.push_back(symbols[i]);
                i += 1;
            }
        }
        symbols.swap(merged);
        if (symbols.size() == 1) {
            break;
        }
        pairs = getPairs(symbols);
    }
    return symbols;
}

void ClipTokenizer::encode(const std::string& text, int contextLength,
                           std::vector<int64_t>& ids, std::vector<int64_t>& mask) const {
    if (!isLoaded()) {
        throw std::runtime_error("Tokenizer not loaded");
    }
    if (contextLength < 2) {
        throw std::runtime_error("Context length must hold the start and end tokens");
    }

    std::vector<int64_t> tokens;
    tokens.push_back(startId_);
    for (const auto& word : splitWords(text)) {
        if (word == kStartToken || word == kEndToken) {
            tokens.push_back(vocab_.at(word));
            continue;
        }
        for (const auto& piece : bpe(word)) {
            auto it = vocab_.find(piece);
            if (it != vocab_.end()) {
                tokens.push_back(it->second);
            }
        }
    }

    // Truncate, keeping the end token last
    if (tokens.size() > static_cast<std::size_t>(contextLength - 1)) {
        tokens.resize(static_cast<std::size_t>(contextLength - 1));
    }
    tokens.push_back(endId_);

    ids.assign(static_cast<std::size_t>(contextLength), padId_);
    mask.assign(static_cast<std::size_t>(contextLength), 0);
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        ids[i] = tokens[i];
        mask[i] = 1;
    }
}

} // namespace revPrompt
