#pragma once
#include <algorithm>
#include <cctype>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "core/config/EngineConfig.hpp"
#include "core/correction/EditDistance.hpp"
#include "core/correction/Lexicon.hpp"
#include "core/correction/SuggestionCache.hpp"
#include "utils/Logger.hpp"

namespace st {

// Proposes spelling suggestions for a single word from a correction
// dictionary and a list of common words, ranked by edit distance.
class CorrectionEngine {
public:
    using DistanceFunction = std::function<size_t(const std::string&, const std::string&)>;

    explicit CorrectionEngine(const CorrectionConfig& config = CorrectionConfig(),
                              const Lexicon& lexicon = defaultLexicon(),
                              DistanceFunction distance = DistanceFunction())
        : m_config(validated(config)),
          m_cache(config.cacheCapacity),
          m_distance(std::move(distance)) {
        if (!m_distance) {
            const size_t cap = m_config.maxEditDistance;
            m_distance = [cap](const std::string& a, const std::string& b) {
                return boundedLevenshteinDistance(a, b, cap);
            };
        }
        loadLexicon(lexicon);
    }

    // Up to maxSuggestions replacements for `word`, best first. Exact
    // dictionary corrections come before fuzzy matches; fuzzy matches are
    // ordered by distance, then alphabetically. Never contains the word itself.
    std::vector<std::string> suggest(const std::string& word) {
        const std::string key = toLower(word);
        if (key.empty())
            return {};
        if (const auto* cached = m_cache.find(key))
            return *cached;

        std::vector<std::string> result = computeSuggestions(key);
        m_cache.insert(key, result);
        return result;
    }

    // Records `correction` as a replacement for `original`. Returns true when
    // the dictionary changed.
    bool learn(const std::string& original, const std::string& correction) {
        const std::string key = toLower(original);
        const std::string value = toLower(correction);
        if (key.empty() || value.empty() || key == value)
            return false;

        auto it = m_dictionary.find(key);
        if (it == m_dictionary.end()) {
            if (m_dictionary.size() >= m_config.maxDictionaryEntries) {
                ST_LOG(LogLevel::Debug, "Dictionary full, not learning \"" + key + "\"");
                return false;
            }
            it = m_dictionary.emplace(key, std::vector<std::string>()).first;
        }

        auto& replacements = it->second;
        if (std::find(replacements.begin(), replacements.end(), value) != replacements.end())
            return false;
        replacements.push_back(value);

        if (m_config.invalidateOnLearn)
            m_cache.erase(key);
        return true;
    }

    // 1 for identical words, falling towards 0 as the edit distance
    // approaches the length of the longer word.
    float confidence(const std::string& word, const std::string& suggestion) const {
        const std::string a = toLower(word);
        const std::string b = toLower(suggestion);
        const size_t maxLength = std::max(a.size(), b.size());
        if (maxLength == 0)
            return 1.f;
        const size_t distance = levenshteinDistance(a, b);
        return 1.f - static_cast<float>(distance) / static_cast<float>(maxLength);
    }

    // Likely next words given the words typed so far. Only the last one is used.
    std::vector<std::string> nextWordSuggestions(const std::vector<std::string>& previousWords) const {
        if (previousWords.empty())
            return {};
        auto it = m_nextWords.find(toLower(previousWords.back()));
        if (it == m_nextWords.end())
            return {};
        return it->second;
    }

    std::vector<std::string> corrections(const std::string& word) const {
        auto it = m_dictionary.find(toLower(word));
        if (it == m_dictionary.end())
            return {};
        return it->second;
    }

    bool invalidate(const std::string& word) { return m_cache.erase(toLower(word)); }
    void clearCache() { m_cache.clear(); }

    size_t cacheSize() const { return m_cache.size(); }
    size_t dictionarySize() const { return m_dictionary.size(); }
    size_t commonWordCount() const { return m_commonWords.size(); }
    const CorrectionConfig& config() const { return m_config; }

    static std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return s;
    }

private:
    static const CorrectionConfig& validated(const CorrectionConfig& config) {
        config.validate();
        return config;
    }

    static void appendUnique(std::vector<std::string>& list, const std::string& value) {
        if (std::find(list.begin(), list.end(), value) == list.end())
            list.push_back(value);
    }

    void loadLexicon(const Lexicon& lexicon) {
        for (const auto& kv : lexicon.corrections) {
            const std::string key = toLower(kv.first);
            if (key.empty())
                continue;
            auto& replacements = m_dictionary[key];
            for (const auto& r : kv.second) {
                const std::string value = toLower(r);
                if (!value.empty() && value != key)
                    appendUnique(replacements, value);
            }
        }
        for (const auto& w : lexicon.commonWords) {
            const std::string word = toLower(w);
            if (!word.empty())
                appendUnique(m_commonWords, word);
        }
        for (const auto& kv : lexicon.nextWords) {
            auto& following = m_nextWords[toLower(kv.first)];
            for (const auto& w : kv.second)
                appendUnique(following, toLower(w));
        }
    }

    std::vector<std::string> computeSuggestions(const std::string& key) const {
        const size_t limit = m_config.maxSuggestions;
        std::vector<std::string> result;
        auto add = [&](const std::string& candidate) {
            if (result.size() < limit && candidate != key)
                appendUnique(result, candidate);
        };

        auto exact = m_dictionary.find(key);
        if (exact != m_dictionary.end()) {
            for (const auto& replacement : exact->second)
                add(replacement);
        }

        std::vector<std::pair<size_t, std::string>> fuzzy;
        auto consider = [&](const std::string& candidate) {
            const size_t distance = m_distance(key, candidate);
            if (distance > 0 && distance <= m_config.maxEditDistance)
                fuzzy.emplace_back(distance, candidate);
        };
        for (const auto& word : m_commonWords)
            consider(word);
        // Other misspellings are offered too, not their corrections.
        for (const auto& kv : m_dictionary)
            consider(kv.first);

        std::sort(fuzzy.begin(), fuzzy.end());
        for (const auto& match : fuzzy) {
            if (result.size() >= limit)
                break;
            add(match.second);
        }
        return result;
    }

    CorrectionConfig m_config;
    SuggestionCache m_cache;
    DistanceFunction m_distance;
    std::unordered_map<std::string, std::vector<std::string>> m_dictionary;
    std::vector<std::string> m_commonWords;
    std::unordered_map<std::string, std::vector<std::string>> m_nextWords;
};

} // namespace st
