#include "core/correction/CorrectionEngine.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>
#include <set>
#include <string>
#include <vector>

namespace {

bool near(float a, float b) { return std::fabs(a - b) < 1e-4f; }

st::Lexicon smallLexicon() {
    st::Lexicon lexicon;
    lexicon.commonWords = {"cat", "bat", "cut", "cast", "dog"};
    return lexicon;
}

} // namespace

int main() {
    // exact dictionary hit with nothing else to match against
    {
        st::Lexicon lexicon;
        lexicon.corrections = {{"teh", {"the"}}};
        st::CorrectionEngine engine(st::CorrectionConfig(), lexicon);
        assert(engine.suggest("teh") == std::vector<std::string>({"the"}));
    }

    st::CorrectionEngine engine;
    {
        auto wierd = engine.suggest("wierd");
        assert(!wierd.empty() && wierd.front() == "weird");
        auto teh = engine.suggest("TEH");
        assert(!teh.empty() && teh.front() == "the");
    }

    // limits, uniqueness, never the word itself
    for (const std::string word : {"teh", "wierd", "recieve", "the", "tell", "wich", "hte", "yuor", "me"}) {
        const auto suggestions = engine.suggest(word);
        assert(suggestions.size() <= 3);
        std::set<std::string> unique(suggestions.begin(), suggestions.end());
        assert(unique.size() == suggestions.size());
        assert(std::find(suggestions.begin(), suggestions.end(),
                         st::CorrectionEngine::toLower(word)) == suggestions.end());
    }

    assert(engine.suggest("").empty());
    assert(engine.suggest("zzzzzzzzzzzz").empty());

    // fuzzy matches ordered by distance, then alphabetically
    {
        st::CorrectionEngine fuzzy(st::CorrectionConfig(), smallLexicon());
        assert(fuzzy.suggest("cot") == std::vector<std::string>({"cat", "cut", "bat"}));
    }

    // exact corrections rank ahead of fuzzy matches
    {
        st::Lexicon lexicon = smallLexicon();
        lexicon.corrections = {{"cot", {"coat"}}};
        st::CorrectionEngine withDictionary(st::CorrectionConfig(), lexicon);
        assert(withDictionary.suggest("cot") == std::vector<std::string>({"coat", "cat", "cut"}));
    }

    // other misspellings are candidates, their corrections are not
    {
        st::Lexicon lexicon;
        lexicon.corrections = {{"recieve", {"receive"}}};
        st::CorrectionEngine misspellings(st::CorrectionConfig(), lexicon);
        assert(misspellings.suggest("recieves") == std::vector<std::string>({"recieve"}));
    }

    // an unlimited edit distance still ranks fuzzy matches
    {
        st::CorrectionConfig config;
        config.maxEditDistance = std::numeric_limits<size_t>::max();
        st::Lexicon lexicon;
        lexicon.commonWords = {"cat", "cut"};
        st::CorrectionEngine unlimited(config, lexicon);
        assert(unlimited.suggest("cot") == std::vector<std::string>({"cat", "cut"}));
        assert(unlimited.commonWordCount() == 2);
        assert(unlimited.config().maxEditDistance == config.maxEditDistance);
    }

    // the suggestion limit is configurable
    {
        st::CorrectionConfig config;
        config.maxSuggestions = 1;
        st::CorrectionEngine single(config, smallLexicon());
        assert(single.suggest("cot") == std::vector<std::string>({"cat"}));
    }

    // a cache hit does not recompute distances
    {
        size_t calls = 0;
        st::CorrectionEngine counted(st::CorrectionConfig(), smallLexicon(),
                                     [&calls](const std::string& a, const std::string& b) {
                                         ++calls;
                                         return st::editDistance(a, b);
                                     });
        const auto first = counted.suggest("cot");
        assert(calls == 5);
        const auto second = counted.suggest("cot");
        assert(second == first);
        assert(calls == 5);
        assert(counted.suggest("COT") == first);
        assert(calls == 5);
        assert(counted.cacheSize() == 1);

        assert(counted.invalidate("Cot"));
        assert(counted.suggest("cot") == first);
        assert(calls == 10);
        counted.clearCache();
        assert(counted.cacheSize() == 0);
    }

    // cache stays bounded
    {
        st::CorrectionConfig config;
        config.cacheCapacity = 2;
        st::CorrectionEngine bounded(config, smallLexicon());
        bounded.suggest("cot");
        bounded.suggest("dot");
        bounded.suggest("bot");
        assert(bounded.cacheSize() == 2);
    }

    assert(near(engine.confidence("teh", "the"), 1.f - 2.f / 3.f));
    assert(near(engine.confidence("word", "word"), 1.f));
    assert(near(engine.confidence("The", "the"), 1.f));
    assert(near(engine.confidence("", ""), 1.f));
    assert(near(engine.confidence("abc", ""), 0.f));
    assert(near(engine.confidence("wierd", "weird"), 0.6f));

    assert(engine.nextWordSuggestions({"I"}) ==
           std::vector<std::string>({"am", "have", "think", "want"}));
    assert(engine.nextWordSuggestions({"hello", "The"}) ==
           std::vector<std::string>({"quick", "big", "small", "best"}));
    assert(engine.nextWordSuggestions({}).empty());
    assert(engine.nextWordSuggestions({"zebra"}).empty());
    return 0;
}
