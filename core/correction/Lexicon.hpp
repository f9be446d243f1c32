#pragma once
#include <string>
#include <unordered_map>
#include <vector>

namespace st {

// Word data the correction engine works from.
struct Lexicon {
    // misspelling -> preferred replacements, most preferred first
    std::unordered_map<std::string, std::vector<std::string>> corrections;
    std::vector<std::string> commonWords;
    // word -> words that commonly follow it
    std::unordered_map<std::string, std::vector<std::string>> nextWords;
};

inline std::unordered_map<std::string, std::vector<std::string>> defaultCorrections() {
    return {
        {"teh", {"the"}},
        {"recieve", {"receive"}},
        {"seperate", {"separate"}},
        {"seperated", {"separated"}},
        {"occured", {"occurred"}},
        {"wierd", {"weird"}},
        {"accomodate", {"accommodate"}},
        {"begining", {"beginning"}},
        {"beleive", {"believe"}},
        {"buisness", {"business"}},
        {"calender", {"calendar"}},
        {"commited", {"committed"}},
        {"fourty", {"forty"}},
        {"freind", {"friend"}},
        {"independant", {"independent"}},
        {"knowlege", {"knowledge"}},
        {"liason", {"liaison"}},
        {"occassion", {"occasion"}},
        {"priviledge", {"privilege"}},
        {"pronounciation", {"pronunciation"}},
        {"restaraunt", {"restaurant"}},
        {"rythm", {"rhythm"}},
        {"tommorow", {"tomorrow"}},
        {"tommorrow", {"tomorrow"}},
        {"vaccuum", {"vacuum"}},
        {"wich", {"which"}},
        {"reccomend", {"recommend"}},
        {"reccommend", {"recommend"}},
        {"comparision", {"comparison"}},
        {"concious", {"conscious"}},
        {"dissapear", {"disappear"}},
        {"existant", {"existent"}},
        {"foriegn", {"foreign"}},
        {"goverment", {"government"}},
        {"hieght", {"height"}},
        {"immediatly", {"immediately"}},
        {"judgement", {"judgment"}},
        {"lenght", {"length"}},
        {"maintainance", {"maintenance"}},
        {"neccessary", {"necessary"}},
        {"noticable", {"noticeable"}},
        {"persue", {"pursue"}},
        {"posession", {"possession"}},
        {"prefered", {"preferred"}},
        {"succesful", {"successful"}},
        {"tounge", {"tongue"}},
        {"truely", {"truly"}},
        {"untill", {"until"}},
    };
}

inline std::vector<std::string> defaultCommonWords() {
    return {
        "the", "and", "for", "are", "but", "not", "you", "all", "can", "had",
        "her", "was", "one", "our", "out", "day", "get", "has", "him", "his",
        "how", "its", "may", "new", "now", "old", "see", "two", "way", "who",
        "boy", "did", "let", "put", "say", "she", "too", "use", "about",
        "after", "again", "air", "also", "america", "animal", "another",
        "answer", "any", "around", "ask", "away", "back", "because", "before",
        "big", "came", "change", "different", "does", "end", "even", "follow",
        "form", "found", "give", "good", "great", "hand", "help", "here",
        "home", "house", "just", "kind", "know", "land", "large", "last",
        "left", "life", "light", "little", "live", "man", "me", "means", "men",
        "most", "mother", "move", "much", "must", "name", "need", "next",
        "only", "other", "over", "part", "people", "place", "play", "right",
        "run", "said", "same", "saw", "school", "seem", "show", "small",
        "sound", "still", "such", "take", "tell", "that", "their", "them",
        "then", "there", "these", "they", "thing", "think", "this", "time",
        "under", "very", "want", "water", "well", "went", "were", "what",
        "when", "where", "which", "while", "will", "with", "word", "work",
        "world", "would", "write", "year", "your",
    };
}

inline std::unordered_map<std::string, std::vector<std::string>> defaultNextWords() {
    return {
        {"the", {"quick", "big", "small", "best"}},
        {"i", {"am", "have", "think", "want"}},
    };
}

inline Lexicon defaultLexicon() {
    return Lexicon{defaultCorrections(), defaultCommonWords(), defaultNextWords()};
}

} // namespace st
