#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "robin_hood.h"

namespace razdel {

// Lexical exception sets used by the blocking evaluator and the quality scorer.
// Entries are stored lower-cased and trimmed, UTF-8 encoded.
class Lexicon {
public:
    using WordSet = robin_hood::unordered_flat_set<std::string>;

    // Built-in abbreviations, titles and speech verbs
    Lexicon();

    // Construction-time extension. Words are normalized; a trailing period is dropped.
    void add_abbreviation(std::string_view word);

    // One abbreviation per line; blank lines and '#' comments are skipped.
    // Returns false if the file cannot be opened.
    bool load_abbreviations(const std::string& path);

    // Hot path: `key` must already be normalized (see normalize_key)
    bool is_abbreviation(std::string_view key) const {
        return abbreviations_.count(std::string(key)) > 0;
    }

    // Normalizes `word` first
    bool contains_abbreviation(std::string_view word) const;

    bool is_title(std::string_view word) const;
    bool is_speech_verb(std::string_view word) const;

    // Sorted longest first, then lexicographically
    std::vector<std::string> abbreviations() const;

    size_t abbreviation_count() const { return abbreviations_.size(); }
    size_t title_count() const { return titles_.size(); }
    size_t speech_verb_count() const { return speech_verbs_.size(); }

private:
    WordSet abbreviations_;
    WordSet titles_;
    WordSet speech_verbs_;
};

} // namespace razdel
