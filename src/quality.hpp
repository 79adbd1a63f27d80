#pragma once

#include "lexicon.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <boost/regex.hpp>

namespace razdel {

// Trimmed sentence text with its code point span [start, stop) in the source
struct Sentence {
    size_t start = 0;
    size_t stop = 0;
    std::string text;
};

// Slices `text` at each boundary, trims every piece and drops empty ones.
// Boundaries are clamped into the text; they are expected sorted ascending.
std::vector<Sentence> split_by_boundaries(std::wstring_view text,
                                          const std::vector<size_t>& boundaries);

// Heuristic confidence for a segmentation, in [0, 1]. Diagnostic only.
class QualityScorer {
public:
    QualityScorer(const Lexicon& lexicon);

    // 0.0 when `boundaries` is empty, even for a text that is one sentence.
    double score(std::wstring_view text, const std::vector<size_t>& boundaries) const;

    // A known abbreviation, as a whole word, directly followed by '.'
    bool contains_abbreviation(std::wstring_view sentence) const;

private:
    boost::wregex abbreviation_pattern_;
};

} // namespace razdel
