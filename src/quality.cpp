#include "quality.hpp"
#include "constants.hpp"
#include <algorithm>

namespace razdel {

namespace {

constexpr double SHORT_SENTENCE_PENALTY = 0.1;
constexpr double LOWERCASE_START_PENALTY = 0.15;
constexpr double ABBREVIATION_ONLY_PENALTY = 0.2;

constexpr size_t SHORT_SENTENCE_LENGTH = 3;
constexpr size_t ABBREVIATION_ONLY_LENGTH = 10;

void append_regex_escaped(std::wstring& out, std::wstring_view word) {
    static const std::wstring_view special = L"\\^$.|?*+()[]{}";
    for (wchar_t c : word) {
        if (special.find(c) != std::wstring_view::npos) {
            out.push_back(L'\\');
        }
        out.push_back(c);
    }
}

// (?:^|[^word])(?:abbr1|abbr2|...)\.
std::wstring build_abbreviation_pattern(const Lexicon& lexicon) {
    std::wstring pattern = L"(?:^|[^" RAZDEL_WORD_CLASS L"])(?:";
    bool first = true;
    for (const auto& abbr : lexicon.abbreviations()) {
        if (!first) pattern.push_back(L'|');
        append_regex_escaped(pattern, decode_utf8(abbr));
        first = false;
    }
    pattern += L")\\.";
    return pattern;
}

} // namespace

std::vector<Sentence> split_by_boundaries(std::wstring_view text,
                                          const std::vector<size_t>& boundaries) {
    std::vector<Sentence> sentences;
    sentences.reserve(boundaries.size() + 1);

    auto emit = [&](size_t start, size_t stop) {
        while (start < stop && is_space(static_cast<char32_t>(text[start]))) ++start;
        while (stop > start && is_space(static_cast<char32_t>(text[stop - 1]))) --stop;
        if (start < stop) {
            sentences.push_back({start, stop, encode_utf8(text, start, stop)});
        }
    };

    size_t n = text.size();
    size_t start = 0;
    for (size_t boundary : boundaries) {
        size_t stop = std::min(std::max(boundary, start), n);
        emit(start, stop);
        start = stop;
    }

    // Last sentence
    if (start < n) {
        emit(start, n);
    }

    return sentences;
}

QualityScorer::QualityScorer(const Lexicon& lexicon)
    : abbreviation_pattern_(build_abbreviation_pattern(lexicon),
                            boost::regex_constants::perl | boost::regex_constants::no_mod_m)
{
}

bool QualityScorer::contains_abbreviation(std::wstring_view sentence) const {
    return boost::regex_search(sentence.data(), sentence.data() + sentence.size(),
                             abbreviation_pattern_);
}

double QualityScorer::score(std::wstring_view text, const std::vector<size_t>& boundaries) const {
    if (boundaries.empty()) {
        return 0.0;
    }

    double penalties = 0.0;
    for (const auto& sent : split_by_boundaries(text, boundaries)) {
        size_t length = sent.stop - sent.start;
        std::wstring_view view = text.substr(sent.start, length);

        // Too short, likely a split error
        if (length < SHORT_SENTENCE_LENGTH) {
            penalties += SHORT_SENTENCE_PENALTY;
        }

        if (is_lower(static_cast<char32_t>(view.front()))) {
            penalties += LOWERCASE_START_PENALTY;
        }

        // Little more than an abbreviation
        if (length < ABBREVIATION_ONLY_LENGTH && contains_abbreviation(view)) {
            penalties += ABBREVIATION_ONLY_PENALTY;
        }
    }

    return std::max(0.0, 1.0 - penalties);
}

} // namespace razdel
