#include "blocking.hpp"
#include "constants.hpp"
#include <algorithm>

namespace razdel {

const char* block_reason_name(BlockReason reason) {
    switch (reason) {
        case BlockReason::none: return "none";
        case BlockReason::abbreviation: return "abbreviation";
        case BlockReason::initials: return "initials";
        case BlockReason::decimal: return "decimal";
        case BlockReason::suppressed: return "suppressed";
    }
    return "unknown";
}

BlockingEvaluator::BlockingEvaluator(const Lexicon& lex)
    : lexicon(lex),
      // Word boundaries are spelled out so they follow the same word class as the rest
      initials_pattern_(
          L"(?:^|[^" RAZDEL_WORD_CLASS L"])"
          L"[" RAZDEL_CYR_UPPER_CLASS L"]\\.[" RAZDEL_SPACE_CLASS L"]*"
          L"(?:[" RAZDEL_CYR_UPPER_CLASS L"]\\.[" RAZDEL_SPACE_CLASS L"]*)?"
          L"[" RAZDEL_CYR_UPPER_CLASS L"][" RAZDEL_CYR_LOWER_CLASS L"]+"
          L"(?![" RAZDEL_WORD_CLASS L"])",
          boost::regex_constants::perl | boost::regex_constants::no_mod_m)
{
}

BlockReason BlockingEvaluator::evaluate(std::wstring_view text, size_t pos) const {
    if (is_abbreviation(text, pos)) {
        return BlockReason::abbreviation;
    }
    if (is_initials_context(text, pos)) {
        return BlockReason::initials;
    }
    if (is_decimal_split(text, pos)) {
        return BlockReason::decimal;
    }
    return BlockReason::none;
}

bool BlockingEvaluator::is_abbreviation(std::wstring_view text, size_t pos) const {
    if (pos == 0 || pos > text.size()) return false;

    size_t i = pos;
    while (i > 0 && is_space(static_cast<char32_t>(text[i - 1]))) --i;
    while (i > 0 && is_terminal_punct(static_cast<char32_t>(text[i - 1]))) --i;
    if (i == 0) return false;

    // `i` is one past the anchor character
    size_t max_len = std::min(ABBREVIATION_LOOK_BACK, i);
    for (size_t len = 1; len <= max_len; ++len) {
        std::string key = normalize_key(text, i - len, i);
        if (!key.empty() && lexicon.is_abbreviation(key)) {
            return true;
        }
    }
    return false;
}

bool BlockingEvaluator::is_initials_context(std::wstring_view text, size_t pos) const {
    size_t start = pos > INITIALS_WINDOW ? pos - INITIALS_WINDOW : 0;
    size_t end = std::min(text.size(), pos + INITIALS_WINDOW);
    if (start >= end) return false;

    return boost::regex_search(text.data() + start, text.data() + end, initials_pattern_);
}

bool BlockingEvaluator::is_decimal_split(std::wstring_view text, size_t pos) const {
    if (pos == 0 || pos >= text.size()) return false;
    return is_digit(static_cast<char32_t>(text[pos - 1])) &&
           is_digit(static_cast<char32_t>(text[pos]));
}

} // namespace razdel
