#pragma once

#include "lexicon.hpp"
#include <string_view>
#include <boost/regex.hpp>

namespace razdel {

enum class BlockReason {
    none,
    abbreviation,
    initials,
    decimal,
    suppressed, // Overridden by a higher-priority non-boundary rule
};

const char* block_reason_name(BlockReason reason);

// Decides whether a candidate boundary is a false positive. All checks take the
// decoded text and a code point offset, and never fail: an offset outside the
// text is simply not blocked.
class BlockingEvaluator {
public:
    const Lexicon& lexicon;

    BlockingEvaluator(const Lexicon& lex);

    // First matching check in order: abbreviation, initials, decimal
    BlockReason evaluate(std::wstring_view text, size_t pos) const;

    bool is_blocked(std::wstring_view text, size_t pos) const {
        return evaluate(text, pos) != BlockReason::none;
    }

    // Steps back over the whitespace and the [.!?] run before `pos`; any
    // 1..10 code point suffix ending at the preceding character that is a
    // known abbreviation (lower-cased, trimmed) blocks.
    bool is_abbreviation(std::wstring_view text, size_t pos) const;

    // Initials followed by a surname ("А. С. Пушкин") anywhere within 20 code
    // points either side of `pos`
    bool is_initials_context(std::wstring_view text, size_t pos) const;

    // Digit on both sides of `pos`
    bool is_decimal_split(std::wstring_view text, size_t pos) const;

private:
    boost::wregex initials_pattern_;
};

} // namespace razdel
