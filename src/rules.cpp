#include "rules.hpp"
#include "constants.hpp"
#include <algorithm>

namespace razdel {

SegmentationRule make_rule(std::string name, std::wstring_view pattern, bool is_boundary,
                           int priority, std::string description) {
    SegmentationRule rule;
    rule.name = std::move(name);
    rule.pattern.assign(pattern.begin(), pattern.end(), boost::regex_constants::perl);
    rule.is_boundary = is_boundary;
    rule.priority = priority;
    rule.description = std::move(description);
    return rule;
}

std::vector<SegmentationRule> RuleTable::default_rules() {
    std::vector<SegmentationRule> rules;
    rules.reserve(3);

    // Matches only start at the head of a punctuation run and the runs are
    // possessive, so a long run is walked once instead of once per position.

    // [.!?]+ whitespace, then a capital letter, a quote or an opening parenthesis
    rules.push_back(make_rule(
        "sentence_end_capital",
        L"(?<![.!?])[.!?]++[" RAZDEL_SPACE_CLASS L"]++(?=[" RAZDEL_CYR_UPPER_CLASS L"\u00AB\"'(])",
        true, 50, "Sentence end + capital letter"));

    // [.!?]+ followed by a blank line
    rules.push_back(make_rule(
        "paragraph_end",
        L"(?<![.!?])[.!?]++[" RAZDEL_SPACE_CLASS L"]*\n[" RAZDEL_SPACE_CLASS L"]*\n",
        true, 45, "Sentence end + paragraph break"));

    // [!?]+ whitespace, whatever case follows
    rules.push_back(make_rule(
        "question_exclamation",
        L"(?<![!?])[!?]++[" RAZDEL_SPACE_CLASS L"]++",
        true, 40, "Question or exclamation mark"));

    return rules;
}

RuleTable::RuleTable(std::vector<SegmentationRule> extra_rules)
    : rules_(default_rules())
{
    rules_.reserve(rules_.size() + extra_rules.size());
    for (auto& rule : extra_rules) {
        rules_.push_back(std::move(rule));
    }

    // Ties keep declaration order
    std::stable_sort(rules_.begin(), rules_.end(),
                     [](const SegmentationRule& a, const SegmentationRule& b) {
                         return a.priority > b.priority;
                     });
}

const SegmentationRule* RuleTable::find(std::string_view name) const {
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [name](const SegmentationRule& rule) { return rule.name == name; });
    return it != rules_.end() ? &*it : nullptr;
}

} // namespace razdel
