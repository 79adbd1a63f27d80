#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <boost/regex.hpp>

namespace razdel {

struct SegmentationRule {
    std::string name;
    boost::wregex pattern;
    // Boundary rules propose a sentence end at each match end. Non-boundary
    // rules suppress lower-priority candidates at the same or an adjacent offset.
    bool is_boundary = true;
    // Higher priority rules are scanned first
    int priority = 0;
    std::string description;
};

// Compiles `pattern` (Perl grammar, code point string).
// Throws boost::regex_error if the pattern is invalid.
SegmentationRule make_rule(std::string name, std::wstring_view pattern, bool is_boundary,
                           int priority, std::string description);

// Ordered rule table, read-only after construction.
class RuleTable {
public:
    // Default rules followed by `extra_rules`, stably sorted by descending priority
    explicit RuleTable(std::vector<SegmentationRule> extra_rules = {});

    const std::vector<SegmentationRule>& ordered() const { return rules_; }
    size_t size() const { return rules_.size(); }

    // nullptr if no rule has that name
    const SegmentationRule* find(std::string_view name) const;

    static std::vector<SegmentationRule> default_rules();

private:
    std::vector<SegmentationRule> rules_;
};

} // namespace razdel
