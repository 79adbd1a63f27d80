#pragma once

#include "blocking.hpp"
#include "lexicon.hpp"
#include "quality.hpp"
#include "rules.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace razdel {

// Construction-time configuration; the engine is immutable afterwards
struct SegmenterConfig {
    std::vector<std::string> extra_abbreviations;
    // Optional file, one abbreviation per line
    std::string abbreviations_path;
    // Merged into the default table by priority
    std::vector<SegmentationRule> extra_rules;
};

// One raw candidate produced by the scan, with the blocking verdict
struct CandidateTrace {
    size_t offset = 0;
    std::string rule;
    BlockReason reason = BlockReason::none;
};

// Rule-based sentence boundary detection for Russian text.
// Input is UTF-8; every offset in and out is a code point offset.
// All const members are safe to call concurrently.
class SentenceSegmenter {
public:
    SentenceSegmenter(const SegmenterConfig& config = SegmenterConfig());

    // Non-copyable: the evaluator and scorer refer to lexicon_
    SentenceSegmenter(const SentenceSegmenter&) = delete;
    SentenceSegmenter& operator=(const SentenceSegmenter&) = delete;

    // Ascending, deduplicated offsets where a new sentence begins
    std::vector<size_t> find_sentence_boundaries(std::string_view text) const;

    // Every candidate in scan order (rule priority, then text order)
    std::vector<CandidateTrace> trace_candidates(std::string_view text) const;

    std::vector<Sentence> sentenize(std::string_view text) const;

    // `boundaries` should come from find_sentence_boundaries on the same text
    double get_quality_score(std::string_view text, const std::vector<size_t>& boundaries) const;

    const Lexicon& lexicon() const { return lexicon_; }
    const RuleTable& rules() const { return rules_; }
    const BlockingEvaluator& blocking() const { return blocking_; }

private:
    Lexicon lexicon_;
    RuleTable rules_;
    BlockingEvaluator blocking_;
    QualityScorer scorer_;

    std::vector<size_t> scan(std::wstring_view cps, std::vector<CandidateTrace>* trace) const;
};

// Process-wide engine with the default configuration, built on first use
std::shared_ptr<const SentenceSegmenter> shared_segmenter();

} // namespace razdel
