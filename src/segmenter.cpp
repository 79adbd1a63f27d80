#include "segmenter.hpp"
#include "constants.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include "robin_hood.h"

namespace razdel {

// Thread-local scratch to avoid a per-call allocation for the decoded text
struct ThreadLocalBuffers {
    std::wstring codepoints;

    ThreadLocalBuffers() {
        codepoints.reserve(4096);
    }
};

static thread_local ThreadLocalBuffers tl_buffers;

static Lexicon build_lexicon(const SegmenterConfig& config) {
    Lexicon lexicon;
    for (const auto& word : config.extra_abbreviations) {
        lexicon.add_abbreviation(word);
    }
    if (!config.abbreviations_path.empty()) {
        // An unreadable file is reported and the built-in set is kept
        lexicon.load_abbreviations(config.abbreviations_path);
    }
    return lexicon;
}

SentenceSegmenter::SentenceSegmenter(const SegmenterConfig& config)
    : lexicon_(build_lexicon(config)),
      rules_(config.extra_rules),
      blocking_(lexicon_),
      scorer_(lexicon_)
{
}

std::vector<size_t> SentenceSegmenter::find_sentence_boundaries(std::string_view text) const {
    auto& cps = tl_buffers.codepoints;
    decode_utf8(text, cps);
    return scan(cps, nullptr);
}

std::vector<CandidateTrace> SentenceSegmenter::trace_candidates(std::string_view text) const {
    auto& cps = tl_buffers.codepoints;
    decode_utf8(text, cps);
    std::vector<CandidateTrace> trace;
    scan(cps, &trace);
    return trace;
}

std::vector<Sentence> SentenceSegmenter::sentenize(std::string_view text) const {
    auto& cps = tl_buffers.codepoints;
    decode_utf8(text, cps);
    return split_by_boundaries(cps, scan(cps, nullptr));
}

double SentenceSegmenter::get_quality_score(std::string_view text,
                                            const std::vector<size_t>& boundaries) const {
    auto& cps = tl_buffers.codepoints;
    decode_utf8(text, cps);
    return scorer_.score(cps, boundaries);
}

std::vector<size_t> SentenceSegmenter::scan(std::wstring_view cps,
                                            std::vector<CandidateTrace>* trace) const {
    if (cps.empty()) {
        return {};
    }

    robin_hood::unordered_flat_set<size_t> accepted;
    // Match ends of non-boundary rules scanned so far
    robin_hood::unordered_flat_set<size_t> suppressed;

    auto is_suppressed = [&suppressed](size_t pos) {
        return suppressed.count(pos) > 0 ||
               (pos > 0 && suppressed.count(pos - 1) > 0) ||
               suppressed.count(pos + 1) > 0;
    };

    const wchar_t* first = cps.data();
    const wchar_t* last = cps.data() + cps.size();

    // Rules are already in descending priority order
    for (const auto& rule : rules_.ordered()) {
        try {
            for (boost::wcregex_iterator it(first, last, rule.pattern), end; it != end; ++it) {
                size_t pos = static_cast<size_t>(it->position(0) + it->length(0));

                if (!rule.is_boundary) {
                    suppressed.insert(pos);
                    continue;
                }

                BlockReason reason = is_suppressed(pos) ? BlockReason::suppressed
                                                        : blocking_.evaluate(cps, pos);
                if (trace) {
                    trace->push_back({pos, rule.name, reason});
                }
                if (reason == BlockReason::none) {
                    accepted.insert(pos);
                }
            }
        } catch (const std::runtime_error& e) {
            // Boost gives up on a match that exceeds its complexity or memory
            // bounds; candidates found before that point are kept.
            std::cerr << "Rule '" << rule.name << "' stopped early: " << e.what() << std::endl;
        }
    }

    std::vector<size_t> boundaries(accepted.begin(), accepted.end());
    std::sort(boundaries.begin(), boundaries.end());
    return boundaries;
}

std::shared_ptr<const SentenceSegmenter> shared_segmenter() {
    // Function-local static: initialized once, thread-safe on first access
    static const std::shared_ptr<const SentenceSegmenter> instance =
        std::make_shared<SentenceSegmenter>();
    return instance;
}

} // namespace razdel
