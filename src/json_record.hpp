#pragma once

#include "segmenter.hpp"
#include <charconv>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace razdel {

// One JSON line per segmented text, built in a thread_local buffer.

namespace detail {

// Offsets and ids are never negative
inline void append_number(std::string& out, size_t value) {
    char digits[24];
    auto result = std::to_chars(digits, digits + sizeof(digits), value);
    out.append(digits, result.ptr);
}

inline void append_offsets(std::string& out, const std::vector<size_t>& offsets) {
    out += '[';
    for (size_t i = 0; i < offsets.size(); ++i) {
        if (i > 0) out += ',';
        append_number(out, offsets[i]);
    }
    out += ']';
}

// Quoted JSON string; UTF-8 passes through, control bytes are hex-escaped
inline void append_string(std::string& out, std::string_view s) {
    out += '"';
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c == '"' || c == '\\') {
            out += '\\';
            out += ch;
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c == '\t') {
            out += "\\t";
        } else if (c < 0x20) {
            out += "\\u00";
            out += "0123456789abcdef"[c >> 4];
            out += "0123456789abcdef"[c & 0xF];
        } else {
            out += ch;
        }
    }
    out += '"';
}

} // namespace detail

// {"id":N,"input":"...","boundaries":[...],"sentences":[...],"score":x[,"candidates":[...]]}
inline std::string build_json_record(
    size_t id,
    const std::string& input,
    const std::vector<size_t>& boundaries,
    const std::vector<Sentence>& sentences,
    double score,
    const std::vector<CandidateTrace>* candidates
) {
    thread_local std::string buffer;
    buffer.clear();
    buffer.reserve(512);

    buffer += "{\"id\":";
    detail::append_number(buffer, id);
    buffer += ",\"input\":";
    detail::append_string(buffer, input);

    buffer += ",\"boundaries\":";
    detail::append_offsets(buffer, boundaries);

    buffer += ",\"sentences\":[";
    for (size_t i = 0; i < sentences.size(); ++i) {
        if (i > 0) buffer += ',';
        detail::append_string(buffer, sentences[i].text);
    }

    std::ostringstream score_str;
    score_str << std::fixed << std::setprecision(4) << score;
    buffer += "],\"score\":";
    buffer += score_str.str();

    if (candidates) {
        buffer += ",\"candidates\":[";
        for (size_t i = 0; i < candidates->size(); ++i) {
            const auto& c = (*candidates)[i];
            if (i > 0) buffer += ',';
            buffer += "{\"offset\":";
            detail::append_number(buffer, c.offset);
            buffer += ",\"rule\":";
            detail::append_string(buffer, c.rule);
            buffer += ",\"blocked\":";
            detail::append_string(buffer, block_reason_name(c.reason));
            buffer += '}';
        }
        buffer += ']';
    }

    buffer += '}';
    return buffer;
}

} // namespace razdel
