#include "utils.hpp"
#include <platform/platform.hpp>
#include <cerrno>
#include <climits>
#include <cstdlib>

std::optional<int> parse_int(const std::string& s) {
    std::string text = s;
    trim(text);
    if (text.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') return std::nullopt;
    if (value < INT_MIN || value > INT_MAX) return std::nullopt;
    return static_cast<int>(value);
}

std::string shell_quote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

// ── UTF-8 decoding ──────────────────────────────────────────

static const char REPLACEMENT_CHAR[] = "\xEF\xBF\xBD";  // U+FFFD

struct LeadByte {
    size_t length;       // 0 = can never start a sequence
    unsigned char lo;    // allowed range of the second byte
    unsigned char hi;
};

// Unicode table 3-7: rejects overlongs, surrogates and anything above U+10FFFF.
static LeadByte classify_lead(unsigned char b) {
    if (b < 0x80) return {1, 0, 0};
    if (b >= 0xC2 && b <= 0xDF) return {2, 0x80, 0xBF};
    if (b == 0xE0) return {3, 0xA0, 0xBF};
    if (b >= 0xE1 && b <= 0xEC) return {3, 0x80, 0xBF};
    if (b == 0xED) return {3, 0x80, 0x9F};
    if (b >= 0xEE && b <= 0xEF) return {3, 0x80, 0xBF};
    if (b == 0xF0) return {4, 0x90, 0xBF};
    if (b >= 0xF1 && b <= 0xF3) return {4, 0x80, 0xBF};
    if (b == 0xF4) return {4, 0x80, 0x8F};
    return {0, 0, 0};
}

// Bytes of p that match the start of a well-formed sequence (the "maximal
// subpart"). Equals lead.length when the whole sequence is valid.
static size_t matched_prefix(const unsigned char* p, size_t remaining, const LeadByte& lead) {
    if (lead.length <= 1) return lead.length;
    size_t n = 1;
    if (n < remaining && p[n] >= lead.lo && p[n] <= lead.hi) {
        n++;
        while (n < lead.length && n < remaining && p[n] >= 0x80 && p[n] <= 0xBF) n++;
    }
    return n;
}

std::string decode_utf8_lossy(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());

    const auto* data = reinterpret_cast<const unsigned char*>(bytes.data());
    size_t size = bytes.size();
    size_t i = 0;
    while (i < size) {
        LeadByte lead = classify_lead(data[i]);
        size_t n = matched_prefix(data + i, size - i, lead);
        if (lead.length > 0 && n == lead.length) {
            out.append(bytes, i, n);
            i += n;
        } else {
            out += REPLACEMENT_CHAR;
            i += (n > 0) ? n : 1;
        }
    }
    return out;
}
