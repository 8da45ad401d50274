#include "qcpack_types.h"

#include <string>

/* ── UTF-8 ──────────────────────────────────────────────────────────── */

void append_codepoint(std::string& s, char32_t cp) {
    if (cp < 0x80) {
        s += static_cast<char>(cp);
    } else if (cp < 0x800) {
        s += static_cast<char>(0xC0 | (cp >> 6));
        s += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        s += static_cast<char>(0xE0 | (cp >> 12));
        s += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        s += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        s += static_cast<char>(0xF0 | (cp >> 18));
        s += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        s += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        s += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::u32string utf8_decode(const std::string& s) {
    std::u32string out;
    out.reserve(s.size());

    auto p = reinterpret_cast<const unsigned char*>(s.data());
    const unsigned char* end = p + s.size();

    auto cont = [&](size_t n) {
        if (static_cast<size_t>(end - p) < n) return false;
        for (size_t k = 0; k < n; ++k)
            if ((p[k] & 0xC0) != 0x80) return false;
        return true;
    };

    /* a malformed sequence costs one byte and yields U+FFFD */
    while (p < end) {
        unsigned char c = *p++;
        char32_t cp;
        if (c < 0x80) {
            cp = c;
        } else if ((c >> 5) == 0x6 && cont(1)) {
            cp = ((c & 0x1F) << 6) | (p[0] & 0x3F);
            p += 1;
        } else if ((c >> 4) == 0xE && cont(2)) {
            cp = ((c & 0x0F) << 12) | ((p[0] & 0x3F) << 6) | (p[1] & 0x3F);
            p += 2;
        } else if ((c >> 3) == 0x1E && cont(3)) {
            cp = ((c & 0x07) << 18) | ((p[0] & 0x3F) << 12) |
                 ((p[1] & 0x3F) << 6) | (p[2] & 0x3F);
            p += 3;
        } else {
            cp = 0xFFFD;
        }
        out.push_back(cp);
    }
    return out;
}

std::string utf8_encode(const std::u32string& s) {
    std::string out;
    out.reserve(s.size());
    for (char32_t cp : s) append_codepoint(out, cp);
    return out;
}

/* ── character classes ──────────────────────────────────────────────── */

static char32_t lower(char32_t c) {
    return (c >= 'A' && c <= 'Z') ? c + ('a' - 'A') : c;
}

static bool is_alnum(char32_t c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

static bool is_space(char32_t c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
           c == '\v' || c == 0xA0 || c == 0x2028 || c == 0x2029 ||
           (c >= 0x2000 && c <= 0x200A) || c == 0x202F || c == 0x3000;
}

static bool is_hyphen(char32_t c) {
    return c == '-' || c == 0xAD || c == 0x2010;
}

/* U+FB00..U+FB04: ff, fi, fl, ffi, ffl */
static const char* ligature(char32_t c) {
    switch (c) {
        case 0xFB00: return "ff";
        case 0xFB01: return "fi";
        case 0xFB02: return "fl";
        case 0xFB03: return "ffi";
        case 0xFB04: return "ffl";
        default:     return nullptr;
    }
}

static bool is_letter(char32_t c) {
    c = lower(c);
    return (c >= 'a' && c <= 'z') || ligature(c) != nullptr;
}

static char32_t straighten_quote(char32_t c) {
    if (c == 0x2018 || c == 0x2019) return '\'';
    if (c == 0x201C || c == 0x201D) return '"';
    return c;
}

/* ── normalization ──────────────────────────────────────────────────── */

NormalizedText normalize_with_map(const std::u32string& s) {
    NormalizedText out;
    out.text.reserve(s.size());
    out.indices.reserve(s.size());

    bool last_space = true;
    auto push = [&](char c, size_t i) {
        out.text += c;
        out.indices.push_back(static_cast<uint32_t>(i));
    };
    auto space = [&](size_t i) {
        if (last_space) return;
        push(' ', i);
        last_space = true;
    };

    for (size_t i = 0; i < s.size(); ++i) {
        char32_t c = straighten_quote(lower(s[i]));

        if (const char* lig = ligature(c)) {
            for (const char* p = lig; *p; ++p) push(*p, i);
            last_space = false;
        } else if (is_space(c)) {
            space(i);
        } else if (is_hyphen(c)) {
            /* line-wrap hyphen: join the word halves */
            if (i + 1 < s.size() && is_letter(s[i + 1])) continue;
            space(i);
        } else if (is_alnum(c) || c == '\'' || c == '"') {
            push(static_cast<char>(c), i);
            last_space = false;
        } else {
            space(i);
        }
    }

    if (!out.text.empty() && out.text.back() == ' ') {
        out.text.pop_back();
        out.indices.pop_back();
    }
    return out;
}

std::string normalize_text(const std::string& s) {
    return normalize_with_map(utf8_decode(s)).text;
}

NormalizedText strip_with_map(const std::u32string& s) {
    NormalizedText out;
    out.text.reserve(s.size());
    out.indices.reserve(s.size());

    for (size_t i = 0; i < s.size(); ++i) {
        char32_t c = lower(s[i]);
        if (const char* lig = ligature(c)) {
            for (const char* p = lig; *p; ++p) {
                out.text += *p;
                out.indices.push_back(static_cast<uint32_t>(i));
            }
        } else if (is_alnum(c)) {
            out.text += static_cast<char>(c);
            out.indices.push_back(static_cast<uint32_t>(i));
        }
    }
    return out;
}

std::string strip_to_alnum(const std::string& s) {
    return strip_with_map(utf8_decode(s)).text;
}
