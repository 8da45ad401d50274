#include "qcpack_types.h"

#include <cctype>
#include <regex>
#include <string>
#include <vector>

/* ── helpers ────────────────────────────────────────────────────────── */

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static bool starts_with(const std::string& s, const char* p) {
    return s.compare(0, std::char_traits<char>::length(p), p) == 0;
}

static bool ends_with(const std::string& s, const char* p) {
    size_t n = std::char_traits<char>::length(p);
    return s.size() >= n && s.compare(s.size() - n, n, p) == 0;
}

/* strip one pair of straight or curly double quotes */
static std::string unquote(const std::string& raw) {
    std::string s = trim(raw);
    if (starts_with(s, "\""))                s.erase(0, 1);
    else if (starts_with(s, "\xE2\x80\x9C")) s.erase(0, 3);
    if (ends_with(s, "\""))                  s.pop_back();
    else if (ends_with(s, "\xE2\x80\x9D"))   s.erase(s.size() - 3);
    return trim(s);
}

static std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::string cur;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) words.push_back(std::move(cur));
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) words.push_back(std::move(cur));
    return words;
}

/* drop ASCII punctuation around a word ("happy," -> "happy") */
static std::string strip_edges(const std::string& w) {
    size_t b = 0, e = w.size();
    while (b < e && std::ispunct(static_cast<unsigned char>(w[b]))) ++b;
    while (e > b && std::ispunct(static_cast<unsigned char>(w[e - 1]))) --e;
    return w.substr(b, e - b);
}

static std::string one_line(const std::string& s) {
    std::string out = s;
    for (char& c : out)
        if (c == '\r' || c == '\n' || c == '\t') c = ' ';
    return out;
}

/* ── placeholder runs ───────────────────────────────────────────────── */

/* "_" and the U+FE4D..U+FE4F low lines mark elided text in scripts */
static const std::regex& placeholder_re() {
    static const std::regex re("(?:_|\xEF\xB9\x8D|\xEF\xB9\x8E|\xEF\xB9\x8F)+");
    return re;
}

std::string searchable_context(const std::string& raw) {
    static const std::regex ws("\\s+");
    std::string s = std::regex_replace(raw, placeholder_re(), " ");
    s = std::regex_replace(s, ws, " ");
    return trim(s);
}

/* words flanking the point where the inserted text must be removed */
static std::vector<std::string> boundary_words(const std::string& context,
                                               const std::string& inserted) {
    std::smatch m;
    if (std::regex_search(context, m, placeholder_re())) {
        auto before = split_words(m.prefix().str());
        auto after  = split_words(m.suffix().str());
        std::string w1 = before.empty() ? "" : strip_edges(before.back());
        std::string w2 = after.empty() ? "" : strip_edges(after.front());
        if (!w1.empty() && !w2.empty()) return {w1, w2};
    }

    /* no placeholder: look for the inserted words themselves */
    auto tokens = split_words(searchable_context(context));
    auto target = split_words(normalize_text(inserted));
    if (target.empty() || tokens.size() < target.size() + 2) return {};

    for (size_t i = 1; i + target.size() < tokens.size(); ++i) {
        bool hit = true;
        for (size_t k = 0; k < target.size() && hit; ++k)
            hit = normalize_text(tokens[i + k]) == target[k];
        if (!hit) continue;
        std::string w1 = strip_edges(tokens[i - 1]);
        std::string w2 = strip_edges(tokens[i + target.size()]);
        if (!w1.empty() && !w2.empty()) return {w1, w2};
        break;
    }
    return {};
}

static const char* count_role(size_t words) {
    return words >= 2 ? "ML" : "MW";
}

/* ── rules ──────────────────────────────────────────────────────────── */
/*
 * Tried in order, first match wins. apply() fills note, words and type and
 * returns the role prefix used in audible mode.
 */

struct NoteRule {
    const char* name;
    std::regex  pattern;
    const char* (*apply)(const std::smatch& m, const std::string& context,
                         Classification& out);
};

static const char* apply_should_be(const std::smatch& m, const std::string&,
                                   Classification& out) {
    std::string wrong = unquote(m[1].str());
    std::string right = unquote(m[2].str());
    out.type  = CorrectionType::Misread;
    out.words = split_words(right);   /* the script carries the right reading */
    out.note  = "read as \"" + wrong + "\" should be read as \"" + right + "\"";
    return "MR";
}

static const char* apply_sounds_like(const std::smatch& m, const std::string&,
                                     Classification& out) {
    std::string script = unquote(m[1].str());
    std::string heard  = unquote(m[2].str());
    out.type  = CorrectionType::Misread;
    out.words = split_words(script);
    out.note  = "\"" + script + "\" is misheard as \"" + heard + "\"";
    return "MR";
}

static const char* apply_read_as(const std::smatch& m, const std::string&,
                                 Classification& out) {
    std::string right = unquote(m[1].str());
    std::string wrong = unquote(m[2].str());
    out.type  = CorrectionType::Misread;
    out.words = split_words(right);
    out.note  = "read as \"" + wrong + "\" should be read as \"" + right + "\"";
    return "MR";
}

static const char* apply_missing(const std::smatch& m, const std::string&,
                                 Classification& out) {
    std::string missing = unquote(m[1].str());
    out.type  = CorrectionType::Missing;
    out.words = split_words(missing);
    out.note  = "\"" + missing + "\" is missing and should be read.";
    return count_role(out.words.size());
}

static const char* apply_inserted(const std::smatch& m, const std::string& context,
                                  Classification& out) {
    std::string inserted = unquote(m[1].str());
    out.type  = CorrectionType::Inserted;
    out.words = boundary_words(context, inserted);
    out.note  = "\"" + inserted + "\" was inserted and should be omitted.";
    return count_role(split_words(inserted).size());
}

static const std::vector<NoteRule>& note_rules() {
    static const auto flags = std::regex::ECMAScript | std::regex::icase;
    static const std::vector<NoteRule> rules = {
        {"should-be",   std::regex("^(.+?)\\s+S/B\\s+(.+)$", flags), apply_should_be},
        {"sounds-like", std::regex("^(.+?)\\s+sounds\\s+like\\s+(.+)$", flags), apply_sounds_like},
        {"read-as",     std::regex("^(.+?)\\s+read\\s+as\\s+(.+)$", flags), apply_read_as},
        {"missing",     std::regex("^(?:words?\\s+)?(?:omitted\\s+line|missing|omitted)\\s*:\\s*(.+)$", flags), apply_missing},
        {"omitted",     std::regex("^omitted\\s+(.+)$", flags), apply_missing},
        {"inserted",    std::regex("^(?:words?\\s+)?inserted\\s*:\\s*(.+)$", flags), apply_inserted},
    };
    return rules;
}

/* ── classify ───────────────────────────────────────────────────────── */

const char* correction_type_name(CorrectionType t) {
    switch (t) {
        case CorrectionType::Misread:  return "misread";
        case CorrectionType::Missing:  return "missing";
        case CorrectionType::Inserted: return "inserted";
    }
    return "misread";
}

Classification classify_note(const std::string& note,
                             const std::string& context, bool audible) {
    static const std::regex role_re("^(MR|MW|ML)\\s*:\\s*",
                                    std::regex::ECMAScript | std::regex::icase);

    Classification out;
    out.type    = CorrectionType::Misread;
    out.context = searchable_context(context);

    std::string body = trim(note);
    std::string explicit_role;
    std::smatch rm;
    if (std::regex_search(body, rm, role_re)) {
        explicit_role = rm[1].str();
        for (char& c : explicit_role)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        body = trim(rm.suffix().str());
    }

    const char* role = "MR";
    bool matched = false;
    std::string line = one_line(body);
    for (const auto& rule : note_rules()) {
        std::smatch m;
        if (!std::regex_match(line, m, rule.pattern)) continue;
        role = rule.apply(m, context, out);
        matched = true;
        break;
    }

    /* unrecognized notes pass through; outside audible mode, tag included */
    if (!matched) {
        out.words.clear();
        if (!audible || body.empty()) {
            out.note = body.empty() ? body : trim(note);
            return out;
        }
        out.note = body;
    }

    if (audible)
        out.note = (explicit_role.empty() ? std::string(role) : explicit_role) +
                   ": " + out.note;
    return out;
}
