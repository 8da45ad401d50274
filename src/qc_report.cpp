#include "qcpack_types.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

/* ── helpers ────────────────────────────────────────────────────────── */

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static std::string upper(std::string s) {
    for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

/* lowercase with whitespace runs collapsed, for literal comparisons */
static std::string fold(const std::string& s) {
    std::string out;
    bool space = false;
    for (char c : trim(s)) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            space = true;
            continue;
        }
        if (space) out += ' ';
        space = false;
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

static bool parse_number(const std::string& s, double& out) {
    std::string t = trim(s);
    if (t.empty()) return false;
    char* endp = nullptr;
    out = std::strtod(t.c_str(), &endp);
    return endp == t.c_str() + t.size() && std::isfinite(out);
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

/* ── header ─────────────────────────────────────────────────────────── */

using HeaderMap = std::unordered_map<std::string, int>;

static const std::string& cell(const Row& row, int idx) {
    static const std::string empty;
    if (idx < 0 || static_cast<size_t>(idx) >= row.size()) return empty;
    return row[idx];
}

static int column(const HeaderMap& cols, const char* name) {
    auto it = cols.find(name);
    return it == cols.end() ? -1 : it->second;
}

static bool is_header(const Row& row, const std::vector<std::string>& required) {
    std::vector<std::string> names;
    names.reserve(row.size());
    for (const auto& c : row) names.push_back(upper(trim(c)));
    for (const auto& r : required) {
        bool found = false;
        for (const auto& n : names)
            if (n == r) { found = true; break; }
        if (!found) return false;
    }
    return true;
}

static int find_header(const Table& rows, const std::vector<std::string>& required) {
    for (size_t i = 0; i < rows.size(); ++i)
        if (is_header(rows[i], required)) return static_cast<int>(i);
    return -1;
}

static HeaderMap map_header(const Row& row) {
    HeaderMap cols;
    for (size_t i = 0; i < row.size(); ++i)
        cols.emplace(upper(trim(row[i])), static_cast<int>(i));   /* first wins */
    return cols;
}

/* ── row scan ───────────────────────────────────────────────────────── */
/*
 * Rows are folded left to right; the state carries the last track seen and
 * the next synthetic id. Interpreting a row never touches anything else.
 */

struct ScanState {
    std::string track;
    int         next_id = 1;
};

struct RowOutcome {
    ScanState                 state;
    std::optional<Correction> correction;
    std::string               dropped;      /* reason, "" if skipped silently */
    int                       page = 0;
    std::string               id;
};

static RowOutcome interpret_standard(const ScanState& in, const Row& row,
                                     const HeaderMap& cols, const Options& opts) {
    static const std::regex track_re("^(\\d+)");

    RowOutcome r;
    r.state = in;

    /* track filename row, e.g. "003_Chapter_One.wav" */
    for (const auto& c : row) {
        std::string t = trim(c);
        if (t.size() < 4 || fold(t.substr(t.size() - 4)) != ".wav") continue;
        std::smatch m;
        if (std::regex_search(t, m, track_re)) r.state.track = m[1].str();
        return r;
    }

    int id_col      = column(cols, "ID");
    int page_col    = column(cols, "PAGE");
    int context_col = column(cols, "CONTEXT");
    int notes_col   = column(cols, "NOTES");
    int time_col    = column(cols, "TIME CODE");
    int status_col  = context_col + 1;

    double number = 0;
    std::string id = trim(cell(row, id_col));
    if (!parse_number(id, number)) return r;
    r.id = id;

    std::string status = cell(row, status_col);
    if (fold(status) != fold(opts.gating_status)) {
        r.dropped = "status '" + trim(status) + "' does not require a pickup";
        return r;
    }

    double page = 0;
    if (!parse_number(cell(row, page_col), page)) {
        r.dropped = "page '" + trim(cell(row, page_col)) + "' is not a number";
        return r;
    }
    r.page = static_cast<int>(std::lround(page));

    Classification c = classify_note(cell(row, notes_col), cell(row, context_col),
                                     opts.audible);
    if (c.context.empty()) {
        r.dropped = "no context phrase";
        return r;
    }

    r.correction = Correction{id, r.page, std::move(c.context), std::move(c.note),
                              in.track, trim(cell(row, time_col)), c.type,
                              std::move(c.words)};
    return r;
}

static std::string strip_brackets(const std::string& s) {
    std::string out;
    for (char c : s)
        if (c != '[' && c != ']') out += c;
    return out;
}

/* words inside [brackets] mark the emphasis in post-QC TEXT cells */
static std::vector<std::string> bracket_words(const std::string& text) {
    static const std::regex re("\\[([^\\]]*)\\]");
    std::vector<std::string> words;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re);
         it != std::sregex_iterator(); ++it) {
        for (auto& w : split_words((*it)[1].str())) words.push_back(std::move(w));
    }
    return words;
}

static std::vector<std::string> quoted_words(const std::string& text) {
    static const std::regex re("\"([^\"]+)\"|\xE2\x80\x9C(.+?)\xE2\x80\x9D");
    std::smatch m;
    if (!std::regex_search(text, m, re)) return {};
    return split_words(m[1].matched ? m[1].str() : m[2].str());
}

static RowOutcome interpret_post_qc(const ScanState& in, const Row& row,
                                    const HeaderMap& cols, const Options& opts) {
    RowOutcome r;
    r.state = in;

    std::string comment = fold(cell(row, column(cols, "EDITOR COMMENTS")));
    if (comment.empty()) return r;

    bool accepted = false;
    for (const auto& a : opts.accepted_comments)
        if (fold(a) == comment) { accepted = true; break; }
    if (!accepted) return r;

    std::string id = std::to_string(in.next_id);
    r.id = id;

    double page = 0;
    std::string page_cell = cell(row, column(cols, "PAGE*"));
    if (!parse_number(page_cell, page)) {
        r.dropped = "page '" + trim(page_cell) + "' is not a number";
        return r;
    }
    r.page = static_cast<int>(std::lround(page));

    const std::string& text = cell(row, column(cols, "TEXT"));
    const std::string& desc = cell(row, column(cols, "PROBLEM DESCRIPTION"));

    Classification c = classify_note(desc, strip_brackets(text), opts.audible);
    if (c.context.empty()) {
        r.dropped = "no context phrase";
        return r;
    }

    std::vector<std::string> words = bracket_words(text);
    /* inserted words are not in the script; keep the boundary words */
    if (words.empty() && c.type != CorrectionType::Inserted) words = quoted_words(desc);
    if (words.empty()) words = std::move(c.words);

    r.state.next_id = in.next_id + 1;
    r.correction = Correction{id, r.page, std::move(c.context), std::move(c.note),
                              trim(cell(row, column(cols, "CD-TRK"))),
                              trim(cell(row, column(cols, "TIME"))), c.type,
                              std::move(words)};
    return r;
}

/* ── dialects ───────────────────────────────────────────────────────── */

struct DialectProfile {
    Dialect                  id;
    std::vector<std::string> required;
    RowOutcome (*interpret)(const ScanState& in, const Row& row,
                            const HeaderMap& cols, const Options& opts);
};

static const DialectProfile& profile_for(Dialect d) {
    static const DialectProfile standard = {
        Dialect::Standard, {"ID", "PAGE", "CONTEXT", "NOTES"}, interpret_standard};
    static const DialectProfile post_qc = {
        Dialect::PostQc,
        {"CD-TRK", "TIME", "PAGE*", "TEXT", "PROBLEM DESCRIPTION", "EDITOR COMMENTS"},
        interpret_post_qc};
    return d == Dialect::PostQc ? post_qc : standard;
}

static std::string join(const std::vector<std::string>& v, const char* sep) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += sep;
        out += v[i];
    }
    return out;
}

int detect_dialect(const Table& rows, Dialect& out) {
    bool post_qc  = find_header(rows, profile_for(Dialect::PostQc).required) >= 0;
    bool standard = find_header(rows, profile_for(Dialect::Standard).required) >= 0;
    if (post_qc && !standard) { out = Dialect::PostQc;   return QCPACK_OK; }
    if (standard)             { out = Dialect::Standard; return QCPACK_OK; }
    return QCPACK_ERR_UNSUPPORTED_DIALECT;
}

/* ── extract ────────────────────────────────────────────────────────── */

ReportResult extract_corrections(const Table& rows, Dialect dialect,
                                 const Options& opts, Diagnostics& diag) {
    ReportResult result;
    result.status  = QCPACK_OK;
    result.dialect = dialect;

    const DialectProfile& profile = profile_for(dialect);
    int header = find_header(rows, profile.required);
    if (header < 0) {
        result.status = QCPACK_ERR_HEADER_NOT_FOUND;
        result.error  = "could not find required header columns (" +
                        join(profile.required, ", ") + ")";
        return result;
    }

    HeaderMap cols = map_header(rows[header]);
    ScanState state;
    for (size_t i = static_cast<size_t>(header) + 1; i < rows.size(); ++i) {
        RowOutcome r = profile.interpret(state, rows[i], cols, opts);
        state = std::move(r.state);
        if (r.correction)
            result.corrections.push_back(std::move(*r.correction));
        else if (!r.dropped.empty())
            diag.emit(DiagKind::CorrectionDropped, r.page, r.id, r.dropped);
    }
    return result;
}

ReportResult parse_report(const void* buf, size_t len, const Options& opts,
                          Diagnostics& diag) {
    ReportResult result;
    result.status  = QCPACK_OK;
    result.dialect = Dialect::Standard;

    if (!buf || len == 0) {
        result.status = QCPACK_ERR_BAD_INPUT;
        result.error  = "empty report";
        return result;
    }

    Table rows;
    std::string fmt = qcpack_detect(buf, len);
    int rc = fmt == "xlsx" ? read_xlsx_rows(buf, len, rows, &result.error)
                           : read_csv_rows(buf, len, rows, &result.error);
    if (rc != QCPACK_OK) {
        result.status = rc;
        return result;
    }

    Dialect dialect = Dialect::Standard;
    if (opts.dialect) {
        dialect = *opts.dialect;
    } else if (detect_dialect(rows, dialect) != QCPACK_OK) {
        result.status = QCPACK_ERR_UNSUPPORTED_DIALECT;
        result.error  = "report matches neither the standard nor the post-QC header";
        return result;
    }

    return extract_corrections(rows, dialect, opts, diag);
}
