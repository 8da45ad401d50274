#include "qcpack_types.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <utility>
#include <vector>

/* ── helpers ────────────────────────────────────────────────────────── */

static bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

static bool is_space(char32_t c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == 0xA0;
}

static bool is_hyphen(char32_t c) {
    return c == '-' || c == 0xAD || c == 0x2010;
}

static bool is_letter(char32_t c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= 0xFB00 && c <= 0xFB04);
}

const char* match_strategy_name(MatchStrategy m) {
    switch (m) {
        case MatchStrategy::None:       return "none";
        case MatchStrategy::Strict:     return "strict";
        case MatchStrategy::Aggressive: return "aggressive";
        case MatchStrategy::Suggested:  return "suggested";
    }
    return "none";
}

/* ── page index ─────────────────────────────────────────────────────── */

std::vector<TextRun> order_runs(std::vector<TextRun> runs, double tolerance) {
    runs.erase(std::remove_if(runs.begin(), runs.end(),
                              [](const TextRun& r) { return is_blank(r.text); }),
               runs.end());
    std::stable_sort(runs.begin(), runs.end(),
                     [](const TextRun& a, const TextRun& b) { return a.y > b.y; });

    /* a run joins the first line whose baseline is within tolerance */
    std::vector<std::pair<double, std::vector<TextRun>>> lines;
    for (auto& run : runs) {
        bool placed = false;
        for (auto& line : lines) {
            if (std::fabs(line.first - run.y) < tolerance) {
                line.second.push_back(std::move(run));
                placed = true;
                break;
            }
        }
        if (!placed) lines.push_back({run.y, {std::move(run)}});
    }

    std::stable_sort(lines.begin(), lines.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<TextRun> ordered;
    for (auto& line : lines) {
        std::stable_sort(line.second.begin(), line.second.end(),
                         [](const TextRun& a, const TextRun& b) { return a.x < b.x; });
        for (auto& run : line.second) ordered.push_back(std::move(run));
    }
    return ordered;
}

PageTextIndex build_page_index(int page_number, std::vector<TextRun> runs) {
    PageTextIndex idx;
    idx.page_number = page_number;
    idx.runs = std::move(runs);
    idx.run_lengths.reserve(idx.runs.size());

    for (size_t r = 0; r < idx.runs.size(); ++r) {
        std::u32string text = utf8_decode(idx.runs[r].text);
        idx.run_lengths.push_back(static_cast<uint32_t>(text.size()));
        if (text.empty()) continue;

        /* runs are separated by a space unless a wrap hyphen joins them */
        if (!idx.corpus.empty()) {
            char32_t prev = idx.corpus.back();
            bool joined = is_hyphen(prev) && is_letter(text.front());
            if (!joined && !is_space(prev) && !is_space(text.front())) {
                idx.corpus.push_back(' ');
                idx.refs.push_back({-1, 0});
            }
        }

        for (size_t k = 0; k < text.size(); ++k) {
            idx.corpus.push_back(text[k]);
            idx.refs.push_back({static_cast<int32_t>(r), static_cast<uint32_t>(k)});
        }
    }

    idx.normalized = normalize_with_map(idx.corpus);
    idx.stripped   = strip_with_map(idx.corpus);
    return idx;
}

std::string page_text(const PageTextIndex& index) {
    return utf8_encode(index.corpus);
}

/* ── matching ───────────────────────────────────────────────────────── */

static std::optional<CorpusRange> find_in(const NormalizedText& hay,
                                          const std::string& needle,
                                          size_t from, bool whole_word) {
    if (needle.empty() || hay.text.empty()) return std::nullopt;

    /* first normalized position produced at or after corpus index `from` */
    size_t pos = static_cast<size_t>(
        std::lower_bound(hay.indices.begin(), hay.indices.end(),
                         static_cast<uint32_t>(from)) - hay.indices.begin());

    while ((pos = hay.text.find(needle, pos)) != std::string::npos) {
        size_t end = pos + needle.size();
        bool bounded = (pos == 0 || hay.text[pos - 1] == ' ') &&
                       (end == hay.text.size() || hay.text[end] == ' ');
        if (!whole_word || bounded)
            return CorpusRange{hay.indices[pos], hay.indices[end - 1]};
        ++pos;
    }
    return std::nullopt;
}

std::optional<CorpusRange> match_strict(const PageTextIndex& index,
                                        const std::string& phrase,
                                        size_t from, bool whole_word) {
    return find_in(index.normalized, normalize_text(phrase), from, whole_word);
}

/*
 * Bare alphanumerics on both sides. Recovers matches split by stray spacing
 * or punctuation, and can also join two distinct words across a dropped gap.
 */
std::optional<CorpusRange> match_aggressive(const PageTextIndex& index,
                                            const std::string& phrase,
                                            size_t from) {
    return find_in(index.stripped, strip_to_alnum(phrase), from, false);
}

std::vector<RunSpan> range_to_spans(const PageTextIndex& index,
                                    const CorpusRange& range) {
    std::map<uint32_t, std::pair<uint32_t, uint32_t>> per_run;
    for (size_t i = range.first; i <= range.last && i < index.refs.size(); ++i) {
        const CharRef& ref = index.refs[i];
        if (ref.run < 0) continue;
        auto key = static_cast<uint32_t>(ref.run);
        auto it = per_run.find(key);
        if (it == per_run.end()) {
            per_run.emplace(key, std::make_pair(ref.offset, ref.offset));
        } else {
            it->second.first  = std::min(it->second.first, ref.offset);
            it->second.second = std::max(it->second.second, ref.offset);
        }
    }

    /* fractions of character length; placement assumes uniform glyph width */
    std::vector<RunSpan> spans;
    spans.reserve(per_run.size());
    for (const auto& [run, r] : per_run) {
        double len = index.run_lengths[run] ? index.run_lengths[run] : 1.0;
        double start = std::clamp(r.first / len, 0.0, 1.0);
        double end   = std::clamp((r.second + 1) / len, 0.0, 1.0);
        spans.push_back({run, start, end});
    }
    return spans;
}

/* ── locate ─────────────────────────────────────────────────────────── */

static std::optional<std::vector<RunSpan>> match_page(const PageTextIndex& idx,
                                                      const std::string& phrase,
                                                      bool aggressive,
                                                      MatchStrategy& how) {
    if (auto r = match_strict(idx, phrase)) {
        how = MatchStrategy::Strict;
        return range_to_spans(idx, *r);
    }
    if (aggressive) {
        if (auto r = match_aggressive(idx, phrase)) {
            how = MatchStrategy::Aggressive;
            return range_to_spans(idx, *r);
        }
    }
    return std::nullopt;
}

/* search first+second as one corpus, then hand each run back to its page */
static bool match_bridged(const PageTextIndex& first, const PageTextIndex& second,
                          const std::string& phrase, bool aggressive,
                          Location& loc) {
    std::vector<TextRun> runs = first.runs;
    runs.insert(runs.end(), second.runs.begin(), second.runs.end());
    PageTextIndex combined = build_page_index(first.page_number, std::move(runs));

    MatchStrategy how = MatchStrategy::None;
    auto spans = match_page(combined, phrase, aggressive, how);
    if (!spans) return false;

    auto split = static_cast<uint32_t>(first.runs.size());
    PageSpans a{first.page_number, {}};
    PageSpans b{second.page_number, {}};
    for (const RunSpan& s : *spans) {
        if (s.run < split) a.spans.push_back(s);
        else               b.spans.push_back({s.run - split, s.start, s.end});
    }

    loc.strategy = how;
    if (!a.spans.empty()) loc.pages.push_back(std::move(a));
    if (!b.spans.empty()) loc.pages.push_back(std::move(b));
    return true;
}

Location locate_phrase(const std::string& phrase,
                       const PageTextIndex& primary,
                       const PageTextIndex* prev,
                       const PageTextIndex* next,
                       const LocateOptions& opts) {
    Location loc;

    MatchStrategy how = MatchStrategy::None;
    if (auto spans = match_page(primary, phrase, opts.aggressive, how)) {
        loc.strategy = how;
        loc.pages.push_back({primary.page_number, std::move(*spans)});
        return loc;
    }

    if (opts.bridging) {
        if (next && match_bridged(primary, *next, phrase, opts.aggressive, loc))
            return loc;
        if (prev && match_bridged(*prev, primary, phrase, opts.aggressive, loc))
            return loc;
    }

    if (opts.suggester && *opts.suggester) {
        std::string text = page_text(primary);
        std::optional<std::string> s = (*opts.suggester)(text, phrase);
        if (s && !s->empty()) {
            /* only trust text that is really on the page */
            std::optional<CorpusRange> r;
            if (text.find(*s) != std::string::npos) r = match_strict(primary, *s);
            if (r) {
                loc.strategy = MatchStrategy::Suggested;
                loc.pages.push_back({primary.page_number, range_to_spans(primary, *r)});
                return loc;
            }
            if (opts.diag)
                opts.diag->emit(DiagKind::SuggestionRejected, primary.page_number, "",
                                "suggested text is not on the page: " + *s);
        }
    }

    return loc;
}
