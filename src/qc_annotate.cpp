#include "qcpack_types.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

/* ── placement ──────────────────────────────────────────────────────── */

MarkSpan place_span(const TextRun& run, uint32_t run_index,
                    double start, double end) {
    start = std::clamp(start, 0.0, 1.0);
    end   = std::clamp(end, 0.0, 1.0);
    if (end < start) end = start;

    double x0 = run.x + run.width * start;
    double x1 = run.x + run.width * end;
    if (x1 - x0 < kMinMarkWidth) {
        double mid = (x0 + x1) / 2;
        x0 = mid - kMinMarkWidth / 2;
        x1 = mid + kMinMarkWidth / 2;
    }
    return {run_index, x0, x1, run.y, run.height};
}

/* ── scoped search ──────────────────────────────────────────────────── */
/*
 * Emphasis words are searched only inside the located context, in one corpus
 * built from the context runs of every page it spans. `owner` maps a scope
 * run back to its page slot and its index on that page.
 */

struct ScopeRun {
    size_t   slot;
    uint32_t run;
};

struct Scope {
    PageTextIndex         index;
    std::vector<ScopeRun> owner;
    size_t                from = 0;   /* first corpus index of the context */
    size_t                to   = 0;   /* last corpus index of the context */
};

static Scope make_scope(const std::vector<ContextOnPage>& parts) {
    Scope scope;
    std::vector<TextRun> runs;
    for (size_t k = 0; k < parts.size(); ++k) {
        for (const RunSpan& s : parts[k].spans) {
            runs.push_back(parts[k].page->runs[s.run]);
            scope.owner.push_back({k, s.run});
        }
    }
    scope.index = build_page_index(parts.front().page->page_number, std::move(runs));
    if (scope.index.refs.empty()) return scope;

    const RunSpan& head = parts.front().spans.front();
    const RunSpan& tail = parts.back().spans.back();
    auto last_run = static_cast<int32_t>(scope.owner.size() - 1);
    auto first_off = static_cast<uint32_t>(std::lround(head.start * scope.index.run_lengths.front()));
    auto end_off   = static_cast<uint32_t>(std::lround(tail.end * scope.index.run_lengths.back()));

    scope.to = scope.index.refs.size() - 1;
    bool have_from = false;
    for (size_t i = 0; i < scope.index.refs.size(); ++i) {
        const CharRef& ref = scope.index.refs[i];
        if (!have_from && ref.run == 0 && ref.offset >= first_off) {
            scope.from = i;
            have_from = true;
        }
        if (ref.run == last_run && ref.offset < end_off) scope.to = i;
    }
    return scope;
}

static bool inside(const Scope& scope, const std::optional<CorpusRange>& r) {
    return r && r->first >= scope.from && r->last <= scope.to;
}

static std::optional<CorpusRange> find_word(const Scope& scope,
                                            const std::string& phrase,
                                            size_t from) {
    auto r = match_strict(scope.index, phrase, from, true);
    if (inside(scope, r)) return r;
    r = match_strict(scope.index, phrase, from, false);
    if (inside(scope, r)) return r;
    r = match_aggressive(scope.index, phrase, from);
    if (inside(scope, r)) return r;
    return std::nullopt;
}

static void add_marks(const Scope& scope, const CorpusRange& range,
                      std::vector<AnnotationPlan>& plans) {
    for (const RunSpan& s : range_to_spans(scope.index, range)) {
        const ScopeRun& o = scope.owner[s.run];
        plans[o.slot].emphasis.push_back(
            place_span(scope.index.runs[s.run], o.run, s.start, s.end));
    }
}

static std::string join_words(const std::vector<std::string>& words) {
    std::string out;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i) out += ' ';
        out += words[i];
    }
    return out;
}

/* ── plan ───────────────────────────────────────────────────────────── */

std::vector<AnnotationPlan> plan_annotation(const Correction& corr,
                                            const std::vector<ContextOnPage>& parts) {
    std::vector<AnnotationPlan> plans(parts.size());

    std::vector<ContextOnPage> located;
    for (size_t k = 0; k < parts.size(); ++k) {
        if (parts[k].spans.empty()) continue;
        located.push_back(parts[k]);
        for (const RunSpan& s : parts[k].spans)
            plans[k].underline.push_back(
                place_span(parts[k].page->runs[s.run], s.run, s.start, s.end));
    }
    if (located.empty()) return plans;

    /* no emphasis words: the whole context is emphasized */
    if (corr.words.empty()) {
        for (AnnotationPlan& p : plans) p.emphasis = p.underline;
        return plans;
    }

    Scope scope = make_scope(located);
    std::vector<AnnotationPlan> marks(located.size());

    if (corr.type == CorrectionType::Inserted && corr.words.size() == 2) {
        auto first = find_word(scope, corr.words[0], scope.from);
        if (!first) return plans;
        auto second = find_word(scope, corr.words[1], first->last + 1);
        if (!second) return plans;

        add_marks(scope, *first, marks);
        add_marks(scope, *second, marks);
    } else if (auto r = find_word(scope, join_words(corr.words), scope.from)) {
        add_marks(scope, *r, marks);
    }

    /* hand the marks back to the slots that carried spans */
    size_t m = 0;
    for (size_t k = 0; k < parts.size(); ++k) {
        if (parts[k].spans.empty()) continue;
        plans[k].emphasis = std::move(marks[m].emphasis);
        plans[k].boundary_pair = corr.type == CorrectionType::Inserted &&
                                 corr.words.size() == 2 && !plans[k].emphasis.empty();
        ++m;
    }
    return plans;
}

AnnotationPlan plan_annotation(const Correction& corr,
                               const PageTextIndex& page,
                               const std::vector<RunSpan>& context) {
    return plan_annotation(corr, {ContextOnPage{&page, context}}).front();
}
