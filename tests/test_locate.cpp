#include "qcpack_types.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

static TextRun run(const char* text, double x, double y, double w = 100) {
    return {text, x, y, w, 10};
}

static std::string covered(const PageTextIndex& idx, const CorpusRange& r) {
    return utf8_encode(idx.corpus.substr(r.first, r.last - r.first + 1));
}

/* ── reading order ─────────────────────────────────────────────────── */

TEST(Locate, OrderRunsByLineThenX) {
    auto ordered = order_runs({run("world", 200, 700), run("second", 50, 680),
                               run("  ", 10, 690), run("Hello", 50, 701.5)},
                              5.0);
    ASSERT_EQ(ordered.size(), 3u);
    EXPECT_EQ(ordered[0].text, "Hello");
    EXPECT_EQ(ordered[1].text, "world");
    EXPECT_EQ(ordered[2].text, "second");
}

TEST(Locate, IndexSeparatesRunsWithSpace) {
    auto idx = build_page_index(1, {run("The quick", 0, 700), run("brown fox", 0, 688)});
    EXPECT_EQ(page_text(idx), "The quick brown fox");
    EXPECT_EQ(idx.refs[9].run, -1);
    EXPECT_EQ(idx.refs[10].run, 1);
    EXPECT_EQ(idx.refs[10].offset, 0u);
}

/* ── strict ────────────────────────────────────────────────────────── */

TEST(Locate, WrapHyphenJoinsRuns) {
    auto idx = build_page_index(3, {run("exam-", 100, 700, 50), run("ple text", 100, 688, 80)});
    auto r = match_strict(idx, "example text");
    ASSERT_TRUE(r);

    auto spans = range_to_spans(idx, *r);
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].run, 0u);
    EXPECT_DOUBLE_EQ(spans[0].start, 0.0);
    EXPECT_DOUBLE_EQ(spans[0].end, 0.8);
    EXPECT_EQ(spans[1].run, 1u);
    EXPECT_DOUBLE_EQ(spans[1].start, 0.0);
    EXPECT_DOUBLE_EQ(spans[1].end, 1.0);

    LocateOptions opts;
    Location loc = locate_phrase("example text", idx, nullptr, nullptr, opts);
    EXPECT_EQ(loc.strategy, MatchStrategy::Strict);
}

TEST(Locate, MatchedTextNormalizesToPhrase) {
    auto idx = build_page_index(1, {run("The quick", 0, 700), run("brown, fox", 0, 688)});
    for (const char* phrase : {"quick brown", "Brown fox", "the quick"}) {
        auto r = match_strict(idx, phrase);
        ASSERT_TRUE(r) << phrase;
        EXPECT_EQ(normalize_text(covered(idx, *r)), normalize_text(phrase)) << phrase;
    }
}

TEST(Locate, StrictFromAndWholeWord) {
    auto idx = build_page_index(1, {run("cart art art", 0, 700)});
    auto any = match_strict(idx, "art");
    ASSERT_TRUE(any);
    EXPECT_EQ(any->first, 1u);

    auto word = match_strict(idx, "art", 0, true);
    ASSERT_TRUE(word);
    EXPECT_EQ(word->first, 5u);

    auto later = match_strict(idx, "art", 6, true);
    ASSERT_TRUE(later);
    EXPECT_EQ(later->first, 9u);
}

/* ── aggressive ────────────────────────────────────────────────────── */

TEST(Locate, AggressiveRecoversPunctuationSplit) {
    auto idx = build_page_index(1, {run("well . known", 0, 700)});
    EXPECT_FALSE(match_strict(idx, "well-known"));

    LocateOptions opts;
    Location loc = locate_phrase("well-known", idx, nullptr, nullptr, opts);
    EXPECT_EQ(loc.strategy, MatchStrategy::Aggressive);
    ASSERT_EQ(loc.pages.size(), 1u);
    EXPECT_DOUBLE_EQ(loc.pages[0].spans[0].start, 0.0);
    EXPECT_DOUBLE_EQ(loc.pages[0].spans[0].end, 1.0);
}

TEST(Locate, AggressiveMergesAcrossWords) {
    /* "car pet" matches "carpet" once spaces are stripped */
    auto idx = build_page_index(1, {run("the car pet shop", 0, 700)});
    EXPECT_FALSE(match_strict(idx, "carpet"));

    auto r = match_aggressive(idx, "carpet");
    ASSERT_TRUE(r);
    EXPECT_EQ(r->first, 4u);
    EXPECT_EQ(r->last, 10u);
    EXPECT_EQ(covered(idx, *r), "car pet");

    LocateOptions opts;
    opts.aggressive = false;
    EXPECT_FALSE(locate_phrase("carpet", idx, nullptr, nullptr, opts).found());
}

/* ── bridging ──────────────────────────────────────────────────────── */

TEST(Locate, BridgesIntoNextPage) {
    auto p1 = build_page_index(1, {run("It was the best of", 0, 100, 180)});
    auto p2 = build_page_index(2, {run("times it was", 0, 700, 120)});

    LocateOptions opts;
    Location loc = locate_phrase("best of times", p1, nullptr, &p2, opts);
    ASSERT_TRUE(loc.found());
    ASSERT_EQ(loc.pages.size(), 2u);

    EXPECT_EQ(loc.pages[0].page_number, 1);
    ASSERT_EQ(loc.pages[0].spans.size(), 1u);
    EXPECT_EQ(loc.pages[0].spans[0].run, 0u);
    EXPECT_DOUBLE_EQ(loc.pages[0].spans[0].start, 11.0 / 18.0);
    EXPECT_DOUBLE_EQ(loc.pages[0].spans[0].end, 1.0);

    EXPECT_EQ(loc.pages[1].page_number, 2);
    ASSERT_EQ(loc.pages[1].spans.size(), 1u);
    EXPECT_EQ(loc.pages[1].spans[0].run, 0u);
    EXPECT_DOUBLE_EQ(loc.pages[1].spans[0].start, 0.0);
    EXPECT_DOUBLE_EQ(loc.pages[1].spans[0].end, 5.0 / 12.0);
}

TEST(Locate, BridgesFromPreviousPage) {
    auto p1 = build_page_index(1, {run("It was the best of", 0, 100)});
    auto p2 = build_page_index(2, {run("times it was", 0, 700)});

    LocateOptions opts;
    Location loc = locate_phrase("best of times", p2, &p1, nullptr, opts);
    ASSERT_EQ(loc.pages.size(), 2u);
    EXPECT_EQ(loc.pages[0].page_number, 1);
    EXPECT_EQ(loc.pages[1].page_number, 2);
}

TEST(Locate, BridgingCanBeDisabled) {
    auto p1 = build_page_index(1, {run("It was the best of", 0, 100)});
    auto p2 = build_page_index(2, {run("times it was", 0, 700)});

    LocateOptions opts;
    opts.bridging = false;
    EXPECT_FALSE(locate_phrase("best of times", p1, nullptr, &p2, opts).found());
}

TEST(Locate, PrimaryPageWinsOverNeighbors) {
    auto p1 = build_page_index(1, {run("shared words", 0, 100)});
    auto p2 = build_page_index(2, {run("shared words", 0, 700)});

    LocateOptions opts;
    Location loc = locate_phrase("shared words", p2, &p1, nullptr, opts);
    ASSERT_EQ(loc.pages.size(), 1u);
    EXPECT_EQ(loc.pages[0].page_number, 2);
}

/* ── suggester ─────────────────────────────────────────────────────── */

TEST(Locate, SuggestionMustBeOnThePage) {
    auto idx = build_page_index(4, {run("The Quick brown fox", 0, 700)});
    Diagnostics diag;

    PhraseSuggester good = [](const std::string& text, const std::string&) {
        EXPECT_EQ(text, "The Quick brown fox");
        return std::optional<std::string>("Quick brown");
    };
    LocateOptions opts;
    opts.suggester = &good;
    opts.diag      = &diag;
    Location loc = locate_phrase("quikc brown", idx, nullptr, nullptr, opts);
    EXPECT_EQ(loc.strategy, MatchStrategy::Suggested);
    EXPECT_EQ(diag.count(DiagKind::SuggestionRejected), 0u);

    PhraseSuggester invented = [](const std::string&, const std::string&) {
        return std::optional<std::string>("quack brown");
    };
    opts.suggester = &invented;
    loc = locate_phrase("quikc brown", idx, nullptr, nullptr, opts);
    EXPECT_FALSE(loc.found());
    EXPECT_EQ(diag.count(DiagKind::SuggestionRejected), 1u);

    PhraseSuggester none = [](const std::string&, const std::string&) {
        return std::optional<std::string>();
    };
    opts.suggester = &none;
    EXPECT_FALSE(locate_phrase("quikc brown", idx, nullptr, nullptr, opts).found());
    EXPECT_EQ(diag.count(DiagKind::SuggestionRejected), 1u);
}
