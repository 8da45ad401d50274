#include "qcpack_types.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

static Correction make(CorrectionType type, const char* context,
                       std::vector<std::string> words) {
    Correction c;
    c.id      = "1";
    c.page    = 1;
    c.context = context;
    c.type    = type;
    c.words   = std::move(words);
    return c;
}

static AnnotationPlan plan_for(const Correction& c, const PageTextIndex& idx) {
    Location loc = locate_phrase(c.context, idx, nullptr, nullptr, LocateOptions{});
    EXPECT_TRUE(loc.found());
    if (!loc.found()) return {};
    return plan_annotation(c, idx, loc.pages[0].spans);
}

TEST(Annotate, PlaceSpanClamps) {
    TextRun r{"abcd", 10, 20, 40, 12};
    MarkSpan m = place_span(r, 3, -0.5, 2.0);
    EXPECT_EQ(m.run, 3u);
    EXPECT_DOUBLE_EQ(m.x0, 10);
    EXPECT_DOUBLE_EQ(m.x1, 50);
    EXPECT_DOUBLE_EQ(m.y, 20);
    EXPECT_DOUBLE_EQ(m.height, 12);
}

TEST(Annotate, PlaceSpanNeverZeroWidth) {
    TextRun r{"abcd", 10, 20, 40, 12};
    MarkSpan m = place_span(r, 0, 0.5, 0.5);
    EXPECT_NEAR(m.x1 - m.x0, kMinMarkWidth, 1e-9);
    EXPECT_NEAR((m.x0 + m.x1) / 2, 30, 1e-9);

    MarkSpan inverted = place_span(r, 0, 0.75, 0.25);
    EXPECT_GE(inverted.x1, inverted.x0 + kMinMarkWidth - 1e-9);
}

TEST(Annotate, MisreadEmphasisInsideContext) {
    auto idx = build_page_index(1, {{"the quick brown fox", 100, 700, 190, 10}});
    auto plan = plan_for(make(CorrectionType::Misread, "the quick brown fox", {"brown"}), idx);

    ASSERT_EQ(plan.underline.size(), 1u);
    EXPECT_NEAR(plan.underline[0].x0, 100, 1e-9);
    EXPECT_NEAR(plan.underline[0].x1, 290, 1e-9);

    ASSERT_EQ(plan.emphasis.size(), 1u);
    EXPECT_NEAR(plan.emphasis[0].x0, 200, 1e-9);
    EXPECT_NEAR(plan.emphasis[0].x1, 250, 1e-9);
    EXPECT_FALSE(plan.boundary_pair);
}

TEST(Annotate, EmphasisStaysInContextRuns) {
    auto idx = build_page_index(1, {{"brown bread", 0, 700, 110, 10},
                                    {"the quick brown fox", 0, 688, 190, 10}});
    auto plan = plan_for(make(CorrectionType::Misread, "quick brown fox", {"brown"}), idx);

    ASSERT_EQ(plan.emphasis.size(), 1u);
    EXPECT_EQ(plan.emphasis[0].run, 1u);
    EXPECT_DOUBLE_EQ(plan.emphasis[0].y, 688);
    EXPECT_NEAR(plan.emphasis[0].x0, 100, 1e-9);
}

TEST(Annotate, EmphasisNotTakenPastContextEnd) {
    auto idx = build_page_index(1, {{"the quick brown fox", 0, 700, 190, 10}});
    auto plan = plan_for(make(CorrectionType::Misread, "quick brown", {"fox"}), idx);
    EXPECT_EQ(plan.underline.size(), 1u);
    EXPECT_TRUE(plan.emphasis.empty());

    auto before = plan_for(make(CorrectionType::Misread, "brown fox", {"the"}), idx);
    EXPECT_TRUE(before.emphasis.empty());
}

TEST(Annotate, BridgedEmphasisSplitByPage) {
    auto p1 = build_page_index(1, {{"and then the", 0, 60, 120, 10}});
    auto p2 = build_page_index(2, {{"dog ran away", 0, 700, 120, 10}});
    Correction c = make(CorrectionType::Missing, "then the dog", {"the", "dog"});

    std::vector<ContextOnPage> parts = {{&p1, {{0, 4.0 / 12, 1.0}}},
                                        {&p2, {{0, 0.0, 3.0 / 12}}}};
    auto plans = plan_annotation(c, parts);
    ASSERT_EQ(plans.size(), 2u);
    ASSERT_EQ(plans[0].emphasis.size(), 1u);
    EXPECT_NEAR(plans[0].emphasis[0].x0, 90, 1e-9);
    ASSERT_EQ(plans[1].emphasis.size(), 1u);
    EXPECT_NEAR(plans[1].emphasis[0].x1, 30, 1e-9);
}

TEST(Annotate, InsertedBoundaryPair) {
    auto idx = build_page_index(1, {{"I am happy today", 0, 700, 160, 10}});
    auto plan = plan_for(make(CorrectionType::Inserted, "I am happy today", {"happy", "today"}), idx);

    EXPECT_TRUE(plan.boundary_pair);
    ASSERT_EQ(plan.emphasis.size(), 2u);
    EXPECT_NEAR(plan.emphasis[0].x0, 50, 1e-9);
    EXPECT_NEAR(plan.emphasis[0].x1, 100, 1e-9);
    EXPECT_NEAR(plan.emphasis[1].x0, 110, 1e-9);
    EXPECT_NEAR(plan.emphasis[1].x1, 160, 1e-9);
}

TEST(Annotate, InsertedMissingBoundaryKeepsUnderline) {
    auto idx = build_page_index(1, {{"I am happy today", 0, 700, 160, 10}});
    auto plan = plan_for(make(CorrectionType::Inserted, "I am happy today", {"happy", "tomorrow"}), idx);

    EXPECT_EQ(plan.underline.size(), 1u);
    EXPECT_TRUE(plan.emphasis.empty());
    EXPECT_FALSE(plan.boundary_pair);
}

TEST(Annotate, MissingPhraseAcrossRuns) {
    auto idx = build_page_index(1, {{"and then the", 0, 700, 120, 10},
                                    {"dog ran away", 0, 688, 120, 10}});
    auto plan = plan_for(make(CorrectionType::Missing, "then the dog ran", {"the", "dog", "ran"}), idx);

    ASSERT_EQ(plan.underline.size(), 2u);
    ASSERT_EQ(plan.emphasis.size(), 2u);
    EXPECT_EQ(plan.emphasis[0].run, 0u);
    EXPECT_EQ(plan.emphasis[1].run, 1u);
}

TEST(Annotate, UnmatchedWordsGiveNoEmphasis) {
    auto idx = build_page_index(1, {{"the quick brown fox", 0, 700, 190, 10}});
    auto plan = plan_for(make(CorrectionType::Misread, "quick brown", {"zebra"}), idx);
    EXPECT_EQ(plan.underline.size(), 1u);
    EXPECT_TRUE(plan.emphasis.empty());
}

TEST(Annotate, NoWordsEmphasizesWholeContext) {
    auto idx = build_page_index(1, {{"the quick brown fox", 0, 700, 190, 10}});
    auto plan = plan_for(make(CorrectionType::Misread, "quick brown", {}), idx);
    ASSERT_EQ(plan.emphasis.size(), plan.underline.size());
    EXPECT_DOUBLE_EQ(plan.emphasis[0].x0, plan.underline[0].x0);
    EXPECT_DOUBLE_EQ(plan.emphasis[0].x1, plan.underline[0].x1);
}

TEST(Annotate, EmptyContextSpansGiveEmptyPlan) {
    auto idx = build_page_index(1, {{"text", 0, 700, 40, 10}});
    auto plan = plan_annotation(make(CorrectionType::Misread, "text", {"text"}), idx, {});
    EXPECT_TRUE(plan.underline.empty());
    EXPECT_TRUE(plan.emphasis.empty());
}
