#include "long_tasks.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

namespace {

const std::unordered_set<std::string> kNoScripts;

}  // namespace

// ---------------------------------------------------------------------------
// Selector
// ---------------------------------------------------------------------------

TEST(SelectLongTasks, ThresholdIsInclusive) {
    ForestBuilder b;
    b.add("RunTask", 0, 49.9);
    b.add("RunTask", 100, 50.0);
    b.add("RunTask", 200, 50.1);
    const auto selected = select_long_tasks(b.forest());
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_DOUBLE_EQ(selected[0]->duration, 50.1);
    EXPECT_DOUBLE_EQ(selected[1]->duration, 50.0);
}

TEST(SelectLongTasks, OnlyTopLevelTasks) {
    ForestBuilder b;
    TaskNode* root = b.add("RunTask", 0, 300);
    b.add("FunctionCall", 10, 200, root);
    const auto selected = select_long_tasks(b.forest());
    ASSERT_EQ(selected.size(), 1u);
    EXPECT_EQ(selected[0], root);
}

TEST(SelectLongTasks, UnboundedTasksAreExcluded) {
    ForestBuilder b;
    b.add("RunTask", 0, 500, nullptr, {}, true);
    b.add("RunTask", 600, 60);
    const auto selected = select_long_tasks(b.forest());
    ASSERT_EQ(selected.size(), 1u);
    EXPECT_DOUBLE_EQ(selected[0]->duration, 60.0);
}

TEST(SelectLongTasks, KeepsTwentyLongest) {
    ForestBuilder b;
    for (int i = 0; i < 25; ++i)
        b.add("RunTask", i * 1000.0, 51.0 + i);
    const auto selected = select_long_tasks(b.forest());
    ASSERT_EQ(selected.size(), kMaxLongTasks);
    EXPECT_DOUBLE_EQ(selected.front()->duration, 75.0);
    EXPECT_DOUBLE_EQ(selected.back()->duration, 56.0);
}

TEST(SelectLongTasks, SortedByDurationDescending) {
    ForestBuilder b;
    b.add("RunTask", 0, 70);
    b.add("RunTask", 100, 300);
    b.add("RunTask", 500, 120);
    const auto selected = select_long_tasks(b.forest());
    ASSERT_EQ(selected.size(), 3u);
    for (size_t i = 1; i < selected.size(); ++i)
        EXPECT_GE(selected[i - 1]->duration, selected[i]->duration);
}

TEST(SelectLongTasks, EqualDurationsKeepTraversalOrder) {
    ForestBuilder b;
    TaskNode* first = b.add("RunTask", 0, 80);
    TaskNode* second = b.add("RunTask", 100, 80);
    TaskNode* third = b.add("RunTask", 200, 80);
    const auto selected = select_long_tasks(b.forest());
    ASSERT_EQ(selected.size(), 3u);
    EXPECT_EQ(selected[0], first);
    EXPECT_EQ(selected[1], second);
    EXPECT_EQ(selected[2], third);
}

TEST(SelectLongTasks, CustomThreshold) {
    ForestBuilder b;
    b.add("RunTask", 0, 20);
    b.add("RunTask", 100, 35);
    EXPECT_EQ(select_long_tasks(b.forest(), 30.0).size(), 1u);
    EXPECT_EQ(select_long_tasks(b.forest(), 10.0).size(), 2u);
}

// ---------------------------------------------------------------------------
// Attributor
// ---------------------------------------------------------------------------

TEST(AttributableUrl, KnownScriptWinsOverEarlierCandidate) {
    ForestBuilder b;
    TaskNode* t = b.add("RunTask", 0, 100, nullptr, {"https://a.test/page", "https://a.test/app.js"});
    EXPECT_EQ(attributable_url_for_task(*t, {"https://a.test/app.js"}), "https://a.test/app.js");
}

TEST(AttributableUrl, FirstCandidateWithoutKnownScript) {
    ForestBuilder b;
    TaskNode* t = b.add("RunTask", 0, 100, nullptr, {"https://a.test/one.js", "https://a.test/two.js"});
    EXPECT_EQ(attributable_url_for_task(*t, kNoScripts), "https://a.test/one.js");
}

TEST(AttributableUrl, BrowserBucketsByEventName) {
    ForestBuilder b;
    TaskNode* profiler = b.add("CpuProfiler::StartProfiling", 0, 100);
    TaskNode* major = b.add("MajorGC", 200, 100);
    TaskNode* minor = b.add("MinorGC", 400, 100);
    TaskNode* compactor = b.add("V8.GCCompactor", 600, 100);
    TaskNode* plain = b.add("RunTask", 800, 100);
    EXPECT_EQ(attributable_url_for_task(*profiler, kNoScripts), "Browser");
    EXPECT_EQ(attributable_url_for_task(*major, kNoScripts), "Browser GC");
    EXPECT_EQ(attributable_url_for_task(*minor, kNoScripts), "Browser GC");
    EXPECT_EQ(attributable_url_for_task(*compactor, kNoScripts), "Browser GC");
    EXPECT_EQ(attributable_url_for_task(*plain, kNoScripts), "Unattributable");
}

TEST(AttributableUrl, AboutBlankFallsBackToBuckets) {
    ForestBuilder b;
    TaskNode* gc = b.add("MajorGC", 0, 100, nullptr, {"about:blank"});
    TaskNode* other = b.add("RunTask", 200, 100, nullptr, {"about:blank"});
    EXPECT_EQ(attributable_url_for_task(*gc, kNoScripts), "Browser GC");
    EXPECT_EQ(attributable_url_for_task(*other, kNoScripts), "Unattributable");
}

TEST(AttributableUrl, RealUrlBeatsBrowserBucket) {
    ForestBuilder b;
    TaskNode* gc = b.add("MajorGC", 0, 100, nullptr, {"https://a.test/app.js"});
    EXPECT_EQ(attributable_url_for_task(*gc, kNoScripts), "https://a.test/app.js");
}

TEST(AttributeLongTasks, RowCarriesTaskFields) {
    ForestBuilder b;
    TaskNode* root = b.add("RunTask", 12.5, 120, nullptr, {"https://a.test/app.js"});
    root->group = "Script Evaluation";
    b.add("FunctionCall", 20, 70, root);
    const auto rows = attribute_long_tasks(b.forest(), {"https://a.test/app.js"});
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].url, "https://a.test/app.js");
    EXPECT_EQ(rows[0].group, "Script Evaluation");
    EXPECT_DOUBLE_EQ(rows[0].start, 12.5);
    EXPECT_DOUBLE_EQ(rows[0].duration, 120.0);
    EXPECT_DOUBLE_EQ(rows[0].self, 50.0);
    EXPECT_DOUBLE_EQ(rows[0].end(), 132.5);
}

TEST(AttributeLongTasks, Deterministic) {
    ForestBuilder b;
    for (int i = 0; i < 30; ++i)
        b.add(i % 3 == 0 ? "MajorGC" : "RunTask", i * 200.0, 40.0 + (i % 7) * 10.0, nullptr,
              i % 2 ? std::vector<std::string>{"https://a.test/" + std::to_string(i) + ".js"} : std::vector<std::string>{});
    const std::unordered_set<std::string> js{"https://a.test/3.js"};
    const auto a = attribute_long_tasks(b.forest(), js);
    const auto c = attribute_long_tasks(b.forest(), js);
    ASSERT_EQ(a.size(), c.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].url, c[i].url);
        EXPECT_DOUBLE_EQ(a[i].start, c[i].start);
        EXPECT_DOUBLE_EQ(a[i].duration, c[i].duration);
    }
}

// ---------------------------------------------------------------------------
// Summary phrase
// ---------------------------------------------------------------------------

TEST(LongTasksDisplayValue, Pluralization) {
    EXPECT_FALSE(long_tasks_display_value(0).has_value());
    EXPECT_EQ(long_tasks_display_value(1).value(), "1 long task found");
    EXPECT_EQ(long_tasks_display_value(4).value(), "4 long tasks found");
}

// ---------------------------------------------------------------------------
// Scenarios
// ---------------------------------------------------------------------------

TEST(LongTasksScenario, NoQualifyingTasks) {
    ForestBuilder b;
    b.add("RunTask", 0, 10);
    b.add("RunTask", 100, 49);
    const auto rows = attribute_long_tasks(b.forest(), kNoScripts);
    EXPECT_TRUE(rows.empty());
    EXPECT_FALSE(long_tasks_display_value(rows.size()).has_value());
}

TEST(LongTasksScenario, FourTasksWithoutUrls) {
    ForestBuilder b;
    for (int i = 0; i < 4; ++i)
        b.add("RunTask", i * 500.0, 200);
    const auto rows = attribute_long_tasks(b.forest(), kNoScripts);
    ASSERT_EQ(rows.size(), 4u);
    for (const auto& r : rows)
        EXPECT_EQ(r.url, "Unattributable");
    EXPECT_EQ(long_tasks_display_value(rows.size()).value(), "4 long tasks found");
}

TEST(LongTasksScenario, MixedDurations) {
    ForestBuilder b;
    b.add("RunTask", 0, 30);
    b.add("RunTask", 100, 100);
    b.add("RunTask", 300, 25);
    b.add("RunTask", 400, 50);
    const auto rows = attribute_long_tasks(b.forest(), kNoScripts);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_DOUBLE_EQ(rows[0].duration, 100.0);
    EXPECT_DOUBLE_EQ(rows[1].duration, 50.0);
    EXPECT_EQ(long_tasks_display_value(rows.size()).value(), "2 long tasks found");
}

TEST(LongTasksScenario, KnownScriptCandidate) {
    ForestBuilder b;
    b.add("RunTask", 0, 200, nullptr, {"https://a.test/app.js"});
    const auto rows = attribute_long_tasks(b.forest(), {"https://a.test/app.js"});
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].url, "https://a.test/app.js");
    EXPECT_EQ(long_tasks_display_value(rows.size()).value(), "1 long task found");
}
