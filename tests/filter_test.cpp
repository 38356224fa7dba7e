#include "filter.hpp"

#include <gtest/gtest.h>

TEST(ContainsIcase, Basics) {
    EXPECT_TRUE(contains_icase_ascii("https://A.test/App.js", "app.JS"));
    EXPECT_TRUE(contains_icase_ascii("anything", ""));
    EXPECT_FALSE(contains_icase_ascii("ab", "abc"));
    EXPECT_FALSE(contains_icase_ascii("Browser GC", "gcx"));
}

TEST(RowFilter, EmptyPatternMatchesEverything) {
    RowFilter f;
    ASSERT_TRUE(f.compile("", false, false));
    EXPECT_TRUE(f.match(std::string_view("whatever")));
}

TEST(RowFilter, Substring) {
    RowFilter f;
    ASSERT_TRUE(f.compile("APP", false, false));
    EXPECT_TRUE(f.match(std::string_view("https://a.test/app.js")));

    ASSERT_TRUE(f.compile("APP", true, false));
    EXPECT_FALSE(f.match(std::string_view("https://a.test/app.js")));
    EXPECT_TRUE(f.match(std::string_view("https://a.test/APP.js")));
}

TEST(RowFilter, Regex) {
    RowFilter f;
    ASSERT_TRUE(f.compile(R"(\.js$)", false, true));
    EXPECT_TRUE(f.match(std::string_view("https://a.test/app.JS")));
    EXPECT_FALSE(f.match(std::string_view("https://a.test/app.json")));
}

TEST(RowFilter, BadRegexLetsRowsThrough) {
    RowFilter f;
    EXPECT_FALSE(f.compile("(unclosed", false, true));
    EXPECT_FALSE(f.error().empty());
    EXPECT_TRUE(f.match(std::string_view("anything")));
}

TEST(RowFilter, MatchesUrlOrGroup) {
    const AttributedRow script{"https://a.test/app.js", "Script Evaluation", 0, 10, 60};
    const AttributedRow gc{"Browser GC", "Garbage Collection", 100, 60, 60};
    RowFilter f;
    ASSERT_TRUE(f.compile("garbage", false, false));
    EXPECT_FALSE(f.match(script));
    EXPECT_TRUE(f.match(gc));
    ASSERT_TRUE(f.compile("a.test", false, false));
    EXPECT_TRUE(f.match(script));
    EXPECT_FALSE(f.match(gc));
}

TEST(RowFilter, MatchesTaskOnNameGroupOrCandidateUrl) {
    TaskNode task;
    task.eventName = "TimerFire";
    task.group = "Script Evaluation";
    task.attributableURLs = {"https://a.test/page", "https://cdn.test/lib.js"};

    RowFilter f;
    ASSERT_TRUE(f.compile("timerfire", false, false));
    EXPECT_TRUE(f.match(task));
    ASSERT_TRUE(f.compile("cdn.test", false, false));
    EXPECT_TRUE(f.match(task));
    ASSERT_TRUE(f.compile("^Layout$", true, true));
    EXPECT_FALSE(f.match(task));
}
