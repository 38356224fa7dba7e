#include "report.hpp"
#include "time_format.hpp"

#include <gtest/gtest.h>

namespace {

AuditResult sampleResult() {
    AuditResult r;
    r.meta = find_audit("long-tasks")->meta;
    r.headings = {
        {"url", "url", 1.0, "URL"},
        {"start", "ms", 10.0, "Start Time"},
        {"duration", "ms", 10.0, "Duration"},
    };
    r.items = {
        {"https://a.test/app.js", "Script Evaluation", 1234.0, 40.0, 1504.0},
        {"Unattributable", "Other", 88.0, 70.0, 73.0},
    };
    r.displayValue = "2 long tasks found";
    return r;
}

}  // namespace

// ---------------------------------------------------------------------------
// Number formatting
// ---------------------------------------------------------------------------

TEST(FormatMs, RoundsToGranularity) {
    EXPECT_EQ(format_ms(1234.4), "1,234 ms");
    EXPECT_EQ(format_ms(1234.0, 10.0), "1,230 ms");
    EXPECT_EQ(format_ms(1235.0, 10.0), "1,240 ms");
    EXPECT_EQ(format_ms(12.3, 0.5), "12.5 ms");
    EXPECT_EQ(format_ms(0.0, 10.0), "0 ms");
}

TEST(FormatMs, GroupsThousands) {
    EXPECT_EQ(format_ms(999.0), "999 ms");
    EXPECT_EQ(format_ms(1000.0), "1,000 ms");
    EXPECT_EQ(format_ms(1234567.0), "1,234,567 ms");
}

TEST(FmtMs, PicksUnit) {
    EXPECT_EQ(fmtMs(0.35), "350 us");
    EXPECT_EQ(fmtMs(12.5), "12.5 ms");
    EXPECT_EQ(fmtMs(250.0), "250 ms");
    EXPECT_EQ(fmtMs(1250.0), "1.250 s");
    EXPECT_EQ(fmtMs(123500.0), "02:03.500");
    EXPECT_EQ(fmtMs(-3.0), "0 us");
}

// ---------------------------------------------------------------------------
// Table cells and text
// ---------------------------------------------------------------------------

TEST(TableCell, UsesHeadingKeyAndGranularity) {
    const AuditResult r = sampleResult();
    EXPECT_EQ(table_cell(r.items[0], r.headings[0]), "https://a.test/app.js");
    EXPECT_EQ(table_cell(r.items[0], r.headings[1]), "1,230 ms");
    EXPECT_EQ(table_cell(r.items[0], r.headings[2]), "1,500 ms");
    EXPECT_EQ(table_cell(r.items[1], TableHeading{"group", "text", 1.0, "Group"}), "Other");
    EXPECT_EQ(table_cell(r.items[1], TableHeading{"end", "ms", 1.0, "End Time"}), "161 ms");
}

TEST(RenderText, TitleSummaryAndRows) {
    const std::string text = render_text(sampleResult());
    EXPECT_EQ(text.rfind("Long main thread tasks - 2 long tasks found\n", 0), 0u);
    EXPECT_NE(text.find("Start Time"), std::string::npos);
    EXPECT_NE(text.find("https://a.test/app.js"), std::string::npos);
    EXPECT_NE(text.find("Unattributable"), std::string::npos);
    // rows keep their order
    EXPECT_LT(text.find("https://a.test/app.js"), text.find("Unattributable"));
}

TEST(RenderText, EmptyResult) {
    AuditResult r = sampleResult();
    r.items.clear();
    r.displayValue.reset();
    r.notApplicable = true;
    EXPECT_EQ(render_text(r), "Long main thread tasks\n  (not applicable: no qualifying tasks)\n");

    r.notApplicable = false;
    EXPECT_EQ(render_text(r), "Long main thread tasks\n  (no tasks)\n");
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

TEST(ResultToJson, Shape) {
    const auto j = result_to_json(sampleResult());
    EXPECT_EQ(j["id"], "long-tasks");
    EXPECT_EQ(j["scoreDisplayMode"], "informative");
    EXPECT_DOUBLE_EQ(j["score"].get<double>(), 1.0);
    EXPECT_EQ(j["displayValue"], "2 long tasks found");
    EXPECT_FALSE(j["notApplicable"].get<bool>());

    const auto& details = j["details"];
    EXPECT_EQ(details["type"], "table");
    ASSERT_EQ(details["headings"].size(), 3u);
    EXPECT_FALSE(details["headings"][0].contains("granularity"));
    EXPECT_DOUBLE_EQ(details["headings"][1]["granularity"].get<double>(), 10.0);

    ASSERT_EQ(details["items"].size(), 2u);
    const auto& first = details["items"][0];
    EXPECT_EQ(first["url"], "https://a.test/app.js");
    // raw values, rounding is left to the presentation
    EXPECT_DOUBLE_EQ(first["start"].get<double>(), 1234.0);
    EXPECT_DOUBLE_EQ(first["duration"].get<double>(), 1504.0);
    EXPECT_FALSE(first.contains("end"));
}

TEST(ResultToJson, EndColumnAndNoSummary) {
    AuditResult r = sampleResult();
    r.headings.push_back({"end", "ms", 1.0, "End Time"});
    r.displayValue.reset();
    const auto j = result_to_json(r);
    EXPECT_FALSE(j.contains("displayValue"));
    EXPECT_DOUBLE_EQ(j["details"]["items"][1]["end"].get<double>(), 161.0);
}
