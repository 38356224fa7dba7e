#include "report.hpp"
#include "time_format.hpp"

#include <algorithm>
#include <sstream>

using json = nlohmann::json;

namespace
{
    double numericField(const AttributedRow& row, const std::string& key)
    {
        if (key == "start") return row.start;
        if (key == "self") return row.self;
        if (key == "duration") return row.duration;
        if (key == "end") return row.end();
        return 0.0;
    }

    bool hasEndColumn(const AuditResult& r)
    {
        return std::any_of(r.headings.begin(), r.headings.end(), [](const TableHeading& h) { return h.key == "end"; });
    }
} // namespace

std::string table_cell(const AttributedRow& row, const TableHeading& heading)
{
    if (heading.key == "url") return row.url;
    if (heading.key == "group") return row.group;
    if (heading.itemType == "ms") return format_ms(numericField(row, heading.key), heading.granularity);
    return {};
}

std::string render_text(const AuditResult& result)
{
    std::ostringstream os;
    os << result.meta.title;
    if (result.displayValue) os << " - " << *result.displayValue;
    os << '\n';

    if (result.items.empty())
    {
        os << (result.notApplicable ? "  (not applicable: no qualifying tasks)\n" : "  (no tasks)\n");
        return os.str();
    }

    // column widths
    const size_t n = result.headings.size();
    std::vector<size_t> width(n);
    std::vector<std::vector<std::string>> cells;
    cells.reserve(result.items.size());
    for (size_t c = 0; c < n; ++c) width[c] = result.headings[c].text.size();
    for (const auto& row : result.items)
    {
        std::vector<std::string> line(n);
        for (size_t c = 0; c < n; ++c)
        {
            line[c] = table_cell(row, result.headings[c]);
            width[c] = std::max(width[c], line[c].size());
        }
        cells.push_back(std::move(line));
    }

    auto put = [&](size_t c, const std::string& s)
    {
        // text left, numbers right
        const bool right = result.headings[c].itemType == "ms";
        const std::string pad(width[c] - s.size(), ' ');
        os << "  " << (right ? pad + s : s + pad);
    };

    for (size_t c = 0; c < n; ++c) put(c, result.headings[c].text);
    os << '\n';
    for (size_t c = 0; c < n; ++c) put(c, std::string(width[c], '-'));
    os << '\n';
    for (const auto& line : cells)
    {
        for (size_t c = 0; c < n; ++c) put(c, line[c]);
        os << '\n';
    }
    return os.str();
}

json result_to_json(const AuditResult& result)
{
    json headings = json::array();
    for (const auto& h : result.headings)
    {
        json jh = { {"key", h.key}, {"itemType", h.itemType}, {"text", h.text} };
        if (h.itemType == "ms") jh["granularity"] = h.granularity;
        headings.push_back(std::move(jh));
    }

    const bool withEnd = hasEndColumn(result);
    json items = json::array();
    for (const auto& row : result.items)
    {
        json it = {
            {"url", row.url},
            {"group", row.group},
            {"start", row.start},
            {"self", row.self},
            {"duration", row.duration},
        };
        if (withEnd) it["end"] = row.end();
        items.push_back(std::move(it));
    }

    json out = {
        {"id", result.meta.id},
        {"title", result.meta.title},
        {"description", result.meta.description},
        {"score", result.score},
        {"scoreDisplayMode", score_display_mode_name(result.meta.scoreDisplayMode)},
        {"notApplicable", result.notApplicable},
        {"details", { {"type", "table"}, {"headings", std::move(headings)}, {"items", std::move(items)} }},
    };
    if (result.displayValue) out["displayValue"] = *result.displayValue;
    return out;
}
