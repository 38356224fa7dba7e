#include "long_tasks.hpp"

#include <algorithm>
#include <array>

namespace
{
    // Overhead of the browser itself when no script triggered the task.
    constexpr std::array<std::string_view, 1> kBrowserTaskNames{
        "CpuProfiler::StartProfiling",
    };

    // Garbage collection overhead when no script triggered the task.
    constexpr std::array<std::string_view, 3> kBrowserGCTaskNames{
        "V8.GCCompactor",
        "MajorGC",
        "MinorGC",
    };

    template <size_t N>
    constexpr bool contains(const std::array<std::string_view, N>& set, std::string_view name)
    {
        for (auto s : set)
            if (s == name) return true;
        return false;
    }
} // namespace

bool is_browser_task_name(std::string_view eventName)
{
    return contains(kBrowserTaskNames, eventName);
}

bool is_browser_gc_task_name(std::string_view eventName)
{
    return contains(kBrowserGCTaskNames, eventName);
}

std::unordered_set<std::string> javascript_urls(const std::vector<ResourceRecord>& records)
{
    std::unordered_set<std::string> urls;
    for (const auto& r : records)
    {
        if (r.resourceType == ResourceType::Script)
            urls.insert(r.url);
    }
    return urls;
}

std::vector<const TaskNode*> select_long_tasks(const TaskForest& forest, double thresholdMs, size_t maxCount)
{
    std::vector<const TaskNode*> out;
    for (const auto& t : forest.tasks)
    {
        if (t->parent || t->unbounded) continue;
        if (t->duration < thresholdMs) continue;
        out.push_back(t.get());
    }

    std::stable_sort(out.begin(), out.end(), [](const TaskNode* a, const TaskNode* b) { return a->duration > b->duration; });
    if (out.size() > maxCount)
        out.resize(maxCount);
    return out;
}

std::string attributable_url_for_task(const TaskNode& task, const std::unordered_set<std::string>& jsUrls)
{
    const auto& urls = task.attributableURLs;
    auto js = std::find_if(urls.begin(), urls.end(), [&](const std::string& u) { return jsUrls.count(u) != 0; });

    std::string url;
    if (js != urls.end()) url = *js;
    else if (!urls.empty()) url = urls.front();

    if (url.empty() || url == kBlankPageUrl)
    {
        if (is_browser_task_name(task.eventName)) url = kBrowserLabel;
        else if (is_browser_gc_task_name(task.eventName)) url = kBrowserGCLabel;
        else url = kUnattributableLabel;
    }
    return url;
}

std::vector<AttributedRow> attribute_long_tasks(const TaskForest& forest, const std::unordered_set<std::string>& jsUrls, double thresholdMs)
{
    const auto selected = select_long_tasks(forest, thresholdMs);

    std::vector<AttributedRow> rows;
    rows.reserve(selected.size());
    for (const TaskNode* t : selected)
    {
        AttributedRow row;
        row.url = attributable_url_for_task(*t, jsUrls);
        row.group = t->group;
        row.start = t->startTime;
        row.self = t->selfTime;
        row.duration = t->duration;
        rows.push_back(std::move(row));
    }
    return rows;
}

std::optional<std::string> long_tasks_display_value(size_t count)
{
    if (count == 0) return std::nullopt;
    if (count == 1) return std::string("1 long task found");
    return std::to_string(count) + " long tasks found";
}
