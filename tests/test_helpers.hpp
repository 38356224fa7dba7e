#pragma once
#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model.hpp"

// Synthetic Chrome trace: renderer pid 1, main thread tid 1, navigationStart at kBaseUs.
class TraceBuilder
{
public:
    static constexpr uint64_t kBaseUs = 1'000'000;

    TraceBuilder()
    {
        _events.push_back({ {"name", "thread_name"}, {"ph", "M"}, {"pid", 1}, {"tid", 1}, {"ts", 0},
                            {"args", { {"name", "CrRendererMain"} }} });
        _events.push_back({ {"name", "thread_name"}, {"ph", "M"}, {"pid", 1}, {"tid", 7}, {"ts", 0},
                            {"args", { {"name", "Compositor"} }} });
        _events.push_back({ {"name", "TracingStartedInBrowser"}, {"ph", "I"}, {"pid", 9}, {"tid", 9}, {"ts", kBaseUs},
                            {"args", { {"data", { {"frames", nlohmann::json::array({ { {"frame", "F1"}, {"processId", 1} } })} }} }} });
        _events.push_back({ {"name", "navigationStart"}, {"ph", "R"}, {"pid", 1}, {"tid", 1}, {"ts", kBaseUs},
                            {"args", { {"frame", "F1"}, {"data", { {"isLoadingMainFrame", true} }} }} });
    }

    // Complete ("X") event on the main thread; times in ms after navigationStart.
    TraceBuilder& task(const std::string& name, double startMs, double durMs, nlohmann::json data = nullptr)
    {
        nlohmann::json e = { {"name", name}, {"cat", "devtools.timeline"}, {"ph", "X"}, {"pid", 1}, {"tid", 1},
                             {"ts", us(startMs)}, {"dur", uint64_t(std::llround(durMs * 1000.0))} };
        if (!data.is_null()) e["args"] = { {"data", std::move(data)} };
        _events.push_back(std::move(e));
        return *this;
    }

    // "X" event without "dur": its end is never observed.
    TraceBuilder& openTask(const std::string& name, double startMs)
    {
        _events.push_back({ {"name", name}, {"ph", "X"}, {"pid", 1}, {"tid", 1}, {"ts", us(startMs)} });
        return *this;
    }

    TraceBuilder& begin(const std::string& name, double atMs)
    {
        _events.push_back({ {"name", name}, {"ph", "B"}, {"pid", 1}, {"tid", 1}, {"ts", us(atMs)} });
        return *this;
    }

    TraceBuilder& end(const std::string& name, double atMs)
    {
        _events.push_back({ {"name", name}, {"ph", "E"}, {"pid", 1}, {"tid", 1}, {"ts", us(atMs)} });
        return *this;
    }

    TraceBuilder& timerInstall(const std::string& timerId, double atMs)
    {
        _events.push_back({ {"name", "TimerInstall"}, {"ph", "I"}, {"pid", 1}, {"tid", 1}, {"ts", us(atMs)},
                            {"args", { {"data", { {"timerId", timerId} }} }} });
        return *this;
    }

    // Event on another thread of the renderer.
    TraceBuilder& otherThreadTask(const std::string& name, double startMs, double durMs)
    {
        _events.push_back({ {"name", name}, {"ph", "X"}, {"pid", 1}, {"tid", 7}, {"ts", us(startMs)},
                            {"dur", uint64_t(std::llround(durMs * 1000.0))} });
        return *this;
    }

    std::string str() const
    {
        return nlohmann::json{ {"traceEvents", _events} }.dump();
    }

private:
    static uint64_t us(double ms) { return kBaseUs + uint64_t(std::llround(ms * 1000.0)); }

    nlohmann::json _events = nlohmann::json::array();
};

// DevTools log with one requestWillBeSent (+ responseReceived) per URL.
inline std::string devtools_log(const std::vector<std::pair<std::string, std::string>>& urlAndType)
{
    nlohmann::json log = nlohmann::json::array();
    int id = 0;
    for (const auto& [url, type] : urlAndType)
    {
        const std::string rid = "r" + std::to_string(++id);
        log.push_back({ {"method", "Network.requestWillBeSent"},
                        {"params", { {"requestId", rid}, {"type", type}, {"timestamp", 1.0 + id},
                                     {"request", { {"url", url} }} }} });
        log.push_back({ {"method", "Network.responseReceived"},
                        {"params", { {"requestId", rid}, {"type", type},
                                     {"response", { {"url", url}, {"mimeType", "text/plain"} }} }} });
    }
    return log.dump();
}

// Hand-built forest for selector/attributor tests.
class ForestBuilder
{
public:
    TaskNode* add(const std::string& name, double start, double duration, TaskNode* parent = nullptr,
                  std::vector<std::string> urls = {}, bool unbounded = false)
    {
        auto node = std::make_unique<TaskNode>();
        node->eventName = name;
        node->group = "Other";
        node->startTime = start;
        node->duration = duration;
        node->endTime = start + duration;
        node->selfTime = duration;
        node->unbounded = unbounded;
        node->parent = parent;
        node->depth = parent ? parent->depth + 1 : 0;
        node->attributableURLs = std::move(urls);
        if (parent)
        {
            parent->children.push_back(node.get());
            parent->selfTime -= duration;
        }
        TaskNode* raw = node.get();
        _forest.tasks.push_back(std::move(node));
        _forest.traceEnd = std::max(_forest.traceEnd, start + duration);
        return raw;
    }

    const TaskForest& forest() const { return _forest; }

private:
    TaskForest _forest;
};
