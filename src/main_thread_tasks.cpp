#include "main_thread_tasks.hpp"
#include "task_groups.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_map>

namespace
{
    // Children may overrun their parent by this much (µs) before the trace is rejected.
    constexpr uint64_t kOverrunToleranceUs = 1000;

    bool isTaskPhase(char ph) { return ph == 'X' || ph == 'B' || ph == 'E'; }
    bool isInstantPhase(char ph) { return ph == 'I' || ph == 'i' || ph == 'n'; }

    struct RawTask
    {
        const TraceEvent* ev;
        uint64_t start;
        uint64_t end;
        bool unbounded;
    };

    // Lists stay short (a few URLs per task); a linear scan keeps them ordered and unique.
    void appendUrl(std::vector<std::string>& list, const std::string& url)
    {
        if (url.empty()) return;
        if (std::find(list.begin(), list.end(), url) != list.end()) return;
        list.push_back(url);
    }

    void appendUrls(std::vector<std::string>& list, const std::vector<std::string>& urls)
    {
        for (const auto& u : urls) appendUrl(list, u);
    }

    /// Pair B/E events (per name, as a stack) and take X events as they are.
    std::vector<RawTask> collectRawTasks(const std::vector<const TraceEvent*>& evs, const MainThreadInfo& info)
    {
        std::vector<RawTask> raw;
        raw.reserve(evs.size());
        std::unordered_map<std::string, std::vector<const TraceEvent*>> open;

        for (const TraceEvent* e : evs)
        {
            if (e->ph == 'X')
            {
                if (e->hasDur)
                    raw.push_back({ e, e->ts, e->ts + e->dur, false });
                else
                    raw.push_back({ e, e->ts, std::max(e->ts, info.traceEnd), true });
            }
            else if (e->ph == 'B')
            {
                open[e->name].push_back(e);
            }
            else if (e->ph == 'E')
            {
                auto it = open.find(e->name);
                if (it == open.end() || it->second.empty())
                {
                    // started before the capture window
                    spdlog::warn("unmatched end event '{}' at {} us", e->name, e->ts);
                    raw.push_back({ e, std::min(info.firstTs, e->ts), e->ts, true });
                    continue;
                }
                const TraceEvent* b = it->second.back();
                it->second.pop_back();
                raw.push_back({ b, b->ts, std::max(b->ts, e->ts), false });
            }
        }

        for (auto& kv : open)
        {
            for (const TraceEvent* b : kv.second)
            {
                spdlog::warn("unmatched begin event '{}' at {} us, ending at trace end", b->name, b->ts);
                raw.push_back({ b, b->ts, std::max(b->ts, info.traceEnd), true });
            }
        }
        return raw;
    }

    std::vector<std::string> ownUrlsOf(const TraceEvent& ev)
    {
        std::vector<std::string> urls;
        if (ev.name == "v8.compile" || ev.name == "EvaluateScript" || ev.name == "FunctionCall")
        {
            urls.push_back(ev.url);
            urls.insert(urls.end(), ev.stackUrls.begin(), ev.stackUrls.end());
        }
        else if (ev.name == "v8.compileModule")
        {
            urls.push_back(ev.fileName);
            urls.insert(urls.end(), ev.stackUrls.begin(), ev.stackUrls.end());
        }
        else
        {
            urls = ev.stackUrls;
        }
        return urls;
    }
} // namespace

bool find_main_thread(const std::vector<TraceEvent>& events, MainThreadInfo& out, std::string* outError)
{
    out = MainThreadInfo{};

    // main frame renderer, when the trace says which one it is
    bool hasMainPid = false;
    uint32_t mainPid = 0;
    std::string mainFrame;
    for (const auto& e : events)
    {
        if (e.name == "TracingStartedInBrowser")
        {
            auto it = std::find_if(e.frames.begin(), e.frames.end(), [](const TraceEvent::Frame& f) { return f.parent.empty(); });
            if (it != e.frames.end() && it->processId != 0)
            {
                mainPid = it->processId;
                mainFrame = it->frame;
                hasMainPid = true;
                break;
            }
        }
        else if (e.name == "TracingStartedInPage")
        {
            mainPid = e.pid;
            hasMainPid = true;
            break;
        }
    }

    const TraceEvent* mainThread = nullptr;
    for (const auto& e : events)
    {
        if (e.ph != 'M' || e.name != "thread_name" || e.argName != "CrRendererMain")
            continue;
        if (!hasMainPid || e.pid == mainPid)
        {
            mainThread = &e;
            break;
        }
        if (!mainThread) mainThread = &e;
    }
    if (!mainThread)
    {
        if (outError) *outError = "No main thread found in trace";
        return false;
    }
    out.pid = mainThread->pid;
    out.tid = mainThread->tid;

    uint64_t firstTs = std::numeric_limits<uint64_t>::max();
    uint64_t navStart = std::numeric_limits<uint64_t>::max();
    uint64_t traceEnd = 0;
    for (const auto& e : events)
    {
        if (e.ph == 'M') continue;
        traceEnd = std::max(traceEnd, e.ts + e.dur);
        if (e.pid != out.pid) continue;

        if (e.tid == out.tid && isTaskPhase(e.ph))
            firstTs = std::min(firstTs, e.ts);

        if (e.name == "navigationStart" && (mainFrame.empty() || e.frame.empty() || e.frame == mainFrame))
            navStart = std::min(navStart, e.ts);
    }
    if (firstTs == std::numeric_limits<uint64_t>::max())
        firstTs = 0;

    out.firstTs = firstTs;
    out.traceEnd = std::max(traceEnd, firstTs);
    // keep every start time non-negative
    out.timeOrigin = std::min(navStart, firstTs);
    return true;
}

bool build_main_thread_tasks(const std::vector<TraceEvent>& events, TaskForest& out, std::string* outError)
{
    out.tasks.clear();
    out.traceEnd = 0.0;

    MainThreadInfo info;
    if (!find_main_thread(events, info, outError))
        return false;

    // main-thread events, in time order
    std::vector<const TraceEvent*> evs;
    std::vector<const TraceEvent*> timerInstalls;
    for (const auto& e : events)
    {
        if (e.pid != info.pid || e.tid != info.tid) continue;
        if (isTaskPhase(e.ph)) evs.push_back(&e);
        else if (isInstantPhase(e.ph) && e.name == "TimerInstall" && !e.timerId.empty()) timerInstalls.push_back(&e);
    }
    std::stable_sort(evs.begin(), evs.end(), [](const TraceEvent* a, const TraceEvent* b) { return a->ts < b->ts; });

    std::vector<RawTask> raw = collectRawTasks(evs, info);
    std::stable_sort(raw.begin(), raw.end(), [](const RawTask& a, const RawTask& b)
    {
        if (a.start != b.start) return a.start < b.start;
        return (a.end - a.start) > (b.end - b.start);
    });

    auto toMs = [&](uint64_t us) { return (double(us) - double(info.timeOrigin)) / 1000.0; };

    // ---- nesting (sorted by start, then longest first => pre-order) ----
    std::vector<std::unique_ptr<TaskNode>> nodes;
    nodes.reserve(raw.size());
    std::vector<const TraceEvent*> nodeEvent;
    nodeEvent.reserve(raw.size());
    std::vector<uint64_t> nodeStartUs, nodeEndUs;
    nodeStartUs.reserve(raw.size());
    nodeEndUs.reserve(raw.size());
    std::vector<size_t> stack;

    for (auto& r : raw)
    {
        while (!stack.empty() && r.start >= nodeEndUs[stack.back()])
            stack.pop_back();

        TaskNode* parent = nullptr;
        if (!stack.empty())
        {
            const size_t pi = stack.back();
            if (r.end > nodeEndUs[pi])
            {
                const uint64_t overrun = r.end - nodeEndUs[pi];
                // an unbounded child has no real end: it stops with its parent
                if (!r.unbounded && overrun >= kOverrunToleranceUs)
                {
                    if (outError) *outError = "Fatal trace logic error - child cannot end after parent";
                    return false;
                }
                spdlog::warn("clamping '{}' to its parent end ({} us overrun)", r.ev->name, overrun);
                r.end = nodeEndUs[pi];
            }
            parent = nodes[pi].get();
        }

        auto node = std::make_unique<TaskNode>();
        node->eventName = r.ev->name;
        node->startTime = toMs(r.start);
        node->endTime = toMs(r.end);
        node->duration = double(r.end - r.start) / 1000.0;
        node->unbounded = r.unbounded;
        node->parent = parent;
        node->depth = parent ? parent->depth + 1 : 0;
        if (parent) parent->children.push_back(node.get());

        stack.push_back(nodes.size());
        nodes.push_back(std::move(node));
        nodeEvent.push_back(r.ev);
        nodeStartUs.push_back(r.start);
        nodeEndUs.push_back(r.end);
    }

    // ---- self time & group ----
    for (auto& n : nodes)
    {
        double childSum = 0.0;
        for (const TaskNode* c : n->children) childSum += c->duration;
        n->selfTime = std::max(0.0, n->duration - childSum);

        if (const TaskGroup* g = task_group_for_event(n->eventName))
            n->group = std::string(g->label);
        else if (n->parent)
            n->group = n->parent->group;
        else
            n->group = std::string(task_group(TaskGroupId::Other).label);
    }

    // ---- timers: installing task of each timerId ----
    std::unordered_map<std::string, size_t> timerInstaller;
    for (const TraceEvent* ti : timerInstalls)
    {
        size_t best = nodes.size();
        for (size_t i = 0; i < nodes.size(); ++i)
        {
            if (nodeStartUs[i] > ti->ts) break;
            if (ti->ts <= nodeEndUs[i] && (best == nodes.size() || nodes[i]->depth > nodes[best]->depth))
                best = i;
        }
        if (best != nodes.size())
            timerInstaller.emplace(ti->timerId, best);
    }

    // ---- attributable URLs ----
    // lineage: ancestors' own URLs then the task's own (top-down)
    std::vector<std::vector<std::string>> own(nodes.size());
    std::vector<std::vector<std::string>> lineage(nodes.size());
    std::unordered_map<const TaskNode*, size_t> index;
    index.reserve(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) index.emplace(nodes[i].get(), i);

    for (size_t i = 0; i < nodes.size(); ++i)
    {
        const TraceEvent& ev = *nodeEvent[i];
        if (ev.name == "TimerFire")
        {
            auto it = timerInstaller.find(ev.timerId);
            if (it != timerInstaller.end() && it->second < i)
                own[i] = lineage[it->second];
        }
        else
        {
            own[i] = ownUrlsOf(ev);
        }

        if (const TaskNode* p = nodes[i]->parent)
            lineage[i] = lineage[index.at(p)];
        appendUrls(lineage[i], own[i]);
    }

    // full list: lineage, then descendants' own URLs in pre-order
    for (size_t i = 0; i < nodes.size(); ++i)
    {
        std::vector<std::string> urls = lineage[i];
        for (size_t j = i + 1; j < nodes.size() && nodes[j]->depth > nodes[i]->depth; ++j)
            appendUrls(urls, own[j]);
        nodes[i]->attributableURLs = std::move(urls);
    }

    out.tasks = std::move(nodes);
    out.traceEnd = toMs(info.traceEnd);

    spdlog::debug("main thread pid={} tid={}: {} tasks, {} timers", info.pid, info.tid, out.tasks.size(), timerInstaller.size());
    return true;
}

bool validate_task_forest(const TaskForest& forest, std::string* outError)
{
    constexpr double kEps = 1e-6;

    std::unordered_map<const TaskNode*, size_t> seen;
    seen.reserve(forest.tasks.size());

    auto fail = [&](size_t i, const TaskNode& t, const char* what)
    {
        if (outError)
            *outError = "task #" + std::to_string(i) + " (" + t.eventName + "): " + what;
        return false;
    };

    for (size_t i = 0; i < forest.tasks.size(); ++i)
    {
        const TaskNode& t = *forest.tasks[i];
        if (!std::isfinite(t.startTime) || !std::isfinite(t.duration) || !std::isfinite(t.selfTime))
            return fail(i, t, "non-finite time");
        if (t.startTime < 0.0 || t.duration < 0.0 || t.selfTime < 0.0)
            return fail(i, t, "negative time");
        if (t.selfTime > t.duration + kEps)
            return fail(i, t, "selfTime exceeds duration");
        if (t.parent)
        {
            if (seen.find(t.parent) == seen.end())
                return fail(i, t, "parent does not precede child");
            if (t.startTime + kEps < t.parent->startTime ||
                t.startTime + t.duration > t.parent->startTime + t.parent->duration + kEps)
                return fail(i, t, "child outside its parent");
        }
        seen.emplace(&t, i);
    }
    return true;
}
