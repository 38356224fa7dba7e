#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include <memory>

// =============== Trace event ===============
// producer: { name, cat, ph, ts, dur, pid, tid, id, args }
// Only the "args" fields used by the task builder are kept.
struct TraceEvent
{
    std::string name;       // "name"
    std::string category;   // "cat"
    char        ph = 'X';   // "ph" (phase)
    uint64_t    ts = 0;     // "ts"  (µs absolute)
    uint64_t    dur = 0;    // "dur" (µs)
    bool        hasDur = false;
    uint32_t    pid = 0;    // "pid"
    uint32_t    tid = 0;    // "tid"
    std::string id;         // "id" (string or number in the source)

    // ---- args ----
    std::string argName;            // args.name (thread_name / process_name)
    std::string url;                // args.data.url
    std::string fileName;           // args.fileName (v8.compileModule)
    std::string frame;              // args.data.frame
    std::string timerId;            // args.data.timerId
    bool        isLoadingMainFrame = false;
    std::vector<std::string> stackUrls;   // args.data.stackTrace[].url

    // args.data.frames[] of TracingStartedInBrowser
    struct Frame
    {
        std::string frame;
        std::string parent;
        uint32_t    processId = 0;
    };
    std::vector<Frame> frames;
};

// =============== Task ===============
// Node of the main-thread task forest. Times are in ms relative to the trace time origin.
// Nodes are owned by TaskForest; parent/children are non-owning links.
struct TaskNode
{
    std::string eventName;
    std::string group;          // group label ("Script Evaluation", ...)
    double startTime = 0.0;
    double endTime = 0.0;
    double duration = 0.0;      // inclusive of descendants
    double selfTime = 0.0;
    bool   unbounded = false;
    int    depth = 0;

    const TaskNode* parent = nullptr;
    std::vector<const TaskNode*> children;

    std::vector<std::string> attributableURLs;
};

// All tasks of the main thread, flat, in traversal order (pre-order, by start time).
struct TaskForest
{
    std::vector<std::unique_ptr<TaskNode>> tasks;
    double traceEnd = 0.0;      // ms, relative to the same origin

    size_t size() const { return tasks.size(); }
    bool empty() const { return tasks.empty(); }
};

// =============== Network ===============
enum class ResourceType
{
    Document, Stylesheet, Image, Media, Font, Script, TextTrack, XHR, Fetch,
    EventSource, WebSocket, Manifest, SignedExchange, Ping, CSPViolationReport,
    Preflight, Other
};

struct ResourceRecord
{
    std::string  requestId;
    std::string  url;
    std::string  mimeType;
    ResourceType resourceType = ResourceType::Other;
    double       startTime = 0.0;   // seconds, protocol clock
};

// =============== Report ===============
struct AttributedRow
{
    std::string url;
    std::string group;
    double start = 0.0;
    double self = 0.0;
    double duration = 0.0;

    double end() const { return start + duration; }
};
