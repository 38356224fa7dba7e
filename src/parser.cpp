#include "parser.hpp"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

bool read_file(const std::string& path, std::string& out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return false;
    std::ostringstream oss; oss << ifs.rdbuf();
    out = std::move(oss).str();
    return true;
}

// "id" and "timerId" show up as numbers or strings depending on the producer
static std::string scalar_to_string(const json& v)
{
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_unsigned()) return std::to_string(v.get<uint64_t>());
    if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
    if (v.is_number_float()) return std::to_string(v.get<double>());
    return {};
}

static std::string string_or_empty(const json& o, const char* key)
{
    auto it = o.find(key);
    if (it == o.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

static void parse_event_args(const json& args, TraceEvent& e)
{
    if (!args.is_object()) return;

    e.argName = string_or_empty(args, "name");
    e.fileName = string_or_empty(args, "fileName");
    // navigationStart carries its frame at args.frame, most others at args.data.frame
    e.frame = string_or_empty(args, "frame");

    auto dataIt = args.find("data");
    if (dataIt == args.end() || !dataIt->is_object())
        return;
    const json& data = *dataIt;

    e.url = string_or_empty(data, "url");
    if (data.contains("frame")) e.frame = string_or_empty(data, "frame");
    e.isLoadingMainFrame = data.value("isLoadingMainFrame", false);
    if (auto it = data.find("timerId"); it != data.end())
        e.timerId = scalar_to_string(*it);

    if (auto it = data.find("stackTrace"); it != data.end() && it->is_array())
    {
        for (const auto& frame : *it)
        {
            if (frame.is_object())
                e.stackUrls.push_back(string_or_empty(frame, "url"));
        }
    }

    if (auto it = data.find("frames"); it != data.end() && it->is_array())
    {
        for (const auto& f : *it)
        {
            if (!f.is_object()) continue;
            TraceEvent::Frame fr;
            fr.frame = string_or_empty(f, "frame");
            fr.parent = string_or_empty(f, "parent");
            fr.processId = f.value("processId", 0u);
            e.frames.push_back(std::move(fr));
        }
    }
}

static void parse_event_object(const json& o, std::vector<TraceEvent>& out)
{
    if (!o.is_object()) return;

    TraceEvent e;
    e.name = string_or_empty(o, "name");
    e.category = string_or_empty(o, "cat");
    const std::string ph = string_or_empty(o, "ph");
    e.ph = ph.empty() ? 'X' : ph.front();
    e.ts = o.value("ts", 0ull);
    e.hasDur = o.contains("dur");
    e.dur = o.value("dur", 0ull);
    e.pid = o.value("pid", 0u);
    e.tid = o.value("tid", 0u);
    if (auto it = o.find("id"); it != o.end())
        e.id = scalar_to_string(*it);
    if (auto it = o.find("args"); it != o.end())
        parse_event_args(*it, e);

    out.push_back(std::move(e));
}

// ---------- API ----------
bool parse_trace_payload(const std::string& jsonText, std::vector<TraceEvent>& outEvents, std::string* outError)
{
    outEvents.clear();

    json root;
    try
    {
        root = json::parse(jsonText);
    }
    catch (const std::exception& e)
    {
        if (outError)
            *outError = e.what();
        return false;
    }

    try
    {
        // 1) {"traceEvents":[...], "metadata":{...}}
        if (root.is_object() && root.contains("traceEvents"))
        {
            const json& evs = root["traceEvents"];
            if (!evs.is_array())
            {
                if (outError) *outError = "\"traceEvents\" is not an array";
                return false;
            }
            outEvents.reserve(evs.size());
            for (const auto& it : evs)
                parse_event_object(it, outEvents);
        }
        // 2) bare array
        else if (root.is_array())
        {
            outEvents.reserve(root.size());
            for (const auto& it : root)
                parse_event_object(it, outEvents);
        }
        // 3) Unique
        else if (root.is_object() && root.contains("ph"))
        {
            parse_event_object(root, outEvents);
        }
        else
        {
            if (outError) *outError = "Unsupported JSON root";
            return false;
        }
    }
    catch (const json::exception& e)
    {
        // wrongly typed field (e.g. "ts" as a string)
        outEvents.clear();
        if (outError) *outError = e.what();
        return false;
    }

    spdlog::debug("trace payload: {} events", outEvents.size());
    return true;
}
