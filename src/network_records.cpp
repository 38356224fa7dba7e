#include "network_records.hpp"
#include "filter.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <unordered_map>

using json = nlohmann::json;

namespace
{
    struct TypeName { ResourceType type; const char* name; };

    constexpr std::array<TypeName, 17> kTypeNames{ {
        { ResourceType::Document,           "Document" },
        { ResourceType::Stylesheet,         "Stylesheet" },
        { ResourceType::Image,              "Image" },
        { ResourceType::Media,              "Media" },
        { ResourceType::Font,               "Font" },
        { ResourceType::Script,             "Script" },
        { ResourceType::TextTrack,          "TextTrack" },
        { ResourceType::XHR,                "XHR" },
        { ResourceType::Fetch,              "Fetch" },
        { ResourceType::EventSource,        "EventSource" },
        { ResourceType::WebSocket,          "WebSocket" },
        { ResourceType::Manifest,           "Manifest" },
        { ResourceType::SignedExchange,     "SignedExchange" },
        { ResourceType::Ping,               "Ping" },
        { ResourceType::CSPViolationReport, "CSPViolationReport" },
        { ResourceType::Preflight,          "Preflight" },
        { ResourceType::Other,              "Other" },
    } };

    constexpr std::string_view kScriptMimeTypes[] = {
        "application/javascript",
        "application/x-javascript",
        "application/ecmascript",
        "text/javascript",
        "text/ecmascript",
        "text/jscript",
        "module",
    };

    std::string stringOrEmpty(const json& o, const char* key)
    {
        auto it = o.find(key);
        if (it == o.end() || !it->is_string()) return {};
        return it->get<std::string>();
    }

    bool startsWith(std::string_view s, std::string_view prefix)
    {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }
} // namespace

ResourceType resource_type_from_string(std::string_view name)
{
    for (const auto& tn : kTypeNames)
    {
        if (name == tn.name) return tn.type;
    }
    return ResourceType::Other;
}

const char* resource_type_name(ResourceType t)
{
    for (const auto& tn : kTypeNames)
    {
        if (tn.type == t) return tn.name;
    }
    return "Other";
}

ResourceType resource_type_from_mime(std::string_view mimeType)
{
    // drop parameters ("text/javascript; charset=utf-8")
    const auto semi = mimeType.find(';');
    std::string mime(mimeType.substr(0, semi));
    for (auto& c : mime) c = tolower_ascii(c);
    while (!mime.empty() && mime.back() == ' ') mime.pop_back();

    for (auto m : kScriptMimeTypes)
    {
        if (mime == m) return ResourceType::Script;
    }
    if (mime == "text/css") return ResourceType::Stylesheet;
    if (mime == "text/html") return ResourceType::Document;
    if (startsWith(mime, "image/")) return ResourceType::Image;
    if (startsWith(mime, "font/") || mime == "application/font-woff") return ResourceType::Font;
    if (startsWith(mime, "audio/") || startsWith(mime, "video/")) return ResourceType::Media;
    return ResourceType::Other;
}

bool parse_devtools_log(const std::string& jsonText, std::vector<ResourceRecord>& out, std::string* outError)
{
    out.clear();

    json root;
    try
    {
        root = json::parse(jsonText);
    }
    catch (const std::exception& e)
    {
        if (outError) *outError = e.what();
        return false;
    }
    if (!root.is_array())
    {
        if (outError) *outError = "DevTools log must be a JSON array";
        return false;
    }

    // requestId -> index of its latest record
    std::unordered_map<std::string, size_t> latest;
    // records that got no type from the protocol
    std::vector<bool> typed;

    try
    {
        for (const auto& entry : root)
        {
            if (!entry.is_object()) continue;
            const std::string method = stringOrEmpty(entry, "method");
            auto pit = entry.find("params");
            if (pit == entry.end() || !pit->is_object()) continue;
            const json& params = *pit;

            if (method == "Network.requestWillBeSent")
            {
                ResourceRecord rec;
                rec.requestId = stringOrEmpty(params, "requestId");
                if (auto rit = params.find("request"); rit != params.end() && rit->is_object())
                    rec.url = stringOrEmpty(*rit, "url");
                rec.startTime = params.value("timestamp", 0.0);

                const std::string type = stringOrEmpty(params, "type");
                rec.resourceType = resource_type_from_string(type);
                typed.push_back(!type.empty());

                latest[rec.requestId] = out.size();
                out.push_back(std::move(rec));
            }
            else if (method == "Network.responseReceived")
            {
                auto it = latest.find(stringOrEmpty(params, "requestId"));
                if (it == latest.end())
                {
                    spdlog::debug("responseReceived for unknown request {}", stringOrEmpty(params, "requestId"));
                    continue;
                }
                ResourceRecord& rec = out[it->second];
                const std::string type = stringOrEmpty(params, "type");
                if (!type.empty())
                {
                    rec.resourceType = resource_type_from_string(type);
                    typed[it->second] = true;
                    if (rec.resourceType == ResourceType::Other && type != "Other")
                        spdlog::warn("unknown resource type '{}' for {}", type, rec.url);
                }
                if (auto rit = params.find("response"); rit != params.end() && rit->is_object())
                {
                    rec.mimeType = stringOrEmpty(*rit, "mimeType");
                    const std::string url = stringOrEmpty(*rit, "url");
                    if (!url.empty()) rec.url = url;
                }
            }
        }
    }
    catch (const json::exception& e)
    {
        out.clear();
        if (outError) *outError = e.what();
        return false;
    }

    for (size_t i = 0; i < out.size(); ++i)
    {
        if (!typed[i] && !out[i].mimeType.empty())
            out[i].resourceType = resource_type_from_mime(out[i].mimeType);
    }

    spdlog::debug("devtools log: {} network records", out.size());
    return true;
}
