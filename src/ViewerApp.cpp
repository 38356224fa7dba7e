#include "ViewerApp.hpp"
#include "long_tasks.hpp"
#include "utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <system_error>

// ---------- Row filter ----------
void ViewerApp::compileFilterIfNeeded()
{
    const char* patt = _filterText;
    const bool cs = _filterCaseSensitive;
    const bool rx = _filterRegex;

    // Recompile only if the UI state changed
    if (_filter_cached != patt || _filter_case_cached != cs || _filter_regex_cached != rx) {
        _filter_cached = patt;
        _filter_case_cached = cs;
        _filter_regex_cached = rx;
        if (!_filter.compile(_filter_cached, cs, rx))
            spdlog::debug("filter: bad regex \"{}\": {}", _filter_cached, _filter.error());
    }
}

// ---------- ViewerApp ----------
ViewerApp::ViewerApp(const AppConfig& cfg)
    : _analysis{}, _loaded{ false }, _ctx{}
    , _selected{ nullptr }, _showTaskInfo{ false }
    , _tracePath{}, _logPath{}
    , _thresholdMs{ float(cfg.thresholdMs) }, _appliedThresholdMs{ float(cfg.thresholdMs) }
    , _lastError{}
    , _autoReload{ cfg.autoReload }
    , _autoReloadInterval{ cfg.autoReloadIntervalS }, _autoReloadTimer{ 0.0 }
    , _traceMTime{}, _logMTime{}
    , _timeline{}, _longTasksPanel{}, _taskInfoPanel{}
    , _filterText{}
    , _filterCaseSensitive{ false }, _filterRegex{ false }
{
    std::snprintf(_tracePath, sizeof(_tracePath), "%s", cfg.tracePath.c_str());
    std::snprintf(_logPath, sizeof(_logPath), "%s", cfg.devtoolsLogPath.c_str());
}
ViewerApp::~ViewerApp() {}

bool ViewerApp::analyze(AuditArtifacts artifacts, double thresholdMs, Analysis& out, std::string* outError)
{
    const AuditDefinition* audit = find_audit("long-tasks");
    if (!audit)
    {
        if (outError) *outError = "long-tasks audit is not registered";
        return false;
    }

    AuditOptions opts;
    opts.thresholdMs = thresholdMs;
    if (!run_audit(*audit, artifacts, _ctx, opts, out.result, outError))
        return false;

    // both are cache hits after the audit
    if (!_ctx.mainThreadTasks(artifacts.traceJson, out.forest, outError))
        return false;
    if (!_ctx.networkRecords(artifacts.devtoolsLogJson, out.records, outError))
        return false;

    out.jsUrls = javascript_urls(*out.records);
    out.longTasks = select_long_tasks(*out.forest, thresholdMs);
    out.longSet = std::unordered_set<const TaskNode*>(out.longTasks.begin(), out.longTasks.end());
    out.artifacts = std::move(artifacts);
    return true;
}

bool ViewerApp::loadFiles(bool preserveView)
{
    if (_tracePath[0] == '\0')
    {
        _lastError = "No trace path";
        return false;
    }

    std::string err;
    AuditArtifacts artifacts;
    if (!load_artifacts(_tracePath, _logPath, artifacts, &err))
    {
        spdlog::error("{}", err);
        _lastError = err;
        return false;
    }

    // an explicit load starts from an empty cache; the shown analysis keeps its own results
    if (!preserveView)
        _ctx.clear();

    Analysis next;
    if (!analyze(std::move(artifacts), _thresholdMs, next, &err))
    {
        _lastError = err.empty() ? "Failed to analyze trace" : err;
        return false;
    }

    // an identical trace keeps its cached forest, and so the selection stays valid
    if (next.forest != _analysis.forest)
        _selected = nullptr;
    _analysis = std::move(next);
    _loaded = true;
    _appliedThresholdMs = _thresholdMs;
    // results of the previous file contents are no longer reachable
    _ctx.retainOnly(_analysis.artifacts);
    if (!preserveView)
        _timeline.reset(_analysis.forest->traceEnd);
    _lastError.clear();

    getFileMTime(_tracePath, _traceMTime);
    if (_logPath[0]) getFileMTime(_logPath, _logMTime);
    return true;
}

bool ViewerApp::reanalyze()
{
    if (!_loaded) return false;
    std::string err;
    Analysis next;
    if (!analyze(_analysis.artifacts, _thresholdMs, next, &err))
    {
        _lastError = err;
        return false;
    }
    _analysis = std::move(next);
    _appliedThresholdMs = _thresholdMs;
    return true;
}

bool ViewerApp::getFileMTime(const char* path, std::filesystem::file_time_type& out)
{
    std::error_code ec;
    const auto t = std::filesystem::last_write_time(path, ec);
    if (ec) return false;
    out = t;
    return true;
}

void ViewerApp::updateAutoReload()
{
    if (!_loaded || _tracePath[0] == '\0') return;
    std::filesystem::file_time_type trace, log;
    bool changed = getFileMTime(_tracePath, trace) && trace != _traceMTime;
    if (_logPath[0] && getFileMTime(_logPath, log) && log != _logMTime)
        changed = true;
    if (!changed) return;

    spdlog::info("{} changed on disk, reloading", _tracePath);
    loadFiles(true);
}

// --- Controls window ---
void ViewerApp::drawControls()
{
    ImGui::Begin("Controls");

    ImGui::InputText("Trace", _tracePath, sizeof(_tracePath));
    ImGui::InputText("DevTools log", _logPath, sizeof(_logPath));
    ImGui::SameLine();
    ImGui::TextDisabled("(optional)");
    if (ImGui::Button("Load"))
        loadFiles(false);

    ImGui::SetNextItemWidth(180.f);
    ImGui::InputFloat("Threshold (ms)", &_thresholdMs, 5.f, 25.f, "%.0f");
    _thresholdMs = std::max(0.f, _thresholdMs);
    if (ImGui::IsItemDeactivatedAfterEdit() && _thresholdMs != _appliedThresholdMs)
        reanalyze();
    if (_thresholdMs != float(kLongTaskThresholdMs))
    {
        ImGui::SameLine();
        if (ImGui::SmallButton("Reset"))
        {
            _thresholdMs = float(kLongTaskThresholdMs);
            reanalyze();
        }
    }

    ImGui::Checkbox("Auto-reload", &_autoReload);
    ImGui::SameLine();
    ImGui::SetNextItemWidth(120.0f);
    ImGui::SliderFloat("Interval (s)", &_autoReloadInterval, 0.2f, 5.0f, "%.1f");

    if (_loaded)
    {
        ImGui::Text("Tasks: %zu   Trace: %s   Scripts: %zu", _analysis.forest->size(),
            fmtMs(_analysis.forest->traceEnd).c_str(), _analysis.jsUrls.size());
        ImGui::Text("Cached forests: %zu   Cached records: %zu", _ctx.taskCache().size(), _ctx.recordCache().size());
    }
    if (!_lastError.empty())
        ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "Error: %s", _lastError.c_str());

    ImGui::SeparatorText("Filter");
    ImGui::Checkbox("Regex", &_filterRegex);
    ImGui::SameLine();
    ImGui::Checkbox("Case", &_filterCaseSensitive);
    ImGui::SetNextItemWidth(260.f);
    ImGui::InputText("URL / group", _filterText, sizeof(_filterText));
    compileFilterIfNeeded();
    if (!_filter.error().empty())
        ImGui::TextColored(ImVec4(1, 0.6f, 0.3f, 1), "Regex: %s", _filter.error().c_str());

    _autoReloadTimer += ImGui::GetIO().DeltaTime;
    if (_autoReload && _autoReloadTimer >= (double)_autoReloadInterval) {
        _autoReloadTimer = 0.0;
        updateAutoReload();
    }
    ImGui::End();
}

// --- drawUI (controls + report + timeline) ---
void ViewerApp::drawUI()
{
    drawControls();

    if (!_loaded)
    {
        ImGui::Begin("Timeline", nullptr, ImGuiWindowFlags_NoBringToFrontOnFocus);
        ImGui::TextDisabled("Load a trace to see its main thread tasks.");
        ImGui::End();
        return;
    }

    if (const TaskNode* clicked = _longTasksPanel.draw(_analysis.result, _analysis.longTasks, _filter, _selected))
    {
        _selected = clicked;
        _showTaskInfo = true;
        _timeline.focus(*clicked);
    }

    ImGui::Begin("Timeline", nullptr, ImGuiWindowFlags_NoBringToFrontOnFocus);
    const TaskNode* before = _selected;
    _timeline.draw(*_analysis.forest, _analysis.longSet, _filter, _appliedThresholdMs, _selected);
    if (_selected != before) _showTaskInfo = true;
    ImGui::End();

    if (_showTaskInfo && _selected)
        _taskInfoPanel.draw(_selected, _analysis.jsUrls, _showTaskInfo);
}
