#pragma once
#include "LongTasksPanel.hpp"
#include "TaskInfoPanel.hpp"
#include "TimelineView.hpp"
#include "analysis.hpp"
#include "audits.hpp"
#include "config.hpp"
#include "filter.hpp"

#include <vector>
#include <string>
#include <unordered_set>
#include <filesystem>

/// @brief ViewerApp: controls, analysis state and the viewer windows.
class ViewerApp
{
public:
    explicit ViewerApp(const AppConfig& cfg);
    ~ViewerApp();

    void drawUI();
    // Read both files and analyze them. preserveView keeps the timeline window and the selection.
    bool loadFiles(bool preserveView);
    void updateAutoReload();

private:
    // One analyzed load, replaced as a whole.
    struct Analysis
    {
        AuditArtifacts artifacts;
        TaskForestPtr forest;
        NetworkRecordsPtr records;
        std::unordered_set<std::string> jsUrls;
        AuditResult result;
        std::vector<const TaskNode*> longTasks;         // parallel to result.items
        std::unordered_set<const TaskNode*> longSet;
    };

    bool analyze(AuditArtifacts artifacts, double thresholdMs, Analysis& out, std::string* outError);
    // Re-run the audit on the loaded artifacts (threshold change); the cache keeps it cheap.
    bool reanalyze();

    void drawControls();

    // file mtimes
    static bool getFileMTime(const char* path, std::filesystem::file_time_type& out);

    void compileFilterIfNeeded();

private:
    Analysis _analysis;
    bool _loaded;
    AnalysisContext _ctx;

    const TaskNode* _selected;
    bool _showTaskInfo;

    // UI
    char _tracePath[1024];
    char _logPath[1024];
    float _thresholdMs;
    float _appliedThresholdMs;
    std::string _lastError;

    // auto reload
    bool _autoReload;
    // seconds
    float _autoReloadInterval;
    double _autoReloadTimer;
    std::filesystem::file_time_type _traceMTime;
    std::filesystem::file_time_type _logMTime;

    TimelineView _timeline;
    LongTasksPanel _longTasksPanel;
    TaskInfoPanel _taskInfoPanel;

    // filtering
    char _filterText[128];
    bool _filterCaseSensitive;
    bool _filterRegex;
    RowFilter _filter;
    std::string _filter_cached;
    bool _filter_case_cached = false;
    bool _filter_regex_cached = false;
};
