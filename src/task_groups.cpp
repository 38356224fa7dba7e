#include "task_groups.hpp"

#include <algorithm>

namespace
{
    constexpr std::array<TaskGroup, 7> kGroups{ {
        { TaskGroupId::ParseHTML,            "parseHTML",            "Parse HTML & CSS" },
        { TaskGroupId::StyleLayout,          "styleLayout",          "Style & Layout" },
        { TaskGroupId::PaintCompositeRender, "paintCompositeRender", "Rendering" },
        { TaskGroupId::ScriptParseCompile,   "scriptParseCompile",   "Script Parsing & Compilation" },
        { TaskGroupId::ScriptEvaluation,     "scriptEvaluation",     "Script Evaluation" },
        { TaskGroupId::GarbageCollection,    "garbageCollection",    "Garbage Collection" },
        { TaskGroupId::Other,                "other",                "Other" },
    } };

    struct EventGroup
    {
        std::string_view eventName;
        TaskGroupId      group;
    };

    constexpr EventGroup kEventGroups[] = {
        { "ParseHTML",                                   TaskGroupId::ParseHTML },
        { "ParseAuthorStyleSheet",                       TaskGroupId::ParseHTML },

        { "ScheduleStyleRecalculation",                  TaskGroupId::StyleLayout },
        { "UpdateLayoutTree",                            TaskGroupId::StyleLayout },
        { "InvalidateLayout",                            TaskGroupId::StyleLayout },
        { "Layout",                                      TaskGroupId::StyleLayout },

        { "Animation",                                   TaskGroupId::PaintCompositeRender },
        { "RequestMainThreadFrame",                      TaskGroupId::PaintCompositeRender },
        { "ActivateLayerTree",                           TaskGroupId::PaintCompositeRender },
        { "DrawFrame",                                   TaskGroupId::PaintCompositeRender },
        { "HitTest",                                     TaskGroupId::PaintCompositeRender },
        { "PaintSetup",                                  TaskGroupId::PaintCompositeRender },
        { "Paint",                                       TaskGroupId::PaintCompositeRender },
        { "PaintImage",                                  TaskGroupId::PaintCompositeRender },
        { "Rasterize",                                   TaskGroupId::PaintCompositeRender },
        { "RasterTask",                                  TaskGroupId::PaintCompositeRender },
        { "ScrollLayer",                                 TaskGroupId::PaintCompositeRender },
        { "UpdateLayer",                                 TaskGroupId::PaintCompositeRender },
        { "UpdateLayerTree",                             TaskGroupId::PaintCompositeRender },
        { "CompositeLayers",                             TaskGroupId::PaintCompositeRender },

        { "v8.compile",                                  TaskGroupId::ScriptParseCompile },
        { "v8.compileModule",                            TaskGroupId::ScriptParseCompile },
        { "v8.parseOnBackground",                        TaskGroupId::ScriptParseCompile },

        { "EventDispatch",                               TaskGroupId::ScriptEvaluation },
        { "EvaluateScript",                              TaskGroupId::ScriptEvaluation },
        { "v8.evaluateModule",                           TaskGroupId::ScriptEvaluation },
        { "FunctionCall",                                TaskGroupId::ScriptEvaluation },
        { "TimerFire",                                   TaskGroupId::ScriptEvaluation },
        { "FireIdleCallback",                            TaskGroupId::ScriptEvaluation },
        { "FireAnimationFrame",                          TaskGroupId::ScriptEvaluation },
        { "RunMicrotasks",                               TaskGroupId::ScriptEvaluation },
        { "V8.Execute",                                  TaskGroupId::ScriptEvaluation },

        { "GCEvent",                                     TaskGroupId::GarbageCollection },
        { "MinorGC",                                     TaskGroupId::GarbageCollection },
        { "MajorGC",                                     TaskGroupId::GarbageCollection },
        { "ThreadState::performIdleLazySweep",           TaskGroupId::GarbageCollection },
        { "ThreadState::completeSweep",                  TaskGroupId::GarbageCollection },
        { "BlinkGCMarking",                              TaskGroupId::GarbageCollection },

        { "MessageLoop::RunTask",                        TaskGroupId::Other },
        { "TaskQueueManager::ProcessTaskFromWorkQueue",  TaskGroupId::Other },
        { "ThreadControllerImpl::DoWork",                TaskGroupId::Other },
    };
} // namespace

const std::array<TaskGroup, 7>& task_groups()
{
    return kGroups;
}

const TaskGroup& task_group(TaskGroupId id)
{
    return kGroups[static_cast<size_t>(id)];
}

const TaskGroup* task_group_for_event(std::string_view eventName)
{
    for (const auto& eg : kEventGroups)
    {
        if (eg.eventName == eventName)
            return &task_group(eg.group);
    }
    return nullptr;
}

const TaskGroup& task_group_by_label(std::string_view label)
{
    auto it = std::find_if(kGroups.begin(), kGroups.end(), [&](const TaskGroup& g) { return g.label == label; });
    return it != kGroups.end() ? *it : task_group(TaskGroupId::Other);
}
