#pragma once

#include <QString>
#include <utility>
#include <vector>

#include "planner/data/Task.hpp"

namespace planner {
namespace data {

struct ScheduledTask
{
    TaskItem task;
    int allocatedMinutes = 0;
    int remainingMinutes = 0;
    double completionPercentage = 0.0;
    int scheduleOrder = 0;
    bool partial = false;
    int recommendedBreakMinutes = 0;
    QString breakSuggestion;
};

struct Allocation
{
    std::vector<ScheduledTask> scheduled;
    std::vector<TaskItem> unscheduled;

    int totalAllocatedMinutes() const;
};

struct TimeSlot
{
    QString name;
    int minutes = 0;
};

constexpr const char *UnscheduledSlotName = "Unscheduled";

struct SlotPlan
{
    // Slots in the order they were planned.
    std::vector<std::pair<QString, std::vector<ScheduledTask>>> entries;
    std::vector<TaskItem> unscheduled;

    const std::vector<ScheduledTask> *slot(const QString &name) const;
};

enum class SessionKind
{
    Focus,
    ShortBreak,
    LongBreak,
};

struct Session
{
    SessionKind kind = SessionKind::Focus;
    int durationMinutes = 0;
    // Focus sessions only.
    TaskItem task;
    int sessionIndex = 0;
    int sessionCount = 0;
    int focusNumber = 0;
    // Break sessions only.
    QString suggestion;

    bool isBreak() const { return kind != SessionKind::Focus; }
};

} // namespace data
} // namespace planner
