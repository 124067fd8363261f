#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <optional>
#include <vector>

#include "planner/data/Analytics.hpp"
#include "planner/data/Schedule.hpp"
#include "planner/data/Task.hpp"

namespace planner {
namespace data {

constexpr auto DefaultTaskTitle = "Untitled Task";

// Field decoders never fail; malformed values fall back to the documented
// default and the substitution is logged.
PriorityTier priorityFromJson(const QJsonValue &value);
QDate deadlineFromJson(const QJsonValue &value);
int estimatedMinutesFromJson(const QJsonValue &value);

TaskItem taskFromJson(const QJsonObject &object);
QJsonObject taskToJson(const TaskItem &task);

// Returns std::nullopt when the value is not an array. Non-object entries are skipped.
std::optional<std::vector<TaskItem>> tasksFromJson(const QJsonValue &value);
QJsonArray tasksToJson(const std::vector<TaskItem> &tasks);

// Returns std::nullopt for negative, non-numeric or out-of-int-range minute counts.
std::optional<int> minutesFromJson(const QJsonValue &value);

// Accepts [{"name": ..., "duration"|"minutes": ...}]. An empty or absent
// array yields an empty list; any malformed entry rejects the whole list.
std::optional<std::vector<TimeSlot>> slotsFromJson(const QJsonValue &value);

// Missing allocated_time means nothing was granted; derived fields are recomputed.
ScheduledTask scheduledTaskFromJson(const QJsonObject &object, int scheduleOrder);
std::optional<std::vector<ScheduledTask>> scheduleFromJson(const QJsonValue &value);
QJsonObject scheduledTaskToJson(const ScheduledTask &entry);
QJsonArray scheduleToJson(const std::vector<ScheduledTask> &schedule);
QJsonObject sessionToJson(const Session &session);
QJsonArray sessionsToJson(const std::vector<Session> &sessions);
QJsonObject slotPlanToJson(const SlotPlan &plan);

QJsonObject diagnosticsToJson(const ScheduleDiagnostics &diagnostics);
QJsonObject completionStatsToJson(const CompletionStats &stats);
QJsonObject completionEstimateToJson(const CompletionEstimate &estimate);

} // namespace data
} // namespace planner
