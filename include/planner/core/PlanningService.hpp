#pragma once

#include <QDate>
#include <QJsonObject>
#include <QStringList>
#include <functional>
#include <vector>

#include "planner/core/SchedulerSettings.hpp"
#include "planner/data/Analytics.hpp"
#include "planner/data/Schedule.hpp"

namespace planner {
namespace data {
class TaskRepository;
}

namespace engine {
class BreakSuggestionProvider;
}

namespace core {

struct FlatSchedule
{
    int budgetMinutes = 0;
    data::Allocation allocation;
    data::ScheduleDiagnostics diagnostics;
};

/**
 * Entry point for callers outside the engine.
 *
 * Typed operations take plain task records; completed tasks are dropped before
 * any planning. handleRequest() is the JSON form of the same operations and
 * answers every request with a "success" flag, rejecting structurally invalid
 * input with an empty result instead of failing.
 */
class PlanningService
{
public:
    using Clock = std::function<QDate()>;

    explicit PlanningService(SchedulerSettings settings = SchedulerSettings(),
                             const engine::BreakSuggestionProvider *suggestions = nullptr,
                             Clock clock = Clock());

    QDate today() const;
    const SchedulerSettings &settings() const;

    FlatSchedule generateSchedule(const std::vector<data::TaskItem> &tasks, int budgetMinutes) const;
    data::SlotPlan planSlots(const std::vector<data::TaskItem> &tasks,
                             const std::vector<data::TimeSlot> &timeSlots = {}) const;
    std::vector<data::Session> planSessions(const std::vector<data::TaskItem> &tasks) const;
    std::vector<data::Session> planSessions(const std::vector<data::TaskItem> &tasks, int focusMinutes,
                                            int breakMinutes) const;
    std::vector<data::TaskItem> splitTask(const data::TaskItem &task, int maxSessionMinutes = 0) const;
    data::ScheduleDiagnostics analyze(const std::vector<data::ScheduledTask> &schedule, int budgetMinutes) const;
    QStringList recommend(const std::vector<data::TaskItem> &tasks) const;
    data::CompletionStats completionStats(const std::vector<data::TaskItem> &tasks) const;
    data::CompletionEstimate estimateCompletion(const std::vector<data::TaskItem> &tasks) const;

    FlatSchedule scheduleRepository(const data::TaskRepository &repository, int budgetMinutes) const;
    data::SlotPlan planRepository(const data::TaskRepository &repository) const;
    QStringList recommendRepository(const data::TaskRepository &repository) const;

    QJsonObject handleRequest(const QJsonObject &request) const;

private:
    PlanningService withToday(const QDate &today) const;
    void annotateBreaks(std::vector<data::ScheduledTask> &schedule) const;

    QJsonObject handleSchedule(const QJsonObject &request) const;
    QJsonObject handleSlots(const QJsonObject &request) const;
    QJsonObject handleSessions(const QJsonObject &request) const;
    QJsonObject handleSplit(const QJsonObject &request) const;
    QJsonObject handleAnalyze(const QJsonObject &request) const;
    QJsonObject handleRecommend(const QJsonObject &request) const;
    QJsonObject handleStats(const QJsonObject &request) const;
    QJsonObject handleEstimate(const QJsonObject &request) const;

    SchedulerSettings m_settings;
    const engine::BreakSuggestionProvider *m_suggestions;
    Clock m_clock;
};

} // namespace core
} // namespace planner
