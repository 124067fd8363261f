#include "planner/core/PlanningService.hpp"

#include <QJsonArray>

#include "planner/Logging.hpp"
#include "planner/data/JsonCodec.hpp"
#include "planner/data/TaskRepository.hpp"
#include "planner/engine/BreakSuggestionProvider.hpp"
#include "planner/engine/RecommendationGenerator.hpp"
#include "planner/engine/ScheduleAnalyzer.hpp"
#include "planner/engine/SessionPlanner.hpp"
#include "planner/engine/SlotPlanner.hpp"
#include "planner/engine/TaskSorter.hpp"
#include "planner/engine/TaskSplitter.hpp"
#include "planner/engine/TimeAllocator.hpp"

namespace planner {
namespace core {

namespace {

constexpr int LongBreakThresholdMinutes = 15;

std::vector<data::TaskItem> activeOnly(const std::vector<data::TaskItem> &tasks)
{
    std::vector<data::TaskItem> active;
    active.reserve(tasks.size());
    for (const auto &task : tasks) {
        if (!task.completed) {
            active.push_back(task);
        }
    }
    return active;
}

QJsonObject succeeded(const QString &operation)
{
    QJsonObject response;
    response.insert(QStringLiteral("success"), true);
    response.insert(QStringLiteral("operation"), operation);
    return response;
}

QJsonObject rejected(const QString &operation, const QString &message, const QString &resultKey = QString(),
                     const QJsonValue &emptyResult = QJsonArray())
{
    qCWarning(lcService) << "Rejected" << operation << "request:" << message;
    QJsonObject response;
    response.insert(QStringLiteral("success"), false);
    response.insert(QStringLiteral("operation"), operation);
    response.insert(QStringLiteral("message"), message);
    if (!resultKey.isEmpty()) {
        response.insert(resultKey, emptyResult);
    }
    return response;
}

QString tasksNotAList()
{
    return QStringLiteral("tasks must be a list of task objects");
}

QString invalidBudget()
{
    return QStringLiteral("available_time must be a non-negative number of minutes");
}

} // namespace

PlanningService::PlanningService(SchedulerSettings settings, const engine::BreakSuggestionProvider *suggestions,
                                 Clock clock)
    : m_settings(std::move(settings))
    , m_suggestions(suggestions)
    , m_clock(std::move(clock))
{
}

QDate PlanningService::today() const
{
    if (m_clock) {
        return m_clock();
    }
    return QDate::currentDate();
}

const SchedulerSettings &PlanningService::settings() const
{
    return m_settings;
}

FlatSchedule PlanningService::generateSchedule(const std::vector<data::TaskItem> &tasks, int budgetMinutes) const
{
    FlatSchedule result;
    result.budgetMinutes = budgetMinutes;
    const engine::TimeAllocator allocator(m_settings.minimumChunkMinutes);
    result.allocation = allocator.allocate(engine::sortTasks(activeOnly(tasks), today()), budgetMinutes);
    annotateBreaks(result.allocation.scheduled);
    result.diagnostics = engine::analyzeSchedule(result.allocation.scheduled, budgetMinutes);
    return result;
}

data::SlotPlan PlanningService::planSlots(const std::vector<data::TaskItem> &tasks,
                                          const std::vector<data::TimeSlot> &timeSlots) const
{
    const engine::SlotPlanner planner(today(), engine::TimeAllocator(m_settings.minimumChunkMinutes));
    auto plan = planner.plan(activeOnly(tasks), timeSlots.empty() ? m_settings.timeSlots : timeSlots);
    for (auto &entry : plan.entries) {
        annotateBreaks(entry.second);
    }
    return plan;
}

std::vector<data::Session> PlanningService::planSessions(const std::vector<data::TaskItem> &tasks) const
{
    const engine::SessionPlanner planner(today(), m_settings.sessions, m_suggestions);
    return planner.plan(activeOnly(tasks));
}

std::vector<data::Session> PlanningService::planSessions(const std::vector<data::TaskItem> &tasks, int focusMinutes,
                                                         int breakMinutes) const
{
    engine::SessionPolicy policy = m_settings.sessions;
    policy.focusMinutes = focusMinutes;
    policy.breakMinutes = breakMinutes;
    const engine::SessionPlanner planner(today(), policy, m_suggestions);
    return planner.plan(activeOnly(tasks));
}

std::vector<data::TaskItem> PlanningService::splitTask(const data::TaskItem &task, int maxSessionMinutes) const
{
    return engine::splitTask(task, maxSessionMinutes > 0 ? maxSessionMinutes : m_settings.maxSessionMinutes);
}

data::ScheduleDiagnostics PlanningService::analyze(const std::vector<data::ScheduledTask> &schedule,
                                                   int budgetMinutes) const
{
    return engine::analyzeSchedule(schedule, budgetMinutes);
}

QStringList PlanningService::recommend(const std::vector<data::TaskItem> &tasks) const
{
    return engine::recommendations(tasks, today());
}

data::CompletionStats PlanningService::completionStats(const std::vector<data::TaskItem> &tasks) const
{
    return engine::completionStats(tasks);
}

data::CompletionEstimate PlanningService::estimateCompletion(const std::vector<data::TaskItem> &tasks) const
{
    return engine::estimateCompletion(tasks, today(), m_settings.efficiencyFactor);
}

FlatSchedule PlanningService::scheduleRepository(const data::TaskRepository &repository, int budgetMinutes) const
{
    return generateSchedule(repository.fetchActiveTasks(), budgetMinutes);
}

data::SlotPlan PlanningService::planRepository(const data::TaskRepository &repository) const
{
    return planSlots(repository.fetchActiveTasks());
}

QStringList PlanningService::recommendRepository(const data::TaskRepository &repository) const
{
    return recommend(repository.fetchTasks());
}

QJsonObject PlanningService::handleRequest(const QJsonObject &request) const
{
    const QString operation = request.value(QStringLiteral("operation")).toString().trimmed().toLower();

    const QJsonValue todayValue = request.value(QStringLiteral("today"));
    if (!todayValue.isUndefined() && !todayValue.isNull()) {
        const QDate fixed = data::deadlineFromJson(todayValue);
        if (!fixed.isValid()) {
            return rejected(operation, QStringLiteral("today must be an ISO date (YYYY-MM-DD)"));
        }
        QJsonObject forwarded = request;
        forwarded.remove(QStringLiteral("today"));
        return withToday(fixed).handleRequest(forwarded);
    }

    qCDebug(lcService) << "Handling" << operation << "request";
    if (operation == QLatin1String("schedule")) {
        return handleSchedule(request);
    }
    if (operation == QLatin1String("slots")) {
        return handleSlots(request);
    }
    if (operation == QLatin1String("sessions")) {
        return handleSessions(request);
    }
    if (operation == QLatin1String("split")) {
        return handleSplit(request);
    }
    if (operation == QLatin1String("analyze")) {
        return handleAnalyze(request);
    }
    if (operation == QLatin1String("recommend")) {
        return handleRecommend(request);
    }
    if (operation == QLatin1String("stats")) {
        return handleStats(request);
    }
    if (operation == QLatin1String("estimate")) {
        return handleEstimate(request);
    }
    return rejected(operation, QStringLiteral("Unknown operation '%1'").arg(operation));
}

PlanningService PlanningService::withToday(const QDate &today) const
{
    return PlanningService(m_settings, m_suggestions, [today]() { return today; });
}

void PlanningService::annotateBreaks(std::vector<data::ScheduledTask> &schedule) const
{
    if (!m_suggestions) {
        return;
    }
    int shortBreaks = 0;
    int longBreaks = 0;
    for (auto &entry : schedule) {
        if (entry.recommendedBreakMinutes <= 0) {
            continue;
        }
        const bool longBreak = entry.recommendedBreakMinutes >= LongBreakThresholdMinutes;
        entry.breakSuggestion = m_suggestions->suggestion(
            longBreak ? data::SessionKind::LongBreak : data::SessionKind::ShortBreak, entry.recommendedBreakMinutes,
            longBreak ? longBreaks++ : shortBreaks++);
    }
}

QJsonObject PlanningService::handleSchedule(const QJsonObject &request) const
{
    const QString operation = QStringLiteral("schedule");
    const auto tasks = data::tasksFromJson(request.value(QStringLiteral("tasks")));
    if (!tasks) {
        return rejected(operation, tasksNotAList(), QStringLiteral("schedule"));
    }
    const auto budget = data::minutesFromJson(request.value(QStringLiteral("available_time")));
    if (!budget) {
        return rejected(operation, invalidBudget(), QStringLiteral("schedule"));
    }

    const FlatSchedule result = generateSchedule(*tasks, *budget);
    QJsonObject response = succeeded(operation);
    response.insert(QStringLiteral("available_time"), *budget);
    response.insert(QStringLiteral("schedule"), data::scheduleToJson(result.allocation.scheduled));
    response.insert(QStringLiteral("unscheduled"), data::tasksToJson(result.allocation.unscheduled));
    response.insert(QStringLiteral("total_allocated"), result.allocation.totalAllocatedMinutes());
    response.insert(QStringLiteral("diagnostics"), data::diagnosticsToJson(result.diagnostics));
    return response;
}

QJsonObject PlanningService::handleSlots(const QJsonObject &request) const
{
    const QString operation = QStringLiteral("slots");
    const auto tasks = data::tasksFromJson(request.value(QStringLiteral("tasks")));
    if (!tasks) {
        return rejected(operation, tasksNotAList(), QStringLiteral("plan"), QJsonObject());
    }
    const auto timeSlots = data::slotsFromJson(request.value(QStringLiteral("slots")));
    if (!timeSlots) {
        return rejected(operation, QStringLiteral("slots must be a list of {name, duration} objects"),
                        QStringLiteral("plan"), QJsonObject());
    }

    QJsonObject response = succeeded(operation);
    response.insert(QStringLiteral("plan"), data::slotPlanToJson(planSlots(*tasks, *timeSlots)));
    return response;
}

QJsonObject PlanningService::handleSessions(const QJsonObject &request) const
{
    const QString operation = QStringLiteral("sessions");
    const auto tasks = data::tasksFromJson(request.value(QStringLiteral("tasks")));
    if (!tasks) {
        return rejected(operation, tasksNotAList(), QStringLiteral("sessions"));
    }
    int focusMinutes = m_settings.sessions.focusMinutes;
    int breakMinutes = m_settings.sessions.breakMinutes;
    if (request.contains(QStringLiteral("session_length"))) {
        const auto parsed = data::minutesFromJson(request.value(QStringLiteral("session_length")));
        if (!parsed || *parsed == 0) {
            return rejected(operation, QStringLiteral("session_length must be a positive number of minutes"),
                            QStringLiteral("sessions"));
        }
        focusMinutes = *parsed;
    }
    if (request.contains(QStringLiteral("break_length"))) {
        const auto parsed = data::minutesFromJson(request.value(QStringLiteral("break_length")));
        if (!parsed) {
            return rejected(operation, QStringLiteral("break_length must be a non-negative number of minutes"),
                            QStringLiteral("sessions"));
        }
        breakMinutes = *parsed;
    }

    const auto sessions = planSessions(*tasks, focusMinutes, breakMinutes);
    qint64 focusTotal = 0;
    qint64 breakTotal = 0;
    for (const auto &session : sessions) {
        (session.isBreak() ? breakTotal : focusTotal) += session.durationMinutes;
    }
    QJsonObject response = succeeded(operation);
    response.insert(QStringLiteral("sessions"), data::sessionsToJson(sessions));
    response.insert(QStringLiteral("total_focus_time"), focusTotal);
    response.insert(QStringLiteral("total_break_time"), breakTotal);
    return response;
}

QJsonObject PlanningService::handleSplit(const QJsonObject &request) const
{
    const QString operation = QStringLiteral("split");
    const QJsonValue taskValue = request.value(QStringLiteral("task"));
    if (!taskValue.isObject()) {
        return rejected(operation, QStringLiteral("task must be a task object"), QStringLiteral("tasks"));
    }
    int maxSession = 0;
    if (request.contains(QStringLiteral("max_session_minutes"))) {
        const auto parsed = data::minutesFromJson(request.value(QStringLiteral("max_session_minutes")));
        if (!parsed || *parsed == 0) {
            return rejected(operation, QStringLiteral("max_session_minutes must be a positive number of minutes"),
                            QStringLiteral("tasks"));
        }
        maxSession = *parsed;
    }

    QJsonObject response = succeeded(operation);
    response.insert(QStringLiteral("tasks"),
                    data::tasksToJson(splitTask(data::taskFromJson(taskValue.toObject()), maxSession)));
    return response;
}

QJsonObject PlanningService::handleAnalyze(const QJsonObject &request) const
{
    const QString operation = QStringLiteral("analyze");
    const auto schedule = data::scheduleFromJson(request.value(QStringLiteral("schedule")));
    if (!schedule) {
        return rejected(operation, QStringLiteral("schedule must be a list of scheduled tasks"),
                        QStringLiteral("diagnostics"), data::diagnosticsToJson(data::ScheduleDiagnostics()));
    }
    const auto budget = data::minutesFromJson(request.value(QStringLiteral("available_time")));
    if (!budget) {
        return rejected(operation, invalidBudget(), QStringLiteral("diagnostics"),
                        data::diagnosticsToJson(data::ScheduleDiagnostics()));
    }

    QJsonObject response = succeeded(operation);
    response.insert(QStringLiteral("diagnostics"), data::diagnosticsToJson(analyze(*schedule, *budget)));
    return response;
}

QJsonObject PlanningService::handleRecommend(const QJsonObject &request) const
{
    const QString operation = QStringLiteral("recommend");
    const auto tasks = data::tasksFromJson(request.value(QStringLiteral("tasks")));
    if (!tasks) {
        return rejected(operation, tasksNotAList(), QStringLiteral("recommendations"));
    }

    QJsonObject response = succeeded(operation);
    response.insert(QStringLiteral("recommendations"), QJsonArray::fromStringList(recommend(*tasks)));
    return response;
}

QJsonObject PlanningService::handleStats(const QJsonObject &request) const
{
    const QString operation = QStringLiteral("stats");
    const auto tasks = data::tasksFromJson(request.value(QStringLiteral("tasks")));
    if (!tasks) {
        return rejected(operation, tasksNotAList(), QStringLiteral("stats"),
                        data::completionStatsToJson(data::CompletionStats()));
    }

    QJsonObject response = succeeded(operation);
    response.insert(QStringLiteral("stats"), data::completionStatsToJson(completionStats(*tasks)));
    return response;
}

QJsonObject PlanningService::handleEstimate(const QJsonObject &request) const
{
    const QString operation = QStringLiteral("estimate");
    const auto tasks = data::tasksFromJson(request.value(QStringLiteral("tasks")));
    if (!tasks) {
        return rejected(operation, tasksNotAList(), QStringLiteral("estimate"),
                        data::completionEstimateToJson(data::CompletionEstimate()));
    }

    data::CompletionEstimate estimate;
    if (request.contains(QStringLiteral("efficiency_factor"))) {
        const double factor = request.value(QStringLiteral("efficiency_factor")).toDouble(-1.0);
        estimate = engine::estimateCompletion(*tasks, today(), factor);
    } else {
        estimate = estimateCompletion(*tasks);
    }

    QJsonObject response = succeeded(operation);
    response.insert(QStringLiteral("estimate"), data::completionEstimateToJson(estimate));
    return response;
}

} // namespace core
} // namespace planner
