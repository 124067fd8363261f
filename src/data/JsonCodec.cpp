#include "planner/data/JsonCodec.hpp"

#include <QtMath>
#include <limits>

#include "planner/Logging.hpp"

namespace planner {
namespace data {

namespace {

std::optional<double> numberFromJson(const QJsonValue &value)
{
    if (value.isDouble()) {
        // Anything an int cannot hold is treated like a non-number.
        const double number = value.toDouble();
        if (qIsFinite(number) && number >= std::numeric_limits<int>::min()
            && number <= std::numeric_limits<int>::max()) {
            return number;
        }
        return std::nullopt;
    }
    if (value.isString()) {
        bool ok = false;
        const int number = value.toString().trimmed().toInt(&ok);
        if (ok) {
            return number;
        }
    }
    return std::nullopt;
}

QJsonValue deadlineToJson(const QDate &deadline)
{
    if (!deadline.isValid()) {
        return QJsonValue::Null;
    }
    return deadline.toString(Qt::ISODate);
}

double roundToTenth(double value)
{
    return qRound(value * 10.0) / 10.0;
}

QString sessionKindLabel(SessionKind kind)
{
    switch (kind) {
    case SessionKind::Focus:
        return QStringLiteral("focus");
    case SessionKind::ShortBreak:
        return QStringLiteral("short_break");
    case SessionKind::LongBreak:
        return QStringLiteral("long_break");
    }
    return QStringLiteral("focus");
}

QJsonObject tierBreakdownToJson(const TierBreakdown &breakdown)
{
    QJsonObject object;
    object.insert(QStringLiteral("high"), breakdown.high);
    object.insert(QStringLiteral("medium"), breakdown.medium);
    object.insert(QStringLiteral("low"), breakdown.low);
    return object;
}

} // namespace

PriorityTier priorityFromJson(const QJsonValue &value)
{
    if (value.isUndefined() || value.isNull()) {
        return PriorityTier::Medium;
    }
    if (value.isString()) {
        const QString text = value.toString().trimmed().toLower();
        if (text == QLatin1String("high")) {
            return PriorityTier::High;
        }
        if (text == QLatin1String("medium")) {
            return PriorityTier::Medium;
        }
        if (text == QLatin1String("low")) {
            return PriorityTier::Low;
        }
    }
    if (const auto number = numberFromJson(value)) {
        switch (static_cast<int>(*number)) {
        case 1:
            return PriorityTier::High;
        case 2:
            return PriorityTier::Medium;
        case 3:
            return PriorityTier::Low;
        default:
            break;
        }
    }
    qCWarning(lcData) << "Unrecognized priority" << value << "- using medium";
    return PriorityTier::Medium;
}

QDate deadlineFromJson(const QJsonValue &value)
{
    if (!value.isString()) {
        if (!value.isUndefined() && !value.isNull()) {
            qCWarning(lcData) << "Ignoring non-text deadline" << value;
        }
        return {};
    }
    const QString text = value.toString().trimmed();
    if (text.isEmpty()) {
        return {};
    }
    // Tolerate a trailing time component ("2025-08-05T10:00:00").
    const QDate date = QDate::fromString(text.left(10), Qt::ISODate);
    if (!date.isValid()) {
        qCWarning(lcData) << "Ignoring unparseable deadline" << text;
    }
    return date;
}

int estimatedMinutesFromJson(const QJsonValue &value)
{
    const auto number = numberFromJson(value);
    if (!number || static_cast<int>(*number) <= 0) {
        if (!value.isUndefined()) {
            qCWarning(lcData) << "Invalid estimated_time" << value << "- using" << DefaultEstimatedMinutes;
        }
        return DefaultEstimatedMinutes;
    }
    return static_cast<int>(*number);
}

TaskItem taskFromJson(const QJsonObject &object)
{
    TaskItem task;

    const QJsonValue id = object.value(QStringLiteral("id"));
    if (id.isString()) {
        task.id = id.toString();
    } else if (id.isDouble()) {
        task.id = QString::number(static_cast<qint64>(id.toDouble()));
    }

    task.title = object.value(QStringLiteral("title")).toString().trimmed();
    if (task.title.isEmpty()) {
        task.title = QString::fromLatin1(DefaultTaskTitle);
    }

    task.estimatedMinutes = estimatedMinutesFromJson(object.value(QStringLiteral("estimated_time")));
    task.priority = priorityFromJson(object.value(QStringLiteral("priority")));
    task.deadline = deadlineFromJson(object.value(QStringLiteral("deadline")));

    const QJsonValue completed = object.value(QStringLiteral("completed"));
    if (completed.isBool()) {
        task.completed = completed.toBool();
    } else {
        task.completed = object.value(QStringLiteral("status")).toString().compare(
                             QLatin1String("completed"), Qt::CaseInsensitive)
            == 0;
    }

    if (const auto actual = numberFromJson(object.value(QStringLiteral("actual_time")))) {
        task.actualMinutes = qMax(0, static_cast<int>(*actual));
    }

    task.sessionIndex = object.value(QStringLiteral("session_index")).toInt();
    task.sessionCount = object.value(QStringLiteral("session_count")).toInt();
    task.parentId = object.value(QStringLiteral("parent_id")).toString();
    return task;
}

QJsonObject taskToJson(const TaskItem &task)
{
    QJsonObject object;
    if (!task.id.isEmpty()) {
        object.insert(QStringLiteral("id"), task.id);
    }
    object.insert(QStringLiteral("title"), task.title);
    object.insert(QStringLiteral("estimated_time"), task.estimatedMinutes);
    object.insert(QStringLiteral("priority"), priorityLabel(task.priority));
    object.insert(QStringLiteral("deadline"), deadlineToJson(task.deadline));
    object.insert(QStringLiteral("completed"), task.completed);
    if (task.actualMinutes > 0) {
        object.insert(QStringLiteral("actual_time"), task.actualMinutes);
    }
    if (task.isSplitPart()) {
        object.insert(QStringLiteral("session_index"), task.sessionIndex);
        object.insert(QStringLiteral("session_count"), task.sessionCount);
        object.insert(QStringLiteral("parent_id"), task.parentId);
    }
    return object;
}

std::optional<std::vector<TaskItem>> tasksFromJson(const QJsonValue &value)
{
    if (!value.isArray()) {
        return std::nullopt;
    }
    const QJsonArray array = value.toArray();
    std::vector<TaskItem> tasks;
    tasks.reserve(static_cast<size_t>(array.size()));
    for (const auto &entry : array) {
        if (!entry.isObject()) {
            qCWarning(lcData) << "Skipping non-object task entry" << entry;
            continue;
        }
        tasks.push_back(taskFromJson(entry.toObject()));
    }
    return tasks;
}

QJsonArray tasksToJson(const std::vector<TaskItem> &tasks)
{
    QJsonArray array;
    for (const auto &task : tasks) {
        array.append(taskToJson(task));
    }
    return array;
}

std::optional<int> minutesFromJson(const QJsonValue &value)
{
    const auto number = numberFromJson(value);
    if (!number || *number < 0.0) {
        return std::nullopt;
    }
    return static_cast<int>(*number);
}

std::optional<std::vector<TimeSlot>> slotsFromJson(const QJsonValue &value)
{
    if (value.isUndefined() || value.isNull()) {
        return std::vector<TimeSlot>{};
    }
    if (!value.isArray()) {
        return std::nullopt;
    }
    std::vector<TimeSlot> timeSlots;
    for (const auto &entry : value.toArray()) {
        const QJsonObject object = entry.toObject();
        TimeSlot slot;
        slot.name = object.value(QStringLiteral("name")).toString().trimmed();
        QJsonValue minutes = object.value(QStringLiteral("duration"));
        if (minutes.isUndefined()) {
            minutes = object.value(QStringLiteral("minutes"));
        }
        const auto parsed = minutesFromJson(minutes);
        if (slot.name.isEmpty() || !parsed) {
            return std::nullopt;
        }
        slot.minutes = *parsed;
        timeSlots.push_back(slot);
    }
    return timeSlots;
}

ScheduledTask scheduledTaskFromJson(const QJsonObject &object, int scheduleOrder)
{
    ScheduledTask entry;
    entry.task = taskFromJson(object);
    const int estimate = entry.task.effectiveMinutes();
    entry.allocatedMinutes = qBound(0, minutesFromJson(object.value(QStringLiteral("allocated_time"))).value_or(0), estimate);
    entry.remainingMinutes = estimate - entry.allocatedMinutes;
    entry.completionPercentage = entry.allocatedMinutes * 100.0 / estimate;
    entry.scheduleOrder = object.value(QStringLiteral("schedule_order")).toInt(scheduleOrder);
    entry.partial = entry.allocatedMinutes < estimate;
    entry.recommendedBreakMinutes = object.value(QStringLiteral("break_minutes")).toInt();
    entry.breakSuggestion = object.value(QStringLiteral("break_suggestion")).toString();
    return entry;
}

std::optional<std::vector<ScheduledTask>> scheduleFromJson(const QJsonValue &value)
{
    if (!value.isArray()) {
        return std::nullopt;
    }
    std::vector<ScheduledTask> schedule;
    for (const auto &entry : value.toArray()) {
        if (!entry.isObject()) {
            qCWarning(lcData) << "Skipping non-object schedule entry" << entry;
            continue;
        }
        schedule.push_back(scheduledTaskFromJson(entry.toObject(), static_cast<int>(schedule.size()) + 1));
    }
    return schedule;
}

QJsonObject scheduledTaskToJson(const ScheduledTask &entry)
{
    QJsonObject object = taskToJson(entry.task);
    object.insert(QStringLiteral("allocated_time"), entry.allocatedMinutes);
    object.insert(QStringLiteral("remaining_time"), entry.remainingMinutes);
    object.insert(QStringLiteral("completion_percentage"), roundToTenth(entry.completionPercentage));
    object.insert(QStringLiteral("schedule_order"), entry.scheduleOrder);
    object.insert(QStringLiteral("partial"), entry.partial);
    object.insert(QStringLiteral("break_minutes"), entry.recommendedBreakMinutes);
    if (!entry.breakSuggestion.isEmpty()) {
        object.insert(QStringLiteral("break_suggestion"), entry.breakSuggestion);
    }
    return object;
}

QJsonArray scheduleToJson(const std::vector<ScheduledTask> &schedule)
{
    QJsonArray array;
    for (const auto &entry : schedule) {
        array.append(scheduledTaskToJson(entry));
    }
    return array;
}

QJsonObject sessionToJson(const Session &session)
{
    QJsonObject object;
    object.insert(QStringLiteral("type"), sessionKindLabel(session.kind));
    object.insert(QStringLiteral("duration"), session.durationMinutes);
    if (session.isBreak()) {
        if (!session.suggestion.isEmpty()) {
            object.insert(QStringLiteral("suggestion"), session.suggestion);
        }
        return object;
    }
    object.insert(QStringLiteral("title"), session.task.title);
    if (!session.task.id.isEmpty()) {
        object.insert(QStringLiteral("task_id"), session.task.id);
    }
    object.insert(QStringLiteral("priority"), priorityLabel(session.task.priority));
    object.insert(QStringLiteral("session_index"), session.sessionIndex);
    object.insert(QStringLiteral("session_count"), session.sessionCount);
    object.insert(QStringLiteral("focus_number"), session.focusNumber);
    return object;
}

QJsonArray sessionsToJson(const std::vector<Session> &sessions)
{
    QJsonArray array;
    for (const auto &session : sessions) {
        array.append(sessionToJson(session));
    }
    return array;
}

QJsonObject slotPlanToJson(const SlotPlan &plan)
{
    QJsonArray slotArray;
    for (const auto &entry : plan.entries) {
        int allocated = 0;
        for (const auto &scheduled : entry.second) {
            allocated += scheduled.allocatedMinutes;
        }
        QJsonObject slot;
        slot.insert(QStringLiteral("name"), entry.first);
        slot.insert(QStringLiteral("allocated_time"), allocated);
        slot.insert(QStringLiteral("tasks"), scheduleToJson(entry.second));
        slotArray.append(slot);
    }
    QJsonObject object;
    object.insert(QStringLiteral("slots"), slotArray);
    object.insert(QString::fromLatin1(UnscheduledSlotName), tasksToJson(plan.unscheduled));
    return object;
}

QJsonObject diagnosticsToJson(const ScheduleDiagnostics &diagnostics)
{
    QJsonObject object;
    object.insert(QStringLiteral("time_utilization"), roundToTenth(diagnostics.utilizationPercentage));
    object.insert(QStringLiteral("priority_weighted_score"), roundToTenth(diagnostics.priorityWeightedScore));
    object.insert(QStringLiteral("quality_rating"), ratingLabel(diagnostics.rating));
    object.insert(QStringLiteral("quality_points"), roundToTenth(diagnostics.qualityPoints));
    object.insert(QStringLiteral("total_allocated_time"), diagnostics.totalAllocatedMinutes);
    return object;
}

QJsonObject completionStatsToJson(const CompletionStats &stats)
{
    QJsonObject object;
    object.insert(QStringLiteral("total_completed"), stats.totalCompleted);
    object.insert(QStringLiteral("total_time_spent"), stats.totalMinutesSpent);
    object.insert(QStringLiteral("avg_completion_time"), stats.averageCompletionMinutes);
    object.insert(QStringLiteral("completion_by_priority"), tierBreakdownToJson(stats.completedByTier));
    object.insert(QStringLiteral("productivity_score"), stats.productivityScore);
    return object;
}

QJsonObject completionEstimateToJson(const CompletionEstimate &estimate)
{
    QJsonObject object;
    object.insert(QStringLiteral("total_time"), estimate.totalMinutes);
    object.insert(QStringLiteral("adjusted_time"), estimate.adjustedMinutes);
    object.insert(QStringLiteral("days_needed"), estimate.daysNeeded);
    object.insert(QStringLiteral("estimated_completion"), deadlineToJson(estimate.estimatedCompletion));
    object.insert(QStringLiteral("priority_breakdown"), tierBreakdownToJson(estimate.minutesByTier));
    object.insert(QStringLiteral("daily_capacity"), estimate.dailyCapacityMinutes);
    object.insert(QStringLiteral("efficiency_factor"), estimate.efficiencyFactor);
    return object;
}

} // namespace data
} // namespace planner
