#include "planner/engine/RecommendationGenerator.hpp"

#include <QObject>

namespace planner {
namespace engine {

QString emptyTaskListRecommendation()
{
    return QObject::tr("Start by adding some tasks to get organized!");
}

QString wellOrganizedRecommendation()
{
    return QObject::tr("Great job! Your task management looks well-organized.");
}

QStringList recommendations(const std::vector<data::TaskItem> &tasks, const QDate &today)
{
    if (tasks.empty()) {
        return { emptyTaskListRecommendation() };
    }

    int active = 0;
    int completed = 0;
    int overdue = 0;
    int dueSoon = 0;
    int highPriority = 0;
    int withDeadline = 0;
    int longTasks = 0;
    qint64 activeMinutes = 0;
    for (const auto &task : tasks) {
        if (task.completed) {
            ++completed;
            continue;
        }
        ++active;
        activeMinutes += task.effectiveMinutes();
        if (task.priority == data::PriorityTier::High) {
            ++highPriority;
        }
        if (task.effectiveMinutes() > LongTaskMinutes) {
            ++longTasks;
        }
        if (!task.hasDeadline()) {
            continue;
        }
        ++withDeadline;
        if (today.isValid()) {
            const qint64 daysLeft = today.daysTo(task.deadline);
            if (daysLeft < 0) {
                ++overdue;
            } else if (daysLeft <= DueSoonWindowDays) {
                ++dueSoon;
            }
        }
    }

    QStringList advice;
    if (overdue > 0) {
        advice << QObject::tr("You have %1 overdue task(s). Consider rescheduling or prioritizing them.").arg(overdue);
    }
    if (active > ManyActiveTasks) {
        advice << QObject::tr("You have %1 active tasks. Consider dropping or delegating some of them.").arg(active);
    } else if (active < FewActiveTasks) {
        advice << QObject::tr("Only %1 active task(s) planned. Add upcoming work to stay ahead.").arg(active);
    }
    if (highPriority > ManyHighPriorityTasks) {
        advice << QObject::tr("You have %1 high-priority tasks. Consider reviewing priorities to focus on what's truly urgent.")
                      .arg(highPriority);
    } else if (highPriority == 0 && active > 0) {
        advice << QObject::tr("None of your active tasks is high priority. Mark the most important ones so they get scheduled first.");
    }
    if (activeMinutes > HeavyWorkloadMinutes) {
        advice << QObject::tr("Your tasks require significant time. Consider spreading them across multiple days.");
    }
    const double completionRate = completed * 100.0 / static_cast<double>(tasks.size());
    if (completionRate < 30.0) {
        advice << QObject::tr("Only %1% of your tasks are completed. Try finishing a few small ones first.")
                      .arg(QString::number(completionRate, 'f', 0));
    } else if (completionRate > 80.0) {
        advice << QObject::tr("%1% of your tasks are completed. Keep up the momentum!")
                      .arg(QString::number(completionRate, 'f', 0));
    }
    if (active > 0 && withDeadline * 2 < active) {
        advice << QObject::tr("Many tasks don't have deadlines. Setting deadlines can improve time management and motivation.");
    }
    if (active > 0 && longTasks * 3 > active) {
        advice << QObject::tr("Consider breaking down large tasks into smaller, more manageable chunks for better productivity.");
    }

    if (dueSoon > 0) {
        advice << QObject::tr("You have %1 task(s) due within %2 days. Consider prioritizing them in your schedule.")
                      .arg(dueSoon)
                      .arg(DueSoonWindowDays);
    }

    if (advice.isEmpty()) {
        return { wellOrganizedRecommendation() };
    }
    while (advice.size() > MaxRecommendations) {
        advice.removeLast();
    }
    return advice;
}

} // namespace engine
} // namespace planner
