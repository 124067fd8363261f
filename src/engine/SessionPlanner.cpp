#include "planner/engine/SessionPlanner.hpp"

#include <QtGlobal>
#include <limits>

#include "planner/Logging.hpp"
#include "planner/engine/BreakSuggestionProvider.hpp"
#include "planner/engine/TaskSorter.hpp"

namespace planner {
namespace engine {

SessionPlanner::SessionPlanner(const QDate &today, SessionPolicy policy, const BreakSuggestionProvider *suggestions)
    : m_today(today)
    , m_policy(policy)
    , m_suggestions(suggestions)
{
}

const SessionPolicy &SessionPlanner::policy() const
{
    return m_policy;
}

std::vector<data::Session> SessionPlanner::plan(const std::vector<data::TaskItem> &tasks) const
{
    std::vector<data::Session> sessions;
    const int length = m_policy.focusMinutes;
    if (length <= 0 || tasks.empty()) {
        return sessions;
    }
    const int interval = qMax(1, m_policy.longBreakInterval);
    const int breakLength = qMax(0, m_policy.breakMinutes);

    qint64 totalFocus = 0;
    for (const auto &task : tasks) {
        totalFocus += 1 + (task.effectiveMinutes() - 1) / length;
    }

    qint64 focusNumber = 0;
    int shortBreaks = 0;
    int longBreaks = 0;
    for (const auto &task : sortTasks(tasks, m_today)) {
        const int duration = task.effectiveMinutes();
        const int needed = 1 + (duration - 1) / length;
        for (int index = 1; index <= needed; ++index) {
            data::Session focus;
            focus.kind = data::SessionKind::Focus;
            focus.durationMinutes = index < needed ? length : duration - length * (needed - 1);
            focus.task = task;
            focus.sessionIndex = index;
            focus.sessionCount = needed;
            focus.focusNumber = static_cast<int>(++focusNumber);
            sessions.push_back(focus);

            if (focusNumber == totalFocus) {
                continue;
            }
            data::Session pause;
            int ordinal = 0;
            if (focusNumber % interval == 0) {
                pause.kind = data::SessionKind::LongBreak;
                const qint64 longLength = qint64(breakLength) * qMax(1, m_policy.longBreakMultiplier);
                pause.durationMinutes = static_cast<int>(qMin<qint64>(longLength, std::numeric_limits<int>::max()));
                ordinal = longBreaks++;
            } else {
                pause.kind = data::SessionKind::ShortBreak;
                pause.durationMinutes = breakLength;
                ordinal = shortBreaks++;
            }
            if (m_suggestions) {
                pause.suggestion = m_suggestions->suggestion(pause.kind, pause.durationMinutes, ordinal);
            }
            sessions.push_back(pause);
        }
    }
    qCDebug(lcEngine) << "Planned" << focusNumber << "focus sessions for" << tasks.size() << "tasks";
    return sessions;
}

} // namespace engine
} // namespace planner
