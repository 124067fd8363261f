#include "planner/engine/TaskSplitter.hpp"

#include <QtGlobal>

#include "planner/Logging.hpp"

namespace planner {
namespace engine {

std::vector<data::TaskItem> splitTask(const data::TaskItem &task, int maxSessionMinutes)
{
    const int duration = task.effectiveMinutes();
    if (maxSessionMinutes <= 0 || duration <= maxSessionMinutes) {
        return { task };
    }

    const int sessionCount = 1 + (duration - 1) / maxSessionMinutes;
    const int perSession = qRound(static_cast<double>(duration) / sessionCount);
    qCDebug(lcEngine) << "Splitting" << task.title << duration << "min into" << sessionCount << "x" << perSession;

    std::vector<data::TaskItem> parts;
    parts.reserve(static_cast<size_t>(sessionCount));
    for (int index = 1; index <= sessionCount; ++index) {
        data::TaskItem part = task;
        part.estimatedMinutes = perSession;
        part.sessionIndex = index;
        part.sessionCount = sessionCount;
        part.parentId = task.id;
        part.title = QStringLiteral("%1 (Part %2/%3)").arg(task.title).arg(index).arg(sessionCount);
        if (!task.id.isEmpty()) {
            part.id = QStringLiteral("%1-%2").arg(task.id).arg(index);
        }
        if (index > 1) {
            part.priority = data::demoted(task.priority);
        }
        parts.push_back(part);
    }
    return parts;
}

} // namespace engine
} // namespace planner
