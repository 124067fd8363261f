#include "planner/engine/TimeAllocator.hpp"

#include <QtGlobal>

#include "planner/Logging.hpp"

namespace planner {
namespace engine {

namespace {

data::ScheduledTask makeScheduled(const data::TaskItem &task, int allocated, int order)
{
    const int estimate = task.effectiveMinutes();
    data::ScheduledTask entry;
    entry.task = task;
    entry.task.estimatedMinutes = estimate;
    entry.allocatedMinutes = allocated;
    entry.remainingMinutes = qMax(0, estimate - allocated);
    entry.completionPercentage = qMin(100.0, allocated * 100.0 / estimate);
    entry.scheduleOrder = order;
    entry.partial = allocated < estimate;
    entry.recommendedBreakMinutes = recommendedBreakMinutes(allocated);
    return entry;
}

} // namespace

int recommendedBreakMinutes(int allocatedMinutes)
{
    if (allocatedMinutes <= 0) {
        return 0;
    }
    if (allocatedMinutes <= 25) {
        return 5;
    }
    if (allocatedMinutes <= 60) {
        return 10;
    }
    if (allocatedMinutes <= 90) {
        return 15;
    }
    return 20;
}

TimeAllocator::TimeAllocator(int minimumChunkMinutes)
    : m_minimumChunk(qMax(1, minimumChunkMinutes))
{
}

int TimeAllocator::minimumChunkMinutes() const
{
    return m_minimumChunk;
}

data::Allocation TimeAllocator::allocate(const std::vector<data::TaskItem> &sortedTasks, int budgetMinutes) const
{
    data::Allocation result;
    if (budgetMinutes <= 0 || sortedTasks.empty()) {
        result.unscheduled = sortedTasks;
        return result;
    }

    std::vector<bool> taken(sortedTasks.size(), false);
    int remaining = budgetMinutes;
    bool partialUsed = false;

    for (std::size_t i = 0; i < sortedTasks.size() && remaining > 0; ++i) {
        const auto &task = sortedTasks[i];
        const int estimate = task.effectiveMinutes();
        int allocated = 0;
        if (estimate <= remaining) {
            allocated = estimate;
        } else if (remaining >= m_minimumChunk && !partialUsed) {
            allocated = remaining;
            partialUsed = true;
        } else {
            qCDebug(lcEngine) << "Skipping" << task.title << "- only" << remaining << "min left";
            continue;
        }
        remaining -= allocated;
        taken[i] = true;
        result.scheduled.push_back(makeScheduled(task, allocated, static_cast<int>(result.scheduled.size()) + 1));
        qCDebug(lcEngine) << "Allocated" << allocated << "of" << estimate << "min to" << task.title;
    }

    for (std::size_t i = 0; i < sortedTasks.size(); ++i) {
        if (!taken[i]) {
            result.unscheduled.push_back(sortedTasks[i]);
        }
    }
    return result;
}

} // namespace engine
} // namespace planner
