#include "planner/engine/SlotPlanner.hpp"

#include "planner/Logging.hpp"
#include "planner/engine/TaskSorter.hpp"

namespace planner {
namespace engine {

SlotPlanner::SlotPlanner(const QDate &today, TimeAllocator allocator)
    : m_today(today)
    , m_allocator(allocator)
{
}

data::SlotPlan SlotPlanner::plan(const std::vector<data::TaskItem> &tasks, std::vector<data::TimeSlot> timeSlots) const
{
    if (timeSlots.empty()) {
        timeSlots = defaultSlots();
    }

    data::SlotPlan result;
    std::vector<data::TaskItem> pool = tasks;
    for (const auto &slot : timeSlots) {
        auto allocation = m_allocator.allocate(sortTasks(pool, m_today), slot.minutes);
        qCDebug(lcEngine) << "Slot" << slot.name << "took" << allocation.scheduled.size() << "tasks,"
                          << allocation.unscheduled.size() << "left";
        result.entries.emplace_back(slot.name, std::move(allocation.scheduled));
        pool = std::move(allocation.unscheduled);
    }
    result.unscheduled = std::move(pool);
    return result;
}

std::vector<data::TimeSlot> SlotPlanner::defaultSlots()
{
    return {
        { QStringLiteral("Morning Focus"), 120 },
        { QStringLiteral("Afternoon Work"), 90 },
        { QStringLiteral("Evening Tasks"), 60 },
    };
}

} // namespace engine
} // namespace planner
