#pragma once

#include <QDate>
#include <vector>

#include "planner/data/Schedule.hpp"
#include "planner/engine/TimeAllocator.hpp"

namespace planner {
namespace engine {

// Runs the allocator slot by slot. A task scheduled in a slot, even partially,
// is not offered to later slots.
class SlotPlanner
{
public:
    explicit SlotPlanner(const QDate &today, TimeAllocator allocator = TimeAllocator());

    data::SlotPlan plan(const std::vector<data::TaskItem> &tasks, std::vector<data::TimeSlot> timeSlots = {}) const;

    static std::vector<data::TimeSlot> defaultSlots();

private:
    QDate m_today;
    TimeAllocator m_allocator;
};

} // namespace engine
} // namespace planner
