#include "planner/data/Schedule.hpp"

namespace planner {
namespace data {

int Allocation::totalAllocatedMinutes() const
{
    int total = 0;
    for (const auto &entry : scheduled) {
        total += entry.allocatedMinutes;
    }
    return total;
}

const std::vector<ScheduledTask> *SlotPlan::slot(const QString &name) const
{
    for (const auto &entry : entries) {
        if (entry.first == name) {
            return &entry.second;
        }
    }
    return nullptr;
}

} // namespace data
} // namespace planner
