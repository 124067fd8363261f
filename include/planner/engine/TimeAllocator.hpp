#pragma once

#include <vector>

#include "planner/data/Schedule.hpp"

namespace planner {
namespace engine {

constexpr int DefaultMinimumChunkMinutes = 15;

int recommendedBreakMinutes(int allocatedMinutes);

/**
 * Greedy allocation of a time budget over an already sorted task sequence.
 *
 * A task that fits is granted in full. A task that does not fit receives the
 * whole remaining budget when at least one minimum chunk is left; otherwise it
 * is skipped so a later, shorter task can still use the remainder. At most one
 * partial allocation happens per call, and there is a single pass: a remainder
 * of at least one chunk can only be left over when no task is waiting.
 */
class TimeAllocator
{
public:
    explicit TimeAllocator(int minimumChunkMinutes = DefaultMinimumChunkMinutes);

    int minimumChunkMinutes() const;
    data::Allocation allocate(const std::vector<data::TaskItem> &sortedTasks, int budgetMinutes) const;

private:
    int m_minimumChunk;
};

} // namespace engine
} // namespace planner
