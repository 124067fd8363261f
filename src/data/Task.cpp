#include "planner/data/Task.hpp"

namespace planner {
namespace data {

bool operator==(const TaskItem &lhs, const TaskItem &rhs)
{
    return lhs.id == rhs.id
        && lhs.title == rhs.title
        && lhs.estimatedMinutes == rhs.estimatedMinutes
        && lhs.priority == rhs.priority
        && lhs.deadline == rhs.deadline
        && lhs.completed == rhs.completed
        && lhs.actualMinutes == rhs.actualMinutes
        && lhs.sessionIndex == rhs.sessionIndex
        && lhs.sessionCount == rhs.sessionCount
        && lhs.parentId == rhs.parentId;
}

bool operator!=(const TaskItem &lhs, const TaskItem &rhs)
{
    return !(lhs == rhs);
}

int priorityWeight(PriorityTier tier)
{
    switch (tier) {
    case PriorityTier::High:
        return 3;
    case PriorityTier::Medium:
        return 2;
    case PriorityTier::Low:
        return 1;
    }
    return 1;
}

PriorityTier demoted(PriorityTier tier)
{
    switch (tier) {
    case PriorityTier::High:
        return PriorityTier::Medium;
    case PriorityTier::Medium:
    case PriorityTier::Low:
        return PriorityTier::Low;
    }
    return PriorityTier::Low;
}

QString priorityLabel(PriorityTier tier)
{
    switch (tier) {
    case PriorityTier::High:
        return QStringLiteral("high");
    case PriorityTier::Medium:
        return QStringLiteral("medium");
    case PriorityTier::Low:
        return QStringLiteral("low");
    }
    return QStringLiteral("medium");
}

} // namespace data
} // namespace planner
