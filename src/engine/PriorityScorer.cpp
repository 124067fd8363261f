#include "planner/engine/PriorityScorer.hpp"

#include <QtGlobal>

namespace planner {
namespace engine {

UrgencyTier urgencyTier(const QDate &deadline, const QDate &today)
{
    if (!deadline.isValid() || !today.isValid()) {
        return UrgencyTier::None;
    }
    const qint64 daysLeft = today.daysTo(deadline);
    if (daysLeft < 0) {
        return UrgencyTier::Overdue;
    }
    if (daysLeft == 0) {
        return UrgencyTier::DueToday;
    }
    if (daysLeft <= DueSoonDays) {
        return UrgencyTier::DueSoon;
    }
    if (daysLeft <= DueThisWeekDays) {
        return UrgencyTier::DueThisWeek;
    }
    return UrgencyTier::None;
}

double priorityBase(data::PriorityTier tier)
{
    switch (tier) {
    case data::PriorityTier::High:
        return HighPriorityBase;
    case data::PriorityTier::Medium:
        return MediumPriorityBase;
    case data::PriorityTier::Low:
        return LowPriorityBase;
    }
    return MediumPriorityBase;
}

double urgencyBoost(UrgencyTier tier)
{
    switch (tier) {
    case UrgencyTier::Overdue:
        return OverdueBoost;
    case UrgencyTier::DueToday:
        return DueTodayBoost;
    case UrgencyTier::DueSoon:
        return DueSoonBoost;
    case UrgencyTier::DueThisWeek:
        return DueThisWeekBoost;
    case UrgencyTier::None:
        break;
    }
    return 0.0;
}

double durationBonus(int estimatedMinutes)
{
    const int clamped = qBound(1, estimatedMinutes, DurationBonusHorizonMinutes);
    return MaxDurationBonus * (1.0 - static_cast<double>(clamped) / DurationBonusHorizonMinutes);
}

double priorityScore(const data::TaskItem &task, const QDate &today)
{
    return priorityBase(task.priority)
        + urgencyBoost(urgencyTier(task.deadline, today))
        + durationBonus(task.effectiveMinutes());
}

} // namespace engine
} // namespace planner
