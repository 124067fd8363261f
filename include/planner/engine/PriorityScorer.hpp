#pragma once

#include <QDate>

#include "planner/data/Task.hpp"

namespace planner {
namespace engine {

enum class UrgencyTier
{
    None,
    DueThisWeek,
    DueSoon,
    DueToday,
    Overdue,
};

// Score constants. Adjacent priority tiers are further apart than the largest
// urgency boost, and adjacent urgency tiers are further apart than the largest
// duration bonus, so priority dominates urgency and urgency dominates duration.
constexpr double HighPriorityBase = 100.0;
constexpr double MediumPriorityBase = 50.0;
constexpr double LowPriorityBase = 10.0;

constexpr double OverdueBoost = 20.0;
constexpr double DueTodayBoost = 15.0;
constexpr double DueSoonBoost = 10.0;
constexpr double DueThisWeekBoost = 5.0;

constexpr double MaxDurationBonus = 4.0;
constexpr int DurationBonusHorizonMinutes = 480;

constexpr int DueSoonDays = 3;
constexpr int DueThisWeekDays = 7;

UrgencyTier urgencyTier(const QDate &deadline, const QDate &today);

double priorityBase(data::PriorityTier tier);
double urgencyBoost(UrgencyTier tier);
double durationBonus(int estimatedMinutes);

// Higher is more urgent. Pure function of the task fields and today's date.
double priorityScore(const data::TaskItem &task, const QDate &today);

} // namespace engine
} // namespace planner
