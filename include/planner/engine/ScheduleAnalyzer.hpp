#pragma once

#include <QDate>
#include <vector>

#include "planner/data/Analytics.hpp"
#include "planner/data/Schedule.hpp"

namespace planner {
namespace engine {

constexpr int ShortAllocationMinutes = 30;
constexpr int LongAllocationMinutes = 90;

constexpr double TierCoveragePoints = 30.0;
constexpr double LengthMixPoints = 20.0;
constexpr double CompletionPoints = 50.0;

constexpr double DefaultEfficiencyFactor = 0.8;
constexpr int DailyCapacityMinutes = 360;

data::ScheduleRating ratingForPoints(double points);

// Empty schedules and non-positive budgets yield zero utilization and a poor rating.
data::ScheduleDiagnostics analyzeSchedule(const std::vector<data::ScheduledTask> &schedule, int budgetMinutes);

// Only tasks flagged completed are counted.
data::CompletionStats completionStats(const std::vector<data::TaskItem> &tasks);

// Only tasks not flagged completed are counted.
data::CompletionEstimate estimateCompletion(const std::vector<data::TaskItem> &tasks, const QDate &today,
                                            double efficiencyFactor = DefaultEfficiencyFactor);

} // namespace engine
} // namespace planner
