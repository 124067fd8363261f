#pragma once

#include <QDate>
#include <QString>

namespace planner {
namespace data {

enum class ScheduleRating
{
    Poor,
    Fair,
    Good,
    Excellent,
};

QString ratingLabel(ScheduleRating rating);

struct ScheduleDiagnostics
{
    double utilizationPercentage = 0.0;
    double priorityWeightedScore = 0.0;
    ScheduleRating rating = ScheduleRating::Poor;
    // Composite the rating was bucketed from, 0..100.
    double qualityPoints = 0.0;
    int totalAllocatedMinutes = 0;
};

struct TierBreakdown
{
    int high = 0;
    int medium = 0;
    int low = 0;
};

struct CompletionStats
{
    int totalCompleted = 0;
    int totalMinutesSpent = 0;
    double averageCompletionMinutes = 0.0;
    TierBreakdown completedByTier;
    double productivityScore = 0.0;
};

struct CompletionEstimate
{
    int totalMinutes = 0;
    int adjustedMinutes = 0;
    double daysNeeded = 0.0;
    QDate estimatedCompletion;
    TierBreakdown minutesByTier;
    int dailyCapacityMinutes = 0;
    double efficiencyFactor = 0.0;
};

} // namespace data
} // namespace planner
