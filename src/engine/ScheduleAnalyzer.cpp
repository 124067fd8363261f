#include "planner/engine/ScheduleAnalyzer.hpp"

#include <QtGlobal>
#include <limits>

namespace planner {
namespace engine {

namespace {

int clampToInt(qint64 value)
{
    return static_cast<int>(qBound<qint64>(0, value, std::numeric_limits<int>::max()));
}

double roundToTenth(double value)
{
    return qRound64(value * 10.0) / 10.0;
}

struct TierTotals
{
    qint64 high = 0;
    qint64 medium = 0;
    qint64 low = 0;

    void add(data::PriorityTier tier, qint64 amount)
    {
        switch (tier) {
        case data::PriorityTier::High:
            high += amount;
            break;
        case data::PriorityTier::Medium:
            medium += amount;
            break;
        case data::PriorityTier::Low:
            low += amount;
            break;
        }
    }

    data::TierBreakdown breakdown() const
    {
        return { clampToInt(high), clampToInt(medium), clampToInt(low) };
    }
};

} // namespace

data::ScheduleRating ratingForPoints(double points)
{
    const double maximum = TierCoveragePoints + LengthMixPoints + CompletionPoints;
    const double share = points / maximum;
    if (share < 0.4) {
        return data::ScheduleRating::Poor;
    }
    if (share < 0.6) {
        return data::ScheduleRating::Fair;
    }
    if (share < 0.8) {
        return data::ScheduleRating::Good;
    }
    return data::ScheduleRating::Excellent;
}

data::ScheduleDiagnostics analyzeSchedule(const std::vector<data::ScheduledTask> &schedule, int budgetMinutes)
{
    data::ScheduleDiagnostics diagnostics;
    if (schedule.empty()) {
        return diagnostics;
    }

    qint64 allocated = 0;
    qint64 weighted = 0;
    bool hasHigh = false;
    bool hasMedium = false;
    bool hasLow = false;
    bool hasShort = false;
    bool hasLong = false;
    double completionSum = 0.0;
    for (const auto &entry : schedule) {
        allocated += entry.allocatedMinutes;
        weighted += qint64(entry.allocatedMinutes) * data::priorityWeight(entry.task.priority);
        hasHigh = hasHigh || entry.task.priority == data::PriorityTier::High;
        hasMedium = hasMedium || entry.task.priority == data::PriorityTier::Medium;
        hasLow = hasLow || entry.task.priority == data::PriorityTier::Low;
        hasShort = hasShort || entry.allocatedMinutes <= ShortAllocationMinutes;
        hasLong = hasLong || entry.allocatedMinutes > LongAllocationMinutes;
        completionSum += entry.completionPercentage;
    }

    diagnostics.totalAllocatedMinutes = clampToInt(allocated);
    if (budgetMinutes > 0) {
        diagnostics.utilizationPercentage = static_cast<double>(allocated) * 100.0 / budgetMinutes;
        diagnostics.priorityWeightedScore = static_cast<double>(weighted) * 100.0 / (budgetMinutes * 3.0);
    }

    double points = 0.0;
    if (hasHigh && hasMedium && hasLow) {
        points += TierCoveragePoints;
    }
    if (hasShort && hasLong) {
        points += LengthMixPoints;
    }
    const double averageCompletion = completionSum / static_cast<double>(schedule.size());
    points += CompletionPoints * qBound(0.0, averageCompletion, 100.0) / 100.0;

    diagnostics.qualityPoints = points;
    diagnostics.rating = ratingForPoints(points);
    return diagnostics;
}

data::CompletionStats completionStats(const std::vector<data::TaskItem> &tasks)
{
    data::CompletionStats stats;
    qint64 spent = 0;
    TierTotals byTier;
    for (const auto &task : tasks) {
        if (!task.completed) {
            continue;
        }
        ++stats.totalCompleted;
        spent += task.actualMinutes > 0 ? task.actualMinutes : task.effectiveMinutes();
        byTier.add(task.priority, 1);
    }
    stats.totalMinutesSpent = clampToInt(spent);
    stats.completedByTier = byTier.breakdown();
    if (stats.totalCompleted == 0) {
        return stats;
    }
    stats.averageCompletionMinutes = roundToTenth(static_cast<double>(spent) / stats.totalCompleted);
    const double score = stats.totalCompleted * 10.0 + qMin(static_cast<double>(spent) / 60.0, 40.0);
    stats.productivityScore = roundToTenth(qMin(100.0, score));
    return stats;
}

data::CompletionEstimate estimateCompletion(const std::vector<data::TaskItem> &tasks, const QDate &today,
                                            double efficiencyFactor)
{
    data::CompletionEstimate estimate;
    estimate.dailyCapacityMinutes = DailyCapacityMinutes;
    estimate.efficiencyFactor = efficiencyFactor > 0.0 && efficiencyFactor <= 1.0 ? efficiencyFactor
                                                                                  : DefaultEfficiencyFactor;
    qint64 total = 0;
    TierTotals byTier;
    for (const auto &task : tasks) {
        if (task.completed) {
            continue;
        }
        total += task.effectiveMinutes();
        byTier.add(task.priority, task.effectiveMinutes());
    }
    estimate.totalMinutes = clampToInt(total);
    estimate.minutesByTier = byTier.breakdown();
    if (total == 0) {
        return estimate;
    }

    const double adjusted = static_cast<double>(total) / estimate.efficiencyFactor;
    const double days = adjusted / DailyCapacityMinutes;
    estimate.adjustedMinutes = clampToInt(qRound64(adjusted));
    estimate.daysNeeded = roundToTenth(days);
    if (today.isValid()) {
        estimate.estimatedCompletion = today.addDays(static_cast<qint64>(days) + 1);
    }
    return estimate;
}

} // namespace engine
} // namespace planner
