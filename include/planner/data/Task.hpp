#pragma once

#include <QDate>
#include <QString>

namespace planner {
namespace data {

constexpr int DefaultEstimatedMinutes = 30;

enum class PriorityTier
{
    High,
    Medium,
    Low,
};

struct TaskItem
{
    QString id;
    QString title;
    int estimatedMinutes = DefaultEstimatedMinutes;
    PriorityTier priority = PriorityTier::Medium;
    QDate deadline;
    bool completed = false;
    int actualMinutes = 0;

    // Set on parts produced by the splitter; sessionIndex 0 marks an unsplit task.
    int sessionIndex = 0;
    int sessionCount = 0;
    QString parentId;

    bool hasDeadline() const { return deadline.isValid(); }
    int effectiveMinutes() const { return estimatedMinutes > 0 ? estimatedMinutes : DefaultEstimatedMinutes; }
    bool isSplitPart() const { return sessionIndex > 0; }
};

bool operator==(const TaskItem &lhs, const TaskItem &rhs);
bool operator!=(const TaskItem &lhs, const TaskItem &rhs);

int priorityWeight(PriorityTier tier);
PriorityTier demoted(PriorityTier tier);
QString priorityLabel(PriorityTier tier);

} // namespace data
} // namespace planner
