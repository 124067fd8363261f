#pragma once

#include <QDate>
#include <QStringList>
#include <vector>

#include "planner/data/Task.hpp"

namespace planner {
namespace engine {

constexpr int MaxRecommendations = 5;

constexpr int ManyActiveTasks = 20;
constexpr int FewActiveTasks = 3;
constexpr int ManyHighPriorityTasks = 5;
constexpr int HeavyWorkloadMinutes = 8 * 60;
constexpr int LongTaskMinutes = 120;
constexpr int DueSoonWindowDays = 2;

QString emptyTaskListRecommendation();
QString wellOrganizedRecommendation();

// Advice over the whole task set, completed tasks included. Triggers are
// evaluated in a fixed order and the list is capped at MaxRecommendations;
// the due-soon reminder comes last so it never displaces the others.
QStringList recommendations(const std::vector<data::TaskItem> &tasks, const QDate &today);

} // namespace engine
} // namespace planner
