#pragma once

#include <QDate>
#include <cstddef>
#include <vector>

#include "planner/data/Task.hpp"

namespace planner {
namespace engine {

// Most urgent first; ties go to the shorter task, then to input order.
std::vector<std::size_t> sortedOrder(const std::vector<data::TaskItem> &tasks, const QDate &today);
std::vector<data::TaskItem> sortTasks(const std::vector<data::TaskItem> &tasks, const QDate &today);

} // namespace engine
} // namespace planner
