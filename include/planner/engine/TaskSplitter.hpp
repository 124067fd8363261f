#pragma once

#include <vector>

#include "planner/data/Task.hpp"

namespace planner {
namespace engine {

constexpr int DefaultMaxSessionMinutes = 90;

// Returns {task} unchanged when it already fits one session. Otherwise the task
// is cut into ceil(duration / maxSessionMinutes) parts of even, rounded length;
// every part after the first is demoted one priority tier.
std::vector<data::TaskItem> splitTask(const data::TaskItem &task, int maxSessionMinutes = DefaultMaxSessionMinutes);

} // namespace engine
} // namespace planner
