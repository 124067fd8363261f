#include "planner/engine/TaskSorter.hpp"

#include <algorithm>
#include <numeric>

#include "planner/engine/PriorityScorer.hpp"

namespace planner {
namespace engine {

std::vector<std::size_t> sortedOrder(const std::vector<data::TaskItem> &tasks, const QDate &today)
{
    std::vector<double> scores;
    scores.reserve(tasks.size());
    for (const auto &task : tasks) {
        scores.push_back(priorityScore(task, today));
    }

    std::vector<std::size_t> order(tasks.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t lhs, std::size_t rhs) {
        if (scores[lhs] != scores[rhs]) {
            return scores[lhs] > scores[rhs];
        }
        return tasks[lhs].effectiveMinutes() < tasks[rhs].effectiveMinutes();
    });
    return order;
}

std::vector<data::TaskItem> sortTasks(const std::vector<data::TaskItem> &tasks, const QDate &today)
{
    std::vector<data::TaskItem> sorted;
    sorted.reserve(tasks.size());
    for (const auto index : sortedOrder(tasks, today)) {
        sorted.push_back(tasks[index]);
    }
    return sorted;
}

} // namespace engine
} // namespace planner
