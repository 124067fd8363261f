#include "planner/data/TaskRepository.hpp"

namespace planner {
namespace data {

std::vector<TaskItem> TaskRepository::fetchActiveTasks() const
{
    std::vector<TaskItem> active;
    for (auto &task : fetchTasks()) {
        if (!task.completed) {
            active.push_back(std::move(task));
        }
    }
    return active;
}

} // namespace data
} // namespace planner
