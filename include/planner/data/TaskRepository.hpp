#pragma once

#include <optional>
#include <vector>

#include "planner/data/Task.hpp"

namespace planner {
namespace data {

class TaskRepository
{
public:
    virtual ~TaskRepository() = default;

    virtual std::vector<TaskItem> fetchTasks() const = 0;
    virtual std::optional<TaskItem> findById(const QString &id) const = 0;
    virtual TaskItem addTask(TaskItem task) = 0;
    virtual bool updateTask(const TaskItem &task) = 0;
    virtual bool removeTask(const QString &id) = 0;

    std::vector<TaskItem> fetchActiveTasks() const;
};

} // namespace data
} // namespace planner
