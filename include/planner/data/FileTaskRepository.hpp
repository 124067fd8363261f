#pragma once

#include "planner/data/TaskFileStorage.hpp"
#include "planner/data/TaskRepository.hpp"

#include <memory>

namespace planner {
namespace data {

class FileTaskRepository : public TaskRepository
{
public:
    explicit FileTaskRepository(std::shared_ptr<TaskFileStorage> storage);
    ~FileTaskRepository() override = default;

    std::vector<TaskItem> fetchTasks() const override;
    std::optional<TaskItem> findById(const QString &id) const override;
    TaskItem addTask(TaskItem task) override;
    bool updateTask(const TaskItem &task) override;
    bool removeTask(const QString &id) override;

private:
    std::shared_ptr<TaskFileStorage> m_storage;
};

} // namespace data
} // namespace planner
