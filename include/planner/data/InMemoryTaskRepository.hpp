#pragma once

#include <QHash>
#include <QStringList>

#include "planner/data/TaskRepository.hpp"

namespace planner {
namespace data {

class InMemoryTaskRepository : public TaskRepository
{
public:
    InMemoryTaskRepository();
    ~InMemoryTaskRepository() override;

    std::vector<TaskItem> fetchTasks() const override;
    std::optional<TaskItem> findById(const QString &id) const override;
    TaskItem addTask(TaskItem task) override;
    bool updateTask(const TaskItem &task) override;
    bool removeTask(const QString &id) override;

private:
    QHash<QString, TaskItem> m_items;
    // Insertion order, so fetchTasks() is reproducible.
    QStringList m_order;
};

} // namespace data
} // namespace planner
