#include "planner/data/InMemoryTaskRepository.hpp"

#include <QUuid>

namespace planner {
namespace data {

InMemoryTaskRepository::InMemoryTaskRepository() = default;
InMemoryTaskRepository::~InMemoryTaskRepository() = default;

std::vector<TaskItem> InMemoryTaskRepository::fetchTasks() const
{
    std::vector<TaskItem> tasks;
    tasks.reserve(static_cast<size_t>(m_order.size()));
    for (const auto &id : m_order) {
        tasks.push_back(m_items.value(id));
    }
    return tasks;
}

std::optional<TaskItem> InMemoryTaskRepository::findById(const QString &id) const
{
    if (m_items.contains(id)) {
        return m_items.value(id);
    }
    return std::nullopt;
}

TaskItem InMemoryTaskRepository::addTask(TaskItem task)
{
    if (task.id.isEmpty()) {
        task.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }
    if (!m_items.contains(task.id)) {
        m_order.append(task.id);
    }
    m_items.insert(task.id, task);
    return task;
}

bool InMemoryTaskRepository::updateTask(const TaskItem &task)
{
    if (!m_items.contains(task.id)) {
        return false;
    }
    m_items.insert(task.id, task);
    return true;
}

bool InMemoryTaskRepository::removeTask(const QString &id)
{
    if (m_items.remove(id) == 0) {
        return false;
    }
    m_order.removeAll(id);
    return true;
}

} // namespace data
} // namespace planner
