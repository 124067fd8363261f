#include "planner/data/FileTaskRepository.hpp"

namespace planner {
namespace data {

FileTaskRepository::FileTaskRepository(std::shared_ptr<TaskFileStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<TaskItem> FileTaskRepository::fetchTasks() const
{
    if (!m_storage) {
        return {};
    }
    return m_storage->tasks();
}

std::optional<TaskItem> FileTaskRepository::findById(const QString &id) const
{
    if (!m_storage || !m_storage->contains(id)) {
        return std::nullopt;
    }
    return m_storage->task(id);
}

TaskItem FileTaskRepository::addTask(TaskItem task)
{
    if (!m_storage) {
        return task;
    }
    return m_storage->addOrUpdateTask(std::move(task));
}

bool FileTaskRepository::updateTask(const TaskItem &task)
{
    if (!m_storage || !m_storage->contains(task.id)) {
        return false;
    }
    m_storage->addOrUpdateTask(task);
    return true;
}

bool FileTaskRepository::removeTask(const QString &id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeTask(id);
}

} // namespace data
} // namespace planner
