#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <vector>

#include "planner/data/Task.hpp"

namespace planner {
namespace data {

// JSON document on disk holding the task list. Every mutation is written back
// atomically.
class TaskFileStorage
{
public:
    explicit TaskFileStorage(QString filePath);

    const QString &filePath() const;
    std::vector<TaskItem> tasks() const;
    bool contains(const QString &id) const;
    TaskItem task(const QString &id) const;

    TaskItem addOrUpdateTask(TaskItem task);
    bool removeTask(const QString &id);

    bool load();
    bool save() const;

private:
    QString m_filePath;
    QHash<QString, TaskItem> m_tasks;
    QStringList m_order;
};

} // namespace data
} // namespace planner
