#include "planner/data/TaskFileStorage.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QUuid>

#include "planner/Logging.hpp"
#include "planner/data/JsonCodec.hpp"

namespace planner {
namespace data {

namespace {
constexpr int CurrentFileVersion = 1;

QString createId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}
} // namespace

TaskFileStorage::TaskFileStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
    if (!load()) {
        qCWarning(lcData) << "Starting with an empty task list";
    }
}

const QString &TaskFileStorage::filePath() const
{
    return m_filePath;
}

std::vector<TaskItem> TaskFileStorage::tasks() const
{
    std::vector<TaskItem> result;
    result.reserve(static_cast<size_t>(m_order.size()));
    for (const auto &id : m_order) {
        result.push_back(m_tasks.value(id));
    }
    return result;
}

bool TaskFileStorage::contains(const QString &id) const
{
    return m_tasks.contains(id);
}

TaskItem TaskFileStorage::task(const QString &id) const
{
    return m_tasks.value(id);
}

TaskItem TaskFileStorage::addOrUpdateTask(TaskItem task)
{
    if (task.id.isEmpty()) {
        task.id = createId();
    }
    if (!m_tasks.contains(task.id)) {
        m_order.append(task.id);
    }
    m_tasks.insert(task.id, task);
    if (!save()) {
        qCWarning(lcData) << "Task" << task.id << "is only kept in memory";
    }
    return task;
}

bool TaskFileStorage::removeTask(const QString &id)
{
    if (m_tasks.remove(id) > 0) {
        m_order.removeAll(id);
        if (!save()) {
            qCWarning(lcData) << "Removal of task" << id << "is only kept in memory";
        }
        return true;
    }
    return false;
}

bool TaskFileStorage::load()
{
    m_tasks.clear();
    m_order.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcData) << "Cannot open task file" << m_filePath << file.errorString();
        return false;
    }

    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError) {
        qCWarning(lcData) << "Malformed task file" << m_filePath << error.errorString();
        return false;
    }

    // Accept both the versioned object and a bare task array.
    const QJsonValue list = document.isArray() ? QJsonValue(document.array())
                                               : document.object().value(QStringLiteral("tasks"));
    const auto decoded = tasksFromJson(list);
    if (!decoded) {
        qCWarning(lcData) << "Task file" << m_filePath << "has no task list";
        return false;
    }
    for (auto task : *decoded) {
        if (task.id.isEmpty() || m_tasks.contains(task.id)) {
            task.id = createId();
        }
        m_order.append(task.id);
        m_tasks.insert(task.id, task);
    }
    qCDebug(lcData) << "Loaded" << m_order.size() << "tasks from" << m_filePath;
    return true;
}

bool TaskFileStorage::save() const
{
    if (m_filePath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    QJsonObject root;
    root.insert(QStringLiteral("version"), CurrentFileVersion);
    root.insert(QStringLiteral("tasks"), tasksToJson(tasks()));

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcData) << "Cannot write task file" << m_filePath << file.errorString();
        return false;
    }
    if (file.write(QJsonDocument(root).toJson(QJsonDocument::Indented)) < 0) {
        qCWarning(lcData) << "Failed to write task file" << m_filePath << file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        qCWarning(lcData) << "Failed to commit task file" << m_filePath << file.errorString();
        return false;
    }
    return true;
}

} // namespace data
} // namespace planner
