#include "planner/core/PlannerContext.hpp"

#include <QDir>
#include <QStandardPaths>

#include "planner/core/PlanningService.hpp"
#include "planner/data/FileTaskRepository.hpp"
#include "planner/data/InMemoryTaskRepository.hpp"
#include "planner/data/TaskFileStorage.hpp"
#include "planner/engine/BreakSuggestionProvider.hpp"

namespace planner {
namespace core {

PlannerContext::PlannerContext(const QString &taskFilePath, SchedulerSettings settings)
{
    if (taskFilePath.isEmpty()) {
        m_taskRepository = std::make_unique<data::InMemoryTaskRepository>();
    } else {
        m_storage = std::make_shared<data::TaskFileStorage>(taskFilePath);
        m_taskRepository = std::make_unique<data::FileTaskRepository>(m_storage);
    }

    if (settings.randomBreakSuggestions) {
        m_breakSuggestions = std::make_unique<engine::RandomBreakSuggestions>();
    } else {
        m_breakSuggestions = std::make_unique<engine::CyclingBreakSuggestions>();
    }
    m_planningService = std::make_unique<PlanningService>(std::move(settings), m_breakSuggestions.get());
}

PlannerContext::~PlannerContext() = default;

data::TaskRepository &PlannerContext::taskRepository()
{
    return *m_taskRepository;
}

const engine::BreakSuggestionProvider &PlannerContext::breakSuggestions() const
{
    return *m_breakSuggestions;
}

PlanningService &PlannerContext::planningService()
{
    return *m_planningService;
}

QString PlannerContext::defaultTaskFilePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/block-planner");
    }
    return QDir(storageFolder).filePath(QStringLiteral("tasks.json"));
}

} // namespace core
} // namespace planner
