#pragma once

#include <QString>
#include <memory>

#include "planner/core/SchedulerSettings.hpp"

namespace planner {
namespace data {
class TaskFileStorage;
class TaskRepository;
}

namespace engine {
class BreakSuggestionProvider;
}

namespace core {

class PlanningService;

// Owns the task repository and the planning service built on the given settings.
// An empty file path keeps tasks in memory only.
class PlannerContext
{
public:
    explicit PlannerContext(const QString &taskFilePath = QString(), SchedulerSettings settings = SchedulerSettings());
    ~PlannerContext();

    data::TaskRepository &taskRepository();
    const engine::BreakSuggestionProvider &breakSuggestions() const;
    PlanningService &planningService();

    static QString defaultTaskFilePath();

private:
    std::shared_ptr<data::TaskFileStorage> m_storage;
    std::unique_ptr<data::TaskRepository> m_taskRepository;
    std::unique_ptr<engine::BreakSuggestionProvider> m_breakSuggestions;
    std::unique_ptr<PlanningService> m_planningService;
};

} // namespace core
} // namespace planner
