#pragma once

#include <QDate>
#include <vector>

#include "planner/data/Schedule.hpp"

namespace planner {
namespace engine {

class BreakSuggestionProvider;

struct SessionPolicy
{
    int focusMinutes = 25;
    int breakMinutes = 5;
    // Every n-th focus session overall is followed by a long break.
    int longBreakInterval = 4;
    int longBreakMultiplier = 3;
};

class SessionPlanner
{
public:
    explicit SessionPlanner(const QDate &today, SessionPolicy policy = SessionPolicy(),
                            const BreakSuggestionProvider *suggestions = nullptr);

    const SessionPolicy &policy() const;

    // Focus sessions for every task in priority order, with breaks between
    // them. No break follows the final focus session.
    std::vector<data::Session> plan(const std::vector<data::TaskItem> &tasks) const;

private:
    QDate m_today;
    SessionPolicy m_policy;
    const BreakSuggestionProvider *m_suggestions;
};

} // namespace engine
} // namespace planner
