#pragma once

#include <QString>
#include <QStringList>

#include "planner/data/Schedule.hpp"

namespace planner {
namespace engine {

class BreakSuggestionProvider
{
public:
    virtual ~BreakSuggestionProvider() = default;

    // ordinal counts the breaks of the same kind within one plan, starting at 0.
    // Providers hold no per-call state, so one instance can serve concurrent plans.
    virtual QString suggestion(data::SessionKind kind, int minutes, int ordinal) const = 0;
};

QStringList shortBreakSuggestions();
QStringList longBreakSuggestions();

// Walks the built-in lists in order of the break ordinal.
class CyclingBreakSuggestions : public BreakSuggestionProvider
{
public:
    QString suggestion(data::SessionKind kind, int minutes, int ordinal) const override;
};

class RandomBreakSuggestions : public BreakSuggestionProvider
{
public:
    RandomBreakSuggestions();
    explicit RandomBreakSuggestions(quint32 seed);

    quint32 seed() const;
    // Same seed, kind and ordinal always give the same text.
    QString suggestion(data::SessionKind kind, int minutes, int ordinal) const override;

private:
    quint32 m_seed;
};

} // namespace engine
} // namespace planner
