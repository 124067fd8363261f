#include "planner/engine/BreakSuggestionProvider.hpp"

#include <QRandomGenerator>
#include <QtGlobal>

namespace planner {
namespace engine {

QStringList shortBreakSuggestions()
{
    return {
        QStringLiteral("Stand up and stretch"),
        QStringLiteral("Drink a glass of water"),
        QStringLiteral("Look out of the window for a minute"),
        QStringLiteral("Take a few deep breaths"),
    };
}

QStringList longBreakSuggestions()
{
    return {
        QStringLiteral("Go for a short walk"),
        QStringLiteral("Have a healthy snack"),
        QStringLiteral("Do a quick mindfulness exercise"),
    };
}

QString CyclingBreakSuggestions::suggestion(data::SessionKind kind, int minutes, int ordinal) const
{
    Q_UNUSED(minutes)
    const auto list = kind == data::SessionKind::LongBreak ? longBreakSuggestions() : shortBreakSuggestions();
    return list.at(qAbs(ordinal) % list.size());
}

RandomBreakSuggestions::RandomBreakSuggestions()
    : m_seed(QRandomGenerator::securelySeeded().generate())
{
}

RandomBreakSuggestions::RandomBreakSuggestions(quint32 seed)
    : m_seed(seed)
{
}

quint32 RandomBreakSuggestions::seed() const
{
    return m_seed;
}

QString RandomBreakSuggestions::suggestion(data::SessionKind kind, int minutes, int ordinal) const
{
    Q_UNUSED(minutes)
    const bool longBreak = kind == data::SessionKind::LongBreak;
    const auto list = longBreak ? longBreakSuggestions() : shortBreakSuggestions();
    const quint32 seeds[] = { m_seed, static_cast<quint32>(ordinal), longBreak ? 1u : 0u };
    QRandomGenerator generator(seeds, seeds + 3);
    return list.at(static_cast<int>(generator.bounded(static_cast<quint32>(list.size()))));
}

} // namespace engine
} // namespace planner
