#include "planner/core/SchedulerSettings.hpp"

#include <QSettings>
#include <QtGlobal>

#include "planner/Logging.hpp"

namespace planner {
namespace core {

namespace {
constexpr int MaxMinutes = 24 * 60;
} // namespace

SchedulerSettings loadSchedulerSettings(QSettings &settings)
{
    SchedulerSettings values;

    const int chunk = settings.value(QStringLiteral("allocation/minimumChunkMinutes"), values.minimumChunkMinutes).toInt();
    values.minimumChunkMinutes = qBound(1, chunk, MaxMinutes);

    const int maxSession = settings.value(QStringLiteral("split/maxSessionMinutes"), values.maxSessionMinutes).toInt();
    values.maxSessionMinutes = qBound(1, maxSession, MaxMinutes);

    auto &sessions = values.sessions;
    sessions.focusMinutes = qBound(1, settings.value(QStringLiteral("sessions/focusMinutes"), sessions.focusMinutes).toInt(), MaxMinutes);
    sessions.breakMinutes = qBound(0, settings.value(QStringLiteral("sessions/breakMinutes"), sessions.breakMinutes).toInt(), MaxMinutes);
    sessions.longBreakInterval = qBound(1, settings.value(QStringLiteral("sessions/longBreakInterval"), sessions.longBreakInterval).toInt(), 100);
    sessions.longBreakMultiplier = qBound(1, settings.value(QStringLiteral("sessions/longBreakMultiplier"), sessions.longBreakMultiplier).toInt(), 10);

    const double efficiency = settings.value(QStringLiteral("estimate/efficiencyFactor"), values.efficiencyFactor).toDouble();
    values.efficiencyFactor = qBound(0.1, efficiency, 1.0);

    values.randomBreakSuggestions = settings.value(QStringLiteral("sessions/randomSuggestions"), false).toBool();

    const int slotCount = settings.beginReadArray(QStringLiteral("slots"));
    std::vector<data::TimeSlot> timeSlots;
    for (int i = 0; i < slotCount; ++i) {
        settings.setArrayIndex(i);
        data::TimeSlot slot;
        slot.name = settings.value(QStringLiteral("name")).toString().trimmed();
        slot.minutes = qBound(0, settings.value(QStringLiteral("minutes")).toInt(), MaxMinutes);
        if (slot.name.isEmpty()) {
            qCWarning(lcConfig) << "Ignoring unnamed slot at index" << i;
            continue;
        }
        timeSlots.push_back(slot);
    }
    settings.endArray();
    if (!timeSlots.empty()) {
        values.timeSlots = std::move(timeSlots);
    }
    return values;
}

void saveSchedulerSettings(QSettings &settings, const SchedulerSettings &values)
{
    settings.setValue(QStringLiteral("allocation/minimumChunkMinutes"), values.minimumChunkMinutes);
    settings.setValue(QStringLiteral("split/maxSessionMinutes"), values.maxSessionMinutes);
    settings.setValue(QStringLiteral("sessions/focusMinutes"), values.sessions.focusMinutes);
    settings.setValue(QStringLiteral("sessions/breakMinutes"), values.sessions.breakMinutes);
    settings.setValue(QStringLiteral("sessions/longBreakInterval"), values.sessions.longBreakInterval);
    settings.setValue(QStringLiteral("sessions/longBreakMultiplier"), values.sessions.longBreakMultiplier);
    settings.setValue(QStringLiteral("sessions/randomSuggestions"), values.randomBreakSuggestions);
    settings.setValue(QStringLiteral("estimate/efficiencyFactor"), values.efficiencyFactor);

    settings.beginWriteArray(QStringLiteral("slots"), static_cast<int>(values.timeSlots.size()));
    for (int i = 0; i < static_cast<int>(values.timeSlots.size()); ++i) {
        settings.setArrayIndex(i);
        settings.setValue(QStringLiteral("name"), values.timeSlots[static_cast<size_t>(i)].name);
        settings.setValue(QStringLiteral("minutes"), values.timeSlots[static_cast<size_t>(i)].minutes);
    }
    settings.endArray();
}

} // namespace core
} // namespace planner
