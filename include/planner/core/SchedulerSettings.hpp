#pragma once

#include <vector>

#include "planner/data/Schedule.hpp"
#include "planner/engine/ScheduleAnalyzer.hpp"
#include "planner/engine/SessionPlanner.hpp"
#include "planner/engine/SlotPlanner.hpp"
#include "planner/engine/TaskSplitter.hpp"
#include "planner/engine/TimeAllocator.hpp"

class QSettings;

namespace planner {
namespace core {

struct SchedulerSettings
{
    int minimumChunkMinutes = engine::DefaultMinimumChunkMinutes;
    int maxSessionMinutes = engine::DefaultMaxSessionMinutes;
    engine::SessionPolicy sessions;
    std::vector<data::TimeSlot> timeSlots = engine::SlotPlanner::defaultSlots();
    double efficiencyFactor = engine::DefaultEfficiencyFactor;
    bool randomBreakSuggestions = false;
};

// Missing keys keep their defaults; out-of-range values are clamped.
SchedulerSettings loadSchedulerSettings(QSettings &settings);
void saveSchedulerSettings(QSettings &settings, const SchedulerSettings &values);

} // namespace core
} // namespace planner
