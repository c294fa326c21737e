#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "schedule.hpp"
#include "solver_base.hpp"
#include <iostream>
#include <string>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// "none" for a same-venue move, otherwise "<N>m to <VENUE>".
std::string formatTransit(const ScheduledOccurrence& entry);

/// "none" for downtime up to `quietMinutes`, otherwise "<N>m".
std::string formatDowntime(const ScheduledOccurrence& entry, int quietMinutes = DEFAULT_SAME_VENUE_MINUTES);

/**
 * @brief Print the schedule as one small table per calendar day.
 */
void printSchedule(const ScheduleResult& result, std::ostream& out = std::cout);

/**
 * @brief Progress hook printing every improving incumbent.
 *
 * The catalog must outlive the returned hook.
 */
ProgressHook makeProgressPrinter(const EventCatalog& catalog, std::ostream& out = std::cout);
