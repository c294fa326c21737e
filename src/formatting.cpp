///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include <iomanip>


///////////////////////////
///       HELPERS       ///
///////////////////////////
std::string formatTransit(const ScheduledOccurrence& entry) {
    if (!entry.transitMinutes || !entry.previousVenue || *entry.previousVenue == entry.venue) {
        return "none";
    }
    return std::to_string(*entry.transitMinutes) + "m to " + entry.venue;
}

std::string formatDowntime(const ScheduledOccurrence& entry, int quietMinutes) {
    if (!entry.downtimeMinutes || *entry.downtimeMinutes <= quietMinutes) {
        return "none";
    }
    return std::to_string(*entry.downtimeMinutes) + "m";
}

/**
 * @brief Print the header row for a per-day schedule table.
 *
 * Uses fixed-width columns to align time, venue, title, transit and downtime.
 */
static void printDayTableHeader(std::ostream& out) {
    out << "    "
        << std::left << std::setw(11) << "Time"
        << " | " << std::left << std::setw(5)  << "Venue"
        << " | " << std::left << std::setw(36) << "Title"
        << " | " << std::left << std::setw(12) << "Transit"
        << " | " << "Downtime"
        << "\n";

    out << "    "
        << std::string(11, '-')
        << "-+-" << std::string(5, '-')
        << "-+-" << std::string(36, '-')
        << "-+-" << std::string(12, '-')
        << "-+-" << std::string(8, '-')
        << "\n";
}

/**
 * @brief Print the attended occurrences grouped by day, in start order.
 *
 * The first occurrence of each day has no transit or downtime; later ones
 * show how the attendee gets there from the previous showing.
 */
void printSchedule(const ScheduleResult& result, std::ostream& out) {
    out << "Attendance: " << result.attendance
        << " | Commute: " << result.totalTransit << " min"
        << " | " << (result.optimal ? "optimal" : "NOT proven optimal (search stopped early)")
        << "\n";

    if (result.entries.empty()) {
        out << "  (no showings)\n";
        return;
    }

    long long currentDay = 0;
    bool first = true;
    for (const ScheduledOccurrence& e : result.entries) {
        long long day = calendarDay(e.occurrence.start);
        if (first || day != currentDay) {
            currentDay = day;
            first = false;
            std::string stamp = formatTimestamp(e.occurrence.start);
            out << "\n  " << stamp.substr(0, 10) << ":\n";
            printDayTableHeader(out);
        }

        std::string start = formatTimestamp(e.occurrence.start).substr(11);
        std::string end = formatTimestamp(e.occurrence.end()).substr(11);

        out << "    "
            << std::left << std::setw(11) << (start + "-" + end)
            << " | " << std::left << std::setw(5)  << e.venue
            << " | " << std::left << std::setw(36) << ("\"" + e.occurrence.title + "\"")
            << " | " << std::left << std::setw(12) << (e.transitMinutes ? formatTransit(e) : "-")
            << " | " << (e.downtimeMinutes ? formatDowntime(e, result.sameVenueMinutes) : "-")
            << "\n";
    }
    out << "\n";
}

/**
 * @brief Hook printing the phase, objective values and attended indices.
 */
ProgressHook makeProgressPrinter(const EventCatalog& catalog, std::ostream& out) {
    return [&catalog, &out](const SearchProgress& p) {
        out << (p.phase == SearchObjective::MAXIMIZE_ATTENDANCE ? "[attendance] " : "[commute]    ")
            << "attendance: " << p.attendance
            << ", commute: " << p.totalTransit << " min, showings:";
        for (std::size_t i = 0; i < p.selected.size() && i < catalog.size(); ++i) {
            if (p.selected[i]) out << " " << i;
        }
        out << "\n";
    };
}
