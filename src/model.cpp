///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <utility>


///////////////////////////
///        TIME         ///
///////////////////////////
/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date.
 */
static long long daysFromCivil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

/**
 * @brief Inverse of daysFromCivil().
 */
static void civilFromDays(long long z, int& y, int& m, int& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    d = (int)(doy - (153 * mp + 2) / 5 + 1);
    m = (int)(mp < 10 ? mp + 3 : mp - 9);
    y = (int)(yoe + era * 400 + (m <= 2 ? 1 : 0));
}

static bool isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static int daysInMonth(int y, int m) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeapYear(y)) return 29;
    return kDays[m - 1];
}

/**
 * @brief Whether text has the fixed layout "DDDD-DD-DD?DD:DD[:DD]".
 *
 * '?' is a space or 'T'; every D is exactly one decimal digit.
 */
static bool hasTimestampLayout(const std::string& text) {
    static const char kLayout[] = "DDDD-DD-DD?DD:DD:DD";
    if (text.size() != 16 && text.size() != 19) return false;

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        switch (kLayout[i]) {
            case 'D':
                if (!std::isdigit((unsigned char)c)) return false;
                break;
            case '?':
                if (c != ' ' && c != 'T') return false;
                break;
            default:
                if (c != kLayout[i]) return false;
        }
    }
    return true;
}

Minutes parseTimestamp(const std::string& text) {
    if (!hasTimestampLayout(text)) {
        throw MalformedEventError("invalid timestamp '" + text + "'");
    }

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    bool ok = std::sscanf(text.c_str(), "%4d-%2d-%2d%*c%2d:%2d", &y, &mo, &d, &h, &mi) == 5;
    // Optional seconds, truncated to the minute.
    if (ok && text.size() == 19) {
        ok = std::sscanf(text.c_str() + 17, "%2d", &s) == 1;
    }
    if (!ok) {
        throw MalformedEventError("invalid timestamp '" + text + "'");
    }

    if (mo < 1 || mo > 12 || d < 1 || d > daysInMonth(y, mo) ||
        h < 0 || h > 23 || mi < 0 || mi > 59 || s < 0 || s > 59) {
        throw MalformedEventError("timestamp out of range '" + text + "'");
    }

    return daysFromCivil(y, mo, d) * MINUTES_PER_DAY + h * 60 + mi;
}

long long calendarDay(Minutes t) {
    // Floor division so that times before the epoch land on the right day.
    return t >= 0 ? t / MINUTES_PER_DAY : (t - (MINUTES_PER_DAY - 1)) / MINUTES_PER_DAY;
}

std::string formatTimestamp(Minutes t) {
    long long day = calendarDay(t);
    Minutes minuteOfDay = t - day * MINUTES_PER_DAY;

    int y, m, d;
    civilFromDays(day, y, m, d);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d",
                  y, m, d, (int)(minuteOfDay / 60), (int)(minuteOfDay % 60));
    return buf;
}


///////////////////////////
///   TRANSIT  TABLE    ///
///////////////////////////
/**
 * @brief Collect the venue set, then fill and check the full cost matrix.
 *
 * Each unordered pair is resolved from whichever directions are present.
 */
TransitCostTable::TransitCostTable(const Entries& entries, int sameVenueMinutes)
        : sameVenueMinutes_(sameVenueMinutes) {
    if (sameVenueMinutes < 0) {
        throw InfeasibleTransitTableError("same-venue transit time must not be negative");
    }

    // Venue set: every code mentioned as a source or as a destination.
    for (const auto& from : entries) {
        ids_.emplace(from.first, 0);
        for (const auto& to : from.second) {
            ids_.emplace(to.first, 0);
        }
    }
    for (auto& entry : ids_) {
        entry.second = (VenueId)codes_.size();
        codes_.push_back(entry.first);
    }

    auto lookup = [&](const std::string& a, const std::string& b, int& out) -> bool {
        auto row = entries.find(a);
        if (row == entries.end()) return false;
        auto cell = row->second.find(b);
        if (cell == row->second.end()) return false;
        out = cell->second;
        return true;
    };

    int n = (int)codes_.size();
    travel_.assign(n, std::vector<int>(n, sameVenueMinutes_));

    for (int a = 0; a < n; ++a) {
        int self = 0;
        if (lookup(codes_[a], codes_[a], self) && self != sameVenueMinutes_) {
            throw InfeasibleTransitTableError(
                    "transit time from " + codes_[a] + " to itself must equal the same-venue constant");
        }

        for (int b = a + 1; b < n; ++b) {
            int ab = 0, ba = 0;
            bool hasAB = lookup(codes_[a], codes_[b], ab);
            bool hasBA = lookup(codes_[b], codes_[a], ba);

            if (!hasAB && !hasBA) {
                throw InfeasibleTransitTableError(
                        "missing transit time between " + codes_[a] + " and " + codes_[b]);
            }
            if (hasAB && hasBA && ab != ba) {
                std::ostringstream ss;
                ss << "asymmetric transit time between " << codes_[a] << " and " << codes_[b]
                   << " (" << ab << " vs " << ba << ")";
                throw InfeasibleTransitTableError(ss.str());
            }

            int cost = hasAB ? ab : ba;
            if (cost < 0) {
                throw InfeasibleTransitTableError(
                        "negative transit time between " + codes_[a] + " and " + codes_[b]);
            }
            travel_[a][b] = cost;
            travel_[b][a] = cost;
        }
    }
}

VenueId TransitCostTable::venueId(const std::string& code) const {
    auto it = ids_.find(code);
    if (it == ids_.end()) return -1;
    return it->second;
}

int TransitCostTable::minutes(VenueId from, VenueId to) const {
    if (from == to) return sameVenueMinutes_;
    return travel_.at(from).at(to);
}


///////////////////////////
///       CATALOG       ///
///////////////////////////
/**
 * @brief Check every occurrence, then sort by start keeping input order on ties.
 */
EventCatalog::EventCatalog(std::vector<EventOccurrence> occurrences, const TransitCostTable& transit)
        : occurrences_(std::move(occurrences)) {
    for (const EventOccurrence& occ : occurrences_) {
        if (occ.title.empty()) {
            throw MalformedEventError("occurrence at " + formatTimestamp(occ.start) + " has no title");
        }
        if (occ.duration <= 0) {
            throw MalformedEventError("\"" + occ.title + "\" has a non-positive duration");
        }
        if (occ.venue < 0 || occ.venue >= transit.venueCount()) {
            throw MalformedEventError("\"" + occ.title + "\" refers to a venue missing from the transit table");
        }
    }

    std::stable_sort(occurrences_.begin(), occurrences_.end(),
                     [](const EventOccurrence& a, const EventOccurrence& b) {
                         return a.start < b.start;
                     });
}

EventCatalog EventCatalog::fromEvents(const std::vector<EventSpec>& events, const TransitCostTable& transit) {
    std::vector<EventOccurrence> occurrences;

    for (const EventSpec& ev : events) {
        if (ev.durationMinutes <= 0) {
            throw MalformedEventError("\"" + ev.title + "\" has a non-positive duration");
        }
        for (const OccurrenceSpec& os : ev.occurrences) {
            VenueId venue = transit.venueId(os.venue);
            if (venue < 0) {
                throw MalformedEventError("\"" + ev.title + "\" is shown at unknown venue '" + os.venue + "'");
            }
            occurrences.push_back({ev.title, parseTimestamp(os.start), (Minutes)ev.durationMinutes, venue});
        }
    }

    return EventCatalog(std::move(occurrences), transit);
}
