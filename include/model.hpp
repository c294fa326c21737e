#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <cstddef>
#include <map>
#include <string>
#include <vector>


///////////////////////////
///        TIME         ///
///////////////////////////
/// Absolute time in whole minutes since 1970-01-01 00:00 (naive local time).
using Minutes = long long;

static constexpr Minutes MINUTES_PER_DAY = 24 * 60;

/// Default in-venue repositioning cost between two showings at one venue.
static constexpr int DEFAULT_SAME_VENUE_MINUTES = 5;

/**
 * @brief Parse a start timestamp into minutes since the epoch.
 *
 * Accepts exactly "YYYY-MM-DD HH:MM", optionally followed by ":SS" (seconds
 * are truncated), with every field zero-padded to its width. A 'T' may
 * replace the space separator.
 *
 * @throws MalformedEventError if the text is not a valid date and time.
 */
Minutes parseTimestamp(const std::string& text);

/**
 * @brief Render minutes since the epoch as "YYYY-MM-DD HH:MM".
 */
std::string formatTimestamp(Minutes t);

/**
 * @brief Calendar day number (days since the epoch) a timestamp falls on.
 */
long long calendarDay(Minutes t);


///////////////////////////
///       MODELS        ///
///////////////////////////
/// Dense venue index assigned by the TransitCostTable.
using VenueId = int;

/**
 * @brief One scheduled showing of a titled work at a venue.
 *
 * Occurrences sharing a title are alternative showings of the same work.
 */
struct EventOccurrence {
    std::string title; ///< Work being shown; duplicates denote the same work.
    Minutes start; ///< Absolute start time.
    Minutes duration; ///< Running time in minutes (strictly positive).
    VenueId venue; ///< Index into the transit table's venue set.

    Minutes end() const { return start + duration; }
};

/**
 * @brief Static venue-to-venue transit costs in minutes.
 *
 * Built from a nested "from -> to -> minutes" mapping. The venue set is every
 * code that appears in the mapping, either as a source or as a destination.
 * Every pair of distinct venues needs a cost in at least one direction, and
 * where both directions are given they must agree. Moving between two
 * showings at the same venue costs a fixed constant.
 */
class TransitCostTable {
public:
    using Entries = std::map<std::string, std::map<std::string, int>>;

    /**
     * @brief Validate and index a transit mapping.
     *
     * @throws InfeasibleTransitTableError on a missing pair, an asymmetric
     *         pair, a negative cost or a negative same-venue constant.
     */
    explicit TransitCostTable(const Entries& entries,
                              int sameVenueMinutes = DEFAULT_SAME_VENUE_MINUTES);

    int venueCount() const { return (int)codes_.size(); }

    /// Venue index for a code, or -1 if the table does not know it.
    VenueId venueId(const std::string& code) const;

    const std::string& venueCode(VenueId id) const { return codes_.at(id); }

    /// Minutes needed to get from one venue to another (fixed constant if equal).
    int minutes(VenueId from, VenueId to) const;

    int sameVenueMinutes() const { return sameVenueMinutes_; }

private:
    std::vector<std::string> codes_;
    std::map<std::string, VenueId> ids_;

    /// travel_[a][b] = minutes needed to move from venue a to venue b.
    std::vector<std::vector<int>> travel_;

    int sameVenueMinutes_;
};

/// One showing of an event as handed over by an ingestion layer.
struct OccurrenceSpec {
    std::string start; ///< Timestamp text, see parseTimestamp().
    std::string venue; ///< Venue code known to the transit table.
};

/// An event with its running time and all of its showings.
struct EventSpec {
    std::string title;
    int durationMinutes;
    std::vector<OccurrenceSpec> occurrences;
};

/**
 * @brief Immutable list of occurrences ordered by start time.
 *
 * The sort is stable: occurrences starting at the same minute keep their
 * input order. Indices into the catalog identify occurrences everywhere in
 * the optimizer.
 */
class EventCatalog {
public:
    EventCatalog() = default;

    /**
     * @brief Validate and sort pre-built occurrences.
     *
     * @throws MalformedEventError if a duration is not positive, a title is
     *         empty or a venue index is outside the transit table.
     */
    EventCatalog(std::vector<EventOccurrence> occurrences, const TransitCostTable& transit);

    /**
     * @brief Expand events into one occurrence per showing and validate them.
     *
     * @throws MalformedEventError on a bad duration, title, timestamp or venue.
     */
    static EventCatalog fromEvents(const std::vector<EventSpec>& events, const TransitCostTable& transit);

    std::size_t size() const { return occurrences_.size(); }
    bool empty() const { return occurrences_.empty(); }

    const EventOccurrence& operator[](std::size_t i) const { return occurrences_[i]; }
    const EventOccurrence& at(std::size_t i) const { return occurrences_.at(i); }

    const std::vector<EventOccurrence>& occurrences() const { return occurrences_; }

    std::vector<EventOccurrence>::const_iterator begin() const { return occurrences_.begin(); }
    std::vector<EventOccurrence>::const_iterator end() const { return occurrences_.end(); }

private:
    std::vector<EventOccurrence> occurrences_;
};
