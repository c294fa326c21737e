#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <vector>


///////////////////////////
///        DEMOS        ///
///////////////////////////
/**
 * @brief Available demo catalogs.
 *
 * S        -> three screenings on one day at two venues.
 * FESTIVAL -> the 2022 film festival programme (31 screenings, 5 venues).
 * L        -> seeded synthetic programme for benchmarking the backends.
 */
enum class DemoSize { S, FESTIVAL, L };

/**
 * @brief A transit table together with a catalog validated against it.
 */
struct DemoInstance {
    TransitCostTable transit;
    EventCatalog catalog;
};

/// Raw event list of a demo, before catalog validation.
std::vector<EventSpec> demoEvents(DemoSize size);

/// Venue-to-venue transit table used by a demo.
TransitCostTable demoTransitTable(DemoSize size);

/// Build a ready-to-solve demo instance.
DemoInstance makeDemoInstance(DemoSize size);

/**
 * @brief Random but reproducible programme.
 *
 * Titles get one to three showings spread over `days` festival days between
 * 10:00 and 22:00 at `numVenues` venues, with transit times of 5 to 40
 * minutes that need not satisfy the triangle inequality.
 */
DemoInstance makeSyntheticInstance(int numTitles, int numVenues, int days, unsigned seed);
