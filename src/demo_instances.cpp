///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"
#include <algorithm>
#include <cstdio>
#include <random>
#include <string>


///////////////////////////
///     DEMO: SMALL     ///
///////////////////////////
static std::vector<EventSpec> makeSmallEvents() {
    return {
            {"First",  120, {{"2022-08-13 14:00", "CAM"}}},
            {"Second",  60, {{"2022-08-13 18:00", "FLH"}}},
            {"Third",  120, {{"2022-08-13 19:00", "FLH"}}},
    };
}

/// Bicycle times between the four cinemas, with some faff to find parking.
static TransitCostTable makeSmallTransit() {
    return TransitCostTable({
            {"CAM", {{"EVR", 20}, {"FLH", 10}, {"VUE", 30}}},
            {"EVR", {{"CAM", 20}, {"FLH", 20}, {"VUE", 10}}},
            {"FLH", {{"CAM", 10}, {"EVR", 20}, {"VUE", 30}}},
            {"VUE", {{"CAM", 30}, {"EVR", 10}, {"FLH", 30}}},
    });
}


///////////////////////////
///   DEMO: FESTIVAL    ///
///////////////////////////
static std::vector<EventSpec> makeFestivalEvents() {
    return {
            {"After Yang", 96, {{"2022-08-20 19:00", "VUE"}}},
            {"Fogaréu", 100, {{"2022-08-16 16:30", "VUE"}, {"2022-08-17 19:00", "FLH"}}},
            {"Leonor Will Never Die", 101, {{"2022-08-16 20:35", "FLH"}, {"2022-08-18 15:30", "VUE"}}},
            {"LOLA", 78, {{"2022-08-15 21:00", "EVR"}, {"2022-08-19 16:00", "VUE"}}},
            {"Full Time", 87, {{"2022-08-17 18:15", "VUE"}, {"2022-08-18 16:00", "FLH"}}},
            {"Special Delivery", 109, {{"2022-08-18 21:35", "VUE"}, {"2022-08-19 16:20", "VUE"}}},
            {"Anonymous Club", 83, {{"2022-08-15 19:00", "CAM"}, {"2022-08-17 21:30", "VUE"}}},
            {"Hallelujah", 115, {{"2022-08-17 15:50", "VUE"}, {"2022-08-20 16:50", "FLH"}}},
            {"The Territory", 85, {{"2022-08-13 14:00", "VUE"}, {"2022-08-19 18:00", "EVR"}}},
            {"The Forgiven", 117, {{"2022-08-17 20:35", "VUE"}}},
            {"The Score", 114, {{"2022-08-18 19:00", "VUE"}, {"2022-08-20 13:30", "FLH"}}},
            {"AEIOU", 104, {{"2022-08-15 21:10", "VUE"}, {"2022-08-16 14:00", "FLH"}}},
            {"Axiom", 112, {{"2022-08-14 17:30", "VUE"}, {"2022-08-16 11:30", "VUE"}}},
            {"Phantom Project", 97, {{"2022-08-14 14:15", "VUE"}, {"2022-08-15 21:20", "CAM"}}},
            {"The Plains", 180, {{"2022-08-13 18:30", "FLH"}}},
            {"Shadow", 56, {{"2022-08-16 18:30", "VUE"}}},
            {"EIFF New Visions", 68, {{"2022-08-14 15:40", "FLH"}}},
            {"Scotland's Voices", 79, {{"2022-08-13 15:30", "FLH"}}},
            {"The Making of A Bear Named Wojtek", 60, {{"2022-08-14 11:30", "FLH"}}},
    };
}

static TransitCostTable makeFestivalTransit() {
    return TransitCostTable({
            {"STA", {{"CAM", 20}, {"EVR", 15}, {"FLH", 15}, {"VUE", 15}}},
            {"CAM", {{"EVR", 20}, {"FLH", 10}, {"STA", 20}, {"VUE", 30}}},
            {"EVR", {{"CAM", 20}, {"FLH", 20}, {"STA", 15}, {"VUE", 10}}},
            {"FLH", {{"CAM", 10}, {"EVR", 20}, {"STA", 15}, {"VUE", 30}}},
            {"VUE", {{"CAM", 30}, {"EVR", 10}, {"FLH", 30}, {"STA", 15}}},
    });
}


///////////////////////////
///   DEMO: SYNTHETIC   ///
///////////////////////////
/**
 * @brief Raw transit entries and events of a synthetic programme.
 */
struct SyntheticProgramme {
    TransitCostTable::Entries entries;
    std::vector<EventSpec> events;
};

static SyntheticProgramme makeSyntheticProgramme(int numTitles, int numVenues, int days, unsigned seed) {
    std::mt19937 rng(seed);
    SyntheticProgramme programme;

    numVenues = std::max(1, numVenues);
    days = std::min(std::max(1, days), 18);

    std::vector<std::string> venues;
    for (int v = 0; v < numVenues; ++v) {
        venues.push_back("V" + std::to_string(v));
    }

    // Independent random costs per pair: no triangle inequality guarantee.
    std::uniform_int_distribution<int> costDist(5, 40);
    for (int a = 0; a < numVenues; ++a) {
        programme.entries[venues[a]];
        for (int b = a + 1; b < numVenues; ++b) {
            programme.entries[venues[a]][venues[b]] = costDist(rng);
        }
    }

    std::uniform_int_distribution<int> showingsDist(1, 3);
    std::uniform_int_distribution<int> durationDist(60, 150);
    std::uniform_int_distribution<int> dayDist(0, days - 1);
    std::uniform_int_distribution<int> slotDist(0, 12 * 4); // quarter hours from 10:00
    std::uniform_int_distribution<int> venueDist(0, numVenues - 1);

    for (int t = 0; t < numTitles; ++t) {
        EventSpec ev;
        ev.title = "Title " + std::to_string(t);
        ev.durationMinutes = durationDist(rng);

        int showings = showingsDist(rng);
        for (int s = 0; s < showings; ++s) {
            int day = dayDist(rng);
            int minuteOfDay = 10 * 60 + slotDist(rng) * 15;

            char stamp[32];
            std::snprintf(stamp, sizeof(stamp), "2022-08-%02d %02d:%02d",
                          13 + day, minuteOfDay / 60, minuteOfDay % 60);
            ev.occurrences.push_back({stamp, venues[venueDist(rng)]});
        }
        programme.events.push_back(ev);
    }

    return programme;
}

DemoInstance makeSyntheticInstance(int numTitles, int numVenues, int days, unsigned seed) {
    SyntheticProgramme programme = makeSyntheticProgramme(numTitles, numVenues, days, seed);
    TransitCostTable transit(programme.entries);
    EventCatalog catalog = EventCatalog::fromEvents(programme.events, transit);
    return DemoInstance{transit, catalog};
}


///////////////////////////
///    DEMO: SELECT     ///
///////////////////////////
// Benchmark programme used for DemoSize::L.
static constexpr int kLargeTitles = 24;
static constexpr int kLargeVenues = 6;
static constexpr int kLargeDays = 4;
static constexpr unsigned kLargeSeed = 2022u;

std::vector<EventSpec> demoEvents(DemoSize size) {
    switch (size) {
        case DemoSize::S:        return makeSmallEvents();
        case DemoSize::FESTIVAL: return makeFestivalEvents();
        case DemoSize::L:        break;
    }
    return makeSyntheticProgramme(kLargeTitles, kLargeVenues, kLargeDays, kLargeSeed).events;
}

TransitCostTable demoTransitTable(DemoSize size) {
    switch (size) {
        case DemoSize::S:        return makeSmallTransit();
        case DemoSize::FESTIVAL: return makeFestivalTransit();
        case DemoSize::L:        break;
    }
    return TransitCostTable(makeSyntheticProgramme(kLargeTitles, kLargeVenues, kLargeDays, kLargeSeed).entries);
}

DemoInstance makeDemoInstance(DemoSize size) {
    TransitCostTable transit = demoTransitTable(size);
    EventCatalog catalog = EventCatalog::fromEvents(demoEvents(size), transit);
    return DemoInstance{transit, catalog};
}
