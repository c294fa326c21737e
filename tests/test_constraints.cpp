/*
===============================================================================
TEST CONSTRAINTS — Oracle, decision model and selection state (constraints.hpp)
===============================================================================

OVERVIEW
--------
Validates the pairwise compatibility predicates, the abstract decision model
built from them, and the incremental SelectionState the search runs on.

TEST ORGANIZATION
-----------------
• Section A: CompatibilityOracle predicates
• Section B: DecisionModel construction and queries
• Section C: SelectionState select / skip / undo bookkeeping

TEST STRATEGY
-------------
• Boundaries: arriving exactly at the start is feasible, one minute late is not
• Duplicate titles conflict regardless of timing
• The all-pairs check rejects pairs that are only reachable via a detour
• Counters after any select/skip/undo sequence match a fresh recount

DEPENDENCIES
------------
• Catch2 v2 - Test framework
• constraints.hpp - System under test

===============================================================================
*/

#include <catch2/catch.hpp>
#include "constraints.hpp"
#include "test_helpers.hpp"
#include <stdexcept>

// ============================================================================
// SECTION A: COMPATIBILITY ORACLE
// ============================================================================

/**
 * @test CompatibilityOracle::TransitMinutes
 * @brief Same venue costs the constant, different venues use the table
 */
TEST_CASE("A1: CompatibilityOracle::TransitMinutes", "[oracle]")
{
    TransitCostTable t = makeCinemaTable();
    CompatibilityOracle oracle(t);

    EventOccurrence a = occurrence(t, "A", "2022-08-13 14:00", 60, "CAM");
    EventOccurrence b = occurrence(t, "B", "2022-08-13 16:00", 60, "CAM");
    EventOccurrence c = occurrence(t, "C", "2022-08-13 18:00", 60, "VUE");

    REQUIRE(oracle.transitMinutes(a, b) == 5);
    REQUIRE(oracle.transitMinutes(a, c) == 30);
    REQUIRE(oracle.transitMinutes(c, a) == 30);
    REQUIRE(oracle.earliestStart(a, c) == a.end() + 30);
    REQUIRE(oracle.earliestStart(c, a) == a.end() + 30);
}

/**
 * @test CompatibilityOracle::Boundary
 * @brief q.start == p.end + transit is feasible; one minute less is not
 */
TEST_CASE("A2: CompatibilityOracle::ArrivalBoundary", "[oracle]")
{
    TransitCostTable t = makeCinemaTable();
    CompatibilityOracle oracle(t);

    EventOccurrence p = occurrence(t, "P", "2022-08-13 14:00", 60, "CAM");
    EventOccurrence onTime = occurrence(t, "Q", "2022-08-13 15:10", 60, "FLH");
    EventOccurrence late = occurrence(t, "Q", "2022-08-13 15:09", 60, "FLH");
    EventOccurrence overlap = occurrence(t, "Q", "2022-08-13 14:30", 60, "FLH");

    REQUIRE(oracle.pairFeasible(p, onTime));
    REQUIRE(oracle.pairFeasible(onTime, p));
    REQUIRE_FALSE(oracle.pairFeasible(p, late));
    REQUIRE_FALSE(oracle.pairFeasible(p, overlap));
}

TEST_CASE("A3: CompatibilityOracle::DuplicateTitlesConflict", "[oracle]")
{
    TransitCostTable t = makeCinemaTable();
    CompatibilityOracle oracle(t);

    EventOccurrence first = occurrence(t, "Fogaréu", "2022-08-16 16:30", 100, "VUE");
    EventOccurrence second = occurrence(t, "Fogaréu", "2022-08-17 19:00", 100, "FLH");

    REQUIRE_FALSE(oracle.pairFeasible(first, second));
}

TEST_CASE("A4: CompatibilityOracle::SameCalendarDay", "[oracle]")
{
    TransitCostTable t = makeCinemaTable();
    CompatibilityOracle oracle(t);

    EventOccurrence evening = occurrence(t, "A", "2022-08-13 22:30", 120, "CAM");
    EventOccurrence morning = occurrence(t, "B", "2022-08-14 00:10", 60, "CAM");
    EventOccurrence noon = occurrence(t, "C", "2022-08-14 12:00", 60, "CAM");

    // Running past midnight does not move the showing to the next day.
    REQUIRE_FALSE(oracle.sameCalendarDay(evening, morning));
    REQUIRE(oracle.sameCalendarDay(morning, noon));
}

/**
 * @test CompatibilityOracle::AllPairs
 * @brief A pair reachable only via a cheaper detour is still a conflict
 *
 * @given CAM -> FLH 10, FLH -> VUE 10, but CAM -> VUE 120
 * @then  the CAM and VUE showings conflict even though a skipped FLH
 *        showing in between would make the trip possible
 */
TEST_CASE("A5: CompatibilityOracle::NoTriangleInequality", "[oracle]")
{
    TransitCostTable::Entries entries;
    entries["CAM"]["FLH"] = 10;
    entries["FLH"]["VUE"] = 10;
    entries["CAM"]["VUE"] = 120;
    TransitCostTable t(entries);
    CompatibilityOracle oracle(t);

    EventOccurrence a = occurrence(t, "A", "2022-08-13 14:00", 60, "CAM");
    EventOccurrence b = occurrence(t, "B", "2022-08-13 15:10", 60, "FLH");
    EventOccurrence c = occurrence(t, "C", "2022-08-13 16:20", 60, "VUE");

    REQUIRE(oracle.pairFeasible(a, b));
    REQUIRE(oracle.pairFeasible(b, c));
    REQUIRE_FALSE(oracle.pairFeasible(a, c));
}

// ============================================================================
// SECTION B: DECISION MODEL
// ============================================================================

static EventCatalog makeSmallCatalog(const TransitCostTable& t) {
    return EventCatalog({
            occurrence(t, "A", "2022-08-13 14:00", 60, "CAM"),   // 0
            occurrence(t, "B", "2022-08-13 15:10", 60, "FLH"),   // 1
            occurrence(t, "C", "2022-08-13 15:20", 60, "VUE"),   // 2
            occurrence(t, "A", "2022-08-14 10:00", 60, "CAM"),   // 3
            occurrence(t, "D", "2022-08-14 12:00", 60, "FLH"),   // 4
    }, t);
}

/**
 * @test DecisionModel::Build
 * @brief Every i < j cell mirrors the oracle
 */
TEST_CASE("B1: DecisionModel::BuildMatchesOracle", "[model][decision]")
{
    TransitCostTable t = makeCinemaTable();
    EventCatalog catalog = makeSmallCatalog(t);
    CompatibilityOracle oracle(t);
    DecisionModel model = DecisionModel::build(catalog, oracle);

    REQUIRE(model.size() == 5);
    for (int i = 0; i < model.size(); ++i) {
        for (int j = i + 1; j < model.size(); ++j) {
            REQUIRE(model.conflicts(i, j) == !oracle.pairFeasible(catalog[i], catalog[j]));
            REQUIRE(model.conflicts(j, i) == model.conflicts(i, j));
            REQUIRE(model.sameDay(i, j) == oracle.sameCalendarDay(catalog[i], catalog[j]));
            REQUIRE(model.transit(i, j) == oracle.transitMinutes(catalog[i], catalog[j]));
        }
    }

    REQUIRE(model.conflicts(0, 2));      // 15:00 + 30 > 15:20
    REQUIRE(model.conflicts(0, 3));      // same title
    REQUIRE_FALSE(model.conflicts(0, 1));
    REQUIRE(model.laterConflicts(0) == std::vector<int>{2, 3});
}

TEST_CASE("B2: DecisionModel::TransitOnlyWithinADay", "[model][decision]")
{
    TransitCostTable t = makeCinemaTable();
    EventCatalog catalog = makeSmallCatalog(t);
    DecisionModel model = DecisionModel::build(catalog, CompatibilityOracle(t));

    REQUIRE(model.transitCharge(-1, 0) == 0);
    REQUIRE(model.transitCharge(0, 1) == 10);
    REQUIRE(model.transitCharge(1, 4) == 0);     // next day
    REQUIRE(model.transitCharge(3, 4) == 10);

    std::vector<char> selected = {1, 1, 0, 0, 1};
    REQUIRE(model.isFeasible(selected));
    REQUIRE(model.totalTransit(selected) == 10);

    REQUIRE_FALSE(model.isFeasible({1, 0, 1, 0, 0}));
    REQUIRE_FALSE(model.isFeasible({1, 1}));
}

TEST_CASE("B3: DecisionModel::RawMatricesAreChecked", "[model][decision][errors]")
{
    REQUIRE_THROWS_AS(DecisionModel(2, {0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}), std::invalid_argument);

    // Only the upper triangle is read; conflicts are mirrored.
    DecisionModel model(2, {0, 1, 0, 0}, {0, 1, 1, 0}, {0, 7, 9, 0});
    REQUIRE(model.conflicts(1, 0));
    REQUIRE(model.sameDay(1, 0));
    REQUIRE(model.transit(0, 1) == 7);
}

// ============================================================================
// SECTION C: SELECTION STATE
// ============================================================================

/**
 * @test SelectionState::Bookkeeping
 * @brief select / skip / undo keep attendance, transit and bounds consistent
 */
TEST_CASE("C1: SelectionState::SelectSkipUndo", "[state]")
{
    TransitCostTable t = makeCinemaTable();
    EventCatalog catalog = makeSmallCatalog(t);
    DecisionModel model = DecisionModel::build(catalog, CompatibilityOracle(t));
    SelectionState state(model);

    REQUIRE(state.depth() == 0);
    REQUIRE(state.openCount() == 5);
    REQUIRE(state.upperBound() == 5);

    state.select();    // 0 blocks 2 and 3
    REQUIRE(state.attendance() == 1);
    REQUIRE(state.openCount() == 2);
    REQUIRE(state.upperBound() == 3);

    state.select();    // 1, 10 minutes from CAM to FLH
    REQUIRE(state.totalTransit() == 10);
    REQUIRE_FALSE(state.canSelect());
    REQUIRE_THROWS_AS(state.select(), std::logic_error);

    state.skip();
    state.skip();
    REQUIRE(state.canSelect());
    state.select();    // 4, next day: no transit
    REQUIRE(state.complete());
    REQUIRE(state.attendance() == 3);
    REQUIRE(state.totalTransit() == 10);
    REQUIRE(state.decisions() == std::vector<char>{1, 1, 0, 0, 1});
    REQUIRE_THROWS_AS(state.skip(), std::logic_error);

    for (int k = 0; k < 5; ++k) state.undo();
    REQUIRE(state.depth() == 0);
    REQUIRE(state.attendance() == 0);
    REQUIRE(state.totalTransit() == 0);
    REQUIRE(state.openCount() == 5);
    REQUIRE(state.decisions() == std::vector<char>(5, 0));
    REQUIRE_THROWS_AS(state.undo(), std::logic_error);
}

TEST_CASE("C2: SelectionState::SkippingBlockedIndexKeepsCount", "[state]")
{
    TransitCostTable t = makeCinemaTable();
    EventCatalog catalog = makeSmallCatalog(t);
    DecisionModel model = DecisionModel::build(catalog, CompatibilityOracle(t));
    SelectionState state(model);

    state.select();    // blocks 2 and 3
    state.skip();      // 1 was open
    REQUIRE(state.openCount() == 1);
    state.skip();      // 2 was blocked: open count unchanged
    REQUIRE(state.openCount() == 1);
    state.undo();
    state.undo();
    REQUIRE(state.openCount() == 2);
}

/**
 * @test SelectionState::CopiesAreIndependent
 * @brief Parallel branches work on copies; changing one leaves the other alone
 */
TEST_CASE("C3: SelectionState::CopiesAreIndependent", "[state]")
{
    TransitCostTable t = makeCinemaTable();
    EventCatalog catalog = makeSmallCatalog(t);
    DecisionModel model = DecisionModel::build(catalog, CompatibilityOracle(t));

    SelectionState state(model);
    state.select();
    SelectionState copy = state;
    copy.skip();
    copy.undo();
    copy.undo();

    REQUIRE(state.depth() == 1);
    REQUIRE(state.attendance() == 1);
    REQUIRE(copy.depth() == 0);
    REQUIRE(copy.openCount() == 5);
}
