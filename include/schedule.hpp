#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include "model.hpp"
#include "solver_base.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///       RESULTS       ///
///////////////////////////
/**
 * @brief One attended occurrence with its same-day transition annotations.
 */
struct ScheduledOccurrence {
    std::size_t index; ///< Catalog index of the occurrence.
    EventOccurrence occurrence; ///< Copy of the catalog entry.
    std::string venue; ///< Venue code of the occurrence.

    /// Transit from the previous attended occurrence of the same day, if any.
    std::optional<int> transitMinutes;

    /// Start minus (previous end + transit), for the same same-day predecessor.
    std::optional<Minutes> downtimeMinutes;

    /// Venue the attendee arrives from, set together with transitMinutes.
    std::optional<std::string> previousVenue;
};

/**
 * @brief Final schedule in start order plus both objective values.
 */
struct ScheduleResult {
    std::vector<ScheduledOccurrence> entries;
    int attendance = 0;
    int totalTransit = 0;
    bool optimal = true;
    long long nodesExplored = 0;
    int sameVenueMinutes = DEFAULT_SAME_VENUE_MINUTES; ///< Downtime up to this is reported as "none".
};


///////////////////////////
///      OPTIMIZER      ///
///////////////////////////
/**
 * @brief Two-phase schedule optimization over one catalog.
 *
 * Builds the decision model from the catalog and the compatibility oracle
 * once, hands it to a solver backend, re-checks the returned selection
 * against every pair, and derives the annotated schedule.
 *
 * The catalog and transit table must outlive the optimizer.
 */
class ScheduleOptimizer {
public:
    ScheduleOptimizer(const EventCatalog& catalog, const TransitCostTable& transit,
                      SolverOptions options = SolverOptions());

    /**
     * @brief Use a decision model built elsewhere (e.g. on an OpenCL device).
     *
     * @throws std::invalid_argument if the model size differs from the catalog.
     */
    ScheduleOptimizer(const EventCatalog& catalog, const TransitCostTable& transit,
                      DecisionModel model, SolverOptions options = SolverOptions());

    /// Solve with the single-threaded branch-and-bound backend.
    ScheduleResult run() const;

    /**
     * @brief Solve with the given backend.
     *
     * @throws std::logic_error if the backend returns an infeasible selection.
     */
    ScheduleResult run(IScheduleSolver& solver) const;

    /// Derive the annotated schedule for any feasible selection.
    ScheduleResult buildResult(const SelectionSolution& solution) const;

    const DecisionModel& model() const { return model_; }
    const CompatibilityOracle& oracle() const { return oracle_; }

private:
    const EventCatalog& catalog_;
    const TransitCostTable& transit_;
    CompatibilityOracle oracle_;
    DecisionModel model_;
    SolverOptions options_;
};

/**
 * @brief Re-check a selection against the oracle for every pair.
 *
 * Independent of any precomputed decision model.
 */
bool verifySelection(const EventCatalog& catalog, const CompatibilityOracle& oracle,
                     const std::vector<char>& selected);
