///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "schedule.hpp"
#include "../sequential/sequential_solver.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>


///////////////////////////
///      OPTIMIZER      ///
///////////////////////////
ScheduleOptimizer::ScheduleOptimizer(const EventCatalog& catalog, const TransitCostTable& transit,
                                     SolverOptions options)
        : catalog_(catalog),
          transit_(transit),
          oracle_(transit),
          options_(std::move(options)) {
    model_ = DecisionModel::build(catalog_, oracle_);
}

ScheduleOptimizer::ScheduleOptimizer(const EventCatalog& catalog, const TransitCostTable& transit,
                                     DecisionModel model, SolverOptions options)
        : catalog_(catalog),
          transit_(transit),
          oracle_(transit),
          model_(std::move(model)),
          options_(std::move(options)) {
    if (model_.size() != (int)catalog_.size()) {
        throw std::invalid_argument("decision model does not match the catalog size");
    }
}

ScheduleResult ScheduleOptimizer::run() const {
    SequentialBranchAndBoundSolver solver;
    return run(solver);
}

ScheduleResult ScheduleOptimizer::run(IScheduleSolver& solver) const {
    SelectionSolution solution = solver.solve(model_, options_);

    if (solution.selected.size() != catalog_.size() ||
        !verifySelection(catalog_, oracle_, solution.selected)) {
        throw std::logic_error("solver returned a selection that violates the pairwise constraints");
    }
    return buildResult(solution);
}

/**
 * @brief Walk the attended occurrences in start order and annotate them.
 *
 * Transit and downtime are only reported between two attended occurrences
 * on the same calendar day; the totals are recomputed from the annotations.
 */
ScheduleResult ScheduleOptimizer::buildResult(const SelectionSolution& solution) const {
    ScheduleResult result;
    result.optimal = solution.optimal;
    result.nodesExplored = solution.nodesExplored;
    result.sameVenueMinutes = transit_.sameVenueMinutes();

    const EventOccurrence* prev = nullptr;
    for (std::size_t i = 0; i < catalog_.size() && i < solution.selected.size(); ++i) {
        if (!solution.selected[i]) continue;
        const EventOccurrence& curr = catalog_[i];

        ScheduledOccurrence entry{i, curr, transit_.venueCode(curr.venue), {}, {}, {}};
        if (prev && oracle_.sameCalendarDay(*prev, curr)) {
            int transit = oracle_.transitMinutes(*prev, curr);
            entry.transitMinutes = transit;
            entry.downtimeMinutes = curr.start - prev->end() - transit;
            entry.previousVenue = transit_.venueCode(prev->venue);
            result.totalTransit += transit;
        }

        result.entries.push_back(std::move(entry));
        prev = &curr;
    }

    result.attendance = (int)result.entries.size();
    return result;
}


///////////////////////////
///    VERIFICATION     ///
///////////////////////////
bool verifySelection(const EventCatalog& catalog, const CompatibilityOracle& oracle,
                     const std::vector<char>& selected) {
    std::size_t n = std::min(catalog.size(), selected.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (!selected[i]) continue;
        for (std::size_t j = i + 1; j < n; ++j) {
            if (selected[j] && !oracle.pairFeasible(catalog[i], catalog[j])) return false;
        }
    }
    return true;
}
