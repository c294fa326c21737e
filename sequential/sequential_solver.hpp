#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include "search.hpp"
#include "solver_base.hpp"


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Single-threaded branch-and-bound solver.
 *
 * Explores the decision tree depth-first with one SelectionState, first to
 * maximize attendance and then to minimize transit at that attendance.
 */
class SequentialBranchAndBoundSolver : public IScheduleSolver {
public:
    SequentialBranchAndBoundSolver() = default;

    /**
     * @brief Solve the decision model exactly.
     *
     * Returns the optimum, or the best selection found when the options stop
     * the search early (optimal == false).
     */
    SelectionSolution solve(const DecisionModel& model, const SolverOptions& options) override;

private:
    /**
     * @brief Search one pass from the empty assignment.
     */
    void runPass(const DecisionModel& model, Incumbent& incumbent, SearchBudget& budget) const;
};
