///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sequential_solver.hpp"


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Solve both passes with a plain depth-first branch-and-bound.
 */
SelectionSolution SequentialBranchAndBoundSolver::solve(const DecisionModel& model, const SolverOptions& options) {
    return solveTwoPhase(model, options, [&](Incumbent& incumbent, SearchBudget& budget) {
        runPass(model, incumbent, budget);
    });
}

/**
 * @brief One exhaustive pass from the root.
 *
 * The state starts with no decisions; the engine restores it on return.
 */
void SequentialBranchAndBoundSolver::runPass(const DecisionModel& model, Incumbent& incumbent,
                                             SearchBudget& budget) const {
    SelectionState state(model);
    BranchAndBound engine(budget);
    engine.explore(state, incumbent);
}
