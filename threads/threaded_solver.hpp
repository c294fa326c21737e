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
 * @brief Multithreaded branch-and-bound solver.
 *
 * Splits the decision tree near the root: at each split node the "attend"
 * and "skip" branches run as parallel tasks with the available threads
 * divided between them. Below the split depth, or once a branch is down to
 * one thread, it is searched sequentially. All tasks share the incumbent,
 * whose bound only ever tightens, and the node budget.
 */
class ThreadedBranchAndBoundSolver : public IScheduleSolver {
public:
    /**
     * @brief Create a threaded solver.
     *
     * @param numThreads Number of worker threads to spread branches over.
     * @param splitDepth Deepest decision index at which branches are split.
     */
    ThreadedBranchAndBoundSolver(int numThreads, int splitDepth);

    /**
     * @brief Solve the decision model exactly.
     *
     * Produces the same selection as the sequential solver on the same model.
     */
    SelectionSolution solve(const DecisionModel& model, const SolverOptions& options) override;

    /**
     * @brief Search every completion of `state` with up to `threadsLeft` threads.
     *
     * Also used by the MPI solver to search its share of the tree.
     */
    void parallelDFS(SelectionState& state, Incumbent& incumbent, SearchBudget& budget, int threadsLeft) const;

private:
    int numThreads_;  ///< Number of worker threads.
    int splitDepth_;  ///< Decisions below this index are never split.
};
