///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_solver.hpp"
#include <algorithm>
#include <future>
#include <vector>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Construct the threaded solver; at least one thread is always used.
 */
ThreadedBranchAndBoundSolver::ThreadedBranchAndBoundSolver(int numThreads, int splitDepth)
        : numThreads_(std::max(1, numThreads)),
          splitDepth_(std::max(0, splitDepth)) {}

/**
 * @brief Entry point: both passes start from the root with all threads.
 */
SelectionSolution ThreadedBranchAndBoundSolver::solve(const DecisionModel& model, const SolverOptions& options) {
    return solveTwoPhase(model, options, [&](Incumbent& incumbent, SearchBudget& budget) {
        SelectionState root(model);
        parallelDFS(root, incumbent, budget, numThreads_);
    });
}

/**
 * @brief Recursive DFS with thread splitting near the root.
 *
 * Each parallel branch works on its own copy of the state. Exceptions raised
 * inside a branch are rethrown here by future::get().
 */
void ThreadedBranchAndBoundSolver::parallelDFS(
        SelectionState& state, Incumbent& incumbent, SearchBudget& budget, int threadsLeft) const {

    BranchAndBound engine(budget);

    // No parallelism left; explore sequentially.
    if (threadsLeft <= 1 || state.depth() >= splitDepth_ || state.complete()) {
        engine.explore(state, incumbent);
        return;
    }

    if (!budget.tick()) return;
    if (!incumbent.admits(state)) return;

    // Only the skip branch exists: keep all threads on it.
    if (!state.canSelect()) {
        state.skip();
        parallelDFS(state, incumbent, budget, threadsLeft);
        state.undo();
        return;
    }

    // Parallel split: attend branch gets the larger half of the threads.
    SelectionState attendState = state;
    attendState.select();
    SelectionState skipState = state;
    skipState.skip();

    int attendThreads = threadsLeft - threadsLeft / 2;
    int skipThreads = threadsLeft / 2;

    std::vector<std::future<void>> tasks;
    tasks.push_back(std::async(std::launch::async, [this, &attendState, &incumbent, &budget, attendThreads]() {
        this->parallelDFS(attendState, incumbent, budget, attendThreads);
    }));
    tasks.push_back(std::async(std::launch::async, [this, &skipState, &incumbent, &budget, skipThreads]() {
        this->parallelDFS(skipState, incumbent, budget, skipThreads);
    }));

    for (auto& t : tasks) t.get();
}
