#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <chrono>
#include <functional>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
class DecisionModel;

/**
 * @brief Objective optimized by one pass of the two-phase search.
 */
enum class SearchObjective { MAXIMIZE_ATTENDANCE, MINIMIZE_TRANSIT };

/**
 * @brief Selection of occurrences and its objective values.
 *
 * selected[i] != 0 means occurrence i (catalog order) is attended.
 */
struct SelectionSolution {
    /// One attend/skip flag per catalog index.
    std::vector<char> selected;

    /// Number of attended occurrences.
    int attendance = 0;

    /// Sum of same-day transit minutes between consecutive attended occurrences.
    int totalTransit = 0;

    /// False when a deadline or node limit stopped the search before proof.
    bool optimal = true;

    /// Search nodes visited over both passes.
    long long nodesExplored = 0;
};

/**
 * @brief Snapshot passed to the progress hook when the incumbent improves.
 */
struct SearchProgress {
    SearchObjective phase;
    const std::vector<char>& selected;
    int attendance;
    int totalTransit;
};

using ProgressHook = std::function<void(const SearchProgress&)>;

/**
 * @brief Run parameters shared by every solver backend.
 */
struct SolverOptions {
    /// Wall-clock budget for both passes together; zero means unlimited.
    std::chrono::milliseconds deadline{0};

    /// Maximum number of search nodes for both passes together; zero means unlimited.
    long long nodeLimit = 0;

    /// Optional observer called on every incumbent improvement.
    ProgressHook progress;
};


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Common interface for schedule solvers.
 *
 * Implementations may be sequential, multithreaded or distributed via MPI,
 * but all expose the same solve() contract over the abstract decision model
 * and return the same selection on the same input.
 */
class IScheduleSolver {
public:
    virtual ~IScheduleSolver() = default;

    /**
     * @brief Find the maximum-attendance, minimum-transit selection.
     *
     * Always returns a feasible selection; the empty selection is feasible.
     * If the options stop the search early, the result has optimal == false.
     */
    virtual SelectionSolution solve(const DecisionModel& model, const SolverOptions& options) = 0;
};
