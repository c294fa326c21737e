#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include "solver_base.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <vector>


///////////////////////////
///     TIE-BREAK       ///
///////////////////////////
/**
 * @brief Search-order comparison of two complete assignments.
 *
 * The search decides indices in order and tries "attend" before "skip", so
 * a precedes b iff at the first index where they differ, a attends.
 * Equal assignments do not precede each other.
 */
bool precedesInSearchOrder(const std::vector<char>& a, const std::vector<char>& b);


///////////////////////////
///       BUDGET        ///
///////////////////////////
/**
 * @brief Shared node counter with optional deadline and node limit.
 *
 * Safe to use from several threads. Once exhausted it stays exhausted.
 */
class SearchBudget {
public:
    SearchBudget(std::chrono::milliseconds deadline, long long nodeLimit);

    /**
     * @brief Count one node.
     *
     * @return false once the deadline or node limit has been reached.
     */
    bool tick();

    bool exhausted() const { return exhausted_.load(std::memory_order_relaxed); }
    long long nodes() const { return nodes_.load(std::memory_order_relaxed); }

private:
    /// The clock is only read every this many nodes.
    static constexpr long long kClockInterval = 1024;

    bool hasDeadline_;
    std::chrono::steady_clock::time_point deadlineAt_;
    long long nodeLimit_;
    std::atomic<long long> nodes_{0};
    std::atomic<bool> exhausted_{false};
};


///////////////////////////
///      INCUMBENT      ///
///////////////////////////
/**
 * @brief Best complete selection found so far for one search pass.
 *
 * Guarded by a mutex so parallel branches can share it. It only ever
 * improves: a candidate replaces it when its objective is strictly better,
 * or equal and earlier in search order. The progress hook, if any, runs on
 * every replacement after the incumbent lock is released; hook calls are
 * serialized with each other.
 */
class Incumbent {
public:
    /**
     * @brief Seed a pass with a known feasible selection.
     *
     * @param objective          Objective of this pass.
     * @param requiredAttendance Attendance every candidate must reach
     *                           (only used when minimizing transit).
     * @param seed               Feasible selection to start from.
     * @param hook               Optional progress observer.
     */
    Incumbent(SearchObjective objective, int requiredAttendance,
              const SelectionSolution& seed, ProgressHook hook = ProgressHook());

    /**
     * @brief Whether some completion of the state could replace the incumbent.
     *
     * Uses the attendance upper bound when maximizing and the accumulated
     * transit lower bound when minimizing; a bound that only ties survives
     * if the state's decided prefix may still come first in search order.
     */
    bool admits(const SelectionState& state) const;

    /// Offer a complete state; returns true if it replaced the incumbent.
    bool offer(const SelectionState& state);

    /// Offer a complete selection computed elsewhere (e.g. on another rank).
    bool offer(const std::vector<char>& selected, int attendance, int totalTransit);

    SelectionSolution snapshot() const;

    SearchObjective objective() const { return objective_; }
    int requiredAttendance() const { return requiredAttendance_; }

private:
    SearchObjective objective_;
    int requiredAttendance_;
    ProgressHook hook_;

    mutable std::mutex mutex_;
    SelectionSolution best_;
    std::mutex hookMutex_;

    bool improvesLocked(const std::vector<char>& selected, int attendance, int totalTransit) const;
};


///////////////////////////
///   BRANCH & BOUND    ///
///////////////////////////
/**
 * @brief Depth-first branch-and-bound over a SelectionState.
 *
 * Stateless apart from the shared budget, so one engine may be used by
 * several threads, each with its own SelectionState.
 */
class BranchAndBound {
public:
    explicit BranchAndBound(SearchBudget& budget);

    /**
     * @brief Exhaustively search every completion of the state.
     *
     * Leaves the state as it found it. Stops early once the budget is spent.
     */
    void explore(SelectionState& state, Incumbent& incumbent) const;

private:
    SearchBudget& budget_;
};


///////////////////////////
///     TWO PHASES      ///
///////////////////////////
/// Backend-specific search of one pass, starting from an empty assignment.
using PassRunner = std::function<void(Incumbent& incumbent, SearchBudget& budget)>;

/**
 * @brief Maximize attendance, then minimize transit at that attendance.
 *
 * The first pass starts from the empty selection; the second is seeded with
 * the first pass result. Backends only provide how a pass is searched.
 */
SelectionSolution solveTwoPhase(const DecisionModel& model, const SolverOptions& options,
                                const PassRunner& runPass);
