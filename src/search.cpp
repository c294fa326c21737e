///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "search.hpp"
#include <algorithm>
#include <utility>


///////////////////////////
///     TIE-BREAK       ///
///////////////////////////
bool precedesInSearchOrder(const std::vector<char>& a, const std::vector<char>& b) {
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        bool ai = a[i] != 0;
        bool bi = b[i] != 0;
        if (ai != bi) return ai;
    }
    return false;
}

/**
 * @brief Whether a completion of the decided prefix can come before `best`.
 *
 * A prefix that already differs from best wins or loses at its first
 * difference; a prefix equal to best's may still go either way.
 */
static bool prefixMayPrecede(const std::vector<char>& decisions, int depth, const std::vector<char>& best) {
    int n = std::min(depth, (int)best.size());
    for (int i = 0; i < n; ++i) {
        bool di = decisions[i] != 0;
        bool bi = best[i] != 0;
        if (di != bi) return di;
    }
    return true;
}


///////////////////////////
///       BUDGET        ///
///////////////////////////
SearchBudget::SearchBudget(std::chrono::milliseconds deadline, long long nodeLimit)
        : hasDeadline_(deadline.count() > 0),
          deadlineAt_(std::chrono::steady_clock::now() + deadline),
          nodeLimit_(nodeLimit) {}

bool SearchBudget::tick() {
    if (exhausted_.load(std::memory_order_relaxed)) return false;

    long long count = nodes_.fetch_add(1, std::memory_order_relaxed) + 1;

    if (nodeLimit_ > 0 && count > nodeLimit_) {
        exhausted_ = true;
        return false;
    }
    if (hasDeadline_ && count % kClockInterval == 0 &&
        std::chrono::steady_clock::now() >= deadlineAt_) {
        exhausted_ = true;
        return false;
    }
    return true;
}


///////////////////////////
///      INCUMBENT      ///
///////////////////////////
Incumbent::Incumbent(SearchObjective objective, int requiredAttendance,
                     const SelectionSolution& seed, ProgressHook hook)
        : objective_(objective),
          requiredAttendance_(requiredAttendance),
          hook_(std::move(hook)),
          best_(seed) {}

bool Incumbent::admits(const SelectionState& state) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (objective_ == SearchObjective::MAXIMIZE_ATTENDANCE) {
        int bound = state.upperBound();
        if (bound != best_.attendance) return bound > best_.attendance;
    } else {
        if (state.upperBound() < requiredAttendance_) return false;
        int bound = state.totalTransit();
        if (bound != best_.totalTransit) return bound < best_.totalTransit;
    }
    return prefixMayPrecede(state.decisions(), state.depth(), best_.selected);
}

bool Incumbent::improvesLocked(const std::vector<char>& selected, int attendance, int totalTransit) const {
    if (objective_ == SearchObjective::MAXIMIZE_ATTENDANCE) {
        if (attendance != best_.attendance) return attendance > best_.attendance;
    } else {
        if (attendance != requiredAttendance_) return false;
        if (totalTransit != best_.totalTransit) return totalTransit < best_.totalTransit;
    }
    return precedesInSearchOrder(selected, best_.selected);
}

bool Incumbent::offer(const SelectionState& state) {
    return offer(state.decisions(), state.attendance(), state.totalTransit());
}

bool Incumbent::offer(const std::vector<char>& selected, int attendance, int totalTransit) {
    std::vector<char> copied;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!improvesLocked(selected, attendance, totalTransit)) return false;

        best_.selected = selected;
        best_.attendance = attendance;
        best_.totalTransit = totalTransit;
        if (!hook_) return true;
        copied = best_.selected;
    }

    // Hooks are serialized among themselves but never hold mutex_, so they may
    // call back into the incumbent.
    std::lock_guard<std::mutex> hookLock(hookMutex_);
    hook_(SearchProgress{objective_, copied, attendance, totalTransit});
    return true;
}

SelectionSolution Incumbent::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return best_;
}


///////////////////////////
///   BRANCH & BOUND    ///
///////////////////////////
BranchAndBound::BranchAndBound(SearchBudget& budget) : budget_(budget) {}

/**
 * @brief Recursive depth-first search, "attend" branch first.
 *
 * Every node is counted against the budget and bounded against the
 * incumbent before it is expanded.
 */
void BranchAndBound::explore(SelectionState& state, Incumbent& incumbent) const {
    if (!budget_.tick()) return;
    if (!incumbent.admits(state)) return;

    if (state.complete()) {
        incumbent.offer(state);
        return;
    }

    if (state.canSelect()) {
        state.select();
        explore(state, incumbent);
        state.undo();
    }

    state.skip();
    explore(state, incumbent);
    state.undo();
}


///////////////////////////
///     TWO PHASES      ///
///////////////////////////
SelectionSolution solveTwoPhase(const DecisionModel& model, const SolverOptions& options,
                                const PassRunner& runPass) {
    SearchBudget budget(options.deadline, options.nodeLimit);

    // The empty selection is always feasible.
    SelectionSolution empty;
    empty.selected.assign(model.size(), 0);

    // Pass 1: maximize attendance.
    Incumbent attendance(SearchObjective::MAXIMIZE_ATTENDANCE, 0, empty, options.progress);
    runPass(attendance, budget);
    SelectionSolution first = attendance.snapshot();

    // Pass 2: minimize transit among selections with that attendance.
    Incumbent transit(SearchObjective::MINIMIZE_TRANSIT, first.attendance, first, options.progress);
    runPass(transit, budget);

    SelectionSolution result = transit.snapshot();
    result.optimal = !budget.exhausted();
    result.nodesExplored = budget.nodes();
    return result;
}
