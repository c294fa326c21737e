#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <vector>


///////////////////////////
///       ORACLE        ///
///////////////////////////
/**
 * @brief Pairwise feasibility and transit cost between two occurrences.
 *
 * All predicates take the pair in start order: p.start <= q.start. Arguments
 * given the other way round are swapped first.
 */
class CompatibilityOracle {
public:
    explicit CompatibilityOracle(const TransitCostTable& transit);

    /// Same-venue constant if both share a venue, table cost otherwise.
    int transitMinutes(const EventOccurrence& p, const EventOccurrence& q) const;

    /// End of the earlier occurrence plus the transit to the later one.
    Minutes earliestStart(const EventOccurrence& p, const EventOccurrence& q) const;

    /**
     * @brief True iff both can be attended: the later one starts no earlier
     *        than earliestStart() and the titles differ.
     */
    bool pairFeasible(const EventOccurrence& p, const EventOccurrence& q) const;

    /// True iff both start on the same calendar date.
    bool sameCalendarDay(const EventOccurrence& p, const EventOccurrence& q) const;

    const TransitCostTable& transit() const { return transit_; }

private:
    const TransitCostTable& transit_;
};


///////////////////////////
///   DECISION  MODEL   ///
///////////////////////////
/**
 * @brief Abstract boolean decision problem solved by every backend.
 *
 * One decision per index, decided in index order. For i < j the model stores
 * whether i and j conflict, whether they share a calendar day, and the
 * transit minutes charged at j when i is the attended occurrence right
 * before it. Nothing here refers to titles, venues or clocks.
 */
class DecisionModel {
public:
    DecisionModel() = default;

    /**
     * @brief Build a model from flat row-major size x size matrices.
     *
     * Only entries with i < j are read; the conflict relation is mirrored.
     *
     * @throws std::invalid_argument if a matrix has the wrong size.
     */
    DecisionModel(int size, const std::vector<char>& conflicts,
                  const std::vector<char>& sameDay, const std::vector<int>& transit);

    /**
     * @brief Query the oracle for every pair of catalog occurrences.
     */
    static DecisionModel build(const EventCatalog& catalog, const CompatibilityOracle& oracle);

    int size() const { return size_; }

    bool conflicts(int i, int j) const { return conflicts_[(size_t)i * size_ + j] != 0; }
    bool sameDay(int i, int j) const { return sameDay_[(size_t)i * size_ + j] != 0; }
    int transit(int i, int j) const { return transit_[(size_t)i * size_ + j]; }

    /// Indices j > i that conflict with i.
    const std::vector<int>& laterConflicts(int i) const { return laterConflicts_[i]; }

    /**
     * @brief Transit charged when `next` is attended right after `previous`.
     *
     * Zero when there is no previous attended index (-1) or the two fall on
     * different calendar days.
     */
    int transitCharge(int previous, int next) const {
        if (previous < 0 || !sameDay(previous, next)) return 0;
        return transit(previous, next);
    }

    /// True iff no two selected indices conflict.
    bool isFeasible(const std::vector<char>& selected) const;

    /// Sum of transit charges along the selected indices.
    int totalTransit(const std::vector<char>& selected) const;

private:
    int size_ = 0;
    std::vector<char> conflicts_;
    std::vector<char> sameDay_;
    std::vector<int> transit_;
    std::vector<std::vector<int>> laterConflicts_;
};


///////////////////////////
///   SELECTION STATE   ///
///////////////////////////
/**
 * @brief Incremental partial assignment used during the search.
 *
 * Indices [0, depth) are decided. For every undecided index the state keeps
 * how many attended indices conflict with it, so that the number of
 * undecided indices that could still be attended is known in O(1).
 * select(), skip() and undo() keep all counters consistent.
 */
class SelectionState {
public:
    explicit SelectionState(const DecisionModel& model);

    int size() const { return (int)decisions_.size(); }
    int depth() const { return depth_; }
    bool complete() const { return depth_ == (int)decisions_.size(); }

    int attendance() const { return attendance_; }
    int totalTransit() const { return transit_; }

    /// Undecided indices not blocked by any attended index.
    int openCount() const { return openCount_; }

    /// Best attendance any completion of this state can reach.
    int upperBound() const { return attendance_ + openCount_; }

    /// True iff the next index to decide conflicts with nothing attended.
    bool canSelect() const { return !complete() && blockedBy_[depth_] == 0; }

    /**
     * @brief Attend the next index.
     *
     * @throws std::logic_error if canSelect() is false.
     */
    void select();

    /// Skip the next index.
    void skip();

    /// Revert the most recent select() or skip().
    void undo();

    /// Decision flags; entries at or past depth() are zero.
    const std::vector<char>& decisions() const { return decisions_; }

private:
    struct Step {
        bool selected;
        int previousLast;
        int transitCharged;
    };

    const DecisionModel* model_;
    std::vector<char> decisions_;
    std::vector<int> blockedBy_;
    std::vector<Step> trail_;
    int depth_ = 0;
    int attendance_ = 0;
    int transit_ = 0;
    int openCount_ = 0;
    int lastSelected_ = -1;
};
