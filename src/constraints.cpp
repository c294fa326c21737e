///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include <stdexcept>
#include <utility>


///////////////////////////
///       ORACLE        ///
///////////////////////////
CompatibilityOracle::CompatibilityOracle(const TransitCostTable& transit) : transit_(transit) {}

int CompatibilityOracle::transitMinutes(const EventOccurrence& p, const EventOccurrence& q) const {
    if (q.start < p.start) return transitMinutes(q, p);
    if (p.venue == q.venue) return transit_.sameVenueMinutes();
    return transit_.minutes(p.venue, q.venue);
}

Minutes CompatibilityOracle::earliestStart(const EventOccurrence& p, const EventOccurrence& q) const {
    if (q.start < p.start) return earliestStart(q, p);
    return p.end() + transitMinutes(p, q);
}

/**
 * @brief Pairwise feasibility of attending both occurrences.
 *
 * Checked for every pair, not only for occurrences that end up adjacent in a
 * schedule, so a direct transit longer than a detour through a skipped venue
 * still rules the pair out.
 */
bool CompatibilityOracle::pairFeasible(const EventOccurrence& p, const EventOccurrence& q) const {
    if (q.start < p.start) return pairFeasible(q, p);
    if (p.title == q.title) return false;
    return q.start >= earliestStart(p, q);
}

bool CompatibilityOracle::sameCalendarDay(const EventOccurrence& p, const EventOccurrence& q) const {
    return calendarDay(p.start) == calendarDay(q.start);
}


///////////////////////////
///   DECISION  MODEL   ///
///////////////////////////
DecisionModel::DecisionModel(int size, const std::vector<char>& conflicts,
                             const std::vector<char>& sameDay, const std::vector<int>& transit)
        : size_(size) {
    size_t cells = (size_t)size * size;
    if (size < 0 || conflicts.size() != cells || sameDay.size() != cells || transit.size() != cells) {
        throw std::invalid_argument("decision model matrices must be size x size");
    }

    conflicts_.assign(cells, 0);
    sameDay_.assign(cells, 0);
    transit_.assign(cells, 0);
    laterConflicts_.assign(size, {});

    for (int i = 0; i < size; ++i) {
        for (int j = i + 1; j < size; ++j) {
            size_t ij = (size_t)i * size + j;
            size_t ji = (size_t)j * size + i;
            if (conflicts[ij]) {
                conflicts_[ij] = conflicts_[ji] = 1;
                laterConflicts_[i].push_back(j);
            }
            sameDay_[ij] = sameDay_[ji] = sameDay[ij] ? 1 : 0;
            transit_[ij] = transit[ij];
        }
    }
}

DecisionModel DecisionModel::build(const EventCatalog& catalog, const CompatibilityOracle& oracle) {
    int n = (int)catalog.size();
    size_t cells = (size_t)n * n;
    std::vector<char> conflicts(cells, 0);
    std::vector<char> sameDay(cells, 0);
    std::vector<int> transit(cells, 0);

    for (int i = 0; i < n; ++i) {
        const EventOccurrence& p = catalog[i];
        for (int j = i + 1; j < n; ++j) {
            const EventOccurrence& q = catalog[j];
            size_t ij = (size_t)i * n + j;
            conflicts[ij] = oracle.pairFeasible(p, q) ? 0 : 1;
            sameDay[ij] = oracle.sameCalendarDay(p, q) ? 1 : 0;
            transit[ij] = oracle.transitMinutes(p, q);
        }
    }

    return DecisionModel(n, conflicts, sameDay, transit);
}

bool DecisionModel::isFeasible(const std::vector<char>& selected) const {
    if ((int)selected.size() != size_) return false;
    for (int i = 0; i < size_; ++i) {
        if (!selected[i]) continue;
        for (int j = i + 1; j < size_; ++j) {
            if (selected[j] && conflicts(i, j)) return false;
        }
    }
    return true;
}

int DecisionModel::totalTransit(const std::vector<char>& selected) const {
    int total = 0;
    int last = -1;
    for (int i = 0; i < size_ && i < (int)selected.size(); ++i) {
        if (!selected[i]) continue;
        total += transitCharge(last, i);
        last = i;
    }
    return total;
}


///////////////////////////
///   SELECTION STATE   ///
///////////////////////////
SelectionState::SelectionState(const DecisionModel& model)
        : model_(&model),
          decisions_(model.size(), 0),
          blockedBy_(model.size(), 0),
          openCount_(model.size()) {
    trail_.reserve(model.size());
}

/**
 * @brief Attend index depth() and block every later index it conflicts with.
 */
void SelectionState::select() {
    if (!canSelect()) {
        throw std::logic_error("cannot attend a blocked occurrence");
    }
    int i = depth_;

    // i itself leaves the undecided-and-open pool.
    --openCount_;
    for (int k : model_->laterConflicts(i)) {
        if (blockedBy_[k]++ == 0) --openCount_;
    }

    int charge = model_->transitCharge(lastSelected_, i);
    trail_.push_back({true, lastSelected_, charge});

    transit_ += charge;
    lastSelected_ = i;
    ++attendance_;
    decisions_[i] = 1;
    ++depth_;
}

void SelectionState::skip() {
    if (complete()) {
        throw std::logic_error("no occurrence left to decide");
    }
    int i = depth_;
    if (blockedBy_[i] == 0) --openCount_;

    trail_.push_back({false, lastSelected_, 0});
    decisions_[i] = 0;
    ++depth_;
}

void SelectionState::undo() {
    if (trail_.empty()) {
        throw std::logic_error("nothing to undo");
    }
    Step step = trail_.back();
    trail_.pop_back();

    --depth_;
    int i = depth_;

    if (step.selected) {
        for (int k : model_->laterConflicts(i)) {
            if (--blockedBy_[k] == 0) ++openCount_;
        }
        ++openCount_;
        --attendance_;
        transit_ -= step.transitCharged;
        lastSelected_ = step.previousLast;
        decisions_[i] = 0;
    } else if (blockedBy_[i] == 0) {
        ++openCount_;
    }
}
