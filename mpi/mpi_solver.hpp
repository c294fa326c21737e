#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include "search.hpp"
#include "solver_base.hpp"
#include "../threads/threaded_solver.hpp"
#include <vector>


///////////////////////////
///       SOLVER        ///
///////////////////////////
/**
 * @brief MPI solver that partitions the decision tree across ranks.
 *
 * The first `prefixDepth` decisions are enumerated in search order; every
 * feasible prefix is owned by one rank (round robin), which searches it with
 * an internal ThreadedBranchAndBoundSolver for intra-node parallelism. After
 * each pass all ranks exchange their incumbents, so every rank enters the
 * next pass, and returns, with the same globally best selection.
 */
class MPIPartitionedSolver : public IScheduleSolver {
public:
    /**
     * @brief Construct a hybrid MPI + threaded solver.
     *
     * @param numThreads  Number of worker threads used inside each rank.
     * @param prefixDepth Number of leading decisions used to partition work.
     */
    MPIPartitionedSolver(int numThreads, int prefixDepth);

    /**
     * @brief Solve the model cooperatively across all MPI ranks.
     *
     * Must be called on every rank of MPI_COMM_WORLD with the same model and
     * options. Every rank returns the same selection; optimal is false if
     * any rank ran out of budget, and nodesExplored is the total over ranks.
     */
    SelectionSolution solve(const DecisionModel& model, const SolverOptions& options) override;

private:
    /// Number of worker threads used within each MPI process.
    int numThreads_;

    /// Leading decisions enumerated to split work between ranks.
    int prefixDepth_;

    /**
     * @brief Search the prefixes owned by this rank, then merge incumbents.
     */
    void runPass(const DecisionModel& model, Incumbent& incumbent, SearchBudget& budget,
                 int rank, int size) const;

    /**
     * @brief Collect every feasible assignment of the first `depth` decisions.
     *
     * Prefixes are produced in search order ("attend" before "skip").
     */
    static void enumeratePrefixes(SelectionState& state, int depth, std::vector<SelectionState>& out);

    /**
     * @brief Exchange incumbents between all ranks.
     *
     * Each rank contributes [attendance, totalTransit, flags...] through
     * MPI_Allgather and offers every received selection, in rank order, to
     * its own incumbent. The tie-break makes the outcome identical on all
     * ranks.
     */
    static void shareIncumbent(Incumbent& incumbent, int modelSize, int size);

    /**
     * @brief Serialize a selection into a flat integer buffer.
     */
    static void serializeSelection(const SelectionSolution& sol, std::vector<int>& buffer);

    /**
     * @brief Deserialize one rank's slice of a gathered buffer.
     */
    static void deserializeSelection(const int* buffer, int modelSize, SelectionSolution& sol);
};
