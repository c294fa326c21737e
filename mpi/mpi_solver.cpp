///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "mpi_solver.hpp"
#include <mpi.h>
#include <algorithm>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Construct the hybrid MPI + threaded solver.
 *
 * @param numThreads  Number of worker threads used on each MPI rank.
 * @param prefixDepth Leading decisions enumerated to split work (clamped
 *                    to the model size at solve time).
 */
MPIPartitionedSolver::MPIPartitionedSolver(int numThreads, int prefixDepth)
        : numThreads_(std::max(1, numThreads)),
          prefixDepth_(std::max(0, prefixDepth)) {}

/**
 * @brief Encode a selection as (attendance, totalTransit, flag...) ints.
 */
void MPIPartitionedSolver::serializeSelection(const SelectionSolution& sol, std::vector<int>& buffer) {
    buffer.clear();
    buffer.reserve(2 + sol.selected.size());
    buffer.push_back(sol.attendance);
    buffer.push_back(sol.totalTransit);
    for (char flag : sol.selected) {
        buffer.push_back(flag ? 1 : 0);
    }
}

/**
 * @brief Decode a buffer produced by serializeSelection().
 */
void MPIPartitionedSolver::deserializeSelection(const int* buffer, int modelSize, SelectionSolution& sol) {
    sol.attendance = buffer[0];
    sol.totalTransit = buffer[1];
    sol.selected.resize(modelSize);
    for (int i = 0; i < modelSize; ++i) {
        sol.selected[i] = buffer[2 + i] ? 1 : 0;
    }
}

void MPIPartitionedSolver::enumeratePrefixes(SelectionState& state, int depth, std::vector<SelectionState>& out) {
    if (state.depth() >= depth || state.complete()) {
        out.push_back(state);
        return;
    }
    if (state.canSelect()) {
        state.select();
        enumeratePrefixes(state, depth, out);
        state.undo();
    }
    state.skip();
    enumeratePrefixes(state, depth, out);
    state.undo();
}

void MPIPartitionedSolver::shareIncumbent(Incumbent& incumbent, int modelSize, int size) {
    std::vector<int> local;
    serializeSelection(incumbent.snapshot(), local);

    int stride = 2 + modelSize;
    std::vector<int> gathered((size_t)stride * size);
    MPI_Allgather(local.data(), stride, MPI_INT, gathered.data(), stride, MPI_INT, MPI_COMM_WORLD);

    for (int r = 0; r < size; ++r) {
        SelectionSolution candidate;
        deserializeSelection(gathered.data() + (size_t)r * stride, modelSize, candidate);
        incumbent.offer(candidate.selected, candidate.attendance, candidate.totalTransit);
    }
}

/**
 * @brief Search this rank's prefixes with threads, then merge with all ranks.
 *
 * Prefix k belongs to rank k % size. Every rank reaches the collective
 * exchange, even when its budget is already spent.
 */
void MPIPartitionedSolver::runPass(const DecisionModel& model, Incumbent& incumbent, SearchBudget& budget,
                                   int rank, int size) const {
    SelectionState root(model);
    std::vector<SelectionState> prefixes;
    enumeratePrefixes(root, std::min(prefixDepth_, model.size()), prefixes);

    // Threaded solver inside each rank (hybrid parallelism).
    ThreadedBranchAndBoundSolver threaded(numThreads_, model.size());

    for (size_t k = 0; k < prefixes.size(); ++k) {
        if ((int)(k % size) != rank) continue;
        threaded.parallelDFS(prefixes[k], incumbent, budget, numThreads_);
    }

    shareIncumbent(incumbent, model.size(), size);
}

/**
 * @brief Solve both passes across all ranks.
 *
 * Deadline and node limit apply per rank. Optimality and node counts are
 * combined with MPI_Allreduce after the second pass.
 */
SelectionSolution MPIPartitionedSolver::solve(const DecisionModel& model, const SolverOptions& options) {
    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    SelectionSolution result = solveTwoPhase(model, options, [&](Incumbent& incumbent, SearchBudget& budget) {
        runPass(model, incumbent, budget, rank, size);
    });

    int localStopped = result.optimal ? 0 : 1;
    int anyStopped = 0;
    MPI_Allreduce(&localStopped, &anyStopped, 1, MPI_INT, MPI_MAX, MPI_COMM_WORLD);

    long long localNodes = result.nodesExplored;
    long long totalNodes = 0;
    MPI_Allreduce(&localNodes, &totalNodes, 1, MPI_LONG_LONG, MPI_SUM, MPI_COMM_WORLD);

    result.optimal = anyStopped == 0;
    result.nodesExplored = totalNodes;
    return result;
}
