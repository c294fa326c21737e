/*
===============================================================================
TEST MPI — Prefix-partitioned solver across ranks (mpi_solver.hpp)
===============================================================================

OVERVIEW
--------
Runs the MPI backend on every rank of MPI_COMM_WORLD and checks that it
returns exactly the sequential selection, whatever the number of ranks and
the depth used to partition the decision tree, and that every rank returns
the same selection as rank 0.

Launched through mpiexec by CTest (see CMakeLists.txt). Every rank executes
every test case in the same order, so the collectives inside the solver
line up.

TEST ORGANIZATION
-----------------
• Section A: agreement with the sequential backend
• Section B: agreement between ranks
• Section C: node limit

DEPENDENCIES
------------
• Catch2 v2 - Test framework
• MPI - Runtime for the solver under test
• mpi_solver.hpp - System under test

===============================================================================
*/

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include <mpi.h>
#include "mpi_solver.hpp"
#include "sequential_solver.hpp"
#include "demo_instances.hpp"
#include "schedule.hpp"
#include "test_helpers.hpp"
#include <cstddef>
#include <vector>

// ============================================================================
// UTILITY
// ============================================================================

/// Attend/skip flags of a result, one per catalog occurrence.
static std::vector<char> selectionFlags(const ScheduleResult& result, std::size_t modelSize) {
    std::vector<char> flags(modelSize, 0);
    for (const ScheduledOccurrence& e : result.entries) {
        flags[e.index] = 1;
    }
    return flags;
}

/// Rank 0's flags, broadcast to every rank.
static std::vector<char> rootSelection(const ScheduleResult& result, std::size_t modelSize) {
    std::vector<char> flags = selectionFlags(result, modelSize);
    if (modelSize > 0) {
        MPI_Bcast(flags.data(), (int)modelSize, MPI_CHAR, 0, MPI_COMM_WORLD);
    }
    return flags;
}

// ============================================================================
// SECTION A: AGREEMENT WITH THE SEQUENTIAL BACKEND
// ============================================================================

/**
 * @test MPIPartitionedSolver::MatchesSequential
 * @brief Same selection as the sequential solver for every prefix depth
 *
 * @given Seeded synthetic programmes of ten titles over two days
 * @when  Solving with prefix depths 0 to 4
 * @then  Attendance, transit and the attended showings are identical
 */
TEST_CASE("A1: MPIPartitionedSolver::MatchesSequentialOnSyntheticCatalogs", "[mpi]")
{
    SequentialBranchAndBoundSolver sequential;

    for (unsigned seed = 1; seed <= 15; ++seed) {
        INFO("seed = " << seed);
        DemoInstance inst = makeSyntheticInstance(10, 4, 2, seed);
        ScheduleOptimizer optimizer(inst.catalog, inst.transit);

        MPIPartitionedSolver distributed(2, (int)(seed % 5));
        ScheduleResult a = optimizer.run(sequential);
        ScheduleResult b = optimizer.run(distributed);

        REQUIRE(b.optimal);
        REQUIRE(a.attendance == b.attendance);
        REQUIRE(a.totalTransit == b.totalTransit);
        REQUIRE(attendedIndices(a) == attendedIndices(b));
    }
}

TEST_CASE("A2: MPIPartitionedSolver::MatchesExhaustiveOptimum", "[mpi][exhaustive]")
{
    for (int n = 0; n <= 12; n += 3) {
        for (unsigned seed = 1; seed <= 3; ++seed) {
            for (int depth : {1, 4, 20}) {
                INFO("n = " << n << ", seed = " << seed << ", depth = " << depth);
                TestInstance inst = makeRandomInstance(n, seed * 31u + (unsigned)n);
                CompatibilityOracle oracle(inst.transit);
                BruteForceOptimum expected = bruteForce(inst.catalog, oracle);

                MPIPartitionedSolver distributed(2, depth);
                ScheduleResult result = ScheduleOptimizer(inst.catalog, inst.transit).run(distributed);

                REQUIRE(result.optimal);
                REQUIRE(result.attendance == expected.attendance);
                REQUIRE(result.totalTransit == expected.totalTransit);
                REQUIRE(selectionFlags(result, inst.catalog.size()) == expected.selected);
            }
        }
    }
}

// ============================================================================
// SECTION B: AGREEMENT BETWEEN RANKS
// ============================================================================

TEST_CASE("B1: MPIPartitionedSolver::EveryRankReturnsTheSameSelection", "[mpi]")
{
    TestInstance inst = makeRandomInstance(16, 4242u);
    ScheduleOptimizer optimizer(inst.catalog, inst.transit);

    MPIPartitionedSolver distributed(2, 3);
    ScheduleResult result = optimizer.run(distributed);

    REQUIRE(result.optimal);
    REQUIRE(rootSelection(result, inst.catalog.size()) == selectionFlags(result, inst.catalog.size()));
}

// ============================================================================
// SECTION C: NODE LIMIT
// ============================================================================

/**
 * @test MPIPartitionedSolver::NodeLimit
 * @brief A rank that runs out of budget flags the result on every rank
 */
TEST_CASE("C1: MPIPartitionedSolver::NodeLimitFlagsResultOnAllRanks", "[mpi][budget]")
{
    TestInstance inst = makeRandomInstance(12, 99u);
    SolverOptions options;
    options.nodeLimit = 5;
    ScheduleOptimizer optimizer(inst.catalog, inst.transit, options);

    MPIPartitionedSolver distributed(2, 2);
    ScheduleResult result = optimizer.run(distributed);

    REQUIRE_FALSE(result.optimal);
    REQUIRE(verifySelection(inst.catalog, optimizer.oracle(), selectionFlags(result, inst.catalog.size())));
}

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char* argv[]) {
    MPI_Init(&argc, &argv);
    int failed = Catch::Session().run(argc, argv);
    MPI_Finalize();
    return failed;
}
