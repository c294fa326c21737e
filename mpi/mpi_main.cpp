///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "schedule.hpp"
#include "formatting.hpp"
#include "mpi_solver.hpp"
#include "demo_instances.hpp"
#include <mpi.h>
#include <iostream>
#include <chrono>
#include <exception>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////

/**
 * @brief MPI entry point for the hybrid MPI + threads schedule optimizer.
 *
 * Initializes MPI, builds the same demo catalog on each rank, runs the
 * MPIPartitionedSolver, and finalizes MPI. Rank 0 prints run information,
 * improving incumbents and the final schedule.
 */
int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    int status = 0;
    try {
        // Every rank builds the same catalog deterministically.
        DemoSize demoSize = DemoSize::L;
        DemoInstance inst = makeDemoInstance(demoSize);

        // Hybrid solver:
        //  - numThreads:  threads used inside each MPI process,
        //  - prefixDepth: leading decisions enumerated to split the tree.
        int numThreads = 4;
        int prefixDepth = 6;
        MPIPartitionedSolver solver(/*numThreads=*/numThreads, /*prefixDepth=*/prefixDepth);

        SolverOptions options;
        options.deadline = std::chrono::milliseconds(60000);
        if (rank == 0) {
            options.progress = makeProgressPrinter(inst.catalog);
        }

        // Only rank 0 prints a brief header about the MPI configuration.
        if (rank == 0) {
            std::cout << "========================================\n";
            std::cout << "MPI+THREADS SCHEDULE OPTIMIZER\n";
            std::cout << "Processes: " << size << "\n";
            std::cout << "Showings: " << inst.catalog.size() << "\n";
            std::cout << "========================================\n";
        }

        ScheduleOptimizer optimizer(inst.catalog, inst.transit, options);

        auto start = std::chrono::high_resolution_clock::now();
        ScheduleResult result = optimizer.run(solver);
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        if (rank == 0) {
            std::cout << "========================================\n";
            std::cout << "Time: " << ms << " ms\n";
            std::cout << "Nodes (all ranks): " << result.nodesExplored << "\n\n";
            printSchedule(result);
            std::cout << "========================================\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[Rank " << rank << "] Error: " << e.what() << "\n";
        status = 1;
        MPI_Abort(MPI_COMM_WORLD, status);
    }

    MPI_Finalize();
    return status;
}
