///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sequential_solver.hpp"
#include "model.hpp"
#include "schedule.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include <iostream>
#include <chrono>
#include <exception>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the sequential schedule optimizer.
 *
 * Builds the festival demo catalog, runs the single-threaded two-phase
 * branch-and-bound, measures its runtime, and prints every improving
 * incumbent followed by the final per-day schedule.
 */
int main(int argc, char** argv) {
    // Currently no command-line handling; silence unused parameter warnings.
    (void)argc;
    (void)argv;

    try {
        // Select the demo programme to plan.
        DemoSize size = DemoSize::FESTIVAL;
        DemoInstance inst = makeDemoInstance(size);

        // No deadline: prove the optimum.
        SolverOptions options;
        options.progress = makeProgressPrinter(inst.catalog);

        std::cout << "========================================\n";
        std::cout << "SEQUENTIAL SCHEDULE OPTIMIZER\n";
        std::cout << "Showings: " << inst.catalog.size() << "\n";
        std::cout << "Venues: " << inst.transit.venueCount() << "\n";
        std::cout << "========================================\n";

        ScheduleOptimizer optimizer(inst.catalog, inst.transit, options);
        SequentialBranchAndBoundSolver solver;

        // Measure wall-clock time of the sequential search.
        auto start = std::chrono::high_resolution_clock::now();
        ScheduleResult result = optimizer.run(solver);
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        std::cout << "========================================\n";
        std::cout << "Time: " << ms << " ms\n";
        std::cout << "Nodes: " << result.nodesExplored << "\n\n";
        printSchedule(result);
        std::cout << "========================================\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
