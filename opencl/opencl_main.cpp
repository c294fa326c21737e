///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "schedule.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include "opencl_evaluator.hpp"
#include "../threads/threaded_solver.hpp"
#include <iostream>
#include <chrono>
#include <exception>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the OpenCL-assisted schedule optimizer.
 *
 * Builds the decision model for a demo catalog on the OpenCL device, then
 * solves it with the threaded backend and prints the schedule.
 */
int main(int argc, char** argv) {
    // No CLI arguments are used yet; silence unused parameter warnings.
    (void)argc;
    (void)argv;

    try {
        // Choose which demo programme to plan.
        DemoSize size = DemoSize::FESTIVAL;
        DemoInstance inst = makeDemoInstance(size);

        // Search configuration once the model is built.
        int numThreads = 4;
        int splitDepth = 8;

        std::cout << "========================================\n";
        std::cout << "OPENCL SCHEDULE OPTIMIZER\n";
        std::cout << "Showings: " << inst.catalog.size() << "\n";
        std::cout << "Pairs evaluated: " << inst.catalog.size() * inst.catalog.size() << "\n";
        std::cout << "========================================\n";

        CompatibilityOpenCLContext gpu;

        // Measure wall-clock time for the device model build.
        auto start = std::chrono::high_resolution_clock::now();
        DecisionModel model = gpu.buildDecisionModel(inst.catalog, inst.transit);
        auto end = std::chrono::high_resolution_clock::now();
        double buildMs = std::chrono::duration<double, std::milli>(end - start).count();

        std::cout << "OpenCL model build time: " << buildMs << " ms\n";

        SolverOptions options;
        options.progress = makeProgressPrinter(inst.catalog);
        ScheduleOptimizer optimizer(inst.catalog, inst.transit, model, options);

        ThreadedBranchAndBoundSolver solver(numThreads, splitDepth);
        start = std::chrono::high_resolution_clock::now();
        ScheduleResult result = optimizer.run(solver);
        end = std::chrono::high_resolution_clock::now();
        double solveMs = std::chrono::duration<double, std::milli>(end - start).count();

        std::cout << "Search time: " << solveMs << " ms\n\n";
        printSchedule(result);
        std::cout << "========================================\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
