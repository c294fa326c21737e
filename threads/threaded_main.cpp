///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_solver.hpp"
#include "../sequential/sequential_solver.hpp"
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
 * @brief Demo entry point for the threaded schedule optimizer.
 *
 * Solves the synthetic benchmark programme with the threaded backend under
 * a deadline, then with the sequential backend under the same deadline, and
 * prints timings, whether both selections agree, and the threaded schedule.
 */
int main(int argc, char** argv) {
    // Suppress unused parameter warnings for now (no CLI parsing yet).
    (void)argc;
    (void)argv;

    try {
        // Choose which demo programme to plan.
        DemoSize size = DemoSize::L;
        DemoInstance inst = makeDemoInstance(size);

        // Configure the threaded solver:
        //  - numThreads = 8  -> spread branches over eight worker threads,
        //  - splitDepth = 12 -> never split below the 12th decision,
        //  - deadline   = 60s per solve, after which the result is flagged.
        int numThreads = 8;
        int splitDepth = 12;
        SolverOptions options;
        options.deadline = std::chrono::milliseconds(60000);

        std::cout << "========================================\n";
        std::cout << "THREADED SCHEDULE OPTIMIZER\n";
        std::cout << "Showings: " << inst.catalog.size() << "\n";
        std::cout << "Threads: " << numThreads << "\n";

        ScheduleOptimizer optimizer(inst.catalog, inst.transit, options);

        ThreadedBranchAndBoundSolver thrSolver(numThreads, splitDepth);
        auto startThr = std::chrono::high_resolution_clock::now();
        ScheduleResult thrResult = optimizer.run(thrSolver);
        auto endThr = std::chrono::high_resolution_clock::now();
        double msThr = std::chrono::duration<double, std::milli>(endThr - startThr).count();

        SequentialBranchAndBoundSolver seqSolver;
        auto startSeq = std::chrono::high_resolution_clock::now();
        ScheduleResult seqResult = optimizer.run(seqSolver);
        auto endSeq = std::chrono::high_resolution_clock::now();
        double msSeq = std::chrono::duration<double, std::milli>(endSeq - startSeq).count();

        bool agree = thrResult.attendance == seqResult.attendance &&
                     thrResult.totalTransit == seqResult.totalTransit;

        std::cout << "Threaded time: " << msThr << " ms (" << thrResult.nodesExplored << " nodes)\n";
        std::cout << "Sequential time: " << msSeq << " ms (" << seqResult.nodesExplored << " nodes)\n";
        if (msThr > 0) {
            std::cout << "Speedup: " << msSeq / msThr << "x\n";
        }
        std::cout << "Objectives agree: " << (agree ? "yes" : "no") << "\n\n";

        printSchedule(thrResult);
        std::cout << "========================================\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
