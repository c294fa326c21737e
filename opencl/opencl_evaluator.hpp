#pragma once
#define CL_TARGET_OPENCL_VERSION 120

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <CL/cl.h>
#include <vector>
#include "model.hpp"
#include "constraints.hpp"


///////////////////////////
///      EVALUATOR      ///
///////////////////////////
/**
 * @brief OpenCL helper context for the all-pairs compatibility check.
 *
 * Owns the OpenCL platform/device/context/queue and a compiled program
 * that evaluates the pairwise oracle for every pair of catalog occurrences
 * in parallel, one work item per (i, j) cell.
 */
class CompatibilityOpenCLContext {
public:
    /**
     * @brief Initialize OpenCL platform, device, context and command queue.
     *
     * Also builds the program containing the pair evaluation kernel.
     * Throws std::runtime_error if OpenCL setup fails.
     */
    CompatibilityOpenCLContext();

    /**
     * @brief Release all OpenCL resources owned by this context.
     */
    ~CompatibilityOpenCLContext();

    CompatibilityOpenCLContext(const CompatibilityOpenCLContext&) = delete;
    CompatibilityOpenCLContext& operator=(const CompatibilityOpenCLContext&) = delete;

    /**
     * @brief Build the decision model for a catalog on the device.
     *
     * For every pair i < j (catalog order) the kernel computes:
     *  - conflict: titles equal, or j starts before end(i) + transit,
     *  - sameDay:  both start on the same calendar day,
     *  - transit:  same-venue constant or table cost between the venues.
     *
     * The result equals DecisionModel::build() with a CompatibilityOracle
     * over the same table.
     */
    DecisionModel buildDecisionModel(const EventCatalog& catalog, const TransitCostTable& transit);

private:
    cl_platform_id platform = nullptr;
    cl_device_id device = nullptr;
    cl_context context = nullptr;
    cl_program program = nullptr;
    cl_command_queue queue = nullptr;

    cl_program buildProgram(const char* src);

    /// Release whatever has been created so far; safe to call twice.
    void release();
};
