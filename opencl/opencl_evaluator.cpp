///////////////////////////
///   IMPORTS SECTION   ///
///////////////////////////
#include "opencl_evaluator.hpp"
#include <cstring>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

///////////////////////////
///   ERROR  CHECKING   ///
///////////////////////////
static inline void checkError(cl_int err, const char* operation) {
    if (err != CL_SUCCESS) {
        std::stringstream ss;
        ss << "OpenCL error during " << operation << ": " << err;
        throw std::runtime_error(ss.str());
    }
}

///////////////////////////
///   OPENCL KERNELS    ///
///////////////////////////
static const char* PAIR_KERNEL_SRC = R"(
long calendar_day(long t) {
    const long MINUTES_PER_DAY = 1440;
    return t >= 0 ? t / MINUTES_PER_DAY : (t - (MINUTES_PER_DAY - 1)) / MINUTES_PER_DAY;
}

__kernel void eval_pairs(
    __global const long* starts,     // size: n, sorted ascending
    __global const long* ends,       // size: n
    __global const int* venues,      // size: n
    __global const int* titleIds,    // size: n, equal ids = equal titles
    __global const int* travel,      // size: numVenues * numVenues, diagonal = same-venue cost
    const int n,
    const int numVenues,
    __global uchar* conflictOut,     // size: n * n
    __global uchar* sameDayOut,      // size: n * n
    __global int* transitOut         // size: n * n
) {
    int cell = get_global_id(0);
    if (cell >= n * n) return;

    int i = cell / n;
    int j = cell % n;
    if (i >= j) {
        conflictOut[cell] = 0;
        sameDayOut[cell] = 0;
        transitOut[cell] = 0;
        return;
    }

    // i precedes j in start order.
    int cost = travel[venues[i] * numVenues + venues[j]];
    long earliest = ends[i] + (long)cost;

    int conflict = (titleIds[i] == titleIds[j]) || (starts[j] < earliest);

    conflictOut[cell] = conflict ? 1 : 0;
    sameDayOut[cell] = calendar_day(starts[i]) == calendar_day(starts[j]) ? 1 : 0;
    transitOut[cell] = cost;
}
)";

///////////////////////////
///  CONTEXT CTOR/DTOR  ///
///////////////////////////
CompatibilityOpenCLContext::CompatibilityOpenCLContext() {
    cl_int err = CL_SUCCESS;

    cl_uint numPlatforms = 0;
    err = clGetPlatformIDs(0, nullptr, &numPlatforms);
    checkError(err, "getting platform count");
    if (numPlatforms == 0)
        throw std::runtime_error("No OpenCL platforms found.");

    std::vector<cl_platform_id> platforms(numPlatforms);
    err = clGetPlatformIDs(numPlatforms, platforms.data(), nullptr);
    checkError(err, "getting platform IDs");
    platform = platforms[0];

    err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_GPU, 1, &device, nullptr);
    if (err != CL_SUCCESS) {
        std::cout << "No GPU found, trying CPU...\n";
        err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_CPU, 1, &device, nullptr);
        checkError(err, "getting device ID");
    }

    char name[256] = {0};
    err = clGetDeviceInfo(device, CL_DEVICE_NAME, sizeof(name), name, nullptr);
    checkError(err, "querying device name");
    std::cout << "Using OpenCL device: " << name << "\n";

    context = clCreateContext(nullptr, 1, &device, nullptr, nullptr, &err);
    checkError(err, "creating context");

    // The destructor does not run if the constructor throws.
    try {
        queue = clCreateCommandQueue(context, device, 0, &err);
        checkError(err, "creating command queue");

        program = buildProgram(PAIR_KERNEL_SRC);
    } catch (const std::exception&) {
        release();
        throw;
    }
}

CompatibilityOpenCLContext::~CompatibilityOpenCLContext() {
    release();
}

void CompatibilityOpenCLContext::release() {
    if (queue)   clReleaseCommandQueue(queue);
    if (program) clReleaseProgram(program);
    if (context) clReleaseContext(context);
    queue = nullptr;
    program = nullptr;
    context = nullptr;
}

///////////////////////////
///   BUILD PROGRAM     ///
///////////////////////////
cl_program CompatibilityOpenCLContext::buildProgram(const char* src) {
    cl_int err = CL_SUCCESS;
    size_t len = std::strlen(src);
    const char* srcs[1] = { src };
    size_t lens[1] = { len };

    cl_program prog = clCreateProgramWithSource(context, 1, srcs, lens, &err);
    checkError(err, "creating program from source");

    err = clBuildProgram(prog, 1, &device, nullptr, nullptr, nullptr);
    if (err != CL_SUCCESS) {
        size_t logSize = 0;
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &logSize);
        std::vector<char> log(logSize + 1, '\0');
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, logSize, log.data(), nullptr);
        std::cerr << "OpenCL build log:\n" << log.data() << "\n";
        clReleaseProgram(prog);
        throw std::runtime_error("Failed to build OpenCL program");
    }

    return prog;
}

///////////////////////////
///    DEVICE BUFFERS   ///
///////////////////////////
/**
 * @brief Owning handle for one cl_mem, released on scope exit.
 */
class DeviceBuffer {
public:
    DeviceBuffer(cl_context context, cl_mem_flags flags, size_t bytes, const char* what) {
        cl_int err = CL_SUCCESS;
        mem_ = clCreateBuffer(context, flags, bytes, nullptr, &err);
        checkError(err, what);
    }
    ~DeviceBuffer() {
        if (mem_) clReleaseMemObject(mem_);
    }
    DeviceBuffer(const DeviceBuffer&) = delete;
    DeviceBuffer& operator=(const DeviceBuffer&) = delete;

    cl_mem& get() { return mem_; }

private:
    cl_mem mem_ = nullptr;
};

template <typename T>
static void upload(cl_command_queue queue, DeviceBuffer& buffer, const std::vector<T>& host, const char* what) {
    cl_int err = clEnqueueWriteBuffer(queue, buffer.get(), CL_TRUE, 0, host.size() * sizeof(T),
                                      host.data(), 0, nullptr, nullptr);
    checkError(err, what);
}

template <typename T>
static void download(cl_command_queue queue, DeviceBuffer& buffer, std::vector<T>& host, const char* what) {
    cl_int err = clEnqueueReadBuffer(queue, buffer.get(), CL_TRUE, 0, host.size() * sizeof(T),
                                     host.data(), 0, nullptr, nullptr);
    checkError(err, what);
}


///////////////////////////
///    BUILD  MODEL     ///
///////////////////////////
DecisionModel CompatibilityOpenCLContext::buildDecisionModel(const EventCatalog& catalog,
                                                             const TransitCostTable& transit) {
    cl_int n = (cl_int)catalog.size();
    if (n == 0) {
        return DecisionModel(0, {}, {}, {});
    }
    cl_int numVenues = (cl_int)transit.venueCount();
    size_t cells = (size_t)n * n;

    // Flatten the catalog; titles are interned to small integers.
    std::vector<cl_long> starts(n);
    std::vector<cl_long> ends(n);
    std::vector<cl_int> venues(n);
    std::vector<cl_int> titleIds(n);
    std::map<std::string, cl_int> titles;

    for (cl_int i = 0; i < n; ++i) {
        const EventOccurrence& occ = catalog[i];
        starts[i] = (cl_long)occ.start;
        ends[i] = (cl_long)occ.end();
        venues[i] = occ.venue;
        titleIds[i] = titles.emplace(occ.title, (cl_int)titles.size()).first->second;
    }

    // Full venue matrix; minutes() already yields the same-venue constant on the diagonal.
    std::vector<cl_int> travel((size_t)numVenues * numVenues);
    for (int a = 0; a < numVenues; ++a) {
        for (int b = 0; b < numVenues; ++b) {
            travel[(size_t)a * numVenues + b] = transit.minutes(a, b);
        }
    }

    DeviceBuffer dStarts(context, CL_MEM_READ_ONLY, n * sizeof(cl_long), "creating d_starts");
    DeviceBuffer dEnds(context, CL_MEM_READ_ONLY, n * sizeof(cl_long), "creating d_ends");
    DeviceBuffer dVenues(context, CL_MEM_READ_ONLY, n * sizeof(cl_int), "creating d_venues");
    DeviceBuffer dTitles(context, CL_MEM_READ_ONLY, n * sizeof(cl_int), "creating d_titleIds");
    DeviceBuffer dTravel(context, CL_MEM_READ_ONLY, travel.size() * sizeof(cl_int), "creating d_travel");
    DeviceBuffer dConflict(context, CL_MEM_WRITE_ONLY, cells * sizeof(cl_uchar), "creating d_conflict");
    DeviceBuffer dSameDay(context, CL_MEM_WRITE_ONLY, cells * sizeof(cl_uchar), "creating d_sameDay");
    DeviceBuffer dTransit(context, CL_MEM_WRITE_ONLY, cells * sizeof(cl_int), "creating d_transit");

    // Upload data
    upload(queue, dStarts, starts, "writing d_starts");
    upload(queue, dEnds, ends, "writing d_ends");
    upload(queue, dVenues, venues, "writing d_venues");
    upload(queue, dTitles, titleIds, "writing d_titleIds");
    upload(queue, dTravel, travel, "writing d_travel");

    // Kernel + args
    cl_int err = CL_SUCCESS;
    cl_kernel kernel = clCreateKernel(program, "eval_pairs", &err);
    checkError(err, "creating kernel");

    try {
        int arg = 0;
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &dStarts.get()); checkError(err, "arg starts");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &dEnds.get()); checkError(err, "arg ends");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &dVenues.get()); checkError(err, "arg venues");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &dTitles.get()); checkError(err, "arg titleIds");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &dTravel.get()); checkError(err, "arg travel");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_int), &n); checkError(err, "arg n");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_int), &numVenues); checkError(err, "arg numVenues");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &dConflict.get()); checkError(err, "arg conflictOut");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &dSameDay.get()); checkError(err, "arg sameDayOut");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &dTransit.get()); checkError(err, "arg transitOut");

        size_t global = cells;
        err = clEnqueueNDRangeKernel(queue, kernel, 1, nullptr, &global, nullptr, 0, nullptr, nullptr);
        checkError(err, "enqueuing eval_pairs");
        err = clFinish(queue);
        checkError(err, "finishing queue");
    } catch (const std::exception&) {
        clReleaseKernel(kernel);
        throw;
    }
    clReleaseKernel(kernel);

    std::vector<cl_uchar> conflictOut(cells);
    std::vector<cl_uchar> sameDayOut(cells);
    std::vector<cl_int> transitOut(cells);
    download(queue, dConflict, conflictOut, "reading conflicts");
    download(queue, dSameDay, sameDayOut, "reading sameDay");
    download(queue, dTransit, transitOut, "reading transit");

    std::vector<char> conflicts(conflictOut.begin(), conflictOut.end());
    std::vector<char> sameDay(sameDayOut.begin(), sameDayOut.end());
    std::vector<int> transitMinutes(transitOut.begin(), transitOut.end());
    return DecisionModel((int)n, conflicts, sameDay, transitMinutes);
}
