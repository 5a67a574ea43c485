#ifndef LINKBENCH_TYPES
#define LINKBENCH_TYPES

#include <chrono>
#include <cstdint>
#include <vector>

namespace linkbench {

    // Wall clock used for every timestamp handed to the reporter
    using wall_clock = std::chrono::system_clock;

    // Monotonic clock used for pacing and duration limits
    using mono_clock = std::chrono::steady_clock;

    using byte_buffer = std::vector<uint8_t>;

}

#endif
