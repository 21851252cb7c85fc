#pragma once

#include <atomic>

namespace core {

    // Routes SIGINT and SIGTERM to `flag` (set to true). The handler only stores
    // the flag; the loop observes it at cycle and sleep-slice boundaries.
    // The flag must outlive the process' signal handling (typically a static in main).
    void installShutdownHandler(std::atomic<bool>& flag);

} // namespace core
