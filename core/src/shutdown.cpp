#include "shutdown.hpp"
#include <csignal>

namespace core {

    namespace {
        std::atomic<bool>* shutdown_flag = nullptr;

        void onTerminationSignal(int) {
            if (shutdown_flag) {
                shutdown_flag->store(true, std::memory_order_relaxed);
            }
        }
    } // end anonymous namespace

    void installShutdownHandler(std::atomic<bool>& flag) {
        shutdown_flag = &flag;
        std::signal(SIGINT, onTerminationSignal);
        std::signal(SIGTERM, onTerminationSignal);
    }

} // namespace core
