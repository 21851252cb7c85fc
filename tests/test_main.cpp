#include <gtest/gtest.h>
#include "logging.hpp"

namespace {

    // Console-only logging for the whole suite
    class LoggingEnvironment : public ::testing::Environment {
    public:
        void SetUp() override {
            core::logging::LoggingOptions options;
            options.file_enabled = false;
            options.console_level = spdlog::level::warn;
            core::logging::initialize(options);
        }
    };

} // end anonymous namespace

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::AddGlobalTestEnvironment(new LoggingEnvironment);
    return RUN_ALL_TESTS();
}
