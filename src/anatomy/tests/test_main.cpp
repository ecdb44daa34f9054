#include <sinew/core/log.hpp>

#include <gtest/gtest.h>

// Main test runner
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Precondition tests log errors on purpose; keep the test output readable
    sinew::core::Logger::instance().set_console_enabled(false);

    return RUN_ALL_TESTS();
}
