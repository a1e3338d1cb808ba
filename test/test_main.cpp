#include <cstdlib>

#include "gtest/gtest.h"

// The FreeRTOS linux port starts the scheduler and runs app_main in a task,
// so the suites run with real tasks, queues and event groups.
extern "C" void app_main(void) {
    int argc = 1;
    char program[] = "voicelink_test";
    char* argv[] = {program, nullptr};
    ::testing::InitGoogleTest(&argc, argv);
    std::exit(RUN_ALL_TESTS());
}
