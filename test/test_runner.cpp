// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point for every ddsledger unit and integration test.
// Library logging is raised to ERROR so test output stays readable.

#include <gtest/gtest.h>

#include "util/logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ddsledger::util::logger::setLogLevel(ddsledger::util::logger::LogLevel::ERROR);
    return RUN_ALL_TESTS();
}
