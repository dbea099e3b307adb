/**
 * Pitwall - Test Runner
 *
 * Runs all unit tests for the telemetry decoder and bridge
 */

#include "test_framework.hpp"
#include "utils/logger.hpp"

// Include test files
#include "test_buffer.cpp"
#include "test_header.cpp"
#include "test_decoders.cpp"
#include "test_dispatcher.cpp"
#include "test_tree.cpp"
#include "test_pipeline.cpp"
#include "test_config.cpp"
#include "test_appendix.cpp"

int main(int argc, char** argv) {
    std::string filter = argc > 1 ? argv[1] : "";

    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║       Pitwall - Unit Test Suite                              ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n\n";

    // Decoders and the processor log; keep the test output readable
    pitwall::utils::Logger::init("", "off");

    int result = pitwall::test::TestRunner::getInstance().run(filter);

    pitwall::utils::Logger::shutdown();
    return result;
}
