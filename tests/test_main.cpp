#include <gtest/gtest.h>
#include "spdlog/spdlog.h"
#include "spdlog/sinks/null_sink.h"

int main(int argc, char ** argv) {
    // components look up the shared logger when they're constructed
    spdlog::null_logger_mt("logger");

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
