#include <gtest/gtest.h>
#include <spdlog/sinks/stdout_sinks.h>

#include "cantypes/Util.hh"

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  // Keep per-frame traffic out of the test output.
  auto logger = spdlog::stdout_logger_mt("console");
  logger->set_level(spdlog::level::warn);
  return RUN_ALL_TESTS();
}
