#define CATCH_CONFIG_RUNNER

#include <cstring>

#include <catch2/catch.hpp>
#include <uuidkit/core/logger.hpp>

int main(int argc, char **argv) {
  spdlog::level::level_enum level = spdlog::level::warn;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      level = spdlog::level::off;
      break;
    }
  }

  // Rejected inputs log at debug; keep test output to warnings and up.
  uuidkit::initLogging("uuidkit_tests", level);

  return Catch::Session().run(argc, argv);
}
