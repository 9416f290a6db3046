#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include <mmdv/core/TaskSystem.hpp>
#include <mmdv/core/logger.hpp>

int main(int argc, char **argv) {
  mmdv::core::Logger::init();

  doctest::Context context;
  context.applyCommandLine(argc, argv);

  int res = context.run();

  mmdv::core::TaskSystem::shutdown();

  mmdv::core::Logger::shutdown();

  return res;
}
