#pragma once

/**
 * @file common.hpp
 * @brief Debug-only invariant checks for MMDV
 */

#include <string>
#include <cpptrace/cpptrace.hpp>

#include "logger.hpp"

#ifdef DEBUG
#define MMDV_ASSERT(condition, message)                                        \
  do {                                                                         \
    if (!(condition)) {                                                        \
        std::string trace = cpptrace::generate_trace().to_string();            \
        mmdv::core::Logger::critical("ASSERTION FAILED: {}\nStack Trace:\n{}", \
            message, trace);                                                   \
      throw cpptrace::runtime_error(                                           \
          "ASSERTION FAILED: " + std::string(message) +                        \
          "\nFile: " __FILE__ "\nLine: " + std::to_string(__LINE__));          \
    }                                                                          \
  } while (0)
#else
#define MMDV_ASSERT(condition, message) (void)(0)
#endif
