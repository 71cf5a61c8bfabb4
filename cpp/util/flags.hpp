#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Logging
  static std::string log_file;
  static bool verbose;

  // Where artifacts are written before they are handed off.
  static std::string temp_directory;

  // Time budgets, in milliseconds.
  static int32_t default_budget_millis;
  static int32_t privileged_budget_millis;

  // Execution unit limits
  static int32_t memory_limit_kb;
  static int32_t max_open_files;

  // Result limits
  static int32_t max_text_chars;
  static uint32_t max_artifact_bytes;
};

#endif
