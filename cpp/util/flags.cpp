#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;

std::string Flags::temp_directory = "/tmp";

int32_t Flags::default_budget_millis = 2000;
int32_t Flags::privileged_budget_millis = 5000;

int32_t Flags::memory_limit_kb = 256 * 1024;
int32_t Flags::max_open_files = 16;

int32_t Flags::max_text_chars = 2048;
uint32_t Flags::max_artifact_bytes = 4 * 1024 * 1024;
