#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <filesystem>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_progress(const std::string& msg, double percentage, int bar_width = 50);

// Quiet mode drops info messages and progress bars; warnings and errors stay
void set_quiet_mode(bool enable);
bool get_quiet_mode();

// String helpers
std::string trim(std::string_view s);
bool is_blank(std::string_view s);

// Filesystem utilities
std::string read_file_to_string(const fs::path& path);
