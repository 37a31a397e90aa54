#pragma once

#include <string>
#include <string_view>
#include <vector>

struct PackageRecord {
    std::string name;
    std::vector<std::string> dependencies; // bare names, no version constraints
};

// Parses a Debian control file (a Packages index) into its records.
// Only the Package and Depends fields are read; everything else is skipped.
// Never throws on malformed input.
std::vector<PackageRecord> parse_control_file(std::string_view text);
