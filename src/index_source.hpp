#pragma once

#include "config.hpp"

#include <filesystem>
#include <string>

// True when `repo` names a file on this machine rather than a mirror URL.
bool is_local_source(const std::string& repo, bool test_mode);

// Local index file for `repo`: strips file:// and appends Packages to a directory.
std::filesystem::path resolve_local_index_path(const std::string& repo);

// Mirror URL of the Packages index. URLs already ending in a Packages file
// (plain or compressed) are kept; anything else gets "/Packages" appended.
std::string resolve_index_url(const std::string& repo);

// Reads or downloads the index named by `cfg`, checks it against cfg.sha256
// when set and returns the decompressed control text.
std::string load_index_text(const RunConfig& cfg);
