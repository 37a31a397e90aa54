#pragma once

#include <string>
#include <string_view>
#include <filesystem>

// True for index files stored with a compression filter (.gz, .xz, .bz2, .zst).
bool is_compressed_index(const std::filesystem::path& path);

// Decompresses a single compressed stream held in memory (e.g. the bytes of
// Packages.gz). `name` only labels error messages.
std::string decompress_index(std::string_view data, const std::string& name);
