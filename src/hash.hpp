#pragma once

#include <string>
#include <string_view>

// SHA256 of `data` as lowercase hex.
std::string calculate_sha256(std::string_view data);

// Throws PkgtreeException unless `data` hashes to `expected` (any case).
// `name` labels the index in messages.
void verify_sha256(std::string_view data, const std::string& expected, const std::string& name);
