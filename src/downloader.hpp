#pragma once

#include <string>

// Fetches `url` into memory. Transient failures are retried up to
// `max_attempts` times in total; the last failure is thrown as PkgtreeException.
std::string fetch_url(const std::string& url, int max_attempts = 3);
