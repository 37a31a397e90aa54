#pragma once

#include "config.hpp"

#include <ostream>

// Prints the run header, loads the index named by `cfg` and writes the
// dependency tree of `cfg.package_name` to `out`. Log lines emitted while
// loading land between the header and the tree banner.
// Throws PkgtreeException when the index cannot be loaded.
void run_pkgtree(const RunConfig& cfg, std::ostream& out);
