#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace grid_rtree {

// Entry point of grid_rover. `args` holds the program name followed by its
// arguments. The map is read from `in`, the final rover position and cleaned
// count are written to `out` and failures to `err`.
//
// Returns 0 on success, 1 on a parse or map error and 2 on a bad command line
// or configuration file.
int run_cli(const std::vector<std::string> &args, std::istream &in, std::ostream &out, std::ostream &err);

} // namespace grid_rtree
