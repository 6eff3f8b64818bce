#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace grid_rtree {

struct Config {
  std::size_t fill_factor = 4;
  // Print every rover position to stderr.
  bool trace_path = false;
  // Print the dust index structure to stderr before moving.
  bool dump_tree = false;
};

// Overrides the fields of `config` present in `doc`, a JSON object such as
// {"fill_factor": 8, "trace_path": true}. Unknown keys are ignored. Returns
// false and leaves `config` untouched on a wrong type or value.
bool apply_config(const nlohmann::json &doc, Config &config);

// Reads a JSON configuration file into `config`.
bool load_config(const std::string &path, Config &config);

} // namespace grid_rtree
