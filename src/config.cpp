#include "grid_rtree/config.h"

#include <cstdint>
#include <fstream>
#include <iostream>

namespace grid_rtree {

namespace {

bool read_bool(const nlohmann::json &doc, const char *key, bool &out) {
  if (!doc.contains(key)) {
    return true;
  }
  const auto &v = doc.at(key);
  if (!v.is_boolean()) {
    std::cerr << "Config " << key << " must be a boolean, got " << v.dump() << std::endl;
    return false;
  }
  out = v.get<bool>();
  return true;
}

} // namespace

bool apply_config(const nlohmann::json &doc, Config &config) {
  if (!doc.is_object()) {
    std::cerr << "Config must be a JSON object" << std::endl;
    return false;
  }
  Config out = config;

  if (doc.contains("fill_factor")) {
    const auto &v = doc.at("fill_factor");
    if (!v.is_number_integer() || v.get<std::int64_t>() < 2) {
      std::cerr << "Config fill_factor must be an integer >= 2, got " << v.dump() << std::endl;
      return false;
    }
    out.fill_factor = v.get<std::size_t>();
  }
  if (!read_bool(doc, "trace_path", out.trace_path) || !read_bool(doc, "dump_tree", out.dump_tree)) {
    return false;
  }

  config = out;
  return true;
}

bool load_config(const std::string &path, Config &config) {
  std::ifstream ifs(path);
  if (!ifs) {
    std::cerr << "Failed to open config file: " << path << std::endl;
    return false;
  }
  nlohmann::json doc;
  try {
    ifs >> doc;
  } catch (const nlohmann::json::parse_error &e) {
    std::cerr << "Failed to parse config " << path << ": " << e.what() << std::endl;
    return false;
  }
  return apply_config(doc, config);
}

} // namespace grid_rtree
