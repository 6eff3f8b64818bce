#include "grid_rtree/cli.h"

#include <cstdlib>
#include <stdexcept>

#include "grid_rtree/config.h"
#include "grid_rtree/errors.h"
#include "grid_rtree/rover.h"

namespace grid_rtree {

namespace {

void print_usage(std::ostream &err, const std::string &prog) {
  err << "usage: " << prog << " [--config FILE] [--fill-factor N] [--trace] [--dump-tree] < map.txt\n"
      << "Reads a map from stdin, runs the rover and prints its final position and the cleaned count.\n";
}

bool parse_fill_factor(const std::string &text, std::size_t &out) {
  if (text.empty() || text.front() == '-' || text.front() == '+') {
    return false;
  }
  try {
    std::size_t used = 0;
    const unsigned long long value = std::stoull(text, &used);
    if (used != text.size() || value < 2) {
      return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
  } catch (const std::invalid_argument &) {
    return false;
  } catch (const std::out_of_range &) {
    return false;
  }
}

} // namespace

int run_cli(const std::vector<std::string> &args, std::istream &in, std::ostream &out, std::ostream &err) {
  const std::string prog = args.empty() ? "grid_rover" : args.front();
  Config config;
  bool have_fill_factor = false;
  std::size_t fill_factor = 0;
  bool trace = false;
  bool dump = false;
  std::string config_path;

  for (std::size_t i = 1; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(err, prog);
      return EXIT_SUCCESS;
    } else if (arg == "--config" && i + 1 < args.size()) {
      config_path = args[++i];
    } else if (arg == "--fill-factor" && i + 1 < args.size()) {
      if (!parse_fill_factor(args[++i], fill_factor)) {
        err << "Invalid fill factor: " << args[i] << " (expected an integer >= 2)" << std::endl;
        return 2;
      }
      have_fill_factor = true;
    } else if (arg == "--trace") {
      trace = true;
    } else if (arg == "--dump-tree") {
      dump = true;
    } else {
      err << "Unknown argument: " << arg << std::endl;
      print_usage(err, prog);
      return 2;
    }
  }

  // Command-line flags win over the file.
  if (!config_path.empty() && !load_config(config_path, config)) {
    return 2;
  }
  if (have_fill_factor) config.fill_factor = fill_factor;
  if (trace) config.trace_path = true;
  if (dump) config.dump_tree = true;

  try {
    const auto result = run_simulation(in, config);
    out << result.rover << "\n" << result.cleaned << std::endl;
  } catch (const ParseError &e) {
    err << "Parsing error at line " << e.line() << ": " << e.what() << std::endl;
    return EXIT_FAILURE;
  } catch (const MapError &e) {
    err << "Format error: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

} // namespace grid_rtree
