#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <vector>

#include "grid_rtree/config.h"
#include "grid_rtree/geometry.h"
#include "grid_rtree/parser.h"
#include "grid_rtree/rtree.h"

namespace grid_rtree {

// A dust cell of the map.
struct Cell {
  bool dust = true;

  // Returns whether there was dust to clean.
  bool clean() {
    const bool had_dust = dust;
    dust = false;
    return had_dust;
  }
};

class GameMap {
 public:
  using index_type = RTree<std::int32_t, Cell>;
  using trace_fn = std::function<void(const GridPoint &)>;

  // The arena spans (0, 0) to grid_top. Throws MapError when the rover or a
  // dust cell lies outside of it.
  GameMap(GridPoint grid_top, GridPoint rover, const std::vector<GridPoint> &dust,
          std::size_t fill_factor = index_type::default_fill_factor);

  static GameMap from_input(const MapInput &input, std::size_t fill_factor = index_type::default_fill_factor);

  GridPoint rover_position() const { return rover_; }
  GridPoint grid_top() const { return grid_top_; }

  // Steps the rover unless the move would leave the arena.
  GridPoint move_rover(RoverMove move);

  // Applies every move and cleans the dust on each cell reached. Returns the
  // number of cells cleaned. `trace` sees the position after every move.
  std::size_t move_rover_path(const std::vector<RoverMove> &moves, const trace_fn &trace = {});

  const index_type &dust_map() const { return dust_map_; }

 private:
  GridPoint rover_;
  GridPoint grid_top_;
  index_type dust_map_;
};

struct RunResult {
  GridPoint rover;
  std::size_t cleaned = 0;
};

// Parses a map from `in` and drives the rover along its path. Trace and tree
// dump output requested by `config` go to stderr. Throws ParseError or
// MapError.
RunResult run_simulation(std::istream &in, const Config &config);

} // namespace grid_rtree
