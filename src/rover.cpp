#include "grid_rtree/rover.h"

#include <iostream>
#include <sstream>

#include "grid_rtree/errors.h"
#include "grid_rtree/rtree_json.h"

namespace grid_rtree {

namespace {

std::string position(const GridPoint &p) {
  std::ostringstream os;
  os << p;
  return os.str();
}

} // namespace

GameMap::GameMap(GridPoint grid_top, GridPoint rover, const std::vector<GridPoint> &dust, std::size_t fill_factor)
    : rover_(rover), grid_top_(grid_top), dust_map_(fill_factor) {
  const Tile<std::int32_t> arena(GridPoint{0, 0}, grid_top);

  if (!is_less_or_equal(compare(rover, arena))) {
    throw MapError(ErrorKind::invalid_rover_position, position(rover));
  }
  for (const auto &p : dust) {
    if (!is_less_or_equal(compare(p, arena))) {
      throw MapError(ErrorKind::invalid_dust_position, position(p));
    }
    dust_map_.insert(p, Cell{});
  }
}

GameMap GameMap::from_input(const MapInput &input, std::size_t fill_factor) {
  return GameMap(input.grid_top, input.rover, input.dust, fill_factor);
}

GridPoint GameMap::move_rover(RoverMove move) {
  const GridPoint next = rover_ + as_vector(move);
  if (is_less_or_equal(compare(next, grid_top_)) && is_greater_or_equal(compare(next, GridPoint{0, 0}))) {
    rover_ = next;
  }
  return rover_;
}

std::size_t GameMap::move_rover_path(const std::vector<RoverMove> &moves, const trace_fn &trace) {
  std::size_t cleaned = 0;
  for (const auto move : moves) {
    const GridPoint pos = move_rover(move);
    if (trace) {
      trace(pos);
    }
    if (Cell *cell = dust_map_.find_mut(pos); cell != nullptr && cell->clean()) {
      ++cleaned;
    }
  }
  return cleaned;
}

RunResult run_simulation(std::istream &in, const Config &config) {
  Parser parser(in);
  const MapInput input = parser.parse();
  GameMap map = GameMap::from_input(input, config.fill_factor);

  if (config.dump_tree) {
    std::cerr << tree_to_json(map.dust_map(), [](const Cell &c) { return c.dust; }).dump(2) << std::endl;
  }
  GameMap::trace_fn trace;
  if (config.trace_path) {
    trace = [](const GridPoint &p) { std::cerr << p << std::endl; };
  }

  RunResult out;
  out.cleaned = map.move_rover_path(input.moves, trace);
  out.rover = map.rover_position();
  return out;
}

} // namespace grid_rtree
