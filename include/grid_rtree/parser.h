#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "grid_rtree/errors.h"
#include "grid_rtree/geometry.h"

namespace grid_rtree {

using GridPoint = Point<std::int32_t>;

enum class RoverMove { north, east, south, west };

// 'N', 'E', 'S' or 'W'.
std::optional<RoverMove> parse_move(char c);

// Unit step of a move: north is +y, east is +x.
GridPoint as_vector(RoverMove move);

struct MapInput {
  GridPoint grid_top;
  GridPoint rover;
  std::vector<GridPoint> dust;
  std::vector<RoverMove> moves;
};

// Reads the line oriented map format:
//
//   <y> <x>        grid top-right corner
//   <y> <x>        initial rover position
//   <y> <x>        zero or more dust cells, each line starting with a digit
//   NNESEW...      rover moves
//
// Coordinates are unsigned 16-bit integers separated by one whitespace
// character. Errors are thrown as ParseError carrying the offending line.
class Parser {
 public:
  explicit Parser(std::istream &in) : in_(in) {}

  MapInput parse();

  // Number of lines consumed so far.
  std::size_t line_number() const { return line_; }

 private:
  GridPoint parse_coordinate();
  std::vector<GridPoint> parse_dust();
  std::vector<RoverMove> parse_rover_path();

  std::string next_line();
  const std::string *peek_line();
  std::optional<std::string> read_line();

  std::istream &in_;
  std::optional<std::string> peeked_;
  std::size_t line_ = 0;
};

} // namespace grid_rtree
