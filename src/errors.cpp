#include "grid_rtree/errors.h"

namespace grid_rtree {

namespace {

std::string message(ErrorKind kind, const std::string &detail) {
  std::string out = describe(kind);
  if (!detail.empty()) {
    out += " ( " + detail + " )";
  }
  return out;
}

} // namespace

const char *describe(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::invalid_rover_position:
      return "initial rover position is outside the arena";
    case ErrorKind::invalid_dust_position:
      return "dust is outside the arena";
    case ErrorKind::invalid_move:
      return "invalid rover move instruction";
    case ErrorKind::invalid_coordinate_format:
      return "invalid coordinate line format";
    case ErrorKind::invalid_number:
      return "invalid coordinate";
    case ErrorKind::input_error:
      return "read error";
    case ErrorKind::unexpected_eof:
      return "unexpected end of file";
  }
  return "unknown error";
}

ParseError::ParseError(ErrorKind kind, std::size_t line, const std::string &detail)
    : std::runtime_error(message(kind, detail)), kind_(kind), line_(line) {}

MapError::MapError(ErrorKind kind, const std::string &detail)
    : std::runtime_error(message(kind, detail)), kind_(kind) {}

} // namespace grid_rtree
