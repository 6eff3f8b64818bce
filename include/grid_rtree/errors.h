#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace grid_rtree {

enum class ErrorKind {
  invalid_rover_position,
  invalid_dust_position,
  invalid_move,
  invalid_coordinate_format,
  invalid_number,
  input_error,
  unexpected_eof,
};

// Short human readable description, e.g. "unexpected end of file".
const char *describe(ErrorKind kind);

// Malformed input, located by its 1-based line number.
class ParseError : public std::runtime_error {
 public:
  ParseError(ErrorKind kind, std::size_t line, const std::string &detail = {});

  ErrorKind kind() const { return kind_; }
  std::size_t line() const { return line_; }

 private:
  ErrorKind kind_;
  std::size_t line_;
};

// Well-formed input describing an impossible map.
class MapError : public std::runtime_error {
 public:
  explicit MapError(ErrorKind kind, const std::string &detail = {});

  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

} // namespace grid_rtree
