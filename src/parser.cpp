#include "grid_rtree/parser.h"

#include <cctype>
#include <charconv>
#include <string>
#include <system_error>
#include <utility>

namespace grid_rtree {

namespace {

std::vector<std::string> split_words(const std::string &line) {
  // Every whitespace character separates two words, so "1  2" has three.
  std::vector<std::string> words(1);
  for (char c : line) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      words.emplace_back();
    } else {
      words.back().push_back(c);
    }
  }
  return words;
}

std::int32_t parse_u16(const std::string &word, std::size_t line) {
  std::uint16_t value = 0;
  const char *first = word.data();
  const char *last = word.data() + word.size();
  // One explicit plus sign is allowed.
  if (first != last && *first == '+') {
    ++first;
  }
  const auto res = std::from_chars(first, last, value);
  if (res.ec == std::errc::result_out_of_range) {
    throw ParseError(ErrorKind::invalid_number, line, "'" + word + "' does not fit in 16 bits");
  }
  if (first == last || res.ec != std::errc() || res.ptr != last) {
    throw ParseError(ErrorKind::invalid_number, line, "'" + word + "' is not an unsigned integer");
  }
  return static_cast<std::int32_t>(value);
}

} // namespace

std::optional<RoverMove> parse_move(char c) {
  switch (c) {
    case 'N':
      return RoverMove::north;
    case 'E':
      return RoverMove::east;
    case 'S':
      return RoverMove::south;
    case 'W':
      return RoverMove::west;
    default:
      return std::nullopt;
  }
}

GridPoint as_vector(RoverMove move) {
  switch (move) {
    case RoverMove::north:
      return GridPoint{0, 1};
    case RoverMove::south:
      return GridPoint{0, -1};
    case RoverMove::east:
      return GridPoint{1, 0};
    case RoverMove::west:
      return GridPoint{-1, 0};
  }
  return GridPoint{0, 0};
}

MapInput Parser::parse() {
  MapInput out;
  out.grid_top = parse_coordinate();
  out.rover = parse_coordinate();
  out.dust = parse_dust();
  out.moves = parse_rover_path();
  return out;
}

GridPoint Parser::parse_coordinate() {
  const std::string line = next_line();
  const auto words = split_words(line);
  if (words.size() != 2) {
    throw ParseError(ErrorKind::invalid_coordinate_format, line_, "expected two numbers, got '" + line + "'");
  }
  // The first column is y.
  const auto x = parse_u16(words[1], line_);
  const auto y = parse_u16(words[0], line_);
  return GridPoint{x, y};
}

std::vector<GridPoint> Parser::parse_dust() {
  std::vector<GridPoint> dust;
  while (true) {
    const std::string *line = peek_line();
    if (line == nullptr) {
      throw ParseError(ErrorKind::unexpected_eof, line_ + 1, "missing rover moves");
    }
    if (line->empty()) {
      throw ParseError(ErrorKind::invalid_coordinate_format, line_ + 1, "empty line");
    }
    if (!std::isdigit(static_cast<unsigned char>(line->front()))) {
      // Start of the rover path.
      return dust;
    }
    dust.push_back(parse_coordinate());
  }
}

std::vector<RoverMove> Parser::parse_rover_path() {
  const std::string line = next_line();
  std::vector<RoverMove> moves;
  moves.reserve(line.size());
  for (std::size_t i = 0; i < line.size(); ++i) {
    const auto move = parse_move(line[i]);
    if (!move) {
      throw ParseError(ErrorKind::invalid_move, line_,
                       "'" + std::string(1, line[i]) + "' at column " + std::to_string(i + 1));
    }
    moves.push_back(*move);
  }
  return moves;
}

std::string Parser::next_line() {
  auto line = read_line();
  if (!line) {
    throw ParseError(ErrorKind::unexpected_eof, line_ + 1);
  }
  ++line_;
  return std::move(*line);
}

const std::string *Parser::peek_line() {
  if (!peeked_) {
    peeked_ = read_line();
  }
  return peeked_ ? &*peeked_ : nullptr;
}

std::optional<std::string> Parser::read_line() {
  if (peeked_) {
    auto line = std::move(peeked_);
    peeked_.reset();
    return line;
  }
  std::string line;
  if (!std::getline(in_, line)) {
    if (in_.bad()) {
      throw ParseError(ErrorKind::input_error, line_ + 1);
    }
    return std::nullopt;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

} // namespace grid_rtree
