#pragma once

#include <algorithm>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <type_traits>

#include "grid_rtree/coordinate.h"

namespace grid_rtree {

// Result of a containment-order comparison. `unordered` means no relation
// holds between the two operands.
enum class Ordering { less, equal, greater, unordered };

// Swaps less and greater, keeps equal and unordered.
constexpr Ordering reverse(Ordering o) {
  switch (o) {
    case Ordering::less:
      return Ordering::greater;
    case Ordering::greater:
      return Ordering::less;
    default:
      return o;
  }
}

constexpr bool is_less_or_equal(Ordering o) { return o == Ordering::less || o == Ordering::equal; }

constexpr bool is_greater_or_equal(Ordering o) { return o == Ordering::greater || o == Ordering::equal; }

const char *to_string(Ordering o);

inline std::ostream &operator<<(std::ostream &os, Ordering o) { return os << to_string(o); }

template <typename Coord>
constexpr Ordering compare_scalar(Coord a, Coord b) {
  if (a < b) return Ordering::less;
  if (b < a) return Ordering::greater;
  return Ordering::equal;
}

template <typename Coord>
struct Point {
  static_assert(is_coordinate_v<Coord>, "Point requires an integral coordinate type");

  Coord x{};
  Coord y{};

  // Total order on the x axis only.
  constexpr Ordering vertical_cmp(const Point &rhs) const { return compare_scalar(x, rhs.x); }
  // Total order on the y axis only.
  constexpr Ordering horizontal_cmp(const Point &rhs) const { return compare_scalar(y, rhs.y); }
};

template <typename Coord>
constexpr bool operator==(const Point<Coord> &a, const Point<Coord> &b) {
  return a.x == b.x && a.y == b.y;
}

template <typename Coord>
constexpr bool operator!=(const Point<Coord> &a, const Point<Coord> &b) {
  return !(a == b);
}

template <typename Coord>
constexpr Point<Coord> operator+(const Point<Coord> &a, const Point<Coord> &b) {
  return Point<Coord>{static_cast<Coord>(a.x + b.x), static_cast<Coord>(a.y + b.y)};
}

template <typename Coord>
constexpr Point<Coord> operator-(const Point<Coord> &a, const Point<Coord> &b) {
  return Point<Coord>{static_cast<Coord>(a.x - b.x), static_cast<Coord>(a.y - b.y)};
}

template <typename Coord>
std::ostream &operator<<(std::ostream &os, const Point<Coord> &p) {
  return os << +p.x << ' ' << +p.y;
}

// Dominance order: a tie on one axis defers to the other axis, otherwise both
// axes must move in the same direction.
template <typename Coord>
constexpr Ordering compare(const Point<Coord> &a, const Point<Coord> &b) {
  if (a.x == b.x) return compare_scalar(a.y, b.y);
  if (a.y == b.y) return compare_scalar(a.x, b.x);
  if (a.x < b.x && a.y < b.y) return Ordering::less;
  if (a.x > b.x && a.y > b.y) return Ordering::greater;
  return Ordering::unordered;
}

// Axis-aligned closed box. bottom <= top on both axes.
template <typename Coord>
class Tile {
 public:
  static_assert(is_coordinate_v<Coord>, "Tile requires an integral coordinate type");

  Tile(Point<Coord> bottom, Point<Coord> top) : bottom_(bottom), top_(top) {
    if (!is_less_or_equal(compare(bottom_, top_))) {
      throw std::invalid_argument("tile bottom-left corner is not below its top-right corner");
    }
  }

  static constexpr Tile from_point(Point<Coord> p) { return Tile(p, p, unchecked{}); }

  constexpr Point<Coord> bottom_left_corner() const { return bottom_; }
  constexpr Point<Coord> top_right_corner() const { return top_; }

  constexpr bool is_point() const { return bottom_ == top_; }

  // Smallest tile covering both.
  constexpr Tile merge(const Tile &rhs) const {
    return Tile(Point<Coord>{std::min(bottom_.x, rhs.bottom_.x), std::min(bottom_.y, rhs.bottom_.y)},
                Point<Coord>{std::max(top_.x, rhs.top_.x), std::max(top_.y, rhs.top_.y)}, unchecked{});
  }

  // Compares the x intervals: equal when they overlap.
  constexpr Ordering vertical_cmp(const Tile &rhs) const {
    if (top_.x < rhs.bottom_.x) return Ordering::less;
    if (bottom_.x > rhs.top_.x) return Ordering::greater;
    return Ordering::equal;
  }

  // Compares the y intervals: equal when they overlap.
  constexpr Ordering horizontal_cmp(const Tile &rhs) const {
    if (top_.y < rhs.bottom_.y) return Ordering::less;
    if (bottom_.y > rhs.top_.y) return Ordering::greater;
    return Ordering::equal;
  }

 private:
  struct unchecked {};
  constexpr Tile(Point<Coord> bottom, Point<Coord> top, unchecked) : bottom_(bottom), top_(top) {}

  Point<Coord> bottom_;
  Point<Coord> top_;
};

template <typename Coord>
constexpr bool operator==(const Tile<Coord> &a, const Tile<Coord> &b) {
  return a.bottom_left_corner() == b.bottom_left_corner() && a.top_right_corner() == b.top_right_corner();
}

template <typename Coord>
constexpr bool operator!=(const Tile<Coord> &a, const Tile<Coord> &b) {
  return !(a == b);
}

template <typename Coord>
std::ostream &operator<<(std::ostream &os, const Tile<Coord> &t) {
  return os << '[' << t.bottom_left_corner() << " - " << t.top_right_corner() << ']';
}

// A tile is greater than the points it contains, equal to the single point it
// is reduced to, and less than every point outside.
template <typename Coord>
constexpr Ordering compare(const Tile<Coord> &tile, const Point<Coord> &p) {
  if (tile.is_point() && tile.bottom_left_corner() == p) return Ordering::equal;
  if (is_greater_or_equal(compare(p, tile.bottom_left_corner())) &&
      is_less_or_equal(compare(p, tile.top_right_corner()))) {
    return Ordering::greater;
  }
  return Ordering::less;
}

template <typename Coord>
constexpr Ordering compare(const Point<Coord> &p, const Tile<Coord> &tile) {
  return reverse(compare(tile, p));
}

// Nesting order. Tiles that overlap without one containing the other, or that
// are disjoint, are unordered.
template <typename Coord>
constexpr Ordering compare(const Tile<Coord> &a, const Tile<Coord> &b) {
  const Point<Coord> ab = a.bottom_left_corner(), at = a.top_right_corner();
  const Point<Coord> bb = b.bottom_left_corner(), bt = b.top_right_corner();
  if (ab == bb && at == bt) return Ordering::equal;
  if (is_greater_or_equal(compare(ab, bb)) && is_less_or_equal(compare(at, bt))) return Ordering::less;
  if (is_less_or_equal(compare(ab, bb)) && is_greater_or_equal(compare(at, bt))) return Ordering::greater;
  return Ordering::unordered;
}

template <typename Coord>
struct Line {
  static_assert(is_coordinate_v<Coord>, "Line requires an integral coordinate type");

  enum class Axis { vertical, horizontal };

  Axis axis;
  Coord at;

  static constexpr Line vertical(Coord x) { return Line{Axis::vertical, x}; }
  static constexpr Line horizontal(Coord y) { return Line{Axis::horizontal, y}; }

  static constexpr Line vertical_at(const Point<Coord> &p) { return vertical(p.x); }
  static constexpr Line horizontal_at(const Point<Coord> &p) { return horizontal(p.y); }

  constexpr bool is_vertical() const { return axis == Axis::vertical; }
  constexpr bool is_horizontal() const { return axis == Axis::horizontal; }

  // Coordinate of `p` on the axis this line cuts.
  constexpr Coord project(const Point<Coord> &p) const { return is_vertical() ? p.x : p.y; }
};

template <typename Coord>
constexpr bool operator==(const Line<Coord> &a, const Line<Coord> &b) {
  return a.axis == b.axis && a.at == b.at;
}

template <typename Coord>
std::ostream &operator<<(std::ostream &os, const Line<Coord> &l) {
  return os << (l.is_vertical() ? "x=" : "y=") << +l.at;
}

// less: the line is strictly before the tile; greater: strictly after;
// equal: the line crosses the tile's closed extent.
template <typename Coord>
constexpr Ordering compare(const Line<Coord> &line, const Tile<Coord> &tile) {
  const Ordering low = compare_scalar(line.at, line.project(tile.bottom_left_corner()));
  const Ordering high = compare_scalar(line.at, line.project(tile.top_right_corner()));
  if (low == Ordering::less && high == Ordering::less) return Ordering::less;
  if (low == Ordering::greater && high == Ordering::greater) return Ordering::greater;
  return Ordering::equal;
}

template <typename Coord>
constexpr Ordering compare(const Line<Coord> &line, const Point<Coord> &p) {
  return compare_scalar(line.at, line.project(p));
}

// Merge of every tile in [first, last), nothing for an empty range.
template <typename Iterator, typename Projection>
auto bounding_tile(Iterator first, Iterator last, Projection proj)
    -> std::optional<std::decay_t<decltype(proj(*first))>> {
  std::optional<std::decay_t<decltype(proj(*first))>> out;
  for (; first != last; ++first) {
    const auto tile = proj(*first);
    out = out ? out->merge(tile) : tile;
  }
  return out;
}

template <typename Iterator>
auto bounding_tile(Iterator first, Iterator last) {
  return bounding_tile(first, last, [](const auto &t) { return t; });
}

} // namespace grid_rtree
