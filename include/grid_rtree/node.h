#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

#include "grid_rtree/geometry.h"

namespace grid_rtree {

template <typename Coord, typename Value>
class Node;

// Containment order between a node and a query. The node is reduced to its
// extent (leaf point as a degenerate tile, or the coverage) and the result is
// read from the node's side: greater means the query is inside the node.
template <typename Coord, typename Value>
Ordering compare(const Node<Coord, Value> &node, const Point<Coord> &p) {
  return reverse(compare(p, node.coverage()));
}

template <typename Coord, typename Value>
Ordering compare(const Node<Coord, Value> &node, const Tile<Coord> &tile) {
  return reverse(compare(tile, node.coverage()));
}

template <typename Coord, typename Value>
Ordering compare(const Node<Coord, Value> &node, const Line<Coord> &line) {
  return reverse(compare(line, node.coverage()));
}

// A tree cell: a leaf binding one point to one value, or an interior node
// caching the bounding tile of the children it owns.
template <typename Coord, typename Value>
class Node {
 public:
  using point_type = Point<Coord>;
  using tile_type = Tile<Coord>;
  using line_type = Line<Coord>;

  struct Leaf {
    point_type point;
    Value value;
  };

  struct Interior {
    tile_type coverage;
    std::vector<Node> children;
  };

  struct InsertResult {
    std::optional<Value> old_value;
    // Sibling produced by a split; the caller adopts it.
    std::optional<Node> overflow;
  };

  static Node leaf(point_type p, Value value) { return Node(Leaf{p, std::move(value)}); }

  static Node interior(std::vector<Node> children) {
    auto coverage = bounding_tile(children.begin(), children.end(), [](const Node &n) { return n.coverage(); });
    if (!coverage) {
      throw std::invalid_argument("interior node needs at least one child");
    }
    return Node(Interior{*coverage, std::move(children)});
  }

  bool is_leaf() const { return std::holds_alternative<Leaf>(data_); }

  tile_type coverage() const {
    return std::visit(
        [](const auto &n) -> tile_type {
          using T = std::decay_t<decltype(n)>;
          if constexpr (std::is_same_v<T, Leaf>) {
            return tile_type::from_point(n.point);
          } else {
            return n.coverage;
          }
        },
        data_);
  }

  // Leaf accessors; std::bad_variant_access on an interior node.
  const point_type &point() const { return std::get<Leaf>(data_).point; }
  const Value &value() const { return std::get<Leaf>(data_).value; }

  // Interior accessor; std::bad_variant_access on a leaf.
  const std::vector<Node> &children() const { return std::get<Interior>(data_).children; }

  // Inserts `value` at `p` in this subtree.
  //
  // An existing binding for `p` is replaced and its value returned. A new
  // point goes into the first child whose extent contains it, or becomes a
  // new leaf of this node when no child does. If this node then holds more
  // than `fill_factor` children it is split, and the split-off sibling is
  // returned as overflow for the parent to adopt.
  InsertResult insert(point_type p, Value value, std::size_t fill_factor) {
    if (auto *leaf = std::get_if<Leaf>(&data_)) {
      if (leaf->point == p) {
        std::swap(leaf->value, value);
        return InsertResult{std::move(value), std::nullopt};
      }
      // Only a leaf root is ever asked to take a foreign point.
      return InsertResult{std::nullopt, leaf_node(p, std::move(value))};
    }

    auto &node = std::get<Interior>(data_);
    std::optional<Value> old_value;
    std::optional<Node> adopted;

    auto it = std::find_if(node.children.begin(), node.children.end(),
                           [&](const Node &child) { return is_greater_or_equal(compare(child, p)); });
    if (it != node.children.end()) {
      auto sub = it->insert(p, std::move(value), fill_factor);
      if (!sub.overflow) {
        return InsertResult{std::move(sub.old_value), std::nullopt};
      }
      old_value = std::move(sub.old_value);
      adopted = std::move(sub.overflow);
    } else {
      adopted = leaf_node(p, std::move(value));
    }

    node.children.push_back(std::move(*adopted));
    refresh_coverage();
    return InsertResult{std::move(old_value), split_node(fill_factor)};
  }

  // Splits an overfull interior node; the right part is returned.
  std::optional<Node> split_node(std::size_t fill_factor) {
    auto *node = std::get_if<Interior>(&data_);
    if (node == nullptr || node->children.size() <= fill_factor) {
      return std::nullopt;
    }
    std::vector<tile_type> tiles;
    tiles.reserve(node->children.size());
    for (const auto &child : node->children) {
      tiles.push_back(child.coverage());
    }
    return partition(sweep(std::move(tiles), fill_factor));
  }

  // Picks the split line for a set of child tiles.
  //
  // For each axis the tiles are ordered by their bottom-left corner and a line
  // is drawn through the corner of the tile at index `fill_factor`. The cost
  // of a line is the number of tiles it crosses; the cheaper line wins, the
  // vertical one on a tie.
  static line_type sweep(std::vector<tile_type> tiles, std::size_t fill_factor) {
    if (tiles.size() <= fill_factor) {
      throw std::invalid_argument("sweep needs more tiles than the fill factor");
    }
    auto vertical = std::move(tiles);
    auto horizontal = vertical;

    std::stable_sort(vertical.begin(), vertical.end(), [](const tile_type &a, const tile_type &b) {
      return a.bottom_left_corner().vertical_cmp(b.bottom_left_corner()) == Ordering::less;
    });
    const auto vline = line_type::vertical_at(vertical[fill_factor].bottom_left_corner());
    const auto vertical_cost = crossing_count(vertical, vline);

    std::stable_sort(horizontal.begin(), horizontal.end(), [](const tile_type &a, const tile_type &b) {
      return a.bottom_left_corner().horizontal_cmp(b.bottom_left_corner()) == Ordering::less;
    });
    const auto hline = line_type::horizontal_at(horizontal[fill_factor].bottom_left_corner());
    const auto horizontal_cost = crossing_count(horizontal, hline);

    return horizontal_cost < vertical_cost ? hline : vline;
  }

  // Splits this node along `line`.
  //
  // Children before the line stay here, children at or after it move to the
  // returned sibling and children crossing it are split recursively. A single
  // moved child is returned as is. When every child ends up on the same side
  // the node is left untouched and nothing is returned. Leaves are never
  // split.
  std::optional<Node> partition(const line_type &line) {
    auto *node = std::get_if<Interior>(&data_);
    if (node == nullptr) {
      return std::nullopt;
    }
    auto halves = split_children(std::move(node->children), line);
    if (halves.left.empty() || halves.right.empty()) {
      node->children = halves.left.empty() ? std::move(halves.right) : std::move(halves.left);
      return std::nullopt;
    }
    node->children = std::move(halves.left);
    refresh_coverage();
    return wrap(std::move(halves.right));
  }

  const Value *find(const point_type &p) const {
    if (const auto *leaf = std::get_if<Leaf>(&data_)) {
      return leaf->point == p ? &leaf->value : nullptr;
    }
    for (const auto &child : std::get<Interior>(data_).children) {
      if (is_greater_or_equal(compare(child, p))) {
        return child.find(p);
      }
    }
    return nullptr;
  }

  Value *find_mut(const point_type &p) {
    if (auto *leaf = std::get_if<Leaf>(&data_)) {
      return leaf->point == p ? &leaf->value : nullptr;
    }
    for (auto &child : std::get<Interior>(data_).children) {
      if (is_greater_or_equal(compare(child, p))) {
        return child.find_mut(p);
      }
    }
    return nullptr;
  }

 private:
  struct Halves {
    std::vector<Node> left;
    std::vector<Node> right;
  };

  explicit Node(Leaf leaf) : data_(std::move(leaf)) {}
  explicit Node(Interior interior) : data_(std::move(interior)) {}

  static std::optional<Node> leaf_node(point_type p, Value value) { return leaf(p, std::move(value)); }

  static std::size_t crossing_count(const std::vector<tile_type> &tiles, const line_type &line) {
    return static_cast<std::size_t>(std::count_if(tiles.begin(), tiles.end(), [&](const tile_type &t) {
      return compare(line, t) == Ordering::equal;
    }));
  }

  // Consumes `children` and distributes them on both sides of `line`.
  static Halves split_children(std::vector<Node> children, const line_type &line) {
    Halves out;
    out.left.reserve(children.size());
    out.right.reserve(children.size());
    for (auto &child : children) {
      const Ordering side = compare(child, line);
      if (side == Ordering::less) {
        out.left.push_back(std::move(child));
        continue;
      }
      // A child starting on the line lies entirely in the right half-plane;
      // this covers every leaf sitting on the line.
      const bool crosses =
          side == Ordering::equal && line.project(child.coverage().bottom_left_corner()) != line.at;
      if (!crosses) {
        out.right.push_back(std::move(child));
        continue;
      }
      auto &inner = std::get<Interior>(child.data_);
      auto sub = split_children(std::move(inner.children), line);
      if (!sub.left.empty()) {
        inner.children = std::move(sub.left);
        child.refresh_coverage();
        out.left.push_back(std::move(child));
      }
      if (auto rest = wrap(std::move(sub.right))) {
        out.right.push_back(std::move(*rest));
      }
    }
    return out;
  }

  static std::optional<Node> wrap(std::vector<Node> nodes) {
    if (nodes.empty()) {
      return std::nullopt;
    }
    if (nodes.size() == 1) {
      return std::move(nodes.front());
    }
    return interior(std::move(nodes));
  }

  void refresh_coverage() {
    auto &node = std::get<Interior>(data_);
    auto coverage =
        bounding_tile(node.children.begin(), node.children.end(), [](const Node &n) { return n.coverage(); });
    if (coverage) {
      node.coverage = *coverage;
    }
  }

  std::variant<Leaf, Interior> data_;
};

} // namespace grid_rtree
