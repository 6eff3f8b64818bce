#pragma once

#include <cstddef>
#include <type_traits>

#include <nlohmann/json.hpp>

#include "grid_rtree/geometry.h"
#include "grid_rtree/node.h"
#include "grid_rtree/rtree.h"

namespace grid_rtree {

template <typename Coord>
nlohmann::json point_to_json(const Point<Coord> &p) {
  return nlohmann::json::array({p.x, p.y});
}

template <typename Coord>
nlohmann::json tile_to_json(const Tile<Coord> &t) {
  nlohmann::json j;
  j["bottom"] = point_to_json(t.bottom_left_corner());
  j["top"] = point_to_json(t.top_right_corner());
  return j;
}

// Structure of a subtree. `encode` maps a leaf value to JSON; pass nullptr to
// leave values out.
template <typename Coord, typename Value, typename Encode>
nlohmann::json node_to_json(const Node<Coord, Value> &node, const Encode &encode) {
  nlohmann::json j;
  if (node.is_leaf()) {
    j["type"] = "leaf";
    j["point"] = point_to_json(node.point());
    if constexpr (!std::is_null_pointer_v<Encode>) {
      j["value"] = encode(node.value());
    }
    return j;
  }
  j["type"] = "interior";
  j["coverage"] = tile_to_json(node.coverage());
  j["children"] = nlohmann::json::array();
  for (const auto &child : node.children()) {
    j["children"].push_back(node_to_json(child, encode));
  }
  return j;
}

// Debug view of the index; null for an empty tree. There is no loader.
template <typename Coord, typename Value, typename Encode = std::nullptr_t>
nlohmann::json tree_to_json(const RTree<Coord, Value> &tree, const Encode &encode = nullptr) {
  const auto *root = tree.root();
  if (root == nullptr) {
    return nlohmann::json();
  }
  return node_to_json(*root, encode);
}

} // namespace grid_rtree
