#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "grid_rtree/geometry.h"
#include "grid_rtree/node.h"

namespace grid_rtree {

// Point index over a 2D integer grid. Each point is bound to one value.
//
// Not thread-safe: concurrent callers must serialize insert() against every
// other call.
template <typename Coord, typename Value>
class RTree {
 public:
  using point_type = Point<Coord>;
  using node_type = Node<Coord, Value>;

  static constexpr std::size_t default_fill_factor = 4;

  // fill_factor is the maximum number of children of an interior node.
  explicit RTree(std::size_t fill_factor = default_fill_factor) : fill_factor_(fill_factor) {
    if (fill_factor_ < 2) {
      throw std::invalid_argument("rtree fill factor must be at least 2");
    }
  }

  // Binds `value` to `p`. Returns the value previously bound to `p`, if any.
  std::optional<Value> insert(const point_type &p, Value value) {
    if (!root_) {
      root_.emplace(node_type::leaf(p, std::move(value)));
      ++size_;
      return std::nullopt;
    }
    auto result = root_->insert(p, std::move(value), fill_factor_);
    if (result.overflow) {
      // Grow by one level.
      std::vector<node_type> children;
      children.reserve(2);
      children.push_back(std::move(*root_));
      children.push_back(std::move(*result.overflow));
      root_.emplace(node_type::interior(std::move(children)));
    }
    if (!result.old_value) {
      ++size_;
    }
    return std::move(result.old_value);
  }

  const Value *find(const point_type &p) const { return root_ ? root_->find(p) : nullptr; }

  Value *find_mut(const point_type &p) { return root_ ? root_->find_mut(p) : nullptr; }

  bool contains(const point_type &p) const { return find(p) != nullptr; }

  std::size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  std::size_t fill_factor() const { return fill_factor_; }

  // nullptr for an empty tree.
  const node_type *root() const { return root_ ? &*root_ : nullptr; }

 private:
  std::size_t fill_factor_;
  std::optional<node_type> root_;
  std::size_t size_ = 0;
};

} // namespace grid_rtree
