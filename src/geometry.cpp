#include "grid_rtree/geometry.h"

namespace grid_rtree {

const char *to_string(Ordering o) {
  switch (o) {
    case Ordering::less:
      return "less";
    case Ordering::equal:
      return "equal";
    case Ordering::greater:
      return "greater";
    case Ordering::unordered:
      return "unordered";
  }
  return "unknown";
}

} // namespace grid_rtree
