#include <gtest/gtest.h>

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "grid_rtree/geometry.h"

using namespace grid_rtree;

using P = Point<std::int32_t>;
using T = Tile<std::int32_t>;
using L = Line<std::int32_t>;

TEST(OrderingTest, Reverse) {
  EXPECT_EQ(reverse(Ordering::less), Ordering::greater);
  EXPECT_EQ(reverse(Ordering::greater), Ordering::less);
  EXPECT_EQ(reverse(Ordering::equal), Ordering::equal);
  EXPECT_EQ(reverse(Ordering::unordered), Ordering::unordered);
  EXPECT_STREQ(to_string(Ordering::unordered), "unordered");
}

TEST(PointTest, Equality) {
  EXPECT_EQ((P{10, 10}), (P{10, 10}));
  EXPECT_NE((P{10, 10}), (P{10, 11}));
  EXPECT_NE((P{11, 10}), (P{10, 10}));
}

TEST(PointTest, DominanceOrder) {
  const P p1{10, 10};
  const P p3{5, 5};
  const P p4{10, 5};
  const P p5{5, 10};

  EXPECT_EQ(compare(p1, p1), Ordering::equal);
  EXPECT_EQ(compare(p1, p3), Ordering::greater);
  EXPECT_EQ(compare(p3, p1), Ordering::less);
  // A tie on x defers to y.
  EXPECT_EQ(compare(p1, p4), Ordering::greater);
  EXPECT_EQ(compare(p4, p1), Ordering::less);
  EXPECT_EQ(compare(p5, p4), Ordering::unordered);
  EXPECT_EQ(compare(P{5, 2}, P{4, 3}), Ordering::unordered);
}

TEST(PointTest, OrderIsAntisymmetric) {
  const std::vector<P> points{{0, 0}, {1, 2}, {2, 1}, {2, 2}, {-3, 4}, {4, -3}, {0, 5}};
  for (const auto &a : points) {
    for (const auto &b : points) {
      EXPECT_EQ(compare(a, b), reverse(compare(b, a))) << a << " vs " << b;
    }
  }
}

TEST(PointTest, AxisComparisons) {
  EXPECT_EQ((P{1, 9}).vertical_cmp(P{2, 0}), Ordering::less);
  EXPECT_EQ((P{1, 9}).horizontal_cmp(P{2, 0}), Ordering::greater);
  EXPECT_EQ((P{3, 9}).vertical_cmp(P{3, 0}), Ordering::equal);
}

TEST(PointTest, Arithmetic) {
  EXPECT_EQ((P{1, 2}) + (P{3, -4}), (P{4, -2}));
  EXPECT_EQ((P{1, 2}) - (P{3, -4}), (P{-2, 6}));

  std::ostringstream os;
  os << P{7, 3};
  EXPECT_EQ(os.str(), "7 3");
}

TEST(PointTest, NarrowCoordinates) {
  using P8 = Point<std::uint8_t>;
  std::ostringstream os;
  os << P8{4, 200};
  EXPECT_EQ(os.str(), "4 200");
  EXPECT_EQ(compare(P8{1, 1}, P8{2, 2}), Ordering::less);
}

TEST(TileTest, InvalidCornersThrow) {
  EXPECT_THROW(T(P{5, 5}, P{4, 6}), std::invalid_argument);
  EXPECT_THROW(T(P{5, 5}, P{6, 4}), std::invalid_argument);
  EXPECT_THROW(T(P{5, 5}, P{4, 4}), std::invalid_argument);
  EXPECT_NO_THROW(T(P{5, 5}, P{5, 5}));
  EXPECT_NO_THROW(T(P{5, 5}, P{5, 9}));
}

TEST(TileTest, DegenerateTileEqualsItsPoint) {
  const P p{10, 10};
  EXPECT_EQ(compare(T::from_point(p), p), Ordering::equal);
  EXPECT_EQ(compare(T(P{10, 10}, P{10, 11}), p), Ordering::greater);
  EXPECT_EQ(compare(T::from_point(P{11, 10}), p), Ordering::less);
  EXPECT_TRUE(T::from_point(p).is_point());
}

TEST(TileTest, Containment) {
  const T arena(P{0, 0}, P{10, 10});
  EXPECT_EQ(compare(arena, P{5, 5}), Ordering::greater);
  EXPECT_EQ(compare(arena, P{15, 5}), Ordering::less);
  EXPECT_EQ(compare(P{5, 5}, arena), Ordering::less);
  EXPECT_EQ(compare(P{15, 5}, arena), Ordering::greater);

  // Borders and corners are inside.
  EXPECT_EQ(compare(arena, P{0, 0}), Ordering::greater);
  EXPECT_EQ(compare(arena, P{10, 10}), Ordering::greater);
  EXPECT_EQ(compare(arena, P{0, 7}), Ordering::greater);
  EXPECT_EQ(compare(arena, P{10, 3}), Ordering::greater);
  EXPECT_EQ(compare(arena, P{-1, 3}), Ordering::less);
  EXPECT_EQ(compare(arena, P{3, 11}), Ordering::less);

  const T t(P{5, 5}, P{15, 15});
  EXPECT_EQ(compare(t, P{5, 8}), Ordering::greater);
  EXPECT_EQ(compare(t, P{15, 10}), Ordering::greater);
  EXPECT_EQ(compare(t, P{7, 11}), Ordering::greater);
  EXPECT_EQ(compare(t, P{7, 22}), Ordering::less);
}

TEST(TileTest, Nesting) {
  const T outer(P{0, 0}, P{10, 10});
  const T inner(P{2, 2}, P{5, 5});
  EXPECT_EQ(compare(inner, outer), Ordering::less);
  EXPECT_EQ(compare(outer, inner), Ordering::greater);
  EXPECT_EQ(compare(outer, outer), Ordering::equal);
  // Sharing a corner still nests.
  EXPECT_EQ(compare(T(P{0, 0}, P{5, 5}), outer), Ordering::less);

  const T overlapping(P{8, 8}, P{12, 12});
  const T disjoint(P{20, 20}, P{30, 30});
  EXPECT_EQ(compare(outer, overlapping), Ordering::unordered);
  EXPECT_EQ(compare(outer, disjoint), Ordering::unordered);
}

TEST(TileTest, Merge) {
  const T t1(P{4, 5}, P{7, 8});
  const T t2(P{4, 5}, P{6, 6});
  const T t3 = t1.merge(t2);
  EXPECT_EQ(t3, t1);
  EXPECT_TRUE(is_greater_or_equal(compare(t3, t1)));
  EXPECT_TRUE(is_greater_or_equal(compare(t3, t2)));

  const T m = T::from_point(P{-1, 9}).merge(T::from_point(P{3, 2}));
  EXPECT_EQ(m.bottom_left_corner(), (P{-1, 2}));
  EXPECT_EQ(m.top_right_corner(), (P{3, 9}));
  EXPECT_EQ(m.merge(m), m);
}

TEST(TileTest, VerticalCmp) {
  const T t1(P{4, 5}, P{7, 8});

  const T right(P{8, 8}, P{9, 9});
  EXPECT_EQ(t1.vertical_cmp(right), Ordering::less);
  EXPECT_EQ(right.vertical_cmp(t1), Ordering::greater);

  // Touching intervals overlap.
  const T touching(P{7, 8}, P{9, 9});
  EXPECT_EQ(t1.vertical_cmp(touching), Ordering::equal);
  EXPECT_EQ(touching.vertical_cmp(t1), Ordering::equal);

  const T inside(P{4, 5}, P{6, 6});
  EXPECT_EQ(t1.vertical_cmp(inside), Ordering::equal);
  EXPECT_EQ(inside.vertical_cmp(t1), Ordering::equal);

  const T wider(P{3, 5}, P{9, 6});
  EXPECT_EQ(t1.vertical_cmp(wider), Ordering::equal);
  EXPECT_EQ(wider.vertical_cmp(t1), Ordering::equal);
}

TEST(TileTest, HorizontalCmp) {
  const T t1(P{4, 5}, P{7, 8});
  EXPECT_EQ(t1.horizontal_cmp(T(P{0, 9}, P{1, 12})), Ordering::less);
  EXPECT_EQ(t1.horizontal_cmp(T(P{0, 0}, P{1, 4})), Ordering::greater);
  EXPECT_EQ(t1.horizontal_cmp(T(P{0, 0}, P{1, 5})), Ordering::equal);
}

TEST(TileTest, BoundingTile) {
  const std::vector<P> points{{3, 1}, {-2, 4}, {0, 0}};
  const auto bbox = bounding_tile(points.begin(), points.end(), [](const P &p) { return T::from_point(p); });
  ASSERT_TRUE(bbox.has_value());
  EXPECT_EQ(*bbox, T(P{-2, 0}, P{3, 4}));

  const std::vector<T> none;
  EXPECT_FALSE(bounding_tile(none.begin(), none.end()).has_value());
}

TEST(LineTest, PointComparison) {
  EXPECT_EQ(compare(L::horizontal(4), P{0, 0}), Ordering::greater);
  EXPECT_EQ(compare(L::horizontal(4), P{0, 4}), Ordering::equal);
  EXPECT_EQ(compare(L::horizontal(4), P{0, 9}), Ordering::less);
  EXPECT_EQ(compare(L::vertical(4), P{0, 9}), Ordering::greater);
  EXPECT_EQ(compare(L::vertical(4), P{4, 9}), Ordering::equal);
}

TEST(LineTest, TileComparison) {
  const T t(P{2, 3}, P{6, 8});
  EXPECT_EQ(compare(L::vertical(1), t), Ordering::less);
  EXPECT_EQ(compare(L::vertical(2), t), Ordering::equal);
  EXPECT_EQ(compare(L::vertical(4), t), Ordering::equal);
  EXPECT_EQ(compare(L::vertical(6), t), Ordering::equal);
  EXPECT_EQ(compare(L::vertical(7), t), Ordering::greater);
  EXPECT_EQ(compare(L::horizontal(2), t), Ordering::less);
  EXPECT_EQ(compare(L::horizontal(9), t), Ordering::greater);
}

TEST(LineTest, ThroughCorner) {
  const P corner{3, 7};
  const auto v = L::vertical_at(corner);
  const auto h = L::horizontal_at(corner);
  EXPECT_TRUE(v.is_vertical());
  EXPECT_TRUE(h.is_horizontal());
  EXPECT_EQ(v.at, 3);
  EXPECT_EQ(h.at, 7);
  EXPECT_EQ(v.project(P{9, 1}), 9);
  EXPECT_EQ(h.project(P{9, 1}), 1);
}
