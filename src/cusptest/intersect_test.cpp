// --------------------------------------------------------------------
// Tests for intersections of curves and paths
// --------------------------------------------------------------------
/*

    This file is part of Cusp, a planar curve geometry kernel.
    Copyright (C) 2026  The Cusp developers

    Cusp is free software; you can redistribute it and/or modify it
    under the terms of the GNU General Public License as published by
    the Free Software Foundation; either version 3 of the License, or
    (at your option) any later version.

    Cusp is distributed in the hope that it will be useful, but WITHOUT
    ANY WARRANTY; without even the implied warranty of MERCHANTABILITY
    or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU General Public
    License for more details.

    You should have received a copy of the GNU General Public License
    along with Cusp; if not, you can find it at
    "http://www.gnu.org/copyleft/gpl.html", or write to the Free
    Software Foundation, Inc., 675 Mass Ave, Cambridge, MA 02139, USA.

*/

#include "cuspintersect.h"

#include <gtest/gtest.h>

using namespace cusp;

static Bezier sCurve()
{
  return Bezier(Vector(0.0, 0.0), Vector(10.0, 0.0),
		Vector(0.0, 10.0), Vector(10.0, 10.0));
}

static Path sPath()
{
  std::vector<Anchor> anchors;
  anchors.push_back(Anchor(Vector(0.0, 0.0), Vector::ZERO, Vector(10.0, 0.0)));
  anchors.push_back(Anchor(Vector(10.0, 10.0), Vector(-10.0, 0.0), Vector::ZERO));
  return Path(anchors);
}

static Path square(double x, double y, double size)
{
  return Path::fromRect(Rect(Vector(x, y), Vector(x + size, y + size)));
}

// --------------------------------------------------------------------

TEST(cusp_intersect, segment_bezier)
{
  Segment seg(Vector(-5.0, 5.0), Vector(15.0, 5.0));
  std::vector<Crossing> cross;
  seg.intersect(sCurve(), cross);
  ASSERT_EQ(cross.size(), 1u);
  EXPECT_NEAR(cross[0].t1, 0.5, 1e-9);
  EXPECT_NEAR(cross[0].t2, 0.5, 1e-9);
  Vector p = sCurve().point(cross[0].t2);
  EXPECT_NEAR(p.x, 5.0, 1e-9);
  EXPECT_NEAR(p.y, 5.0, 1e-9);

  // the mirrored call swaps the parameters
  std::vector<Crossing> mirrored;
  sCurve().intersect(seg, mirrored);
  ASSERT_EQ(mirrored.size(), 1u);
  EXPECT_DOUBLE_EQ(mirrored[0].t1, cross[0].t2);
  EXPECT_DOUBLE_EQ(mirrored[0].t2, cross[0].t1);
}

TEST(cusp_intersect, segment_bezier_two_crossings)
{
  Bezier bez(Vector(0.0, 0.0), Vector(3.0, 10.0),
	     Vector(7.0, 10.0), Vector(10.0, 0.0));
  // y(t) = 30 t (1 - t) = 3.3
  Segment seg(Vector(-1.0, 3.3), Vector(11.0, 3.3));
  std::vector<Crossing> cross;
  seg.intersect(bez, cross);
  ASSERT_EQ(cross.size(), 2u);
  double r = std::sqrt(1.0 - 4.0 * 0.11) / 2.0;
  double lo = min(cross[0].t2, cross[1].t2);
  double hi = max(cross[0].t2, cross[1].t2);
  EXPECT_NEAR(lo, 0.5 - r, 1e-9);
  EXPECT_NEAR(hi, 0.5 + r, 1e-9);
  for (const auto &c : cross) {
    Vector p1 = seg.point(c.t1);
    Vector p2 = bez.point(c.t2);
    EXPECT_LT((p1 - p2).len(), 1e-9);
  }
}

TEST(cusp_intersect, segment_bezier_outside_segment)
{
  // the line crosses the curve, but the segment stops short of it
  Segment seg(Vector(-5.0, 5.0), Vector(2.0, 5.0));
  std::vector<Crossing> cross;
  seg.intersect(sCurve(), cross);
  EXPECT_TRUE(cross.empty());
}

TEST(cusp_intersect, segment_bezier_degenerate)
{
  Segment seg(Vector(5.0, 5.0), Vector(5.0, 5.0));
  std::vector<Crossing> cross;
  seg.intersect(sCurve(), cross);
  EXPECT_TRUE(cross.empty());
}

TEST(cusp_intersect, bezier_bezier)
{
  Bezier bez1(Vector(0.0, 0.0), Vector(3.0, 10.0),
	      Vector(7.0, 10.0), Vector(10.0, 0.0));
  Bezier bez2(Vector(0.0, 3.3), Vector(3.0, 3.3),
	      Vector(7.0, 3.3), Vector(10.0, 3.3));
  std::vector<Crossing> cross;
  bez1.intersect(bez2, cross);
  ASSERT_EQ(cross.size(), 2u);
  double r = std::sqrt(1.0 - 4.0 * 0.11) / 2.0;
  double lo = min(cross[0].t1, cross[1].t1);
  double hi = max(cross[0].t1, cross[1].t1);
  EXPECT_NEAR(lo, 0.5 - r, 1e-4);
  EXPECT_NEAR(hi, 0.5 + r, 1e-4);
  for (const auto &c : cross) {
    Vector p1 = bez1.point(c.t1);
    Vector p2 = bez2.point(c.t2);
    EXPECT_LT((p1 - p2).len(), DEFAULT_TOLERANCE);
  }
}

TEST(cusp_intersect, bezier_bezier_far_apart)
{
  Bezier bez = sCurve();
  Matrix m(Vector(100.0, 0.0));
  std::vector<Crossing> cross;
  bez.intersect(m * bez, cross);
  EXPECT_TRUE(cross.empty());
}

TEST(cusp_intersect, bezier_bezier_identical)
{
  Bezier bez = sCurve();
  std::vector<Crossing> cross;
  bez.intersect(bez, cross);
  EXPECT_TRUE(cross.empty());
  bez.intersect(bez.reversed(), cross);
  EXPECT_TRUE(cross.empty());
  Bezier moved(bez.iV[0], bez.iV[1] + Vector(0.0, 0.0005),
	       bez.iV[2], bez.iV[3]);
  bez.intersect(moved, cross);
  EXPECT_TRUE(cross.empty());
}

TEST(cusp_intersect, bezier_overlap)
{
  Bezier bez(Vector(0.0, 0.0), Vector(3.0, 10.0),
	     Vector(7.0, 10.0), Vector(10.0, 0.0));
  Bezier piece = bez.trimmed(0.25, 0.75);
  EXPECT_TRUE(bez.overlaps(piece, DEFAULT_TOLERANCE));
  EXPECT_TRUE(piece.overlaps(bez, DEFAULT_TOLERANCE));
  // the piece running the other way overlaps as well
  EXPECT_TRUE(bez.overlaps(piece.reversed(), DEFAULT_TOLERANCE));

  std::vector<Crossing> cross;
  bez.intersect(piece, cross);
  EXPECT_TRUE(cross.empty());
}

TEST(cusp_intersect, bezier_no_overlap)
{
  Bezier bez1(Vector(0.0, 0.0), Vector(3.0, 10.0),
	      Vector(7.0, 10.0), Vector(10.0, 0.0));
  Bezier bez2(Vector(0.0, 3.3), Vector(3.0, 3.3),
	      Vector(7.0, 3.3), Vector(10.0, 3.3));
  EXPECT_FALSE(bez1.overlaps(bez2, DEFAULT_TOLERANCE));

  // common end point only
  Bezier bez3(Vector(10.0, 0.0), Vector(13.0, -10.0),
	      Vector(17.0, -10.0), Vector(20.0, 0.0));
  EXPECT_FALSE(bez1.overlaps(bez3, DEFAULT_TOLERANCE));
}

TEST(cusp_intersect, bezier_overlap_end_tie)
{
  // the end of line and the start of hook both match time 1 on line,
  // the match found from hook decides where the shared piece ends
  Bezier line(Vector(0.0, 0.0), Vector(1.0, 0.0),
	      Vector(2.0, 0.0), Vector(3.0, 0.0));
  Bezier hook(Vector(3.3, 0.0), Vector(3.5, 0.1),
	      Vector(1.9, -0.6), Vector(1.0, 0.0));
  EXPECT_FALSE(line.overlaps(hook, 0.5));
  EXPECT_FALSE(hook.overlaps(line, 0.5));
}

TEST(cusp_intersect, bezier_self_intersection)
{
  Bezier loop(Vector(0.0, 0.0), Vector(20.0, 10.0),
	      Vector(-10.0, 10.0), Vector(10.0, 0.0));
  std::vector<Crossing> cross;
  loop.selfIntersect(cross);
  EXPECT_TRUE(cross.empty());
}

// --------------------------------------------------------------------

TEST(cusp_intersect, square_with_itself)
{
  Path sq = square(0.0, 0.0, 10.0);
  std::vector<const Path *> paths(1, &sq);
  std::vector<Intersection> result;
  pathIntersections(paths, result);
  EXPECT_TRUE(result.empty());
}

TEST(cusp_intersect, polyline_with_itself)
{
  std::vector<Vector> points;
  points.push_back(Vector(0.0, 0.0));
  points.push_back(Vector(10.0, 0.0));
  points.push_back(Vector(10.0, 10.0));
  Path path = Path::fromPoints(points);
  std::vector<const Path *> paths(1, &path);
  std::vector<Intersection> result;
  pathIntersections(paths, result);
  EXPECT_TRUE(result.empty());
}

TEST(cusp_intersect, bowtie)
{
  std::vector<Vector> points;
  points.push_back(Vector(0.0, 0.0));
  points.push_back(Vector(10.0, 10.0));
  points.push_back(Vector(10.0, 0.0));
  points.push_back(Vector(0.0, 10.0));
  Path bowtie = Path::fromPoints(points, true);
  std::vector<const Path *> paths(1, &bowtie);
  std::vector<Intersection> result;
  pathIntersections(paths, result);
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0].iPath1, &bowtie);
  EXPECT_EQ(result[0].iPath2, &bowtie);
  EXPECT_DOUBLE_EQ(result[0].iTime1, 0.5);
  EXPECT_DOUBLE_EQ(result[0].iTime2, 2.5);
  EXPECT_NEAR(result[0].iPos.x, 5.0, 1e-12);
  EXPECT_NEAR(result[0].iPos.y, 5.0, 1e-12);
  EXPECT_LT(result[0].iDistance, 0.0);
}

TEST(cusp_intersect, two_squares)
{
  Path a = square(0.0, 0.0, 10.0);
  Path b = square(5.0, 5.0, 10.0);
  std::vector<const Path *> paths1(1, &a);
  std::vector<const Path *> paths2(1, &b);
  std::vector<Intersection> result;
  partitionedPathIntersections(paths1, paths2, result);
  ASSERT_EQ(result.size(), 2u);

  EXPECT_EQ(result[0].iPath1, &a);
  EXPECT_EQ(result[0].iPath2, &b);
  EXPECT_DOUBLE_EQ(result[0].iTime1, 1.5);
  EXPECT_DOUBLE_EQ(result[0].iTime2, 0.5);
  EXPECT_EQ(result[0].iPos, Vector(10.0, 5.0));

  EXPECT_DOUBLE_EQ(result[1].iTime1, 2.5);
  EXPECT_DOUBLE_EQ(result[1].iTime2, 3.5);
  EXPECT_EQ(result[1].iPos, Vector(5.0, 10.0));

  // the same crossings are found in a single list
  std::vector<const Path *> both;
  both.push_back(&a);
  both.push_back(&b);
  std::vector<Intersection> all;
  pathIntersections(both, all);
  ASSERT_EQ(all.size(), 2u);
  for (const auto &is : all) {
    EXPECT_EQ(is.iPath1, &a);
    EXPECT_EQ(is.iPath2, &b);
  }
}

TEST(cusp_intersect, distance_filter)
{
  Path a = square(0.0, 0.0, 10.0);
  Path b = square(5.0, 5.0, 10.0);
  std::vector<const Path *> both;
  both.push_back(&a);
  both.push_back(&b);
  std::vector<Intersection> result;
  pathIntersections(both, 1.0, Vector(10.5, 5.0), result);
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0].iPos, Vector(10.0, 5.0));
  EXPECT_NEAR(result[0].iDistance, 0.5, 1e-12);

  result.clear();
  pathIntersections(both, 1.0, Vector(20.0, 20.0), result);
  EXPECT_TRUE(result.empty());

  std::vector<const Path *> paths1(1, &a);
  std::vector<const Path *> paths2(1, &b);
  partitionedPathIntersections(paths1, paths2, 10.0, Vector(0.0, 0.0), result);
  EXPECT_TRUE(result.empty());
  partitionedPathIntersections(paths1, paths2, 12.0, Vector(0.0, 0.0), result);
  EXPECT_EQ(result.size(), 2u);
}

TEST(cusp_intersect, line_and_s_curve)
{
  Path curve = sPath();
  std::vector<Vector> points;
  points.push_back(Vector(-5.0, 5.0));
  points.push_back(Vector(15.0, 5.0));
  Path line = Path::fromPoints(points);
  std::vector<const Path *> paths;
  paths.push_back(&line);
  paths.push_back(&curve);
  std::vector<Intersection> result;
  pathIntersections(paths, result);
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0].iPath1, &line);
  EXPECT_EQ(result[0].iPath2, &curve);
  EXPECT_GT(result[0].iTime2, 0.0);
  EXPECT_LT(result[0].iTime2, 1.0);
  EXPECT_NEAR(result[0].iPos.x, 5.0, 1e-9);
  EXPECT_NEAR(result[0].iPos.y, 5.0, 1e-9);
}

TEST(cusp_intersect, rect_crossing)
{
  Path sq = square(0.0, 0.0, 10.0);
  EXPECT_TRUE(sq.isIntersectedByRect(Rect(Vector(8.0, 2.0), Vector(12.0, 4.0))));
  // inside, no crossing with the outline
  EXPECT_FALSE(sq.isIntersectedByRect(Rect(Vector(2.0, 2.0), Vector(4.0, 4.0))));
  EXPECT_FALSE(sq.isIntersectedByRect(Rect(Vector(20.0, 2.0), Vector(24.0, 4.0))));
  EXPECT_TRUE(sPath().isIntersectedByRect(Rect(Vector(4.0, 4.0), Vector(6.0, 6.0))));
}
