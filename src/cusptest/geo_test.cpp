// --------------------------------------------------------------------
// Tests for geometric primitives
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

#include "cuspgeo.h"

#include <gtest/gtest.h>
#include <string>

using namespace cusp;

TEST(cusp_geo, vector_basics)
{
  Vector v(3.0, 4.0);
  EXPECT_DOUBLE_EQ(v.len(), 5.0);
  EXPECT_DOUBLE_EQ(v.sqLen(), 25.0);
  EXPECT_EQ(v.orthogonal(), Vector(-4.0, 3.0));
  EXPECT_DOUBLE_EQ(v.normalized().len(), 1.0);
  EXPECT_DOUBLE_EQ(dot(v, Vector(1.0, 1.0)), 7.0);
  EXPECT_DOUBLE_EQ(cross(Vector(1.0, 0.0), Vector(0.0, 1.0)), 1.0);
  EXPECT_EQ(mix(Vector(0.0, 0.0), Vector(10.0, 20.0), 0.25), Vector(2.5, 5.0));
  EXPECT_TRUE(Vector::ZERO.isZero());
  EXPECT_FALSE(Vector(std::nan(""), 0.0).isFinite());
}

TEST(cusp_geo, vector_angle)
{
  EXPECT_DOUBLE_EQ(double(Vector(0.0, 2.0).angle()), CuspHalfPi);
  EXPECT_DOUBLE_EQ(double(Vector::ZERO.angle()), 0.0);
  Vector r = Vector(1.0, 0.0).rotated(Angle(CuspHalfPi));
  EXPECT_NEAR(r.x, 0.0, 1e-12);
  EXPECT_NEAR(r.y, 1.0, 1e-12);
  Vector u(Angle::Degrees(180.0));
  EXPECT_NEAR(u.x, -1.0, 1e-12);
  EXPECT_NEAR(u.y, 0.0, 1e-12);
}

TEST(cusp_geo, angle_normalize)
{
  Angle a(-CuspHalfPi);
  a.normalize(0.0);
  EXPECT_NEAR(double(a), 3.0 * CuspHalfPi, 1e-12);
  Angle b(2.0);
  b.normalize(1.0);
  EXPECT_DOUBLE_EQ(double(b), 2.0);
  EXPECT_NEAR(double(Angle::Degrees(90.0)), CuspHalfPi, 1e-12);
}

TEST(cusp_geo, rect)
{
  Rect r;
  EXPECT_TRUE(r.isEmpty());
  r.expand(1.0);
  EXPECT_TRUE(r.isEmpty());
  r.addPoint(Vector(1.0, 2.0));
  r.addPoint(Vector(-1.0, 5.0));
  EXPECT_FALSE(r.isEmpty());
  EXPECT_EQ(r.bottomLeft(), Vector(-1.0, 2.0));
  EXPECT_EQ(r.topRight(), Vector(1.0, 5.0));
  EXPECT_DOUBLE_EQ(r.width(), 2.0);
  EXPECT_DOUBLE_EQ(r.height(), 3.0);
  EXPECT_TRUE(r.contains(Vector(1.0, 5.0)));
  EXPECT_FALSE(r.contains(Vector(1.5, 5.0)));
  r.expand(0.5);
  EXPECT_TRUE(r.contains(Vector(1.5, 5.0)));

  Rect a(Vector(0.0, 0.0), Vector(10.0, 10.0));
  Rect b(Vector(10.0, 10.0), Vector(20.0, 20.0));
  Rect c(Vector(11.0, 0.0), Vector(20.0, 5.0));
  EXPECT_TRUE(a.intersects(b));
  EXPECT_FALSE(a.intersects(c));
  EXPECT_TRUE(a.contains(Rect(Vector(1.0, 1.0), Vector(2.0, 2.0))));
  EXPECT_TRUE(a.certainClearance(Vector(15.0, 5.0), 2.0));
  EXPECT_FALSE(a.certainClearance(Vector(11.0, 5.0), 2.0));
}

TEST(cusp_geo, line)
{
  Line l = Line::through(Vector(0.0, 0.0), Vector(10.0, 0.0));
  EXPECT_GT(l.side(Vector(5.0, 1.0)), 0.0);
  EXPECT_LT(l.side(Vector(5.0, -1.0)), 0.0);
  EXPECT_DOUBLE_EQ(l.side(Vector(3.0, -4.0)), -4.0);
  EXPECT_EQ(l.normal(), Vector(0.0, 1.0));
}

TEST(cusp_geo, segment_distance)
{
  Segment s(Vector(0.0, 0.0), Vector(10.0, 0.0));
  EXPECT_DOUBLE_EQ(s.closestTime(Vector(2.5, 3.0)), 0.25);
  EXPECT_DOUBLE_EQ(s.closestTime(Vector(-5.0, 3.0)), 0.0);
  EXPECT_DOUBLE_EQ(s.closestTime(Vector(15.0, 3.0)), 1.0);
  EXPECT_DOUBLE_EQ(s.distance(Vector(5.0, 3.0)), 3.0);
  EXPECT_DOUBLE_EQ(s.distance(Vector(13.0, 4.0)), 5.0);
  EXPECT_DOUBLE_EQ(s.distance(Vector(5.0, 30.0), 10.0), 10.0);
}

TEST(cusp_geo, segment_snap)
{
  Segment s(Vector(0.0, 0.0), Vector(10.0, 0.0));
  double t = -1.0;
  Vector pos;
  double bound = 5.0;
  EXPECT_TRUE(s.snap(Vector(4.0, 3.0), t, pos, bound));
  EXPECT_DOUBLE_EQ(t, 0.4);
  EXPECT_EQ(pos, Vector(4.0, 0.0));
  EXPECT_DOUBLE_EQ(bound, 3.0);
  // farther than the new bound
  EXPECT_FALSE(s.snap(Vector(12.0, 4.0), t, pos, bound));
  EXPECT_DOUBLE_EQ(t, 0.4);
  EXPECT_DOUBLE_EQ(bound, 3.0);
}

TEST(cusp_geo, segment_crossing)
{
  Segment s1(Vector(0.0, 0.0), Vector(10.0, 10.0));
  Segment s2(Vector(0.0, 10.0), Vector(10.0, 0.0));
  std::vector<Crossing> cross;
  s1.intersect(s2, cross);
  ASSERT_EQ(cross.size(), 1u);
  EXPECT_DOUBLE_EQ(cross[0].t1, 0.5);
  EXPECT_DOUBLE_EQ(cross[0].t2, 0.5);
  Vector p1 = s1.point(cross[0].t1);
  Vector p2 = s2.point(cross[0].t2);
  EXPECT_LT((p1 - p2).len(), DEFAULT_TOLERANCE);

  Vector pt;
  EXPECT_TRUE(s1.intersects(s2, pt));
  EXPECT_NEAR(pt.x, 5.0, 1e-12);
  EXPECT_NEAR(pt.y, 5.0, 1e-12);
}

TEST(cusp_geo, segment_crossing_parameters)
{
  Segment s1(Vector(0.0, 0.0), Vector(4.0, 0.0));
  Segment s2(Vector(1.0, -1.0), Vector(1.0, 3.0));
  std::vector<Crossing> cross;
  s1.intersect(s2, cross);
  ASSERT_EQ(cross.size(), 1u);
  EXPECT_DOUBLE_EQ(cross[0].t1, 0.25);
  EXPECT_DOUBLE_EQ(cross[0].t2, 0.25);
}

TEST(cusp_geo, segment_no_crossing)
{
  std::vector<Crossing> cross;
  // parallel
  Segment(Vector(0.0, 0.0), Vector(10.0, 0.0))
    .intersect(Segment(Vector(0.0, 1.0), Vector(10.0, 1.0)), cross);
  EXPECT_TRUE(cross.empty());
  // collinear
  Segment(Vector(0.0, 0.0), Vector(10.0, 0.0))
    .intersect(Segment(Vector(5.0, 0.0), Vector(15.0, 0.0)), cross);
  EXPECT_TRUE(cross.empty());
  // lines cross outside the segments
  Segment(Vector(0.0, 0.0), Vector(1.0, 1.0))
    .intersect(Segment(Vector(5.0, 0.0), Vector(4.0, 1.0)), cross);
  EXPECT_TRUE(cross.empty());
  Vector pt;
  EXPECT_FALSE(Segment(Vector(0.0, 0.0), Vector(1.0, 1.0))
	       .intersects(Segment(Vector(5.0, 0.0), Vector(4.0, 1.0)), pt));
}

TEST(cusp_geo, matrix)
{
  Matrix m = Matrix(Vector(3.0, 4.0)) * Matrix(Linear(Angle(CuspHalfPi)));
  Vector v = m * Vector(1.0, 0.0);
  EXPECT_NEAR(v.x, 3.0, 1e-12);
  EXPECT_NEAR(v.y, 5.0, 1e-12);
  EXPECT_EQ(m.translation(), Vector(3.0, 4.0));
  EXPECT_TRUE(m.isInvertible());
  EXPECT_TRUE(m.isValid());

  Vector w = m.inverse() * v;
  EXPECT_NEAR(w.x, 1.0, 1e-12);
  EXPECT_NEAR(w.y, 0.0, 1e-12);

  Linear l(2.0, 0.0, 0.0, 4.0);
  EXPECT_DOUBLE_EQ(l.determinant(), 8.0);
  EXPECT_TRUE((l * l.inverse()).isIdentity());
  EXPECT_TRUE(Matrix().isIdentity());
  EXPECT_FALSE(Matrix(1.0, 0.0, 0.0, 1.0, std::nan(""), 0.0).isValid());
}

// --------------------------------------------------------------------

static std::string lastMessage;

static void recordMessage(const char *msg)
{
  lastMessage = msg;
}

TEST(cusp_base, debug_handler)
{
  Platform::initLib(CUSPLIB_VERSION);
  EXPECT_EQ(Platform::libVersion(), CUSPLIB_VERSION);
  Platform::setDebugHandler(recordMessage);
  cuspDebug("anchor %d at %g", 3, 0.5);
  EXPECT_EQ(lastMessage, "anchor 3 at 0.5");
  Platform::setDebug(true);
  EXPECT_TRUE(Platform::debugEnabled());
  Platform::setDebug(false);
  EXPECT_FALSE(Platform::debugEnabled());
  Platform::setDebugHandler(nullptr);
}
