// --------------------------------------------------------------------
// Intersections of segments, Bezier curves, and paths
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

#include <cmath>

using namespace cusp;

// --------------------------------------------------------------------

namespace {
  // absolute tolerance for vanishing polynomial coefficients
  const double EPSILON = 1e-6;

  // rounds of subdivision for two Bezier curves
  const int BEZIER_ROUNDS = 20;
  // from this round on, only the chords are compared
  const int BEZIER_CHORD_ROUND = 10;

  inline bool approximately(double a, double b)
  {
    return std::fabs(a - b) <= EPSILON;
  }

  inline void addRoot(double t, std::vector<double> &roots)
  {
    if (0.0 <= t && t <= 1.0)
      roots.push_back(t);
  }

  // Real roots in [0, 1] of the cubic polynomial with Bernstein
  // coefficients pa, pb, pc, pd.
  void bernsteinRoots(double pa, double pb, double pc, double pd,
		      std::vector<double> &roots)
  {
    double d = -pa + 3.0 * pb - 3.0 * pc + pd;
    double a = 3.0 * pa - 6.0 * pb + 3.0 * pc;
    double b = -3.0 * pa + 3.0 * pb;
    double c = pa;

    if (approximately(d, 0.0)) {
      // not a cubic
      if (approximately(a, 0.0)) {
	// not a quadratic either
	if (approximately(b, 0.0))
	  return;
	addRoot(-c / b, roots);
	return;
      }
      double disc = b * b - 4.0 * a * c;
      if (disc < 0.0)
	return;
      double q = std::sqrt(disc);
      addRoot((q - b) / (2.0 * a), roots);
      addRoot((-b - q) / (2.0 * a), roots);
      return;
    }

    // Cardano's method on the monic cubic
    a /= d;
    b /= d;
    c /= d;
    double p = (3.0 * b - a * a) / 3.0;
    double p3 = p / 3.0;
    double q = (2.0 * a * a * a - 9.0 * a * b + 27.0 * c) / 27.0;
    double q2 = q / 2.0;
    double disc = q2 * q2 + p3 * p3 * p3;

    if (disc < 0.0) {
      // three real roots
      double mp3 = -p / 3.0;
      double r = std::sqrt(mp3 * mp3 * mp3);
      double phi = std::acos(clamp(-q / (2.0 * r), -1.0, 1.0));
      double t1 = 2.0 * std::cbrt(r);
      addRoot(t1 * std::cos(phi / 3.0) - a / 3.0, roots);
      addRoot(t1 * std::cos((phi + CuspTwoPi) / 3.0) - a / 3.0, roots);
      addRoot(t1 * std::cos((phi + 2.0 * CuspTwoPi) / 3.0) - a / 3.0, roots);
    } else if (disc == 0.0) {
      double u1 = q2 < 0.0 ? std::cbrt(-q2) : -std::cbrt(q2);
      addRoot(2.0 * u1 - a / 3.0, roots);
      addRoot(-u1 - a / 3.0, roots);
    } else {
      double sd = std::sqrt(disc);
      addRoot(std::cbrt(-q2 + sd) - std::cbrt(q2 + sd) - a / 3.0, roots);
    }
  }

  struct BezierPair {
    double iT1;
    Bezier iC1;
    double iT2;
    Bezier iC2;
  };

  inline BezierPair makePair(double t1, const Bezier &c1,
			     double t2, const Bezier &c2)
  {
    BezierPair p;
    p.iT1 = t1; p.iC1 = c1;
    p.iT2 = t2; p.iC2 = c2;
    return p;
  }

  inline Segment chord(const Bezier &bez)
  {
    return Segment(bez.iV[0], bez.iV[3]);
  }

  inline bool chordsCross(const BezierPair &p)
  {
    std::vector<Crossing> cross;
    chord(p.iC1).intersect(chord(p.iC2), cross);
    return !cross.empty();
  }

  // An end point of one curve lying on the other.
  struct EndMatch {
    double iT1;
    double iT2;
  };

  inline bool lessT1(const EndMatch &lhs, const EndMatch &rhs)
  {
    return lhs.iT1 < rhs.iT1;
  }
}

// --------------------------------------------------------------------

//! Compute the crossing of two segments.
/*! Appends at most one Crossing with the parameter on this segment
  and on \a seg.  Parallel segments never cross. */
void Segment::intersect(const Segment &seg, std::vector<Crossing> &result) const
{
  Vector d1 = iQ - iP;
  Vector d2 = seg.iQ - seg.iP;
  double denom = cross(d1, d2);
  if (denom == 0.0)
    return;
  Vector w = iP - seg.iP;
  double ua = cross(d2, w) / denom;
  double ub = cross(d1, w) / denom;
  if (ua < 0.0 || ua > 1.0 || ub < 0.0 || ub > 1.0)
    return;
  Crossing c = { ua, ub };
  result.push_back(c);
}

//! Compute crossings of the segment with a Bezier curve.
/*! The signed distances of the control points from the line through
  the segment are the Bernstein coefficients of a cubic, whose roots
  are the curve parameters of the crossings.  Curve points outside
  the bounding box of the segment are dropped.  The parameter on the
  segment is found by projection, and can lie slightly outside [0, 1]
  near the end points. */
void Segment::intersect(const Bezier &bez, std::vector<Crossing> &result) const
{
  if (degenerate())
    return;
  Vector dir = iQ - iP;
  Line l = line();
  double h[4];
  for (int i = 0; i < 4; ++i)
    h[i] = l.side(bez.iV[i]);

  std::vector<double> roots;
  bernsteinRoots(h[0], h[1], h[2], h[3], roots);

  Rect box(iP, iQ);
  box.expand(EPSILON);
  for (double t : roots) {
    Vector pt = bez.point(t);
    if (!box.contains(pt))
      continue;
    Crossing c = { dot(pt - iP, dir) / dir.sqLen(), t };
    result.push_back(c);
  }
}

// --------------------------------------------------------------------

//! Compute crossings of the curve with a segment.
/*! The first parameter of each Crossing refers to this curve. */
void Bezier::intersect(const Segment &seg, std::vector<Crossing> &result) const
{
  std::vector<Crossing> cross;
  seg.intersect(*this, cross);
  for (const auto &c : cross) {
    Crossing r = { c.t2, c.t1 };
    result.push_back(r);
  }
}

//! Compute crossings of two Bezier curves.
/*! Both curves are subdivided simultaneously for a fixed number of
  rounds, keeping only pairs whose control boxes (and in later rounds,
  chords) intersect.  The chords of the surviving pairs are intersected
  at the end.

  Identical, almost identical, and overlapping curves have infinitely
  many common points, and no crossings are reported for them. */
void Bezier::intersect(const Bezier &bez, std::vector<Crossing> &result) const
{
  if (*this == bez || *this == bez.reversed())
    return;
  if (almostEqual(bez, DEFAULT_TOLERANCE))
    return;
  if (!controlBox().intersects(bez.controlBox()))
    return;
  if (overlaps(bez, DEFAULT_TOLERANCE)) {
    cuspDebug("Bezier::intersect: overlapping curves (%g, %g) - (%g, %g)",
	      iV[0].x, iV[0].y, iV[3].x, iV[3].y);
    return;
  }

  std::vector<BezierPair> pairs;
  pairs.push_back(makePair(0.0, *this, 0.0, bez));
  double width = 1.0;
  for (int round = 0; round < BEZIER_ROUNDS; ++round) {
    std::vector<BezierPair> next;
    for (const auto &p : pairs) {
      bool keep = (round < BEZIER_CHORD_ROUND) ?
	p.iC1.controlBox().intersects(p.iC2.controlBox()) : chordsCross(p);
      if (!keep)
	continue;
      Bezier l1, r1, l2, r2;
      p.iC1.subdivide(l1, r1);
      p.iC2.subdivide(l2, r2);
      double half = 0.5 * width;
      next.push_back(makePair(p.iT1, l1, p.iT2, l2));
      next.push_back(makePair(p.iT1, l1, p.iT2 + half, r2));
      next.push_back(makePair(p.iT1 + half, r1, p.iT2, l2));
      next.push_back(makePair(p.iT1 + half, r1, p.iT2 + half, r2));
    }
    if (next.empty())
      return;
    pairs.swap(next);
    width *= 0.5;
  }

  for (const auto &p : pairs) {
    std::vector<Crossing> cross;
    chord(p.iC1).intersect(chord(p.iC2), cross);
    for (const auto &c : cross) {
      Crossing r = { p.iT1 + c.t1 * width, p.iT2 + c.t2 * width };
      result.push_back(r);
    }
  }
}

//! Compute self-intersections of the curve.
/*! Not implemented: nothing is appended. */
void Bezier::selfIntersect(std::vector<Crossing> &) const
{
  // nothing
}

//! Do the curves share a piece of positive length?
/*! End points of either curve lying within \a tolerance of the other
  curve determine the candidate shared piece.  The curves overlap if
  the pieces trimmed from both curves have the same inner control
  points within \a tolerance. */
bool Bezier::overlaps(const Bezier &bez, double tolerance) const
{
  Rect box1 = controlBox();
  box1.expand(tolerance);
  Rect box2 = bez.controlBox();
  box2.expand(tolerance);

  // own end points first, so that ties in iT1 keep them in front
  std::vector<EndMatch> matches;
  double t;
  for (int i = 0; i < 4; i += 3) {
    if (box2.contains(iV[i])) {
      Vector p = bez.closestPoint(iV[i], t);
      if ((p - iV[i]).len() < tolerance) {
	EndMatch m = { i == 0 ? 0.0 : 1.0, t };
	matches.push_back(m);
      }
    }
  }
  for (int i = 0; i < 4; i += 3) {
    if (box1.contains(bez.iV[i])) {
      Vector p = closestPoint(bez.iV[i], t);
      if ((p - bez.iV[i]).len() < tolerance) {
	EndMatch m = { t, i == 0 ? 0.0 : 1.0 };
	matches.push_back(m);
      }
    }
  }
  if (matches.size() < 2)
    return false;

  std::stable_sort(matches.begin(), matches.end(), lessT1);
  const EndMatch &first = matches.front();
  const EndMatch &last = matches.back();
  if (last.iT1 - first.iT1 < tolerance)
    return false;
  Bezier piece1 = trimmed(first.iT1, last.iT1);
  Bezier piece2 = bez.trimmed(first.iT2, last.iT2);
  return ((piece1.iV[1] - piece2.iV[1]).len() < tolerance &&
	  (piece1.iV[2] - piece2.iV[2]).len() < tolerance);
}

// --------------------------------------------------------------------

namespace {

  // A segment of a path taking part in an intersection query.
  struct Primitive {
    const Path *iPath;
    int iIndex;
    CurveSegment iSeg;
  };

  // Filter applied to primitives and results.
  struct Query {
    bool iFilter;
    double iMaxDistance;
    Vector iPoint;
  };

  void collectPrimitives(const std::vector<const Path *> &paths,
			 const Query &query, std::vector<Primitive> &prims)
  {
    for (const Path *path : paths) {
      for (int i = 0; i < path->countSegments(); ++i) {
	CurveSegment seg = path->segment(i);
	if (query.iFilter) {
	  Rect box = seg.controlBox();
	  box.expand(query.iMaxDistance);
	  if (!box.contains(query.iPoint))
	    continue;
	}
	Primitive p = { path, i, seg };
	prims.push_back(p);
      }
    }
  }

  void addIntersections(const Primitive &p1, const Primitive &p2,
			const std::vector<Crossing> &crossings,
			const Query &query, std::vector<Intersection> &result)
  {
    for (const auto &c : crossings) {
      double time1 = p1.iIndex + c.t1;
      double time2 = p2.iIndex + c.t2;
      if (p1.iPath == p2.iPath) {
	// adjacent segments meet in their common anchor
	if (time1 == time2)
	  continue;
	if (p1.iPath->closed()) {
	  double n = p1.iPath->countAnchors();
	  if ((time1 == 0.0 && time2 == n) || (time1 == n && time2 == 0.0))
	    continue;
	}
      }
      Intersection is;
      is.iPath1 = p1.iPath;
      is.iPath2 = p2.iPath;
      is.iTime1 = time1;
      is.iTime2 = time2;
      is.iPos = p1.iPath->positionAtTime(time1);
      is.iDistance = -1.0;
      if (query.iFilter) {
	is.iDistance = (is.iPos - query.iPoint).len();
	if (is.iDistance > query.iMaxDistance)
	  continue;
      }
      result.push_back(is);
    }
  }

  void intersectAll(const std::vector<const Path *> &paths,
		    const Query &query, std::vector<Intersection> &result)
  {
    std::vector<Primitive> prims;
    collectPrimitives(paths, query, prims);
    std::vector<Crossing> cross;
    for (uint i = 0; i < prims.size(); ++i) {
      const Primitive &p1 = prims[i];
      if (p1.iSeg.type() == CurveSegment::ECubic) {
	cross.clear();
	p1.iSeg.bezier().selfIntersect(cross);
	addIntersections(p1, p1, cross, query, result);
      }
      for (uint j = i + 1; j < prims.size(); ++j) {
	cross.clear();
	p1.iSeg.intersect(prims[j].iSeg, cross);
	addIntersections(p1, prims[j], cross, query, result);
      }
    }
  }

  void intersectPartitioned(const std::vector<const Path *> &paths1,
			    const std::vector<const Path *> &paths2,
			    const Query &query,
			    std::vector<Intersection> &result)
  {
    std::vector<Primitive> prims1, prims2;
    collectPrimitives(paths1, query, prims1);
    collectPrimitives(paths2, query, prims2);
    std::vector<Crossing> cross;
    for (const auto &p1 : prims1) {
      for (const auto &p2 : prims2) {
	cross.clear();
	p1.iSeg.intersect(p2.iSeg, cross);
	addIntersections(p1, p2, cross, query, result);
      }
    }
  }

  inline Query makeQuery(bool filter, double maxDistance, const Vector &point)
  {
    Query q;
    q.iFilter = filter;
    q.iMaxDistance = maxDistance;
    q.iPoint = point;
    return q;
  }
}

// --------------------------------------------------------------------

/*! \defgroup intersect Cusp Intersections
  \brief Crossings between the segments of a set of paths.
*/

//! Find all crossings between the segments of \a paths.
/*! Every segment is tested against all later segments, including the
  other segments of its own path.  The common anchors of adjacent
  segments of a path are not reported.  Results are appended to \a
  result, and iPath1 never comes after iPath2 in \a paths.
  \ingroup intersect
*/
void cusp::pathIntersections(const std::vector<const Path *> &paths,
			     std::vector<Intersection> &result)
{
  intersectAll(paths, makeQuery(false, 0.0, Vector::ZERO), result);
}

//! Find the crossings between the segments of \a paths near \a point.
/*! Only crossings at most \a maxDistance from \a point are reported,
  and their distance is recorded in the result.
  \ingroup intersect
*/
void cusp::pathIntersections(const std::vector<const Path *> &paths,
			     double maxDistance, const Vector &point,
			     std::vector<Intersection> &result)
{
  intersectAll(paths, makeQuery(true, maxDistance, point), result);
}

//! Find all crossings of a path in \a paths1 with a path in \a paths2.
/*! \ingroup intersect */
void cusp::partitionedPathIntersections(const std::vector<const Path *> &paths1,
					const std::vector<const Path *> &paths2,
					std::vector<Intersection> &result)
{
  intersectPartitioned(paths1, paths2, makeQuery(false, 0.0, Vector::ZERO),
		       result);
}

//! Find crossings of \a paths1 with \a paths2 at most \a maxDistance from \a point.
/*! \ingroup intersect */
void cusp::partitionedPathIntersections(const std::vector<const Path *> &paths1,
					const std::vector<const Path *> &paths2,
					double maxDistance, const Vector &point,
					std::vector<Intersection> &result)
{
  intersectPartitioned(paths1, paths2, makeQuery(true, maxDistance, point),
		       result);
}

// --------------------------------------------------------------------
