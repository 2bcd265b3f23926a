// --------------------------------------------------------------------
// Anchors and paths
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

/*! \defgroup path Cusp Paths
  \brief Chains of cubic Bezier anchors.

  A path is a sequence of anchors, optionally closed.  Consecutive
  anchors are joined by a segment that is straight when the handles
  between them are zero, and a cubic Bezier curve otherwise.

  Positions along a path are addressed by a "time": the integer part
  is the index of the segment, the fractional part the parameter on
  that segment.
*/

#include "cusppath.h"
#include "cuspintersect.h"

#include <cmath>

using namespace cusp;

// --------------------------------------------------------------------

// Like Vector::normalized(), but the zero vector stays zero.
static inline Vector unit(const Vector &v)
{
  return v.isZero() ? v : v.normalized();
}

// --------------------------------------------------------------------

/*! \class cusp::Anchor
  \ingroup path
  \brief A vertex of a path with its two Bezier handles.

  The handles are stored relative to the position.  A zero handle
  means that the adjoining segment has no curvature on this side.
*/

//! Create an anchor with handles.
Anchor::Anchor(const Vector &position, const Vector &handleIn,
	       const Vector &handleOut)
  : iPosition(position), iHandleIn(handleIn), iHandleOut(handleOut)
{
  // nothing
}

//! Are position and both handles finite?
bool Anchor::isValid() const
{
  return iPosition.isFinite() && iHandleIn.isFinite()
    && iHandleOut.isFinite();
}

//! Do the two handles point in opposite directions?
/*! A smooth anchor has tangent handles.  Zero handles are never
  tangent, so an anchor without handles is a sharp corner. */
bool Anchor::hasTangentHandles(double tolerance) const
{
  return dot(unit(iHandleIn), unit(iHandleOut)) <= tolerance - 1.0;
}

//! Swap incoming and outgoing handle.
void Anchor::reverse()
{
  std::swap(iHandleIn, iHandleOut);
}

//! Transform position by \a m, and the handles by its linear part.
void Anchor::transform(const Matrix &m)
{
  Linear lin = m.linear();
  iPosition = m * iPosition;
  iHandleIn = lin * iHandleIn;
  iHandleOut = lin * iHandleOut;
}

//! Transform position and handles by the linear part of \a m.
void Anchor::transformLinear(const Matrix &m)
{
  Linear lin = m.linear();
  iPosition = lin * iPosition;
  iHandleIn = lin * iHandleIn;
  iHandleOut = lin * iHandleOut;
}

// --------------------------------------------------------------------

/*! \class cusp::CurveSegment
  \ingroup path
  \brief A segment of a Path.

  A segment joins two consecutive anchors of a path.  This is a
  lightweight object, created on the fly by Path::segment().  It
  refers to the anchors of the path, and becomes invalid when the
  path is modified.

  The type() is one of the following:

  - \c ELine: the outgoing handle of the first anchor and the incoming
    handle of the second anchor are zero, and the segment is the
    straight line between the two positions.

  - \c ECubic: a cubic Bezier curve whose control points are the
    first position, the first position plus its outgoing handle, the
    second position plus its incoming handle, and the second position.
*/

//! Create a segment from \a a1 to \a a2.
CurveSegment::CurveSegment(const Anchor &a1, const Anchor &a2)
  : iA1(&a1), iA2(&a2)
{
  iType = (a1.iHandleOut.isZero() && a2.iHandleIn.isZero()) ? ELine : ECubic;
}

//! Return the straight segment between the two positions.
Segment CurveSegment::line() const
{
  return Segment(iA1->iPosition, iA2->iPosition);
}

//! Return the segment as a Bezier curve.
/*! For an ELine segment the inner control points coincide with the
  end points. */
Bezier CurveSegment::bezier() const
{
  return Bezier(iA1->iPosition, iA1->iPosition + iA1->iHandleOut,
		iA2->iPosition + iA2->iHandleIn, iA2->iPosition);
}

//! Box containing all control points of the segment.
Rect CurveSegment::controlBox() const
{
  switch (type()) {
  case ELine:
    return Rect(iA1->iPosition, iA2->iPosition);
  case ECubic:
  default:
    return bezier().controlBox();
  }
}

//! Return point on the segment at parameter \a t.
Vector CurveSegment::point(double t) const
{
  switch (type()) {
  case ELine:
    return line().point(t);
  case ECubic:
  default:
    return bezier().point(t);
  }
}

//! Return derivative at parameter \a t.
/*! The derivative of a straight segment is its unit direction. */
Vector CurveSegment::derivative(double t) const
{
  switch (type()) {
  case ELine:
    return unit(iA2->iPosition - iA1->iPosition);
  case ECubic:
  default:
    return bezier().derivative(t);
  }
}

//! Return length of the segment.
double CurveSegment::length() const
{
  switch (type()) {
  case ELine:
    return (iA2->iPosition - iA1->iPosition).len();
  case ECubic:
  default:
    return bezier().length();
  }
}

//! Return length of the piece from parameter 0 to \a t.
double CurveSegment::length(double t) const
{
  switch (type()) {
  case ELine:
    return t * (iA2->iPosition - iA1->iPosition).len();
  case ECubic:
  default:
    return bezier().length(t);
  }
}

//! Snap to the point on the segment closest to \a mouse.
/*! Only succeeds if that point is closer than \a bound, and then
  updates \a t, \a pos and \a bound. */
bool CurveSegment::snap(const Vector &mouse, double &t, Vector &pos,
			double &bound) const
{
  switch (type()) {
  case ELine:
    return line().snap(mouse, t, pos, bound);
  case ECubic:
  default:
    return bezier().snap(mouse, t, pos, bound);
  }
}

//! Compute crossings of this segment with \a rhs.
/*! Crossings are appended to \a result, the first parameter of each
  refers to this segment. */
void CurveSegment::intersect(const CurveSegment &rhs,
			     std::vector<Crossing> &result) const
{
  if (type() == ELine) {
    if (rhs.type() == ELine)
      line().intersect(rhs.line(), result);
    else
      line().intersect(rhs.bezier(), result);
  } else {
    if (rhs.type() == ELine)
      bezier().intersect(rhs.line(), result);
    else
      bezier().intersect(rhs.bezier(), result);
  }
}

// --------------------------------------------------------------------

/*! \class cusp::Path
  \ingroup path
  \brief A sequence of anchors, optionally closed.

  A path with n anchors has n - 1 segments if it is open and n
  segments if it is closed, the last one joining the last anchor back
  to the first.  A path with fewer than two anchors has no segments.

  Paths are values: copying a path copies its anchors.  The mutating
  methods only modify the path they are called on.
*/

//! Create empty open path.
Path::Path()
  : iClosed(false)
{
  // nothing
}

//! Create path from anchors.
Path::Path(const std::vector<Anchor> &anchors, bool closed)
  : iAnchors(anchors), iClosed(closed)
{
  // nothing
}

//! Create a polygon through \a points.
Path Path::fromPoints(const std::vector<Vector> &points, bool closed)
{
  Path path;
  path.iClosed = closed;
  for (const auto &p : points)
    path.iAnchors.push_back(Anchor(p));
  return path;
}

//! Create a path from a flat list of Bezier control points.
/*! The list is p0, c1, c2, p1, c1, c2, p2, ...  When the path is
  closed, the final two control points are the handles of the closing
  segment.  A trailing incomplete segment of an open path ends in the
  last given point. */
Path Path::fromCubicBezierPoints(const std::vector<Vector> &points,
				 bool closed)
{
  Path path;
  path.iClosed = closed;
  int n = points.size();
  if (n == 0)
    return path;
  path.iAnchors.push_back(Anchor(points[0]));
  int i = 1;
  while (i < n) {
    Anchor &prev = path.iAnchors.back();
    prev.iHandleOut = points[i] - prev.iPosition;
    if (++i == n)
      break;
    Vector handleIn = points[i];
    if (++i == n) {
      if (closed) {
	Anchor &first = path.iAnchors.front();
	first.iHandleIn = handleIn - first.iPosition;
      } else
	path.iAnchors.push_back(Anchor(handleIn));
      break;
    }
    path.iAnchors.push_back(Anchor(points[i], handleIn - points[i],
				   Vector::ZERO));
    ++i;
  }
  return path;
}

//! Create the closed outline of \a rect, counterclockwise from bottom left.
Path Path::fromRect(const Rect &rect)
{
  std::vector<Vector> corners;
  corners.push_back(rect.bottomLeft());
  corners.push_back(rect.bottomRight());
  corners.push_back(rect.topRight());
  corners.push_back(rect.topLeft());
  return fromPoints(corners, true);
}

//! Create a circular arc approximated by cubic Bezier segments.
/*! The arc runs from \a startAngle to \a endAngle (counterclockwise if
  endAngle is larger).  Each Bezier segment spans at most 90 degrees,
  with handle length 4/3 tan(angle / 4) times the radius. */
Path Path::fromArc(const Vector &center, double radius,
		   Angle startAngle, Angle endAngle)
{
  double delta = double(endAngle) - double(startAngle);
  int numSegments = int(std::ceil(std::fabs(delta) / CuspHalfPi));
  double angle = numSegments > 0 ? delta / numSegments : 0.0;
  double f = 4.0 / 3.0 * std::tan(angle / 4.0);

  // unit circle arc starting at (1, 0)
  Path path;
  path.iAnchors.push_back(Anchor(Vector(1.0, 0.0)));
  for (int i = 0; i < numSegments; ++i) {
    Linear rot = Linear(Angle(i * angle));
    path.iAnchors.back().iHandleOut = rot * Vector(0.0, f);
    path.iAnchors.push_back(Anchor(rot * Vector(Angle(angle)),
				   rot * Vector(0.0, -f).rotated(angle),
				   Vector::ZERO));
  }
  path.transform(Matrix(center) * Matrix(Linear(startAngle))
		 * Matrix(Linear(radius, 0.0, 0.0, radius)));
  return path;
}

//! Are all anchors valid?
bool Path::isValid() const
{
  for (const auto &a : iAnchors) {
    if (!a.isValid())
      return false;
  }
  return true;
}

//! Number of segments.
int Path::countSegments() const
{
  int n = countAnchors();
  if (n < 2)
    return 0;
  return iClosed ? n : n - 1;
}

//! Return segment \a i.
/*! The segment refers to the anchors of this path, and is only valid
  as long as the path is not modified. */
CurveSegment Path::segment(int i) const
{
  assert(0 <= i && i < countSegments());
  int n = countAnchors();
  return CurveSegment(iAnchors[i], iAnchors[(i + 1) % n]);
}

//! Time of the end of the path.
/*! This is the number of anchors for a closed path, one less for an
  open path. */
double Path::finalTime() const
{
  int n = countAnchors();
  if (n == 0)
    return 0.0;
  return iClosed ? n : n - 1;
}

//! Bring \a time into the valid range of the path.
/*! Times on a closed path wrap around modulo the number of anchors,
  the result lies in [0, n).  Times on an open path are clamped to
  [0, n - 1]. */
double Path::normalizeTime(double time) const
{
  int n = countAnchors();
  if (n == 0)
    return 0.0;
  if (iClosed) {
    double t = std::fmod(time, double(n));
    if (t < 0.0)
      t += n;
    if (t >= n)
      t -= n;
    return t;
  }
  return clamp(time, 0.0, n - 1.0);
}

//! Return the point at \a time.
/*! The empty path returns the origin.  Integer times return the
  anchor position exactly. */
Vector Path::positionAtTime(double time) const
{
  int n = countAnchors();
  if (n == 0)
    return Vector::ZERO;
  if (n < 2)
    return iAnchors[0].iPosition;
  time = normalizeTime(time);
  int i = int(time);
  if (time == i)
    return iAnchors[i].iPosition;
  return segment(i).point(time - i);
}

//! Return the derivative at \a time.
/*! At an anchor this is the direction of the outgoing handle, or of
  the incoming handle at the end of an open path.  If that handle is
  zero, the direction towards the neighbouring control point is used.
  Paths with fewer than two anchors return the zero vector. */
Vector Path::derivativeAtTime(double time) const
{
  int n = countAnchors();
  if (n < 2)
    return Vector::ZERO;
  time = normalizeTime(time);
  int i = int(time);
  const Anchor &a = iAnchors[i];
  if (time == i) {
    if (!iClosed && i == n - 1) {
      if (a.iHandleIn.isZero()) {
	const Anchor &prev = iAnchors[i - 1];
	return unit(a.iPosition - (prev.iPosition + prev.iHandleOut));
      }
      return unit(-a.iHandleIn);
    }
    if (a.iHandleOut.isZero()) {
      const Anchor &next = iAnchors[(i + 1) % n];
      return unit(next.iPosition + next.iHandleIn - a.iPosition);
    }
    return unit(a.iHandleOut);
  }
  return segment(i).derivative(time - i);
}

//! Return the unit tangent at \a time (zero where the derivative vanishes).
Vector Path::tangentAtTime(double time) const
{
  return unit(derivativeAtTime(time));
}

//! Return the tangent at \a time turned 90 degrees to the left.
Vector Path::normalAtTime(double time) const
{
  return tangentAtTime(time).orthogonal();
}

// --------------------------------------------------------------------

//! Return the length of the path.
double Path::length() const
{
  double len = 0.0;
  for (int i = 0; i < countSegments(); ++i)
    len += segment(i).length();
  return len;
}

//! Return the time at arc length \a distance from the start.
/*! On a cubic segment the time is interpolated linearly in a table of
  100 samples along the curve.  Distances beyond the length of the
  path return finalTime(). */
double Path::timeAtDistance(double distance) const
{
  const int LUT_COUNT = 100;
  const double LUT_STEP = 1.0 / (LUT_COUNT - 1);

  if (distance <= 0.0)
    return 0.0;
  double len = 0.0;
  for (int i = 0; i < countSegments(); ++i) {
    CurveSegment seg = segment(i);
    double segLength = seg.length();
    if (len + segLength > distance) {
      if (seg.type() == CurveSegment::ELine)
	return i + (distance - len) / segLength;
      Bezier bez = seg.bezier();
      Vector prev = bez.iV[0];
      for (int k = 1; k < LUT_COUNT; ++k) {
	Vector cur = bez.point(k * LUT_STEP);
	double d = (cur - prev).len();
	if (len + d > distance)
	  return i + (k - 1 + (distance - len) / d) * LUT_STEP;
	len += d;
	prev = cur;
      }
      // chords are shorter than the curve
      return i + 1.0;
    }
    len += segLength;
  }
  return finalTime();
}

//! Return the arc length from the start to \a time.
double Path::distanceAtTime(double time) const
{
  if (time <= 0.0 || countSegments() == 0)
    return 0.0;
  if (time >= finalTime())
    return length();
  int index = int(time);
  double distance = 0.0;
  for (int i = 0; i < index; ++i)
    distance += segment(i).length();
  double t = time - index;
  if (t > 0.0)
    distance += segment(index).length(t);
  return distance;
}

// --------------------------------------------------------------------

//! Insert an anchor at \a time without changing the shape of the path.
/*! Returns the index of the anchor at \a time.  If \a time is an
  integer, this is the existing anchor and nothing is inserted.  On a
  cubic segment the handles of both neighbours are shortened to the
  de Casteljau split of the curve.  Returns -1 if the path has fewer
  than two anchors. */
int Path::insertAnchorAtTime(double time)
{
  int n = countAnchors();
  if (n < 2)
    return -1;
  time = normalizeTime(time);
  int i1 = int(time);
  if (time == i1)
    return i1 % n;
  double t = time - i1;
  int i2 = (i1 + 1) % n;

  CurveSegment seg = segment(i1);
  Anchor anchor;
  if (seg.type() == CurveSegment::ELine) {
    anchor.iPosition = seg.line().point(t);
  } else {
    Bezier l, r;
    seg.bezier().split(t, l, r);
    iAnchors[i1].iHandleOut = l.iV[1] - iAnchors[i1].iPosition;
    iAnchors[i2].iHandleIn = r.iV[2] - iAnchors[i2].iPosition;
    anchor = Anchor(r.iV[0], l.iV[2] - r.iV[0], r.iV[1] - r.iV[0]);
  }
  iAnchors.insert(iAnchors.begin() + i1 + 1, anchor);
  return i1 + 1;
}

//! Split the path at anchor \a index.
/*! A closed path is opened in place: the anchors are rotated so that
  \a index comes first, a copy of it is appended, and the single
  resulting path is returned.  An open path is left unchanged, and two
  new paths are returned that share a copy of the anchor.  An invalid
  index returns a copy of the path. */
std::vector<Path> Path::splitAtAnchor(int index)
{
  std::vector<Path> result;
  int n = countAnchors();
  if (index < 0 || index >= n) {
    result.push_back(*this);
    return result;
  }
  if (iClosed) {
    std::rotate(iAnchors.begin(), iAnchors.begin() + index, iAnchors.end());
    iAnchors.push_back(iAnchors.front());
    iClosed = false;
    result.push_back(*this);
  } else {
    std::vector<Anchor> first(iAnchors.begin(), iAnchors.begin() + index);
    std::vector<Anchor> second(iAnchors.begin() + index, iAnchors.end());
    first.push_back(second.front());
    result.push_back(Path(first));
    result.push_back(Path(second));
  }
  return result;
}

//! Insert an anchor at \a time and split the path there.
std::vector<Path> Path::splitAtTime(double time)
{
  int index = insertAnchorAtTime(time);
  if (index < 0)
    return std::vector<Path>(1, *this);
  return splitAtAnchor(index);
}

// --------------------------------------------------------------------

// Point at distance d from the path, to the left of it for positive d.
static Vector offsetAtTime(const Path &path, double time, double d)
{
  return path.positionAtTime(time) + d * path.normalAtTime(time);
}

//! Find a fillet of \a radius at the corner in anchor \a index.
/*! The offset curves at distance \a radius on both sides of the
  corner are sampled in 100 steps per segment.  The first crossing of
  the offset before the corner with the offset after the corner is
  the center of the fillet.  The left side (-1) is searched first.

  Returns false if \a radius is not positive, \a index is invalid or
  an end of an open path, or no crossing was found. */
bool Path::roundCornerInfoAtAnchor(int index, double radius,
				   RoundCornerInfo &info) const
{
  if (radius <= 0.0)
    return false;
  int n = countAnchors();
  if (index < 0 || index >= n)
    return false;
  if (!iClosed && (index == 0 || index == n - 1))
    return false;

  const int NUM_STEPS = 100;
  const double step = 1.0 / NUM_STEPS;
  const double time = index;
  const int signs[2] = { -1, 1 };

  for (int sign : signs) {
    std::vector<Vector> before(NUM_STEPS);
    for (int i = 1; i < NUM_STEPS; ++i)
      before[i] = offsetAtTime(*this, time - i * step, sign * radius);
    Vector prev;
    for (int j = 1; j < NUM_STEPS; ++j) {
      Vector cur = offsetAtTime(*this, time + j * step, sign * radius);
      if (j > 1) {
	Segment after(prev, cur);
	for (int i = 2; i < NUM_STEPS; ++i) {
	  Vector center;
	  if (!Segment(before[i - 1], before[i]).intersects(after, center))
	    continue;
	  info.iCenter = center;
	  info.iTime1 = time - (i - 1) * step;
	  info.iTime2 = time + (j - 1) * step;
	  info.iPoint1 = positionAtTime(info.iTime1);
	  info.iPoint2 = positionAtTime(info.iTime2);
	  info.iSign = sign;
	  Angle start = (info.iPoint1 - center).angle();
	  Angle end = (info.iPoint2 - center).angle();
	  // the arc turns counterclockwise on one side, clockwise on the other
	  if (sign == 1)
	    end.normalize(start);
	  else
	    start.normalize(end);
	  info.iStartAngle = start;
	  info.iEndAngle = end;
	  return true;
	}
      }
      prev = cur;
    }
  }
  cuspDebug("Path::roundCornerInfoAtAnchor: no fillet of radius %g at anchor %d",
	    radius, index);
  return false;
}

//! Replace the corner at anchor \a index by a circular arc of \a radius.
/*! Anchors are inserted where the fillet touches the path, and the
  corner anchor is replaced by the inner anchors of the arc.  Returns
  false and leaves the path unchanged if no fillet was found. */
bool Path::roundCornerAtAnchor(int index, double radius)
{
  RoundCornerInfo info;
  if (!roundCornerInfoAtAnchor(index, radius, info))
    return false;

  double time1 = normalizeTime(info.iTime1);
  double time2 = normalizeTime(info.iTime2);

  // insert the later anchor first, then fix the index that moved
  int index1, index2;
  if (time1 > time2) {
    index1 = insertAnchorAtTime(time1);
    int count = countAnchors();
    index2 = insertAnchorAtTime(time2);
    if (countAnchors() > count && index1 >= index2)
      ++index1;
  } else {
    index2 = insertAnchorAtTime(time2);
    int count = countAnchors();
    index1 = insertAnchorAtTime(time1);
    if (countAnchors() > count && index2 >= index1)
      ++index2;
  }

  Path arc = fromArc(info.iCenter, radius, info.iStartAngle, info.iEndAngle);
  iAnchors[index1].iHandleOut = arc.iAnchors.front().iHandleOut;
  iAnchors[index2].iHandleIn = arc.iAnchors.back().iHandleIn;
  iAnchors.erase(iAnchors.begin() + index2 - 1);
  iAnchors.insert(iAnchors.begin() + index2 - 1,
		  arc.iAnchors.begin() + 1, arc.iAnchors.end() - 1);
  return true;
}

// --------------------------------------------------------------------

// Append anchor to the current edge, and start a new edge at a
// sharp corner.
static void addEdgeAnchor(const Anchor &a, std::vector<Anchor> &edge,
			  std::vector<Path> &edges)
{
  edge.push_back(a);
  if (edge.size() >= 2 && !a.hasTangentHandles()) {
    edges.push_back(Path(edge));
    edge.assign(1, a);
  }
}

//! Split the path into open paths at its sharp corners.
/*! A closed path without sharp corners is returned as a single closed
  edge. */
std::vector<Path> Path::edges() const
{
  std::vector<Path> result;
  int n = countAnchors();
  if (n < 2)
    return result;

  int start = 0;
  if (iClosed) {
    while (start < n && iAnchors[start].hasTangentHandles())
      ++start;
    if (start == n) {
      result.push_back(Path(iAnchors, true));
      return result;
    }
  }

  std::vector<Anchor> edge;
  for (int i = start; i < n; ++i)
    addEdgeAnchor(iAnchors[i], edge, result);
  if (start > 0) {
    for (int i = 0; i <= start; ++i)
      addEdgeAnchor(iAnchors[i], edge, result);
  } else if (iClosed)
    edge.push_back(iAnchors[0]);
  if (edge.size() > 1)
    result.push_back(Path(edge));
  return result;
}

//! Replace the path by a polygon whose edges are at most \a maxSegmentLength long.
/*! Each segment is divided into pieces of equal arc length.  Does
  nothing if \a maxSegmentLength is not positive. */
void Path::polygonize(double maxSegmentLength)
{
  if (maxSegmentLength <= 0.0 || countAnchors() < 2)
    return;
  std::vector<Anchor> result;
  for (int i = 0; i < countSegments(); ++i) {
    std::vector<Anchor> ends;
    ends.push_back(iAnchors[i]);
    ends.push_back(iAnchors[(i + 1) % countAnchors()]);
    Path seg(ends);
    double len = seg.length();
    int divisions = max(1, int(std::ceil(len / maxSegmentLength)));
    double step = len / divisions;
    for (int k = 0; k < divisions; ++k) {
      double t = seg.timeAtDistance(k * step);
      result.push_back(Anchor(seg.positionAtTime(t)));
    }
  }
  if (!iClosed)
    result.push_back(Anchor(iAnchors.back().iPosition));
  iAnchors.swap(result);
}

//! Reverse the direction of the path.
void Path::reverse()
{
  for (auto &a : iAnchors)
    a.reverse();
  std::reverse(iAnchors.begin(), iAnchors.end());
}

//! Transform all anchors by \a m.
void Path::transform(const Matrix &m)
{
  for (auto &a : iAnchors)
    a.transform(m);
}

//! Return box containing all anchors and the handles of all segments.
/*! The box contains the path, but is usually larger than necessary.
  The empty path returns an empty box. */
Rect Path::looseBoundingBox() const
{
  Rect box;
  int n = countAnchors();
  if (n == 0)
    return box;
  const Anchor &first = iAnchors[0];
  box.addPoint(first.iPosition);
  if (n == 1)
    return box;
  box.addPoint(first.iPosition + first.iHandleOut);
  if (iClosed)
    box.addPoint(first.iPosition + first.iHandleIn);
  for (int i = 1; i < n - 1; ++i) {
    const Anchor &a = iAnchors[i];
    box.addPoint(a.iPosition);
    box.addPoint(a.iPosition + a.iHandleIn);
    box.addPoint(a.iPosition + a.iHandleOut);
  }
  const Anchor &last = iAnchors[n - 1];
  box.addPoint(last.iPosition);
  box.addPoint(last.iPosition + last.iHandleIn);
  if (iClosed)
    box.addPoint(last.iPosition + last.iHandleOut);
  return box;
}

//! Does the outline of \a rect cross the path?
bool Path::isIntersectedByRect(const Rect &rect) const
{
  if (!looseBoundingBox().intersects(rect))
    return false;
  Path outline = fromRect(rect);
  std::vector<const Path *> paths1(1, this);
  std::vector<const Path *> paths2(1, &outline);
  std::vector<Intersection> result;
  partitionedPathIntersections(paths1, paths2, result);
  return !result.empty();
}

//! Find the point on the path nearest to \a mouse.
/*! Only points closer than \a bound are considered.  If one is found,
  sets \a time and \a pos to it, \a bound to its distance, and
  returns true. */
bool Path::snap(const Vector &mouse, double &time, Vector &pos,
		double &bound) const
{
  int n = countAnchors();
  if (n == 0)
    return false;
  if (n == 1) {
    if (!iAnchors[0].iPosition.snap(mouse, pos, bound))
      return false;
    time = 0.0;
    return true;
  }
  bool found = false;
  for (int i = 0; i < countSegments(); ++i) {
    double t;
    if (segment(i).snap(mouse, t, pos, bound)) {
      time = i + t;
      found = true;
    }
  }
  return found;
}

// --------------------------------------------------------------------
