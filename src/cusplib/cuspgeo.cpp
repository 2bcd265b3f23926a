// --------------------------------------------------------------------
// Cusp geometry primitives
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

/*! \defgroup geo Cusp Geometry
  \brief Geometric primitives for Cusp.

  The CuspGeo module provides the constant-size primitives the curve
  kernel is built from: vectors, axis-aligned rectangles, lines, line
  segments, linear and affine maps, and cubic Bezier curves.

*/

#include "cuspgeo.h"

using namespace cusp;

inline double sq(double x)
{
  return x * x;
}

// --------------------------------------------------------------------

/*! \class cusp::Angle
  \ingroup geo
  \brief A double that's an angle.

  An Angle is really nothing more than a double.  Having a separate
  type makes it clear whether a value is in radians or in degrees.
  Angles are always stored in radians.
*/

//! Normalize the value to the range lowlimit .. lowlimit + 2 pi.
/*! This Angle object is modified, a copy is returned. */
Angle Angle::normalize(double lowlimit)
{
  while (iAlpha >= lowlimit + CuspTwoPi)
    iAlpha -= CuspTwoPi;
  while (iAlpha < lowlimit)
    iAlpha += CuspTwoPi;
  return *this;
}

// --------------------------------------------------------------------

/*! \class cusp::Vector
  \ingroup geo
  \brief Two-dimensional vector.

  There is no difference between points and vectors.  Anchor handles
  are vectors relative to the anchor position, everything else is an
  absolute position.
*/

//! Construct a unit vector with this direction.
Vector::Vector(Angle alpha)
{
  x = cos(alpha);
  y = sin(alpha);
}

//! Return angle of the vector (with positive x-direction).
/*! The returned angle lies between -pi and +pi.
  Returns zero for the zero vector. */
Angle Vector::angle() const
{
  if (x == 0.0 && y == 0.0)
    return Angle(0.0);
  else
    return Angle(atan2(y, x));
}

//! The origin (zero vector).
Vector Vector::ZERO = Vector(0.0, 0.0);

//! Return Euclidean length.
double Vector::len() const
{
  return sqrt(sqLen());
}

//! Return this vector normalized (with length one).
/*! Normalizing the zero vector returns the vector (1,0). */
Vector Vector::normalized() const
{
  double len = sqLen();
  if (len == 1.0)
    return *this;
  if (len == 0.0)
    return Vector(1,0);
  return (1.0/sqrt(len)) * (*this);
}

//! Return this vector turned 90 degrees to the left.
Vector Vector::orthogonal() const
{
  return Vector(-y, x);
}

//! Return this vector rotated counterclockwise by \a alpha.
Vector Vector::rotated(Angle alpha) const
{
  double c = cos(alpha);
  double s = sin(alpha);
  return Vector(c * x - s * y, s * x + c * y);
}

//! Snap to nearby vertex.
/*! If distance between \a mouse and this vector is less than \a
  bound, set \a pos to this vector and \a bound to the distance, and
  return \c true. */
bool Vector::snap(const Vector &mouse, Vector &pos,
		  double &bound) const
{
  double d = (mouse - *this).len();
  if (d < bound) {
    pos = *this;
    bound = d;
    return true;
  }
  return false;
}

// --------------------------------------------------------------------

/*! \class cusp::Rect
  \ingroup geo
  \brief Axis-parallel rectangle (which can be empty)
*/

//! Create rectangle containing points \a c1 and \a c2.
Rect::Rect(const Vector &c1, const Vector &c2)
  : iMin(1,0), iMax(-1,0)
{
  addPoint(c1);
  addPoint(c2);
}

//! Does (closed) rectangle contain the point?
bool Rect::contains(const Vector &rhs) const
{
  // this correctly handles empty this
  return (iMin.x <= rhs.x && rhs.x <= iMax.x &&
	  iMin.y <= rhs.y && rhs.y <= iMax.y);
}

//! Does rectangle contain other rectangle?
bool Rect::contains(const Rect &rhs) const
{
  if (rhs.isEmpty()) return true;
  if (isEmpty()) return false;
  return (iMin.x <= rhs.iMin.x &&
	  rhs.iMax.x <= iMax.x &&
	  iMin.y <= rhs.iMin.y &&
	  rhs.iMax.y <= iMax.y);
}

//! Does rectangle intersect other rectangle?
/*! Rectangles that only touch along their boundary intersect. */
bool Rect::intersects(const Rect &rhs) const
{
  if (isEmpty() || rhs.isEmpty()) return false;
  return (iMin.x <= rhs.iMax.x && rhs.iMin.x <= iMax.x &&
	  iMin.y <= rhs.iMax.y && rhs.iMin.y <= iMax.y);
}

//! Enlarge rectangle to contain point.
void Rect::addPoint(const Vector &rhs)
{
  if (isEmpty()) {
    iMin = rhs; iMax = rhs;
  } else {
    if (rhs.x > iMax.x)
      iMax.x = rhs.x;
    else if (rhs.x < iMin.x)
      iMin.x = rhs.x;
    if (rhs.y > iMax.y)
      iMax.y = rhs.y;
    else if (rhs.y < iMin.y)
      iMin.y = rhs.y;
  }
}

//! Enlarge rectangle to contain rhs rectangle.
/*! Does nothing if \a rhs is empty. */
void Rect::addRect(const Rect &rhs)
{
  if (isEmpty()) {
    iMin = rhs.iMin; iMax = rhs.iMax;
  } else if (!rhs.isEmpty()) {
    if (rhs.iMax.x > iMax.x)
      iMax.x = rhs.iMax.x;
    if (rhs.iMin.x < iMin.x)
      iMin.x = rhs.iMin.x;
    if (rhs.iMax.y > iMax.y)
      iMax.y = rhs.iMax.y;
    if (rhs.iMin.y < iMin.y)
      iMin.y = rhs.iMin.y;
  }
}

//! Grow the rectangle by \a amount on every side.
/*! Does nothing if the rectangle is empty. */
void Rect::expand(double amount)
{
  if (isEmpty())
    return;
  iMin.x -= amount;
  iMin.y -= amount;
  iMax.x += amount;
  iMax.y += amount;
}

/*! Returns false if the distance between the box and v is smaller
  than \a bound.  Often returns true if their distance is larger than
  \a bound.
*/
bool Rect::certainClearance(const Vector &v, double bound) const
{
  return ((iMin.x - v.x) >= bound ||
	  (v.x - iMax.x) >= bound ||
	  (iMin.y - v.y) >= bound ||
	  (v.y - iMax.y) >= bound);
}

// --------------------------------------------------------------------

/*! \class cusp::Line
  \ingroup geo
  \brief A directed line.
*/

//! Construct a line from \a p with direction \a dir.
/*! Asserts unit length of \a dir. */
Line::Line(const Vector &p, const Vector &dir)
{
  assert(sq(dir.sqLen() - 1.0) < 1e-10);
  iP = p;
  iDir = dir;
}

//! Construct a line through two points.
Line Line::through(const Vector &p, const Vector &q)
{
  assert(q != p);
  return Line(p, (q - p).normalized());
}

//! Result is > 0, = 0, < 0 if point lies to the left, on, to the right.
double Line::side(const Vector &p) const
{
  return dot(normal(), p - iP);
}

// --------------------------------------------------------------------

/*! \class cusp::Segment
  \ingroup geo
  \brief A directed line segment.

  A segment is the straight primitive of the intersection engine.
  Its parameter runs from 0 at iP to 1 at iQ.
*/

/*! Returns distance between segment and point \a v,
  but may just return \a bound when its larger than \a bound. */
double Segment::distance(const Vector &v, double bound) const
{
  if (Rect(iP, iQ).certainClearance(v, bound))
    return bound;
  return distance(v);
}

/*! Returns distance between segment and point \a v */
double Segment::distance(const Vector &v) const
{
  return (v - point(closestTime(v))).len();
}

//! Parameter of the point on the segment closest to \a v.
/*! The result lies in [0, 1].  A degenerate segment returns 0. */
double Segment::closestTime(const Vector &v) const
{
  Vector dir = iQ - iP;
  double len = dir.sqLen();
  if (len == 0.0)
    return 0.0;
  return saturate(dot(v - iP, dir) / len);
}

/*! Snaps to nearest point on segment if within \a bound.
  Updates \a t, \a pos and \a bound in that case. */
bool Segment::snap(const Vector &mouse, double &t, Vector &pos,
		   double &bound) const
{
  double d = distance(mouse, bound);
  if (d >= bound)
    return false;
  t = closestTime(mouse);
  pos = point(t);
  bound = d;
  return true;
}

//! Compute intersection point. Return \c false if segs don't intersect.
bool Segment::intersects(const Segment &seg, Vector &pt) const
{
  std::vector<Crossing> cross;
  intersect(seg, cross);
  if (cross.empty())
    return false;
  pt = point(cross.front().t1);
  return true;
}

// --------------------------------------------------------------------

/*! \class cusp::Linear
  \ingroup geo
  \brief Linear transformation in the plane (2x2 matrix).
*/

//! Create identity matrix.
Linear::Linear()
{
  a[0] = a[3] = 1.0;
  a[1] = a[2] = 0.0;
}

//! Create matrix representing a rotation by angle.
Linear::Linear(Angle angle)
{
  a[0] = cos(angle);
  a[1] = sin(angle);
  a[2] = -a[1];
  a[3] = a[0];
}

//! Return inverse.
Linear Linear::inverse() const
{
  double t = determinant();
  assert(t != 0);
  t = 1.0/t;
  return Linear(a[3]*t, -a[1]*t, -a[2]*t, a[0]*t);
}

// --------------------------------------------------------------------

/*! \class cusp::Matrix
  \ingroup geo
  \brief Homogeneous transformation in the plane.

  The six coefficients (a, b, c, d, tx, ty) map the point (x, y) to
  (a x + c y + tx, b x + d y + ty).
*/

//! Create identity matrix.
Matrix::Matrix()
{
  a[0] = a[3] = 1.0;
  a[1] = a[2] = a[4] = a[5] = 0.0;
}

//! Return inverse.
Matrix Matrix::inverse() const
{
  double t = determinant();
  assert(t != 0);
  t = 1.0/t;
  return Matrix(a[3]*t, -a[1]*t, -a[2]*t, a[0]*t,
		(a[2]*a[5]-a[3]*a[4])*t, -(a[0]*a[5]-a[1]*a[4])*t);
}

//! Are all six coefficients finite?
bool Matrix::isValid() const
{
  for (int i = 0; i < 6; ++i) {
    if (!std::isfinite(a[i]))
      return false;
  }
  return true;
}

// --------------------------------------------------------------------
