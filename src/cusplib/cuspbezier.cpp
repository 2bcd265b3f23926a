// --------------------------------------------------------------------
// Cubic Bezier curves
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

using namespace cusp;

// --------------------------------------------------------------------

/*! \class cusp::Bezier
  \ingroup geo
  \brief A cubic Bezier spline.

  The curve starts in iV[0] and ends in iV[3]; iV[1] and iV[2] are the
  inner control points.  The parameter t runs from 0.0 to 1.0.
*/

//! Return point on curve with parameter \a t (from 0.0 to 1.0).
/*! The end points are returned exactly for t = 0 and t = 1. */
Vector Bezier::point(double t) const
{
  if (t == 0.0)
    return iV[0];
  if (t == 1.0)
    return iV[3];
  double t1 = 1.0 - t;
  return t1 * t1 * t1 * iV[0] + 3 * t * t1 * t1 * iV[1] +
    3 * t * t * t1 * iV[2] + t * t * t * iV[3];
}

//! Return derivative of the curve at parameter \a t.
Vector Bezier::derivative(double t) const
{
  double t1 = 1.0 - t;
  return 3 * t1 * t1 * (iV[1] - iV[0]) + 6 * t1 * t * (iV[2] - iV[1])
    + 3 * t * t * (iV[3] - iV[2]);
}

//! Return the bounding box of the four control points.
/*! The curve lies inside this box. */
Rect Bezier::controlBox() const
{
  Rect box(iV[0], iV[1]);
  box.addPoint(iV[2]);
  box.addPoint(iV[3]);
  return box;
}

//! Subdivide this Bezier curve in the middle.
void Bezier::subdivide(Bezier &l, Bezier &r) const
{
  Vector h;
  l.iV[0] = iV[0];
  l.iV[1] = 0.5 * (iV[0] + iV[1]);
  h = 0.5 * (iV[1] + iV[2]);
  l.iV[2] = 0.5 * (l.iV[1] + h);
  r.iV[2] = 0.5 * (iV[2] + iV[3]);
  r.iV[1] = 0.5 * (h + r.iV[2]);
  r.iV[0] = 0.5 * (l.iV[2] + r.iV[1]);
  l.iV[3] = r.iV[0];
  r.iV[3] = iV[3];
}

//! Split the curve at parameter \a t.
/*! \a l covers the parameter range [0, t], \a r the range [t, 1]. */
void Bezier::split(double t, Bezier &l, Bezier &r) const
{
  Vector m = mix(iV[1], iV[2], t);
  l.iV[0] = iV[0];
  l.iV[1] = mix(iV[0], iV[1], t);
  l.iV[2] = mix(l.iV[1], m, t);
  r.iV[3] = iV[3];
  r.iV[2] = mix(iV[2], iV[3], t);
  r.iV[1] = mix(m, r.iV[2], t);
  l.iV[3] = mix(l.iV[2], r.iV[1], t);
  r.iV[0] = l.iV[3];
}

//! Return the piece of the curve between parameters \a start and \a end.
/*! If \a start is larger than \a end, the returned piece runs
  backwards, from point(start) to point(end). */
Bezier Bezier::trimmed(double start, double end) const
{
  if (start > end)
    return reversed().trimmed(1.0 - start, 1.0 - end);
  Bezier l, r;
  Bezier result = *this;
  if (start != 0.0) {
    result.split(start, l, r);
    result = r;
  }
  if (end != 1.0) {
    result.split((end - start) / (1.0 - start), l, r);
    result = l;
  }
  return result;
}

//! Return the same curve traversed in the opposite direction.
Bezier Bezier::reversed() const
{
  return Bezier(iV[3], iV[2], iV[1], iV[0]);
}

//! Do the control points agree within \a tolerance?
/*! The curves are also considered equal if one is the reversal of
  the other. */
bool Bezier::almostEqual(const Bezier &rhs, double tolerance) const
{
  bool forward = true;
  bool backward = true;
  for (int i = 0; i < 4; ++i) {
    if ((iV[i] - rhs.iV[i]).len() > tolerance)
      forward = false;
    if ((iV[i] - rhs.iV[3 - i]).len() > tolerance)
      backward = false;
  }
  return forward || backward;
}

// --------------------------------------------------------------------

namespace {
  const int GAUSS_ORDER = 24;

  // Nodes and weights of Gauss-Legendre quadrature on [-1, 1].
  struct GaussLegendre {
    GaussLegendre();
    double iX[GAUSS_ORDER];
    double iW[GAUSS_ORDER];
  };

  // Newton iteration on the Legendre polynomial P_n, starting from
  // the Chebyshev estimate of each root.
  GaussLegendre::GaussLegendre()
  {
    const int n = GAUSS_ORDER;
    for (int i = 0; i < (n + 1) / 2; ++i) {
      double z = cos(CuspPi * (i + 0.75) / (n + 0.5));
      double pp = 1.0;
      for (int iter = 0; iter < 100; ++iter) {
	double p1 = 1.0;
	double p2 = 0.0;
	for (int j = 1; j <= n; ++j) {
	  double p3 = p2;
	  p2 = p1;
	  p1 = ((2.0 * j - 1.0) * z * p2 - (j - 1.0) * p3) / j;
	}
	pp = n * (z * p1 - p2) / (z * z - 1.0);
	double z1 = z;
	z = z1 - p1 / pp;
	if (std::fabs(z - z1) < 1e-15)
	  break;
      }
      iX[i] = -z;
      iX[n - 1 - i] = z;
      iW[i] = iW[n - 1 - i] = 2.0 / ((1.0 - z * z) * pp * pp);
    }
  }

  const GaussLegendre &gaussLegendre()
  {
    static const GaussLegendre rule;
    return rule;
  }
}

//! Return the arc length of the curve.
/*! Uses 24-point Gauss-Legendre quadrature of the speed |B'(t)|. */
double Bezier::length() const
{
  const GaussLegendre &rule = gaussLegendre();
  double sum = 0.0;
  for (int i = 0; i < GAUSS_ORDER; ++i)
    sum += rule.iW[i] * derivative(0.5 * rule.iX[i] + 0.5).len();
  return 0.5 * sum;
}

//! Return the arc length of the piece of the curve from 0 to \a t.
double Bezier::length(double t) const
{
  if (t <= 0.0)
    return 0.0;
  if (t >= 1.0)
    return length();
  Bezier l, r;
  split(t, l, r);
  return l.length();
}

// --------------------------------------------------------------------

/* Closest point on a cubic, after Philip J. Schneider, "A Bezier
   Curve-Based Root-Finder", Graphics Gems (1990).  The squared
   distance from the query point is minimal where the derivative is
   orthogonal to the vector from the curve to the point.  That dot
   product is a polynomial of degree five, written as a Bezier curve
   whose x-coordinates are i/5, and its roots in [0,1] are found by
   recursive subdivision. */

namespace {
  const int W_DEGREE = 5;
  const int FIND_ROOTS_MAX_DEPTH = 64;
  const double FIND_ROOTS_EPSILON = ldexp(1.0, -FIND_ROOTS_MAX_DEPTH - 1);

  // Coefficients of the products of degree-2 and degree-3 Bernstein
  // polynomials, divided by the degree-5 binomial.
  const double Z[3][4] = {
    { 1.0, 0.6, 0.3, 0.1 },
    { 0.4, 0.6, 0.6, 0.4 },
    { 0.1, 0.3, 0.6, 1.0 },
  };

  void bernsteinForm(const Bezier &bez, const Vector &v, Vector *w)
  {
    Vector c[4];
    for (int i = 0; i < 4; ++i)
      c[i] = bez.iV[i] - v;
    for (int i = 0; i <= W_DEGREE; ++i)
      w[i] = Vector(double(i) / W_DEGREE, 0.0);
    for (int j = 0; j < 3; ++j) {
      Vector d = 3.0 * (bez.iV[j + 1] - bez.iV[j]);
      for (int i = 0; i < 4; ++i)
	w[i + j].y += dot(d, c[i]) * Z[j][i];
    }
  }

  int sign(double x)
  {
    return (x > 0) - (x < 0);
  }

  // Number of sign changes in the control polygon.  Zero counts as a
  // sign of its own.
  int zeroCrossingCount(const Vector *w)
  {
    int count = 0;
    int prev = sign(w[0].y);
    for (int i = 1; i <= W_DEGREE; ++i) {
      int s = sign(w[i].y);
      if (s != prev) {
	++count;
	prev = s;
      }
    }
    return count;
  }

  // Bounds the distance between the chord intercept and the intercept
  // of the polygon's bounding band (with the corrections of James Walker).
  bool flatEnough(const Vector *w)
  {
    double a = w[0].y - w[W_DEGREE].y;
    double b = w[W_DEGREE].x - w[0].x;
    double c = w[0].x * w[W_DEGREE].y - w[W_DEGREE].x * w[0].y;

    double above = 0.0;
    double below = 0.0;
    for (int i = 1; i < W_DEGREE; ++i) {
      double value = a * w[i].x + b * w[i].y + c;
      if (value > above)
	above = value;
      else if (value < below)
	below = value;
    }
    // intercepts of the band with the x-axis are (c - above) / -a
    // and (c - below) / -a
    if (a == 0.0)
      return false;
    double error = (above - below) / std::fabs(a);
    return error < FIND_ROOTS_EPSILON;
  }

  // Intersection of the chord from first to last control point with
  // the x-axis.
  double xIntercept(const Vector *w)
  {
    double dx = w[W_DEGREE].x - w[0].x;
    double dy = w[W_DEGREE].y - w[0].y;
    return (dx * w[0].y - dy * w[0].x) / -dy;
  }

  void splitHalf(const Vector *w, Vector *left, Vector *right)
  {
    Vector tri[W_DEGREE + 1][W_DEGREE + 1];
    for (int i = 0; i <= W_DEGREE; ++i)
      tri[0][i] = w[i];
    for (int j = 1; j <= W_DEGREE; ++j)
      for (int i = 0; i <= W_DEGREE - j; ++i)
	tri[j][i] = 0.5 * (tri[j - 1][i] + tri[j - 1][i + 1]);
    for (int j = 0; j <= W_DEGREE; ++j) {
      left[j] = tri[j][0];
      right[j] = tri[W_DEGREE - j][j];
    }
  }

  void findRoots(const Vector *w, int depth, std::vector<double> &roots)
  {
    int crossings = zeroCrossingCount(w);
    if (crossings == 0)
      return;
    if (depth >= FIND_ROOTS_MAX_DEPTH) {
      roots.push_back(0.5 * (w[0].x + w[W_DEGREE].x));
      return;
    }
    if (crossings == 1 && flatEnough(w)) {
      roots.push_back(xIntercept(w));
      return;
    }
    Vector left[W_DEGREE + 1], right[W_DEGREE + 1];
    splitHalf(w, left, right);
    findRoots(left, depth + 1, roots);
    findRoots(right, depth + 1, roots);
  }
}

//! Find the point on the curve closest to \a v.
/*! Returns the point and sets \a t to its parameter.  Ties between
  an interior candidate and the start point keep the start point,
  while the end point wins any tie. */
Vector Bezier::closestPoint(const Vector &v, double &t) const
{
  Vector w[W_DEGREE + 1];
  bernsteinForm(*this, v, w);
  std::vector<double> roots;
  findRoots(w, 0, roots);

  Vector pos = iV[0];
  double best = (v - iV[0]).sqLen();
  t = 0.0;
  for (double root : roots) {
    Vector p = point(root);
    double d = (v - p).sqLen();
    if (d < best) {
      best = d;
      pos = p;
      t = root;
    }
  }
  if ((v - iV[3]).sqLen() <= best) {
    pos = iV[3];
    t = 1.0;
  }
  return pos;
}

//! Find nearest point on Bezier spline.
/*! Find point on spline nearest to \a v, but only if
  it is closer than \a bound.
  If a point is found, sets \a t to the parameter value and
  \a pos to the actual point, and returns true. */
bool Bezier::snap(const Vector &v, double &t, Vector &pos, double &bound) const
{
  if (controlBox().certainClearance(v, bound))
    return false;
  double t1;
  Vector u = closestPoint(v, t1);
  double d = (v - u).len();
  if (d < bound) {
    t = t1;
    pos = u;
    bound = d;
    return true;
  }
  return false;
}

// --------------------------------------------------------------------
