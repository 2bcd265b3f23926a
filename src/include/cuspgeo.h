// -*- C++ -*-
// --------------------------------------------------------------------
// Geometric primitives
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

#ifndef CUSPGEO_H
#define CUSPGEO_H

#include "cuspbase.h"

#include <cmath>

// --------------------------------------------------------------------

namespace cusp {

  //! Returns the maximum of two values.
  /*! \ingroup base */
  template<class T>
  inline T max(const T &lhs, const T &rhs)
  {
    return (lhs > rhs) ? lhs : rhs;
  }

  //! Returns the minimum of two values.
  /*! \ingroup base */
  template<class T>
  inline T min(const T &lhs, const T &rhs)
  {
    return (lhs < rhs) ? lhs : rhs;
  }

  //! Clamp \a x to the interval [lo, hi].
  /*! \ingroup base */
  inline double clamp(double x, double lo, double hi)
  {
    return x < lo ? lo : (x > hi ? hi : x);
  }

  //! Clamp \a x to the interval [0, 1].
  /*! \ingroup base */
  inline double saturate(double x)
  {
    return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
  }

  // --------------------------------------------------------------------

  const double CuspPi = 3.14159265358979323846;
  const double CuspHalfPi = 1.57079632679489661923;
  const double CuspTwoPi = 6.28318530717958647693;

  class Angle {
  public:
    //! Construct a zero angle.
    inline explicit Angle() : iAlpha(0.0) { /* nothing */ }
    //! Construct an angle (in radians).
    inline Angle(double alpha) : iAlpha(alpha) { /* nothing */ }
    //! Construct an angle in degrees.
    inline static Angle Degrees(double alpha) {
      return Angle(alpha * CuspPi / 180.0); }
    //! Convert an angle to a double.
    inline operator double() const { return iAlpha; }

    Angle normalize(double lowlimit);

  private:
    double iAlpha;
  };

  // --------------------------------------------------------------------

  class Vector {
  public:
    //! The zero vector.
    Vector() : x(0.0), y(0.0) { /* nothing */ }
    explicit Vector(Angle alpha);
    //! Construct a vector.
    explicit Vector(double x0, double y0) : x(x0), y(y0) { /* nothing */ }
    inline double sqLen() const;
    double len() const;
    Angle angle() const;
    Vector normalized() const;
    Vector orthogonal() const;
    Vector rotated(Angle alpha) const;
    bool snap(const Vector &mouse, Vector &pos, double &bound) const;
    //! Is this exactly the zero vector?
    inline bool isZero() const { return x == 0.0 && y == 0.0; }
    //! Are both coordinates finite?
    inline bool isFinite() const {
      return std::isfinite(x) && std::isfinite(y); }

    inline bool operator==(const Vector &rhs) const;
    inline bool operator!=(const Vector &rhs) const;
    inline void operator+=(const Vector &rhs);
    inline void operator-=(const Vector &rhs);
    inline void operator*=(double rhs);
    inline Vector operator+(const Vector &rhs) const;
    inline Vector operator-(const Vector &rhs) const;
    inline Vector operator*(double rhs) const;
    inline Vector operator-() const;

    static Vector ZERO;

  public:
    double x; //!< Coordinates are public.
    double y; //!< Coordinates are public.
  };

  inline Vector operator*(double lhs, const Vector &rhs);
  inline double dot(const Vector &lhs, const Vector &rhs);
  inline double cross(const Vector &lhs, const Vector &rhs);
  inline Vector mix(const Vector &p, const Vector &q, double t);

  // --------------------------------------------------------------------

  class Rect {
  public:
    //! Create empty rectangle.
    explicit Rect() : iMin(1,0), iMax(-1,0) { /* nothing */ }
    //! Create rectangle containing just the point \a c.
    explicit Rect(const Vector &c) : iMin(c), iMax(c) { /* nothing */ }
    explicit Rect(const Vector &c1, const Vector &c2);

    void addPoint(const Vector &rhs);
    void addRect(const Rect &rhs);
    void expand(double amount);
    bool contains(const Vector &rhs) const;
    bool contains(const Rect &rhs) const;
    bool certainClearance(const Vector &v, double bound) const;
    bool intersects(const Rect &rhs) const;

    //! True if rectangle is empty.
    int isEmpty() const { return iMin.x > iMax.x; }
    //! Return top right corner.
    inline Vector topRight() const { return iMax; }
    //! Return bottom left corner.
    inline Vector bottomLeft() const { return iMin; }
    //! Return top left corner.
    inline Vector topLeft() const { return Vector(iMin.x, iMax.y); }
    //! Return bottom right corner.
    inline Vector bottomRight() const { return Vector(iMax.x, iMin.y); }
    //! Return center of rectangle.
    inline Vector center() const { return 0.5 * (iMin + iMax); }
    //! Return width.
    double width() const { return iMax.x - iMin.x; }
    //! Return height.
    double height() const { return iMax.y - iMin.y; }

  private:
    Vector iMin; //!< Lower-left corner.
    Vector iMax; //!< Upper-right corner.
  };

  // --------------------------------------------------------------------

  class Line {
  public:
    //! Create default line (x-axis).
    explicit Line() : iP(0.0, 0.0), iDir(1.0, 0.0) { /* nothing */ }
    explicit Line(const Vector &p, const Vector &dir);
    static Line through(const Vector &p, const Vector &q);
    double side(const Vector &p) const;
    //! Return direction of line.
    inline Vector dir() const { return iDir; }
    //! Return normal vector pointing to the left of the directed line.
    inline Vector normal() const { return Vector(-iDir.y, iDir.x); }

  public:
    //! Point on the line.
    Vector iP;
  private:
    Vector iDir; // unit direction
  };

  // --------------------------------------------------------------------

  class Bezier;

  //! A pair of curve parameters at which two primitives cross.
  /*! \ingroup geo */
  struct Crossing {
    double t1; //!< Parameter on the first primitive.
    double t2; //!< Parameter on the second primitive.
  };

  class Segment {
  public:
    //! Create uninitialized segment
    Segment() { /* nothing */ }
    //! Create a segment
    explicit Segment(const Vector &p0, const Vector &q0)
      : iP(p0), iQ(q0) { /* nothing */ }

    //! Return directed line supporting the segment.
    inline Line line() const { return Line::through(iP, iQ); }
    //! Return point on the segment with parameter \a t.
    inline Vector point(double t) const { return mix(iP, iQ, t); }
    //! Is the segment just a point?
    inline bool degenerate() const { return iP == iQ; }

    double distance(const Vector &v, double bound) const;
    double distance(const Vector &v) const;
    double closestTime(const Vector &v) const;
    bool snap(const Vector &mouse, double &t, Vector &pos,
	      double &bound) const;
    bool intersects(const Segment &seg, Vector &pt) const;

    void intersect(const Segment &seg, std::vector<Crossing> &result) const;
    void intersect(const Bezier &bez, std::vector<Crossing> &result) const;

  public:
    //! First endpoint.
    Vector iP;
    //! Second endpoint.
    Vector iQ;
  };

  // --------------------------------------------------------------------

  class Linear {
  public:
    Linear();
    explicit Linear(Angle angle);
    inline explicit Linear(double m11, double m21, double m12, double m22);

    Linear inverse() const;
    inline bool isIdentity() const;
    inline Vector operator*(const Vector &rhs) const;
    inline bool operator==(const Linear &rhs) const;
    inline double determinant() const;

  public:
    double a[4];
  };

  // --------------------------------------------------------------------

  class Matrix {
  public:
    Matrix();
    inline Matrix(const Linear &linear);
    inline explicit Matrix(const Linear &linear, const Vector &t);
    inline explicit Matrix(double m11, double m21, double m12, double m22,
			   double t1, double t2);
    inline explicit Matrix(const Vector &v);

    Matrix inverse() const;
    inline bool isInvertible() const;
    bool isValid() const;
    inline Vector operator*(const Vector &rhs) const;
    inline Bezier operator*(const Bezier &rhs) const;
    inline Vector translation() const;
    inline Linear linear() const;
    inline double determinant() const;
    inline bool isIdentity() const;
    inline bool operator==(const Matrix &rhs) const;

  public:
    double a[6];
  };

  // --------------------------------------------------------------------

  class Bezier {
  public:
    //! Default constructor, uninitialized curve.
    inline Bezier() { /* nothing */ }
    inline Bezier(const Vector &p0, const Vector &p1,
		  const Vector &p2, const Vector &p3);

    Vector point(double t) const;
    Vector derivative(double t) const;
    Rect controlBox() const;
    void subdivide(Bezier &l, Bezier &r) const;
    void split(double t, Bezier &l, Bezier &r) const;
    Bezier trimmed(double start, double end) const;
    Bezier reversed() const;
    bool almostEqual(const Bezier &rhs, double tolerance) const;

    double length() const;
    double length(double t) const;

    Vector closestPoint(const Vector &v, double &t) const;
    bool snap(const Vector &v, double &t, Vector &pos, double &bound) const;

    void intersect(const Segment &seg, std::vector<Crossing> &result) const;
    void intersect(const Bezier &bez, std::vector<Crossing> &result) const;
    void selfIntersect(std::vector<Crossing> &result) const;
    bool overlaps(const Bezier &bez, double tolerance) const;

    inline bool operator==(const Bezier &rhs) const;

  public:
    Vector iV[4];
  };

  // --------------------------------------------------------------------

  //! Return square of Euclidean length
  inline double Vector::sqLen() const
  {
    return (x * x + y * y);
  }

  //! Equality.
  inline bool Vector::operator==(const Vector &rhs) const
  {
    return x == rhs.x && y == rhs.y;
  }

  //! Inequality.
  inline bool Vector::operator!=(const Vector &rhs) const
  {
    return x != rhs.x || y != rhs.y;
  }

  //! Vector-addition.
  inline void Vector::operator+=(const Vector &rhs)
  {
    x += rhs.x; y += rhs.y;
  }

  //! Vector-subtraction.
  inline void Vector::operator-=(const Vector &rhs)
  {
    x -= rhs.x; y -= rhs.y;
  }

  //! Multiply vector by scalar.
  inline void Vector::operator*=(double rhs)
  {
    x *= rhs; y *= rhs;
  }

  //! Vector-addition.
  inline Vector Vector::operator+(const Vector &rhs) const
  {
    Vector result = *this; result += rhs; return result;
  }

  //! Vector-subtraction.
  inline Vector Vector::operator-(const Vector &rhs) const
  {
    Vector result = *this; result -= rhs; return result;
  }

  //! Vector * scalar.
  inline Vector Vector::operator*(double rhs) const
  {
    Vector result = *this; result *= rhs; return result;
  }

  //! Unary minus for Vector.
  inline Vector Vector::operator-() const
  {
    return -1 * *this;
  }

  //! Scalar * vector. \relates Vector
  inline Vector operator*(double lhs, const Vector &rhs)
  {
    return Vector(lhs * rhs.x, lhs * rhs.y);
  }

  //! Dotproduct of two vectors. \relates Vector
  inline double dot(const Vector &lhs, const Vector &rhs)
  {
    return lhs.x * rhs.x + lhs.y * rhs.y;
  }

  //! Signed area of the parallelogram spanned by two vectors. \relates Vector
  inline double cross(const Vector &lhs, const Vector &rhs)
  {
    return lhs.x * rhs.y - lhs.y * rhs.x;
  }

  //! Linear interpolation from \a p (t = 0) to \a q (t = 1). \relates Vector
  inline Vector mix(const Vector &p, const Vector &q, double t)
  {
    return Vector(p.x + (q.x - p.x) * t, p.y + (q.y - p.y) * t);
  }

  // --------------------------------------------------------------------

  //! Create matrix with given coefficients.
  inline Linear::Linear(double m11, double m21, double m12, double m22)
  {
    a[0] = m11;
    a[1] = m21;
    a[2] = m12;
    a[3] = m22;
  }

  //! Linear matrix times vector.
  inline Vector Linear::operator*(const Vector &rhs) const
  {
    return Vector(a[0] * rhs.x + a[2] * rhs.y,
		  a[1] * rhs.x + a[3] * rhs.y);
  }

  //! Is this the identity matrix?
  inline bool Linear::isIdentity() const
  {
    return (a[0] == 1.0 && a[1] == 0.0 && a[2] == 0.0 && a[3] == 1.0);
  }

  //! Linear matrix multiplication.
  inline Linear operator*(const Linear &a1, const Linear &a2)
  {
    return Linear(a1.a[0] * a2.a[0] +  a1.a[2] * a2.a[1],
		  a1.a[1] * a2.a[0] +  a1.a[3] * a2.a[1],
		  a1.a[0] * a2.a[2] +  a1.a[2] * a2.a[3],
		  a1.a[1] * a2.a[2] +  a1.a[3] * a2.a[3]);
  }

  //! Check for equality of two linear matrices.
  inline bool Linear::operator==(const Linear &rhs) const
  {
    return (a[0] == rhs.a[0] && a[1] == rhs.a[1] &&
	    a[2] == rhs.a[2] && a[3] == rhs.a[3]);
  }

  //! Return determinant of a linear matrix.
  inline double Linear::determinant() const
  {
    return (a[0] * a[3] - a[1] * a[2]);
  }

  // --------------------------------------------------------------------

  //! Create matrix with given coefficients.
  inline Matrix::Matrix(double m11, double m21, double m12, double m22,
			double t1, double t2)
  {
    a[0] = m11;
    a[1] = m21;
    a[2] = m12;
    a[3] = m22;
    a[4] = t1;
    a[5] = t2;
  }

  //! Create linear matrix.
  inline Matrix::Matrix(const Linear &linear)
  {
    a[0] = linear.a[0];
    a[1] = linear.a[1];
    a[2] = linear.a[2];
    a[3] = linear.a[3];
    a[4] = a[5] = 0.0;
  }

  //! Create linear map followed by translation by \a t.
  inline Matrix::Matrix(const Linear &linear, const Vector &t)
  {
    a[0] = linear.a[0];
    a[1] = linear.a[1];
    a[2] = linear.a[2];
    a[3] = linear.a[3];
    a[4] = t.x;
    a[5] = t.y;
  }

  //! Matrix translating by \a v.
  inline Matrix::Matrix(const Vector &v)
  {
    a[0] = a[3] = 1.0;
    a[1] = a[2] = 0.0;
    a[4] = v.x;
    a[5] = v.y;
  }

  //! Matrix multiplication.
  inline Matrix operator*(const Matrix &a1, const Matrix &a2)
  {
    return Matrix(a1.a[0] * a2.a[0] + a1.a[2] * a2.a[1],
		  a1.a[1] * a2.a[0] + a1.a[3] * a2.a[1],
		  a1.a[0] * a2.a[2] + a1.a[2] * a2.a[3],
		  a1.a[1] * a2.a[2] + a1.a[3] * a2.a[3],
		  a1.a[0] * a2.a[4] + a1.a[2] * a2.a[5] + a1.a[4],
		  a1.a[1] * a2.a[4] + a1.a[3] * a2.a[5] + a1.a[5]);
  }

  //! Matrix times vector.
  inline Vector Matrix::operator*(const Vector &rhs) const
  {
    return Vector(a[0] * rhs.x + a[2] * rhs.y + a[4],
		  a[1] * rhs.x + a[3] * rhs.y + a[5]);
  }

  //! Transform all control points of \a rhs.
  inline Bezier Matrix::operator*(const Bezier &rhs) const
  {
    return Bezier(*this * rhs.iV[0], *this * rhs.iV[1],
		  *this * rhs.iV[2], *this * rhs.iV[3]);
  }

  //! Return translation component.
  inline Vector Matrix::translation() const
  {
    return Vector(a[4], a[5]);
  }

  //! Return linear transformation component of this affine map.
  inline Linear Matrix::linear() const
  {
    return Linear(a[0], a[1], a[2], a[3]);
  }

  //! Return determinant of the matrix.
  inline double Matrix::determinant() const
  {
    return (a[0] * a[3] - a[1] * a[2]);
  }

  //! Can the matrix be inverted?
  inline bool Matrix::isInvertible() const
  {
    return determinant() != 0.0;
  }

  //! Is this the identity matrix?
  inline bool Matrix::isIdentity() const
  {
    return (a[0] == 1.0 && a[1] == 0.0 && a[2] == 0.0 && a[3] == 1.0
	    && a[4] == 0.0 && a[5] == 0.0);
  }

  //! Check for equality of two matrices.
  inline bool Matrix::operator==(const Matrix &rhs) const
  {
    return (a[0] == rhs.a[0] && a[1] == rhs.a[1] && a[2] == rhs.a[2] &&
	    a[3] == rhs.a[3] && a[4] == rhs.a[4] && a[5] == rhs.a[5]);
  }

  // --------------------------------------------------------------------

  //! Constructor.
  inline Bezier::Bezier(const Vector &p0, const Vector &p1,
			const Vector &p2, const Vector &p3)
  {
    iV[0] = p0; iV[1] = p1; iV[2] = p2; iV[3] = p3;
  }

  //! Are all four control points identical?
  inline bool Bezier::operator==(const Bezier &rhs) const
  {
    return (iV[0] == rhs.iV[0] && iV[1] == rhs.iV[1] &&
	    iV[2] == rhs.iV[2] && iV[3] == rhs.iV[3]);
  }

} // namespace

// --------------------------------------------------------------------
#endif
