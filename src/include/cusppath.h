// -*- C++ -*-
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

#ifndef CUSPPATH_H
#define CUSPPATH_H

#include "cuspgeo.h"

// --------------------------------------------------------------------

namespace cusp {

  class Anchor {
  public:
    //! Anchor at the origin without handles.
    Anchor() { /* nothing */ }
    //! Anchor at \a position without handles.
    explicit Anchor(const Vector &position) : iPosition(position) { }
    explicit Anchor(const Vector &position, const Vector &handleIn,
		    const Vector &handleOut);

    bool isValid() const;
    bool hasTangentHandles(double tolerance = DEFAULT_TOLERANCE) const;
    //! Are both handles zero?
    inline bool hasZeroHandles() const {
      return iHandleIn.isZero() && iHandleOut.isZero(); }
    void reverse();
    void transform(const Matrix &m);
    void transformLinear(const Matrix &m);

    inline bool operator==(const Anchor &rhs) const;

  public:
    //! Position of the anchor.
    Vector iPosition;
    //! Incoming handle, relative to the position.
    Vector iHandleIn;
    //! Outgoing handle, relative to the position.
    Vector iHandleOut;
  };

  // --------------------------------------------------------------------

  class CurveSegment {
  public:
    //! Type of segment.
    enum Type { ELine, ECubic };

    //! Type of segment.
    inline Type type() const { return iType; }
    //! Anchor where the segment starts.
    inline const Anchor &first() const { return *iA1; }
    //! Anchor where the segment ends.
    inline const Anchor &last() const { return *iA2; }

    Segment line() const;
    Bezier bezier() const;
    Rect controlBox() const;

    Vector point(double t) const;
    Vector derivative(double t) const;
    double length() const;
    double length(double t) const;
    bool snap(const Vector &mouse, double &t, Vector &pos,
	      double &bound) const;

    void intersect(const CurveSegment &rhs,
		   std::vector<Crossing> &result) const;

  private:
    CurveSegment(const Anchor &a1, const Anchor &a2);

  private:
    Type iType;
    const Anchor *iA1;
    const Anchor *iA2;

    friend class Path;
  };

  // --------------------------------------------------------------------

  //! Result of the search for a fillet at a corner.
  /*! \ingroup path */
  struct RoundCornerInfo {
    //! Center of the fillet circle.
    Vector iCenter;
    //! Time where the fillet leaves the path before the corner.
    double iTime1;
    //! Time where the fillet joins the path after the corner.
    double iTime2;
    //! Position at iTime1.
    Vector iPoint1;
    //! Position at iTime2.
    Vector iPoint2;
    //! Side of the path the center lies on (-1 or +1).
    int iSign;
    //! Angle of iPoint1 as seen from the center.
    Angle iStartAngle;
    //! Angle of iPoint2 as seen from the center.
    Angle iEndAngle;
  };

  // --------------------------------------------------------------------

  class Path {
  public:
    explicit Path();
    explicit Path(const std::vector<Anchor> &anchors, bool closed = false);

    static Path fromPoints(const std::vector<Vector> &points,
			   bool closed = false);
    static Path fromCubicBezierPoints(const std::vector<Vector> &points,
				      bool closed = false);
    static Path fromRect(const Rect &rect);
    static Path fromArc(const Vector &center, double radius,
			Angle startAngle, Angle endAngle);

    //! Number of anchors.
    inline int countAnchors() const { return int(iAnchors.size()); }
    //! Return anchor \a i.
    inline const Anchor &anchor(int i) const { return iAnchors[i]; }
    //! Return anchor \a i.
    inline Anchor &anchor(int i) { return iAnchors[i]; }
    //! Return all anchors.
    inline const std::vector<Anchor> &anchors() const { return iAnchors; }
    //! Is the path closed?
    inline bool closed() const { return iClosed; }
    //! Open or close the path.
    inline void setClosed(bool closed) { iClosed = closed; }
    //! Append an anchor at the end.
    inline void append(const Anchor &a) { iAnchors.push_back(a); }

    bool isValid() const;

    int countSegments() const;
    CurveSegment segment(int i) const;
    double finalTime() const;
    double normalizeTime(double time) const;

    Vector positionAtTime(double time) const;
    Vector derivativeAtTime(double time) const;
    Vector tangentAtTime(double time) const;
    Vector normalAtTime(double time) const;

    double length() const;
    double timeAtDistance(double distance) const;
    double distanceAtTime(double time) const;

    int insertAnchorAtTime(double time);
    std::vector<Path> splitAtAnchor(int index);
    std::vector<Path> splitAtTime(double time);
    bool roundCornerInfoAtAnchor(int index, double radius,
				 RoundCornerInfo &info) const;
    bool roundCornerAtAnchor(int index, double radius);

    std::vector<Path> edges() const;
    void polygonize(double maxSegmentLength);
    void reverse();
    void transform(const Matrix &m);
    Rect looseBoundingBox() const;
    bool isIntersectedByRect(const Rect &rect) const;
    bool snap(const Vector &mouse, double &time, Vector &pos,
	      double &bound) const;

  private:
    std::vector<Anchor> iAnchors;
    bool iClosed;
  };

  // --------------------------------------------------------------------

  //! Are position and both handles identical?
  inline bool Anchor::operator==(const Anchor &rhs) const
  {
    return (iPosition == rhs.iPosition && iHandleIn == rhs.iHandleIn &&
	    iHandleOut == rhs.iHandleOut);
  }

} // namespace

// --------------------------------------------------------------------
#endif
