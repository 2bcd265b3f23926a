// -*- C++ -*-
// --------------------------------------------------------------------
// Intersections of paths
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

#ifndef CUSPINTERSECT_H
#define CUSPINTERSECT_H

#include "cusppath.h"

// --------------------------------------------------------------------

namespace cusp {

  //! A point where two paths cross.
  /*! \ingroup path */
  struct Intersection {
    //! First path.
    const Path *iPath1;
    //! Second path (may be the same as the first).
    const Path *iPath2;
    //! Time on the first path.
    double iTime1;
    //! Time on the second path.
    double iTime2;
    //! Position of the intersection, computed on the first path.
    Vector iPos;
    //! Distance from the query point, negative if there was none.
    double iDistance;
  };

  void pathIntersections(const std::vector<const Path *> &paths,
			 std::vector<Intersection> &result);
  void pathIntersections(const std::vector<const Path *> &paths,
			 double maxDistance, const Vector &point,
			 std::vector<Intersection> &result);

  void partitionedPathIntersections(const std::vector<const Path *> &paths1,
				    const std::vector<const Path *> &paths2,
				    std::vector<Intersection> &result);
  void partitionedPathIntersections(const std::vector<const Path *> &paths1,
				    const std::vector<const Path *> &paths2,
				    double maxDistance, const Vector &point,
				    std::vector<Intersection> &result);

} // namespace

// --------------------------------------------------------------------
#endif
