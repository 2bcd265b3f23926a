// -*- C++ -*-
// --------------------------------------------------------------------
// Base header file --- must be included by all Cusp components.
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

#ifndef CUSPBASE_H
#define CUSPBASE_H

#include <cstdio>
#include <vector>
#include <algorithm>

// --------------------------------------------------------------------

using uint = unsigned int;

#undef assert
#define assert(e) ((e) ? (void)0 : cuspAssertionFailed(__FILE__, __LINE__, #e))
extern void cuspAssertionFailed(const char *, int, const char *);

// --------------------------------------------------------------------

extern void cuspDebug(const char *msg, ...) noexcept;

namespace cusp {

  //! Cusplib version.
  /*! \ingroup base */
  const int CUSPLIB_VERSION = 10000;

  //! Distance below which two points are considered the same.
  /*! \ingroup base */
  const double DEFAULT_TOLERANCE = 0.001;
  //! Smallest tolerance that still makes numerical sense.
  /*! \ingroup base */
  const double MINIMUM_TOLERANCE = 0.000001;

  // --------------------------------------------------------------------

  class Platform {
  public:
    using DebugHandler = void (*)(const char *);

    static int libVersion();
    static void initLib(int version);
    static void setDebug(bool debug);
    static bool debugEnabled();
    static void setDebugHandler(DebugHandler handler);
  };

} // namespace

// --------------------------------------------------------------------
#endif
