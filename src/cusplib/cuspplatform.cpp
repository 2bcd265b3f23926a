// --------------------------------------------------------------------
// Platform dependent methods
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

#include "cuspbase.h"

#include <cstdlib>
#include <cstdarg>

using namespace cusp;

// --------------------------------------------------------------------

/*! \class cusp::Platform
  \ingroup base
  \brief Platform dependent methods.
*/

//! Return the Cusplib version.
/*! This is available as a function so that one can verify what
  version of Cusplib one has actually linked with (as opposed to the
  header files used during compilation).
*/
int Platform::libVersion()
{
  return CUSPLIB_VERSION;
}

// --------------------------------------------------------------------

static bool initialized = false;
static bool showDebug = false;
static Platform::DebugHandler debugHandler = nullptr;

static void debugHandlerImpl(const char *msg)
{
  if (showDebug) {
    fprintf(stderr, "%s\n", msg);
    fflush(stderr);
  }
}

//! Initialize Cusplib.
/*! This method should be called before Cusplib is used.

  It checks that the correct version of Cusplib is loaded, and aborts
  with an error message if the version is not correct.  Also enables
  cuspDebug messages if environment variable CUSPDEBUG is defined.
  (You can override this using setDebug).
*/
void Platform::initLib(int version)
{
  if (initialized)
    return;
  initialized = true;
  showDebug = false;
  if (getenv("CUSPDEBUG") != nullptr) {
    showDebug = true;
    fprintf(stderr, "Debug messages enabled\n");
  }
  if (debugHandler == nullptr)
    debugHandler = debugHandlerImpl;
  if (version == CUSPLIB_VERSION)
    return;
  fprintf(stderr,
	  "This program has been compiled with header files for Cusplib %d\n"
	  "but is linked against libcusp %d.\n"
	  "Rebuild it against the installed version of Cusplib.\n",
	  version, CUSPLIB_VERSION);
  exit(99);
}

//! Enable or disable display of cuspDebug messages.
void Platform::setDebug(bool debug)
{
  showDebug = debug;
  if (debugHandler == nullptr)
    debugHandler = debugHandlerImpl;
}

//! Are cuspDebug messages currently shown?
bool Platform::debugEnabled()
{
  return showDebug;
}

//! Replace the function that receives cuspDebug messages.
/*! The handler is called for every message, whether or not debugging
  has been enabled with setDebug().  Passing nullptr restores the
  default handler, which writes to stderr. */
void Platform::setDebugHandler(DebugHandler handler)
{
  debugHandler = handler ? handler : debugHandlerImpl;
}

// --------------------------------------------------------------------

void cuspDebug(const char *msg, ...) noexcept
{
  if (debugHandler) {
    char buf[8196];
    va_list ap;
    va_start(ap, msg);
    std::vsnprintf(buf, sizeof(buf), msg, ap);
    va_end(ap);
    debugHandler(buf);
  }
}

void cuspAssertionFailed(const char *file, int line, const char *assertion)
{
  fprintf(stderr, "Assertion failed on line #%d (%s): '%s'\n",
	  line, file, assertion);
  abort();
}

// --------------------------------------------------------------------
