/***************************************************************************
                          wxutil.h  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#ifndef __wxutil_h
#define __wxutil_h

#include "wx/wxprec.h"

#ifndef WX_PRECOMP
	#include "wx/wx.h"
#endif

#include <string>

using std::string;

/** Convert UTF-8 bytes to a wxString.
  *
  * Each byte that is not part of a valid UTF-8 sequence becomes U+FFFD;
  * the rest of the text is kept. \c lossy, if given, is set to true when
  * any byte was replaced.
  */
wxString DecodeBytes(const string& bytes, bool *lossy = NULL);

#endif	// __wxutil_h
