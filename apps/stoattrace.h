/***************************************************************************
                          stoattrace.h  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
 ***************************************************************************/

#ifndef __stoattrace_h
#define __stoattrace_h

#include "stoatlib.h"

#define S(x) ((const char *) x.ToUTF8())

#endif	// __stoattrace_h
