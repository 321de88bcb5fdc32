/***************************************************************************
                          normalize.h  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#ifndef __NORMALIZE_H
#define __NORMALIZE_H

#include "stoatlib.h"

#include <string>

using std::string;

/*! \file */

/** \defgroup Normalize Field normalization
  */
/** @{ */

/// An amateur band, bounds inclusive, in MHz
typedef struct {
	const char *name;	///< Band name, e.g. "20M"
	double lower;		///< Lowest frequency
	double upper;		///< Highest frequency
} stoat_bandEntry;

/** Convert a free-form power string to watts.
  *
  * Recognizes a leading number optionally followed by a unit: a "kw"
  * anywhere scales by 1000, otherwise an "mw" scales by 0.001. Whole
  * results have no decimals, others have three. Input without a leading
  * number is returned unchanged.
  */
string stoat_normalizePower(const string& power);

/** Name the band containing \c freq (MHz).
  *
  * Returns an empty string if \c freq is not a number or is outside
  * every band.
  */
string stoat_calculateBand(const string& freq);

/** Number of entries in the band table */
int stoat_getNumBand(void);

/** Get a band table entry. Returns NULL if \c index is out of range. */
const stoat_bandEntry *stoat_getBand(int index);

/** Normalize POWER in place and set BAND from FREQ when FREQ is present */
void stoat_normalizeQSO(stoatlib::QSORecord& rec, const stoatlib::LogContext& ctx);

/** @} */

#endif /* __NORMALIZE_H */
