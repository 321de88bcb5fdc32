/***************************************************************************
                          contactxml.h  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#ifndef __CONTACTXML_H
#define __CONTACTXML_H

#include "stoatlib.h"

#include <string>

using std::string;

#define STOAT_CONTACT_ROOT "contactinfo"	///< Root element of an XML contact

/// XML frequencies are in units of 10 Hz
#define STOAT_XML_FREQ_DIVISOR 100000.0

namespace stoatlib {

/** Parses a logger's \c contactinfo XML document.
  *
  * The document carries one contact as child elements of \c contactinfo
  * (timestamp, call, mode, txfreq, rxfreq, rcv, snt, power, operator,
  * comment, sntnr, rcvnr, mycall, gridsquare). USB and LSB modes are
  * reported as SSB, frequencies are converted to MHz and the timestamp is
  * split into date and time fields.
  *
  * Throws ParseError for malformed XML, a different root element, a bad
  * timestamp or frequency, or a missing call.
  */
class XMLParser : public QSOParser {
 public:
	XMLParser() {}
	virtual void parse(const string& payload, QSORecord& rec, const LogContext& ctx) const;
};

}	// namespace stoatlib

/** Split an XML timestamp \c YYYY-MM-DDTHH:MM:SS[.fff] into
  * \c YYYYMMDD and \c HHMMSS.
  *
  * Returns false if the timestamp is malformed or names an impossible
  * date or time.
  */
bool stoat_splitTimestamp(const string& timestamp, string& date, string& time);

#endif /* __CONTACTXML_H */
