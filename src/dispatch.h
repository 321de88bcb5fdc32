/***************************************************************************
                          dispatch.h  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#ifndef __dispatch_h
#define __dispatch_h

#include "stoatlib.h"

#include <string>
#include <vector>

using std::string;
using std::vector;

/** \file
  * Payload dispatch: format detection, batch splitting and the per-record
  * parse, normalize, serialize and submit pipeline.
  */

/** \defgroup Dispatch Dispatch API
  */
/** @{ */

#define STOAT_FORMAT_ADIF 0	///< ADIF text
#define STOAT_FORMAT_XML 1	///< contactinfo XML

/** Decide whether a payload is XML or ADIF.
  *
  * Any payload containing the text "xml" is taken to be XML.
  */
int stoat_detectFormat(const string& payload);

/** Split an ADIF payload into records on \c <EOR>.
  *
  * Each piece is trimmed and empty pieces are dropped. Every piece except
  * the one following the last \c <EOR> gets the marker back. A payload
  * without \c <EOR> is returned whole as a single record.
  *
  * Returns the number of pieces the payload split into, including
  * empty ones.
  */
int stoat_splitADIFBatch(const string& payload, vector<string>& records);

namespace stoatlib {

/** Receives each finished record.
  *
  * \c submit() throws an exception derived from std::exception if the
  * record could not be delivered.
  */
class QSOSink {
 public:
	virtual ~QSOSink() {}
	virtual void submit(const QSORecord& rec, const string& adif) = 0;
};

/** Parse one record in the given format, normalize it and return its
  * ADIF rendering. Throws ParseError.
  */
string prepareQSO(const string& message, int format, QSORecord& rec, const LogContext& ctx);

/** Runs payloads through detection, parsing, normalization and
  * serialization, and hands each record to a QSOSink.
  *
  * A record that fails to parse or submit is logged and skipped; the
  * rest of its batch is still processed. One pipeline may be shared by
  * several threads provided the sink is thread safe.
  */
class RecordPipeline {
 public:
	RecordPipeline(QSOSink& sink, const LogContext& ctx) : _sink(sink), _ctx(ctx) {}
	/// Process one received payload. Returns the number of records submitted.
	int processMessage(const string& message) const;
	/// Process a single record. Returns true if it was submitted.
	bool processSingleQSO(const string& message, bool isXML) const;

 private:
	int processMultipleQSOs(const string& payload) const;
	QSOSink& _sink;
	LogContext _ctx;
};

}	// namespace stoatlib

/** @} */

#endif	// __dispatch_h
