/***************************************************************************
                          stoatlib.h  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#ifndef STOATLIB_H
#define STOATLIB_H

#include <stdio.h>
#include <stdarg.h>
#include <string>

using std::string;

/** \file
  * stoatlib - QSO record parsing and normalization for WaveLog transport.
  */

#define STOATLIB_VERSION "0.0.2"

#define STOAT_APP_NAME "WavelogStoat"

#ifdef __GNUC__
#define STOAT_PRINTF_FORMAT(f, a) __attribute__((format(printf, f, a)))
#else
#define STOAT_PRINTF_FORMAT(f, a)
#endif

/** \defgroup Record QSO record
  */
/** @{ */

/// Fields of a QSO record. Every value is carried as text.
typedef enum {
	STOAT_QSO_CALL,
	STOAT_QSO_MODE,
	STOAT_QSO_QSO_DATE_OFF,
	STOAT_QSO_QSO_DATE,
	STOAT_QSO_TIME_OFF,
	STOAT_QSO_TIME_ON,
	STOAT_QSO_RST_RCVD,
	STOAT_QSO_RST_SENT,
	STOAT_QSO_FREQ,
	STOAT_QSO_FREQ_RX,
	STOAT_QSO_OPERATOR,
	STOAT_QSO_COMMENT,
	STOAT_QSO_POWER,
	STOAT_QSO_STX,
	STOAT_QSO_SRX,
	STOAT_QSO_STX_STRING,
	STOAT_QSO_SRX_STRING,
	STOAT_QSO_RTX,
	STOAT_QSO_MYCALL,
	STOAT_QSO_GRIDSQUARE,
	STOAT_QSO_MY_GRIDSQUARE,
	STOAT_QSO_STATION_CALLSIGN,
	STOAT_QSO_BAND,
	STOAT_QSO_NAME,
	STOAT_QSO_QTH,
	STOAT_QSO_STATE,
	STOAT_QSO_COUNTRY,
	STOAT_QSO_CQZ,
	STOAT_QSO_ITUZ,
	STOAT_QSO_CONT,
	STOAT_QSO_IOTA,
	STOAT_QSO_DXCC,
	STOAT_QSO_PROP_MODE,
	STOAT_QSO_SAT_NAME,
	STOAT_QSO_SAT_MODE,
	STOAT_QSO_CONTEST_ID,
	STOAT_QSO_PREFIX,
	STOAT_QSO_SUBMODE,
	STOAT_QSO_QSLMSG,
	STOAT_QSO_NOTES,
	STOAT_QSO_EMAIL,
	STOAT_QSO_DARC_DOK,
	STOAT_QSO_SOTA_REF,
	STOAT_QSO_WWFF_REF,
	STOAT_QSO_POTA_REF,
	STOAT_QSO_CNTY,
	STOAT_QSO_REGION,
	STOAT_QSO_LAT,
	STOAT_QSO_LON,
	STOAT_QSO_ANT_AZ,
	STOAT_QSO_ANT_EL,
	STOAT_QSO_ANT_PATH,
	STOAT_QSO_A_INDEX,
	STOAT_QSO_K_INDEX,
	STOAT_QSO_SFI,
	STOAT_QSO_RX_PWR,
	STOAT_QSO_NFIELDS		///< Number of fields, not a field
} STOAT_QSO_FIELD;

namespace stoatlib {

/** One contact, populated by a single parser and then normalized.
  *
  * A QSORecord is a flat set of text values indexed by STOAT_QSO_FIELD.
  * Unset fields are empty strings.
  */
class QSORecord {
 public:
	QSORecord() {}
	/// Get a field's value
	const string& get(STOAT_QSO_FIELD field) const { return _fields[field]; }
	/// Set a field's value
	void set(STOAT_QSO_FIELD field, const string& value) { _fields[field] = value; }
	/// True if the field holds a non-empty value
	bool isSet(STOAT_QSO_FIELD field) const { return !_fields[field].empty(); }
	/// Number of non-empty fields
	int count() const;
	/// Reset every field to empty
	void clear();

 private:
	string _fields[STOAT_QSO_NFIELDS];
};

/** @} */

/** \defgroup Log Logging
  */
/** @{ */

#define STOAT_LOG_INFO 0		///< Always reported
#define STOAT_LOG_VERBOSE 1		///< Reported only in verbose mode

/// Receives formatted log lines from the library
typedef void (*stoat_log_fn)(void *userdata, int level, const char *msg);

/** Logging capability handed to every parse and pipeline call.
  *
  * The library keeps no logger of its own. A default-constructed context
  * drops everything, which is what the unit tests use.
  */
class LogContext {
 public:
	LogContext() : _verbose(false), _fn(0), _userdata(0) {}
	LogContext(bool verbose, stoat_log_fn fn, void *userdata)
		: _verbose(verbose), _fn(fn), _userdata(userdata) {}
	bool isVerbose() const { return _verbose && _fn != 0; }
	/// Report a line at STOAT_LOG_INFO
	void message(const char *format, ...) const STOAT_PRINTF_FORMAT(2, 3);
	/// Report a line at STOAT_LOG_VERBOSE. Dropped unless verbose.
	void verbose(const char *format, ...) const STOAT_PRINTF_FORMAT(2, 3);

 private:
	void emit(int level, const char *format, va_list ap) const;
	bool _verbose;
	stoat_log_fn _fn;
	void *_userdata;
};

/** Abstract source of QSO records.
  *
  * Implemented once per wire format. \c parse() fills \c rec from
  * \c payload or throws ParseError.
  */
class QSOParser {
 public:
	virtual ~QSOParser() {}
	virtual void parse(const string& payload, QSORecord& rec, const LogContext& ctx) const = 0;
};

}	// namespace stoatlib

/** @} */

/** \defgroup Util Utility API
  */
/** @{ */

/** Gets the error string corresponding to the given error number.
  *
  * The values for the error code are defined in stoaterrno.h
  */
const char *stoat_getErrorString_v(int err);

/** Gets the ADIF output name of a record field, or NULL if the
  * field is never written to ADIF.
  */
const char *stoat_qsoFieldName(STOAT_QSO_FIELD field);

/** Remove leading and trailing whitespace */
string stoat_trimSpace(const string& s);

/** Parse a decimal number in the "C" locale.
  *
  * The whole string must be consumed; leading or trailing whitespace is
  * rejected. Returns false if \c s is not a number.
  */
bool stoat_parseDecimal(const string& s, double& value);

/// Diagnostic log file
extern FILE* stoat_DiagFile;

/** Open a diagnostic trace file. Returns 0 on success */
int stoat_openDiagFile(const char *fname);

/** Close the diagnostic trace file */
void stoat_closeDiagFile(void);

/** Returns nonzero if the diagnostic trace file is open */
int stoat_diagFileOpen(void);

/** Write a timestamped line to the diagnostic trace file, if open */
void stoatTrace(const char *name, const char *format, ...) STOAT_PRINTF_FORMAT(2, 3);

/** @} */

#endif /* STOATLIB_H */
