/***************************************************************************
                          stoatlib.cpp  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#include "stoatlib.h"
#include <string.h>
#include <errno.h>
#include <time.h>
#include <stdlib.h>
#include <ctype.h>
#include <sstream>
#include <locale>

#include "stoaterrno.h"

FILE* stoat_DiagFile = 0;

static const char *error_strings[] = {
	"Missing required CALL field",				/* STOAT_CALL_MISSING */
	"Timestamp parsing failed",				/* STOAT_INVALID_DATE */
	"Frequency parsing failed",				/* STOAT_INVALID_FREQ */
	"Not a contactinfo record",				/* STOAT_XML_SCHEMA_ERROR */
};

/* ADIF output names, indexed by STOAT_QSO_FIELD. NULL means the field
 * is input-only.
 */
static const char *qso_field_names[STOAT_QSO_NFIELDS] = {
	"CALL",			/* STOAT_QSO_CALL */
	"MODE",			/* STOAT_QSO_MODE */
	NULL,			/* STOAT_QSO_QSO_DATE_OFF */
	"QSO_DATE",		/* STOAT_QSO_QSO_DATE */
	NULL,			/* STOAT_QSO_TIME_OFF */
	"TIME_ON",		/* STOAT_QSO_TIME_ON */
	"RST_RCVD",		/* STOAT_QSO_RST_RCVD */
	"RST_SENT",		/* STOAT_QSO_RST_SENT */
	"FREQ",			/* STOAT_QSO_FREQ */
	"FREQ_RX",		/* STOAT_QSO_FREQ_RX */
	"OPERATOR",		/* STOAT_QSO_OPERATOR */
	"COMMENT",		/* STOAT_QSO_COMMENT */
	"TX_PWR",		/* STOAT_QSO_POWER */
	"STX",			/* STOAT_QSO_STX */
	"SRX",			/* STOAT_QSO_SRX */
	"STX_STRING",		/* STOAT_QSO_STX_STRING */
	"SRX_STRING",		/* STOAT_QSO_SRX_STRING */
	"RTX",			/* STOAT_QSO_RTX */
	"MY_CALL",		/* STOAT_QSO_MYCALL */
	"GRIDSQUARE",		/* STOAT_QSO_GRIDSQUARE */
	"MY_GRIDSQUARE",	/* STOAT_QSO_MY_GRIDSQUARE */
	"STATION_CALLSIGN",	/* STOAT_QSO_STATION_CALLSIGN */
	"BAND",			/* STOAT_QSO_BAND */
	"NAME",			/* STOAT_QSO_NAME */
	"QTH",			/* STOAT_QSO_QTH */
	"STATE",		/* STOAT_QSO_STATE */
	"COUNTRY",		/* STOAT_QSO_COUNTRY */
	"CQZ",			/* STOAT_QSO_CQZ */
	"ITUZ",			/* STOAT_QSO_ITUZ */
	"CONT",			/* STOAT_QSO_CONT */
	"IOTA",			/* STOAT_QSO_IOTA */
	"DXCC",			/* STOAT_QSO_DXCC */
	"PROP_MODE",		/* STOAT_QSO_PROP_MODE */
	"SAT_NAME",		/* STOAT_QSO_SAT_NAME */
	"SAT_MODE",		/* STOAT_QSO_SAT_MODE */
	"CONTEST_ID",		/* STOAT_QSO_CONTEST_ID */
	"PREFIX",		/* STOAT_QSO_PREFIX */
	"SUBMODE",		/* STOAT_QSO_SUBMODE */
	"QSLMSG",		/* STOAT_QSO_QSLMSG */
	"NOTES",		/* STOAT_QSO_NOTES */
	"EMAIL",		/* STOAT_QSO_EMAIL */
	"DARC_DOK",		/* STOAT_QSO_DARC_DOK */
	"SOTA_REF",		/* STOAT_QSO_SOTA_REF */
	"WWFF_REF",		/* STOAT_QSO_WWFF_REF */
	"POTA_REF",		/* STOAT_QSO_POTA_REF */
	"CNTY",			/* STOAT_QSO_CNTY */
	"REGION",		/* STOAT_QSO_REGION */
	"LAT",			/* STOAT_QSO_LAT */
	"LON",			/* STOAT_QSO_LON */
	"ANT_AZ",		/* STOAT_QSO_ANT_AZ */
	"ANT_EL",		/* STOAT_QSO_ANT_EL */
	"ANT_PATH",		/* STOAT_QSO_ANT_PATH */
	"A_INDEX",		/* STOAT_QSO_A_INDEX */
	"K_INDEX",		/* STOAT_QSO_K_INDEX */
	"SFI",			/* STOAT_QSO_SFI */
	"RX_PWR",		/* STOAT_QSO_RX_PWR */
};

namespace stoatlib {

int
QSORecord::count() const {
	int n = 0;
	for (int i = 0; i < STOAT_QSO_NFIELDS; i++)
		if (!_fields[i].empty())
			n++;
	return n;
}

void
QSORecord::clear() {
	for (int i = 0; i < STOAT_QSO_NFIELDS; i++)
		_fields[i].clear();
}

void
LogContext::emit(int level, const char *format, va_list ap) const {
	char buf[4096];
	vsnprintf(buf, sizeof buf, format, ap);
	(*_fn)(_userdata, level, buf);
}

void
LogContext::message(const char *format, ...) const {
	if (!_fn)
		return;
	va_list ap;
	va_start(ap, format);
	emit(STOAT_LOG_INFO, format, ap);
	va_end(ap);
}

void
LogContext::verbose(const char *format, ...) const {
	if (!isVerbose())
		return;
	va_list ap;
	va_start(ap, format);
	emit(STOAT_LOG_VERBOSE, format, ap);
	va_end(ap);
}

}	// namespace stoatlib

const char *
stoat_getErrorString_v(int err) {
	if (err == STOAT_NO_ERROR)
		return "NO ERROR";
	if (err == STOAT_SYSTEM_ERROR)
		return "System error";
	if (err == STOAT_XML_ERROR)
		return "XML parsing failed";
	int adjusted_err = err - STOAT_ERROR_ENUM_BASE;
	if (adjusted_err < 0 ||
	    adjusted_err >= static_cast<int>(sizeof error_strings / sizeof error_strings[0]))
		return "Invalid error code";
	return error_strings[adjusted_err];
}

const char *
stoat_qsoFieldName(STOAT_QSO_FIELD field) {
	if (field < 0 || field >= STOAT_QSO_NFIELDS)
		return NULL;
	return qso_field_names[field];
}

string
stoat_trimSpace(const string& s) {
	static const char *ws = " \t\n\r\v\f";
	string::size_type first = s.find_first_not_of(ws);
	if (first == string::npos)
		return "";
	string::size_type last = s.find_last_not_of(ws);
	return s.substr(first, last - first + 1);
}

bool
stoat_parseDecimal(const string& s, double& value) {
	if (s.empty() || isspace(static_cast<unsigned char>(s[0])))
		return false;
	std::istringstream in(s);
	in.imbue(std::locale::classic());
	double v;
	if (!(in >> v))
		return false;
	if (in.peek() != std::char_traits<char>::eof())
		return false;
	value = v;
	return true;
}

void
stoatTrace(const char *name, const char *format, ...) {
	va_list ap;
	FILE *fp = stoat_DiagFile;
	if (!fp) return;

	time_t t = time(0);
	char timebuf[50];
	struct tm tmbuf;
	strftime(timebuf, sizeof timebuf, "%a %b %d %H:%M:%S %Y", localtime_r(&t, &tmbuf));
	char msg[4096];
	if (!format) {
		fprintf(fp, "%s %s\n", timebuf, name ? name : "");
		fflush(fp);
		return;
	}
	va_start(ap, format);
	vsnprintf(msg, sizeof msg, format, ap);
	va_end(ap);
	// One write per line so concurrent workers don't interleave
	if (name)
		fprintf(fp, "%s %s: %s\n", timebuf, name, msg);
	else
		fprintf(fp, "%s %s\n", timebuf, msg);
	fflush(fp);
}

void
stoat_closeDiagFile(void) {
	if (stoat_DiagFile)
		fclose(stoat_DiagFile);
	stoat_DiagFile = NULL;
}

int
stoat_diagFileOpen(void) {
	return stoat_DiagFile != NULL;
}

int
stoat_openDiagFile(const char *fname) {
	if (fname == NULL) {
		errno = EINVAL;
		return 1;
	}
	stoat_DiagFile = fopen(fname, "ab");
	return (stoat_DiagFile == NULL);
}
