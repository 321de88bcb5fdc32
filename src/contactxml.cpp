/***************************************************************************
                          contactxml.cpp  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#include "contactxml.h"

#include <ctype.h>
#include <stdio.h>

#include "xml.h"
#include "stoaterrno.h"
#include "stoatexc.h"

using stoatlib::XMLElement;
using stoatlib::QSORecord;
using stoatlib::LogContext;
using stoatlib::ParseError;

static int
digits(const string& s, string::size_type pos, string::size_type n) {
	int val = 0;
	for (string::size_type i = pos; i < pos + n; i++) {
		if (!isdigit(static_cast<unsigned char>(s[i])))
			return -1;
		val = val * 10 + (s[i] - '0');
	}
	return val;
}

static int
days_in_month(int year, int month) {
	static const int mdays[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
	if (month == 2 && ((year % 4 == 0 && year % 100 != 0) || year % 400 == 0))
		return 29;
	return mdays[month - 1];
}

bool
stoat_splitTimestamp(const string& ts, string& date, string& time) {
	// 0123456789012345678
	// YYYY-MM-DDTHH:MM:SS
	if (ts.size() < 19)
		return false;
	if (ts[4] != '-' || ts[7] != '-' || ts[10] != 'T' || ts[13] != ':' || ts[16] != ':')
		return false;
	int year = digits(ts, 0, 4);
	int month = digits(ts, 5, 2);
	int day = digits(ts, 8, 2);
	int hour = digits(ts, 11, 2);
	int minute = digits(ts, 14, 2);
	int second = digits(ts, 17, 2);
	if (year < 0 || month < 1 || month > 12 || day < 1 || day > days_in_month(year, month))
		return false;
	if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59)
		return false;
	// Fractional seconds are accepted and dropped
	if (ts.size() > 19) {
		if ((ts[19] != '.' && ts[19] != ',') || ts.size() == 20)
			return false;
		for (string::size_type i = 20; i < ts.size(); i++)
			if (!isdigit(static_cast<unsigned char>(ts[i])))
				return false;
	}
	date = ts.substr(0, 4) + ts.substr(5, 2) + ts.substr(8, 2);
	time = ts.substr(11, 2) + ts.substr(14, 2) + ts.substr(17, 2);
	return true;
}

/* Text of the last child named name, or empty if there is none */
static string
child_text(XMLElement& parent, const char *name) {
	string text;
	XMLElement child;
	bool ok = parent.getFirstElement(name, child);
	while (ok) {
		text = child.getText();
		ok = parent.getNextElement(child);
	}
	return text;
}

static string
freq_to_mhz(const string& value, const char *which) {
	double freq;
	if (!stoat_parseDecimal(value, freq))
		throw ParseError(STOAT_INVALID_FREQ, string(which) + " \"" + value + "\" is not a number");
	char buf[64];
	snprintf(buf, sizeof buf, "%.6f", freq / STOAT_XML_FREQ_DIVISOR);
	return buf;
}

namespace stoatlib {

void
XMLParser::parse(const string& payload, QSORecord& rec, const LogContext& ctx) const {
	XMLElement doc;
	int status = doc.parseString(payload);
	if (status == XML_PARSE_SYSTEM_ERROR)
		throw ParseError(STOAT_SYSTEM_ERROR, doc.getParseError());
	if (status != XML_PARSE_NO_ERROR)
		throw ParseError(STOAT_XML_ERROR, doc.getParseError());

	XMLElement contact;
	if (!doc.getFirstElement(contact))
		throw ParseError(STOAT_XML_SCHEMA_ERROR, "document has no elements");
	if (contact.getElementName() != STOAT_CONTACT_ROOT)
		throw ParseError(STOAT_XML_SCHEMA_ERROR, "expected <" STOAT_CONTACT_ROOT "> but found <" + contact.getElementName() + ">");

	string timestamp = child_text(contact, "timestamp");
	string date, time;
	if (!stoat_splitTimestamp(timestamp, date, time))
		throw ParseError(STOAT_INVALID_DATE, "cannot parse \"" + timestamp + "\" as YYYY-MM-DDTHH:MM:SS");

	string mode = child_text(contact, "mode");
	if (mode == "USB" || mode == "LSB")
		mode = "SSB";

	string freq = freq_to_mhz(child_text(contact, "txfreq"), "TX frequency");
	string freqRx = freq_to_mhz(child_text(contact, "rxfreq"), "RX frequency");

	rec.clear();
	rec.set(STOAT_QSO_CALL, child_text(contact, "call"));
	rec.set(STOAT_QSO_MODE, mode);
	rec.set(STOAT_QSO_QSO_DATE_OFF, date);
	rec.set(STOAT_QSO_QSO_DATE, date);
	rec.set(STOAT_QSO_TIME_OFF, time);
	rec.set(STOAT_QSO_TIME_ON, time);
	rec.set(STOAT_QSO_RST_RCVD, child_text(contact, "rcv"));
	rec.set(STOAT_QSO_RST_SENT, child_text(contact, "snt"));
	rec.set(STOAT_QSO_FREQ, freq);
	rec.set(STOAT_QSO_FREQ_RX, freqRx);
	rec.set(STOAT_QSO_OPERATOR, child_text(contact, "operator"));
	rec.set(STOAT_QSO_COMMENT, child_text(contact, "comment"));
	rec.set(STOAT_QSO_POWER, child_text(contact, "power"));
	rec.set(STOAT_QSO_STX, child_text(contact, "sntnr"));
	rec.set(STOAT_QSO_RTX, child_text(contact, "rcvnr"));
	string mycall = child_text(contact, "mycall");
	rec.set(STOAT_QSO_MYCALL, mycall);
	rec.set(STOAT_QSO_STATION_CALLSIGN, mycall);
	rec.set(STOAT_QSO_GRIDSQUARE, child_text(contact, "gridsquare"));

	if (rec.get(STOAT_QSO_CALL).empty())
		throw ParseError(STOAT_CALL_MISSING, "");

	ctx.verbose("Parsed XML QSO: %s on %s MHz", rec.get(STOAT_QSO_CALL).c_str(), rec.get(STOAT_QSO_FREQ).c_str());
}

}	// namespace stoatlib
