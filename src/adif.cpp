/***************************************************************************
                          adif.cpp  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#include "adif.h"

#include <ctype.h>
#include <stdio.h>
#include <string.h>
#include <stdlib.h>
#include <errno.h>
#include <strings.h>

#include "stoaterrno.h"
#include "stoatexc.h"

using stoatlib::QSORecord;
using stoatlib::LogContext;
using stoatlib::ParseError;

typedef enum {
	STOAT_ADIF_STATE_BEGIN,
	STOAT_ADIF_STATE_GET_NAME,
	STOAT_ADIF_STATE_GET_SIZE,
	STOAT_ADIF_STATE_GET_DATA
}  STOAT_ADIF_STATE;

/* Largest length a tag may declare. Longer values are treated as
 * unparseable and the tag is skipped.
 */
#define STOAT_ADIF_MAX_DATA_LENGTH 9223372036854775807ULL

/* Tags that populate the record. BAND is deliberately absent: it is
 * always computed from FREQ.
 */
static const stoat_adifInputField adif_input_fields[] = {
	{ "CALL", STOAT_QSO_CALL, STOAT_QSO_NFIELDS },
	{ "MODE", STOAT_QSO_MODE, STOAT_QSO_NFIELDS },
	{ "QSO_DATE_OFF", STOAT_QSO_QSO_DATE_OFF, STOAT_QSO_QSO_DATE },
	{ "QSO_DATE", STOAT_QSO_QSO_DATE, STOAT_QSO_NFIELDS },
	{ "TIME_OFF", STOAT_QSO_TIME_OFF, STOAT_QSO_TIME_ON },
	{ "TIME_ON", STOAT_QSO_TIME_ON, STOAT_QSO_NFIELDS },
	{ "RST_RCVD", STOAT_QSO_RST_RCVD, STOAT_QSO_NFIELDS },
	{ "RST_SENT", STOAT_QSO_RST_SENT, STOAT_QSO_NFIELDS },
	{ "FREQ", STOAT_QSO_FREQ, STOAT_QSO_NFIELDS },
	{ "FREQ_RX", STOAT_QSO_FREQ_RX, STOAT_QSO_NFIELDS },
	{ "OPERATOR", STOAT_QSO_OPERATOR, STOAT_QSO_NFIELDS },
	{ "COMMENT", STOAT_QSO_COMMENT, STOAT_QSO_NFIELDS },
	{ "TX_PWR", STOAT_QSO_POWER, STOAT_QSO_NFIELDS },
	{ "STX", STOAT_QSO_STX, STOAT_QSO_NFIELDS },
	{ "SRX", STOAT_QSO_SRX, STOAT_QSO_NFIELDS },
	{ "STX_STRING", STOAT_QSO_STX_STRING, STOAT_QSO_NFIELDS },
	{ "SRX_STRING", STOAT_QSO_SRX_STRING, STOAT_QSO_NFIELDS },
	{ "RTX", STOAT_QSO_RTX, STOAT_QSO_NFIELDS },
	{ "CONTEST_ID", STOAT_QSO_CONTEST_ID, STOAT_QSO_NFIELDS },
	{ "PREFIX", STOAT_QSO_PREFIX, STOAT_QSO_NFIELDS },
	{ "SUBMODE", STOAT_QSO_SUBMODE, STOAT_QSO_NFIELDS },
	{ "QSLMSG", STOAT_QSO_QSLMSG, STOAT_QSO_NFIELDS },
	{ "NOTES", STOAT_QSO_NOTES, STOAT_QSO_NFIELDS },
	{ "EMAIL", STOAT_QSO_EMAIL, STOAT_QSO_NFIELDS },
	{ "DARC_DOK", STOAT_QSO_DARC_DOK, STOAT_QSO_NFIELDS },
	{ "SOTA_REF", STOAT_QSO_SOTA_REF, STOAT_QSO_NFIELDS },
	{ "WWFF_REF", STOAT_QSO_WWFF_REF, STOAT_QSO_NFIELDS },
	{ "POTA_REF", STOAT_QSO_POTA_REF, STOAT_QSO_NFIELDS },
	{ "CNTY", STOAT_QSO_CNTY, STOAT_QSO_NFIELDS },
	{ "REGION", STOAT_QSO_REGION, STOAT_QSO_NFIELDS },
	{ "LAT", STOAT_QSO_LAT, STOAT_QSO_NFIELDS },
	{ "LON", STOAT_QSO_LON, STOAT_QSO_NFIELDS },
	{ "ANT_AZ", STOAT_QSO_ANT_AZ, STOAT_QSO_NFIELDS },
	{ "ANT_EL", STOAT_QSO_ANT_EL, STOAT_QSO_NFIELDS },
	{ "ANT_PATH", STOAT_QSO_ANT_PATH, STOAT_QSO_NFIELDS },
	{ "A_INDEX", STOAT_QSO_A_INDEX, STOAT_QSO_NFIELDS },
	{ "K_INDEX", STOAT_QSO_K_INDEX, STOAT_QSO_NFIELDS },
	{ "SFI", STOAT_QSO_SFI, STOAT_QSO_NFIELDS },
	{ "RX_PWR", STOAT_QSO_RX_PWR, STOAT_QSO_NFIELDS },
	{ "MY_CALL", STOAT_QSO_MYCALL, STOAT_QSO_STATION_CALLSIGN },
	{ "MY_GRIDSQUARE", STOAT_QSO_MY_GRIDSQUARE, STOAT_QSO_NFIELDS },
	{ "NAME", STOAT_QSO_NAME, STOAT_QSO_NFIELDS },
	{ "QTH", STOAT_QSO_QTH, STOAT_QSO_NFIELDS },
	{ "STATE", STOAT_QSO_STATE, STOAT_QSO_NFIELDS },
	{ "COUNTRY", STOAT_QSO_COUNTRY, STOAT_QSO_NFIELDS },
	{ "CQZ", STOAT_QSO_CQZ, STOAT_QSO_NFIELDS },
	{ "ITUZ", STOAT_QSO_ITUZ, STOAT_QSO_NFIELDS },
	{ "CONT", STOAT_QSO_CONT, STOAT_QSO_NFIELDS },
	{ "IOTA", STOAT_QSO_IOTA, STOAT_QSO_NFIELDS },
	{ "DXCC", STOAT_QSO_DXCC, STOAT_QSO_NFIELDS },
	{ "PROP_MODE", STOAT_QSO_PROP_MODE, STOAT_QSO_NFIELDS },
	{ "SAT_NAME", STOAT_QSO_SAT_NAME, STOAT_QSO_NFIELDS },
	{ "SAT_MODE", STOAT_QSO_SAT_MODE, STOAT_QSO_NFIELDS },
	{ "GRIDSQUARE", STOAT_QSO_GRIDSQUARE, STOAT_QSO_NFIELDS },
	{ "STATION_CALLSIGN", STOAT_QSO_STATION_CALLSIGN, STOAT_QSO_NFIELDS },
	{ NULL, STOAT_QSO_NFIELDS, STOAT_QSO_NFIELDS }
};

/* Order in which fields are written. QSO_DATE_OFF and TIME_OFF are
 * carried only through their aliases.
 */
static const STOAT_QSO_FIELD adif_output_order[] = {
	STOAT_QSO_CALL,
	STOAT_QSO_QSO_DATE,
	STOAT_QSO_TIME_ON,
	STOAT_QSO_MODE,
	STOAT_QSO_RST_RCVD,
	STOAT_QSO_RST_SENT,
	STOAT_QSO_FREQ,
	STOAT_QSO_FREQ_RX,
	STOAT_QSO_BAND,
	STOAT_QSO_POWER,
	STOAT_QSO_OPERATOR,
	STOAT_QSO_MYCALL,
	STOAT_QSO_STATION_CALLSIGN,
	STOAT_QSO_GRIDSQUARE,
	STOAT_QSO_COMMENT,
	STOAT_QSO_STX,
	STOAT_QSO_SRX,
	STOAT_QSO_STX_STRING,
	STOAT_QSO_SRX_STRING,
	STOAT_QSO_RTX,
	// Contest fields
	STOAT_QSO_CONTEST_ID,
	STOAT_QSO_PREFIX,
	STOAT_QSO_MY_GRIDSQUARE,
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
	STOAT_QSO_RX_PWR
};

const stoat_adifInputField *
stoat_adifFindInputField(const char *name) {
	if (name == NULL)
		return NULL;
	for (int i = 0; adif_input_fields[i].name != NULL; i++) {
		/* case insensitive compare */
		if (strcasecmp(name, adif_input_fields[i].name) == 0)
			return &adif_input_fields[i];
	}
	return NULL;
}

static void
adif_store(QSORecord& rec, const char *name, const string& data) {
	const stoat_adifInputField *def = stoat_adifFindInputField(name);
	if (def == NULL)
		return;
	rec.set(def->field, data);
	if (def->alias != STOAT_QSO_NFIELDS)
		rec.set(def->alias, data);
}

namespace stoatlib {

/* Scan for tags of the form <NAME:LENGTH>. A '<' that does not start a
 * well-formed tag is treated as data and the scan resumes just after it.
 * After a tag is consumed the scan resumes at the end of the tag, not the
 * end of its data.
 */
void
ADIFParser::parse(const string& payload, QSORecord& rec, const LogContext& ctx) const {
	STOAT_ADIF_STATE adifState = STOAT_ADIF_STATE_BEGIN;
	string::size_type size = payload.size();
	string::size_type tagStart = 0;
	string::size_type pos = 0;
	string fieldName;
	string fieldSize;

	rec.clear();
	while (pos < size) {
		char currentCharacter = payload[pos];
		switch (adifState) {
			case STOAT_ADIF_STATE_BEGIN:
				/* find the field opening "<", ignoring everything else */
				if (currentCharacter == '<') {
					tagStart = pos;
					fieldName.clear();
					fieldSize.clear();
					adifState = STOAT_ADIF_STATE_GET_NAME;
				}
				pos++;
				break;

			case STOAT_ADIF_STATE_GET_NAME:
				/* letters and underscores until ':' */
				if (isalpha(static_cast<unsigned char>(currentCharacter)) || currentCharacter == '_') {
					fieldName += currentCharacter;
					pos++;
				} else if (currentCharacter == ':' && !fieldName.empty()) {
					adifState = STOAT_ADIF_STATE_GET_SIZE;
					pos++;
				} else {
					/* not a tag */
					adifState = STOAT_ADIF_STATE_BEGIN;
					pos = tagStart + 1;
				}
				break;

			case STOAT_ADIF_STATE_GET_SIZE:
				/* digits until '>' */
				if (isdigit(static_cast<unsigned char>(currentCharacter))) {
					fieldSize += currentCharacter;
					pos++;
				} else if (currentCharacter == '>' && !fieldSize.empty()) {
					adifState = STOAT_ADIF_STATE_GET_DATA;
					pos++;
				} else {
					adifState = STOAT_ADIF_STATE_BEGIN;
					pos = tagStart + 1;
				}
				break;

			case STOAT_ADIF_STATE_GET_DATA: {
				/* pos is the first byte after the tag */
				adifState = STOAT_ADIF_STATE_BEGIN;
				errno = 0;
				unsigned long long dataLength = strtoull(fieldSize.c_str(), NULL, 10);
				if (errno == ERANGE || dataLength > STOAT_ADIF_MAX_DATA_LENGTH) {
					stoatTrace("ADIFParser::parse", "skipping %s: bad length %s", fieldName.c_str(), fieldSize.c_str());
					break;
				}
				string::size_type remaining = size - pos;
				string::size_type take = dataLength < remaining ? static_cast<string::size_type>(dataLength) : remaining;
				adif_store(rec, fieldName.c_str(), stoat_trimSpace(payload.substr(pos, take)));
				break;
			}
		}
	}
	/* A tag that ends the payload has no data and is dropped. */

	if (rec.get(STOAT_QSO_CALL).empty())
		throw ParseError(STOAT_CALL_MISSING, "");

	ctx.verbose("Parsed ADIF QSO: %s on %s MHz", rec.get(STOAT_QSO_CALL).c_str(), rec.get(STOAT_QSO_FREQ).c_str());
}

}	// namespace stoatlib

/* Output an ADIF field to a string.
 */
string
stoat_adifMakeField(const char *fieldname, const string& value) {
	string out = "<";
	out += fieldname;
	if (!value.empty()) {
		char nbuf[20];
		snprintf(nbuf, sizeof nbuf, ":%lu", static_cast<unsigned long>(value.size()));
		out += nbuf;
		out += ">";
		out += value;
	} else {
		out += ">";
	}
	return out;
}

string
stoat_generateADIF(const QSORecord& rec) {
	string adif = STOAT_ADIF_HEADER;
	for (int i = 0; i < static_cast<int>(sizeof adif_output_order / sizeof adif_output_order[0]); i++) {
		STOAT_QSO_FIELD field = adif_output_order[i];
		const string& value = rec.get(field);
		if (value.empty())
			continue;
		adif += stoat_adifMakeField(stoat_qsoFieldName(field), value);
		adif += " ";
	}
	adif += STOAT_ADIF_EOR;
	adif += "\n";
	return adif;
}
