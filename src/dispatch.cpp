/***************************************************************************
                          dispatch.cpp  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#include "dispatch.h"

#include <exception>

#include "adif.h"
#include "contactxml.h"
#include "normalize.h"
#include "stoatexc.h"

using std::exception;

int
stoat_detectFormat(const string& payload) {
	if (payload.find("xml") != string::npos)
		return STOAT_FORMAT_XML;
	return STOAT_FORMAT_ADIF;
}

int
stoat_splitADIFBatch(const string& payload, vector<string>& records) {
	static const string eor = STOAT_ADIF_EOR;
	records.clear();
	if (payload.find(eor) == string::npos) {
		records.push_back(payload);
		return 1;
	}

	vector<string> pieces;
	string::size_type start = 0;
	string::size_type idx;
	while ((idx = payload.find(eor, start)) != string::npos) {
		pieces.push_back(payload.substr(start, idx - start));
		start = idx + eor.size();
	}
	pieces.push_back(payload.substr(start));

	for (vector<string>::size_type i = 0; i < pieces.size(); i++) {
		string rec = stoat_trimSpace(pieces[i]);
		if (rec.empty())
			continue;
		if (i < pieces.size() - 1)
			rec += eor;
		records.push_back(rec);
	}
	return static_cast<int>(pieces.size());
}

namespace stoatlib {

string
prepareQSO(const string& message, int format, QSORecord& rec, const LogContext& ctx) {
	if (format == STOAT_FORMAT_XML) {
		XMLParser parser;
		parser.parse(message, rec, ctx);
	} else {
		ADIFParser parser;
		parser.parse(message, rec, ctx);
	}
	stoat_normalizeQSO(rec, ctx);
	return stoat_generateADIF(rec);
}

int
RecordPipeline::processMessage(const string& message) const {
	if (stoat_detectFormat(message) == STOAT_FORMAT_XML) {
		// XML carries a single contact
		return processSingleQSO(message, true) ? 1 : 0;
	}
	if (message.find(STOAT_ADIF_EOR) != string::npos)
		return processMultipleQSOs(message);
	return processSingleQSO(message, false) ? 1 : 0;
}

int
RecordPipeline::processMultipleQSOs(const string& payload) const {
	vector<string> records;
	int npieces = stoat_splitADIFBatch(payload, records);

	int processedCount = 0;
	for (vector<string>::size_type i = 0; i < records.size(); i++) {
		_ctx.verbose("Processing QSO %d of %d", processedCount + 1, npieces - 1);
		if (processSingleQSO(records[i], false))
			processedCount++;
	}

	if (processedCount > 1)
		_ctx.message("Successfully processed %d QSOs from batch payload", processedCount);
	return processedCount;
}

bool
RecordPipeline::processSingleQSO(const string& message, bool isXML) const {
	QSORecord rec;
	string adif;
	try {
		adif = prepareQSO(message, isXML ? STOAT_FORMAT_XML : STOAT_FORMAT_ADIF, rec, _ctx);
	} catch(ParseError& x) {
		_ctx.message("Failed to parse message: %s", x.what());
		return false;
	}

	try {
		_sink.submit(rec, adif);
	} catch(exception& x) {
		_ctx.message("Failed to send QSO to WaveLog: %s", x.what());
		return false;
	}
	return true;
}

}	// namespace stoatlib
