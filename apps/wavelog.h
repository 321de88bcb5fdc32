/***************************************************************************
                          wavelog.h  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#ifndef __wavelog_h
#define __wavelog_h

#include "wx/wxprec.h"

#ifndef WX_PRECOMP
	#include "wx/wx.h"
#endif

#include <string>
#include <vector>

#include "dispatch.h"
#include "stoat_prefs.h"

using std::string;
using std::vector;

#define WAVELOG_QSO_PATH "/api/qso"
#define WAVELOG_STATUS_CREATED "created"

/// Fixed record posted by the connection test
#define WAVELOG_TEST_ADIF "<ADIF_VER:5>5.0<EOH>\n" \
	"<TEST_CALL:6>K0TEST<QSO_DATE:8>20240101<TIME_ON:6>120000<MODE:4>FT8<FREQ:6>14.074<BAND:3>20M<EOR>"

/// Decoded body of a WaveLog API reply
struct WaveLogResponse {
	string status;
	vector<string> messages;
};

/// Build the QSO endpoint from the configured base URL
string WaveLogApiURL(const wxString& baseURL);

/// Build the JSON request body for an ADIF string
string MakeWaveLogPayload(const StoatPrefs& prefs, const string& adif);

/** Decode a reply body. Returns false and sets \c err if the body is
  * not a JSON object of the expected shape.
  */
bool ParseWaveLogResponse(const string& body, WaveLogResponse& resp, string& err);

/** Submits records to WaveLog over HTTP.
  *
  * Each call makes one request on its own curl handle, so one client may
  * be used from several worker threads.
  */
class WaveLogClient : public stoatlib::QSOSink {
 public:
	explicit WaveLogClient(const StoatPrefs& prefs) : _prefs(prefs) {}
	/// Throws StoatException if the record is not accepted
	virtual void submit(const stoatlib::QSORecord& rec, const string& adif);
	/// Post the test record. Throws StoatException on failure.
	void TestConnection();
 private:
	long Post(const string& json, const char *userAgent, string& body);
	const StoatPrefs& _prefs;
};

#endif	// __wavelog_h
