/***************************************************************************
                          wavelog.cpp  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#include "wavelog.h"

#include <curl/curl.h>

#include <wx/jsonval.h>
#include <wx/jsonreader.h>
#include <wx/jsonwriter.h>

#include "stoatapp.h"
#include "stoatexcept.h"
#include "stoattrace.h"
#include "wxutil.h"

using stoatlib::QSORecord;

class ResponseHandler {
 public:
	string s;
	ResponseHandler(): s() { s.reserve(2000); }

	size_t internal_recv(char *ptr, size_t size, size_t nmemb) {
		s.append(ptr, size*nmemb);
		return size*nmemb;
	}

	static size_t recv(char *ptr, size_t size, size_t nmemb, void *userdata) {
		return (reinterpret_cast<ResponseHandler*>(userdata))->internal_recv(ptr, size, nmemb);
	}
};

string
WaveLogApiURL(const wxString& baseURL) {
	wxString url = baseURL;
	if (url.EndsWith(wxT("/")))
		url.RemoveLast();
	return string(url.ToUTF8()) + WAVELOG_QSO_PATH;
}

string
MakeWaveLogPayload(const StoatPrefs& prefs, const string& adif) {
	wxJSONValue root;
	root[wxT("key")] = prefs.apiKey;
	root[wxT("station_profile_id")] = prefs.stationProfileId;
	root[wxT("type")] = wxT("adif");
	bool lossy;
	root[wxT("string")] = DecodeBytes(adif, &lossy);
	if (lossy)
		wxLogMessage(wxT("QSO contains invalid UTF-8; bad bytes replaced with U+FFFD"));

	wxJSONWriter writer(wxJSONWRITER_NONE);
	wxString out;
	writer.Write(root, out);
	return string(out.ToUTF8());
}

bool
ParseWaveLogResponse(const string& body, WaveLogResponse& resp, string& err) {
	wxJSONReader reader;
	wxJSONValue root;

	int errors = reader.Parse(DecodeBytes(body), &root);
	if (errors > 0) {
		const wxArrayString& msgs = reader.GetErrors();
		err = msgs.IsEmpty() ? "invalid JSON" : string(msgs[0].ToUTF8());
		return false;
	}
	if (!root.IsObject()) {
		err = "response is not a JSON object";
		return false;
	}

	resp.status.clear();
	resp.messages.clear();
	if (root.HasMember(wxT("status"))) {
		wxJSONValue status = root[wxT("status")];
		if (!status.IsNull()) {
			if (!status.IsString()) {
				err = "status is not a string";
				return false;
			}
			resp.status = status.AsString().ToUTF8();
		}
	}
	if (root.HasMember(wxT("messages"))) {
		wxJSONValue msgs = root[wxT("messages")];
		if (!msgs.IsNull()) {
			if (!msgs.IsArray()) {
				err = "messages is not an array";
				return false;
			}
			for (int x = 0; x < msgs.Size(); x++) {
				if (!msgs[x].IsString()) {
					err = "messages contains a non-string value";
					return false;
				}
				resp.messages.push_back(string(msgs[x].AsString().ToUTF8()));
			}
		}
	}
	return true;
}

/* POST json to the QSO endpoint. Returns the HTTP status and fills body;
 * throws StoatException if no response was received.
 */
long
WaveLogClient::Post(const string& json, const char *userAgent, string& body) {
	string url = WaveLogApiURL(_prefs.url);
	stoatTrace("WaveLogClient::Post", "url=%s agent=%s", url.c_str(), userAgent);

	CURL *curlReq = curl_easy_init();
	if (!curlReq)
		throw StoatException("HTTP request failed: can't initialize curl");

	struct curl_slist *headers = NULL;
	headers = curl_slist_append(headers, "Content-Type: application/json");

	ResponseHandler handler;
	char errorbuf[CURL_ERROR_SIZE];
	errorbuf[0] = '\0';

	curl_easy_setopt(curlReq, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curlReq, CURLOPT_USERAGENT, userAgent);
	curl_easy_setopt(curlReq, CURLOPT_HTTPHEADER, headers);
	curl_easy_setopt(curlReq, CURLOPT_POST, 1L);
	curl_easy_setopt(curlReq, CURLOPT_POSTFIELDS, json.c_str());
	curl_easy_setopt(curlReq, CURLOPT_POSTFIELDSIZE, static_cast<long>(json.size()));
	curl_easy_setopt(curlReq, CURLOPT_TIMEOUT_MS, _prefs.timeout);
	curl_easy_setopt(curlReq, CURLOPT_NOSIGNAL, 1L);	// worker threads
	curl_easy_setopt(curlReq, CURLOPT_WRITEFUNCTION, &ResponseHandler::recv);
	curl_easy_setopt(curlReq, CURLOPT_WRITEDATA, &handler);
	curl_easy_setopt(curlReq, CURLOPT_ERRORBUFFER, errorbuf);

	CURLcode retval = curl_easy_perform(curlReq);
	long status = 0;
	if (retval == CURLE_OK)
		curl_easy_getinfo(curlReq, CURLINFO_RESPONSE_CODE, &status);
	curl_slist_free_all(headers);
	curl_easy_cleanup(curlReq);

	if (retval != CURLE_OK) {
		stoatTrace("WaveLogClient::Post", "curl error %d: %s", retval, errorbuf);
		throw StoatException(string("HTTP request failed: ") + (errorbuf[0] ? errorbuf : curl_easy_strerror(retval)));
	}
	stoatTrace("WaveLogClient::Post", "status=%ld body=%s", status, handler.s.c_str());
	body = handler.s;
	return status;
}

void
WaveLogClient::submit(const QSORecord& rec, const string& adif) {
	const char *call = rec.get(STOAT_QSO_CALL).c_str();
	const char *freq = rec.get(STOAT_QSO_FREQ).c_str();
	string json = MakeWaveLogPayload(_prefs, adif);

	wxLogVerbose(wxT("Sending QSO to WaveLog: %hs on %hs"), call, freq);
	wxLogVerbose(wxT("API URL: %hs"), WaveLogApiURL(_prefs.url).c_str());
	wxLogVerbose(wxT("Payload: %s"), wxString::FromUTF8(json.c_str()));

	string body;
	long status = Post(json, STOAT_USER_AGENT, body);
	if (status < 200 || status > 299)
		throw StoatException(wxString::Format(wxT("API returned status code: %ld"), status).ToStdString());

	WaveLogResponse resp;
	string err;
	if (!ParseWaveLogResponse(body, resp, err))
		throw StoatException("failed to decode response: " + err);

	if (resp.status != WAVELOG_STATUS_CREATED) {
		string msgs;
		for (size_t i = 0; i < resp.messages.size(); i++) {
			if (i > 0)
				msgs += ", ";
			msgs += resp.messages[i];
		}
		throw StoatException("QSO not added (status: " + resp.status + "): " + msgs);
	}
	wxLogMessage(wxT("QSO successfully added: %hs on %hs MHz"), call, freq);
}

void
WaveLogClient::TestConnection() {
	string json = MakeWaveLogPayload(_prefs, WAVELOG_TEST_ADIF);
	wxLogMessage(wxT("Testing WaveLog connection to: %hs"), WaveLogApiURL(_prefs.url).c_str());

	string body;
	long status = Post(json, STOAT_TEST_USER_AGENT, body);

	WaveLogResponse resp;
	string err;
	if (!ParseWaveLogResponse(body, resp, err))
		throw StoatException("failed to decode response: " + err);

	wxLogMessage(wxT("WaveLog connection test - Status: %ld, Response: %hs"), status, resp.status.c_str());
	if (status >= 200 && status <= 299) {
		wxLogMessage(wxT("WaveLog connection successful"));
		return;
	}
	throw StoatException(wxString::Format(wxT("WaveLog connection failed: HTTP %ld - %hs"), status, resp.status.c_str()).ToStdString());
}
