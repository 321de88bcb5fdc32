/***************************************************************************
                          stoat_prefs.cpp  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#include "stoat_prefs.h"

#include "wx/filename.h"
#include "wx/wfstream.h"
#include "wx/sstream.h"

#include "stoatexcept.h"
#include "stoattrace.h"

StoatPrefs::StoatPrefs()
	: timeout(DEFAULT_WAVELOG_TIMEOUT), port(DEFAULT_SERVER_PORT), verbose(DEFAULT_SERVER_VERBOSE),
	  workers(DEFAULT_SERVER_WORKERS), queueLimit(DEFAULT_SERVER_QUEUE_LIMIT) {
}

bool
ParsePrefBool(const wxString& value, bool& result) {
	static const char *trueValues[] = { "1", "t", "true", "y", "yes", "on", 0 };
	static const char *falseValues[] = { "0", "f", "false", "n", "no", "off", 0 };
	wxString v = value;
	v.Trim(true);
	v.Trim(false);
	for (int i = 0; trueValues[i]; i++) {
		if (v.IsSameAs(wxString::FromAscii(trueValues[i]), false)) {
			result = true;
			return true;
		}
	}
	for (int i = 0; falseValues[i]; i++) {
		if (v.IsSameAs(wxString::FromAscii(falseValues[i]), false)) {
			result = false;
			return true;
		}
	}
	return false;
}

static void
readLong(wxConfigBase& config, const wxString& key, long& value) {
	wxString s;
	if (!config.Read(key, &s))
		return;
	s.Trim(true);
	s.Trim(false);
	if (s.IsEmpty())
		return;
	long v;
	if (!s.ToLong(&v))
		throw StoatException(wxString::Format(wxT("failed to map config: %s = \"%s\" is not a number"), key, s).ToStdString());
	value = v;
}

static wxString
readString(wxConfigBase& config, const wxString& key) {
	wxString s = config.Read(key, wxT(""));
	s.Trim(true);
	s.Trim(false);
	return s;
}

void
ReadPrefs(wxConfigBase& config, StoatPrefs& prefs) {
	prefs.url = readString(config, wxT("/wavelog/url"));
	prefs.apiKey = readString(config, wxT("/wavelog/api_key"));
	prefs.stationProfileId = readString(config, wxT("/wavelog/station_profile_id"));
	readLong(config, wxT("/wavelog/timeout"), prefs.timeout);

	readLong(config, wxT("/server/port"), prefs.port);
	wxString verbose;
	if (config.Read(wxT("/server/verbose"), &verbose) && !verbose.IsEmpty()) {
		if (!ParsePrefBool(verbose, prefs.verbose))
			throw StoatException(wxString::Format(wxT("failed to map config: verbose = \"%s\" is not a boolean"), verbose).ToStdString());
	}
	readLong(config, wxT("/server/workers"), prefs.workers);
	readLong(config, wxT("/server/queue_limit"), prefs.queueLimit);

	if (prefs.url.IsEmpty() || prefs.apiKey.IsEmpty() || prefs.stationProfileId.IsEmpty())
		throw StoatException("missing required WaveLog configuration (url, api_key, station_profile_id)");
	if (prefs.port < 1 || prefs.port > 65535)
		throw StoatException(wxString::Format(wxT("invalid server port %ld"), prefs.port).ToStdString());
	if (prefs.timeout < 0)
		throw StoatException(wxString::Format(wxT("invalid WaveLog timeout %ld"), prefs.timeout).ToStdString());
	if (prefs.workers < 1)
		throw StoatException(wxString::Format(wxT("invalid worker count %ld"), prefs.workers).ToStdString());
	if (prefs.queueLimit < 1)
		throw StoatException(wxString::Format(wxT("invalid queue_limit %ld"), prefs.queueLimit).ToStdString());
}

void
CreateDefaultConfig(const wxString& file) {
	stoatTrace("CreateDefaultConfig", "file=%s", S(file));
	wxStringInputStream empty(wxEmptyString);
	wxFileConfig config(empty);
	config.Write(wxT("/wavelog/url"), DEFAULT_NEW_URL);
	config.Write(wxT("/wavelog/api_key"), DEFAULT_NEW_API_KEY);
	config.Write(wxT("/wavelog/station_profile_id"), DEFAULT_NEW_PROFILE_ID);
	config.Write(wxT("/wavelog/timeout"), static_cast<long>(DEFAULT_WAVELOG_TIMEOUT));
	config.Write(wxT("/server/port"), static_cast<long>(DEFAULT_SERVER_PORT));
	config.Write(wxT("/server/verbose"), DEFAULT_NEW_VERBOSE);

	wxFileOutputStream out(file);
	if (!out.IsOk() || !config.Save(out))
		throw StoatException("failed to create default config: cannot write " + file.ToStdString());
}

void
LoadPrefs(const wxString& file, StoatPrefs& prefs) {
	stoatTrace("LoadPrefs", "file=%s", S(file));
	if (!wxFileName::FileExists(file)) {
		wxLogMessage(wxT("Creating default config file: %s"), file);
		CreateDefaultConfig(file);
		wxLogMessage(wxT("Please edit %s with your WaveLog settings and restart"), file);
		throw StoatException("default config created - please configure and restart");
	}

	wxFileInputStream in(file);
	if (!in.IsOk())
		throw StoatException("failed to parse config file: cannot read " + file.ToStdString());
	wxFileConfig config(in);
	config.SetExpandEnvVars(false);
	ReadPrefs(config, prefs);
}
