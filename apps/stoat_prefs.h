/***************************************************************************
                          stoat_prefs.h  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#ifndef __STOAT_PREFS_H
#define __STOAT_PREFS_H

#include "wx/wxprec.h"

#ifndef WX_PRECOMP
	#include "wx/wx.h"
#endif

#include "wx/fileconf.h"

#define DEFAULT_CONFIG_FILE wxT("config.ini")

#define DEFAULT_WAVELOG_TIMEOUT 5000
#define DEFAULT_SERVER_PORT 2333
#define DEFAULT_SERVER_VERBOSE false
#define DEFAULT_SERVER_WORKERS 4
#define DEFAULT_SERVER_QUEUE_LIMIT 64

// Values written to a freshly created config file
#define DEFAULT_NEW_URL wxT("https://your-wavelog-url.com")
#define DEFAULT_NEW_API_KEY wxT("your-api-key-here")
#define DEFAULT_NEW_PROFILE_ID wxT("1")
#define DEFAULT_NEW_VERBOSE wxT("true")

/// Settings read from the config file at startup
class StoatPrefs {
 public:
	StoatPrefs();
	// [wavelog]
	wxString url;
	wxString apiKey;
	wxString stationProfileId;
	long timeout;			///< HTTP timeout, milliseconds
	// [server]
	long port;
	bool verbose;
	long workers;
	long queueLimit;
};

/** Load \c file into \c prefs.
  *
  * A missing file is replaced by a default one and reported as an error.
  * Throws StoatException on any problem.
  */
void LoadPrefs(const wxString& file, StoatPrefs& prefs);

/** Load settings from an already opened config */
void ReadPrefs(wxConfigBase& config, StoatPrefs& prefs);

/** Write a default config file. Throws StoatException. */
void CreateDefaultConfig(const wxString& file);

/** Parse an INI boolean (true/false, yes/no, on/off, 1/0, t/f, y/n) */
bool ParsePrefBool(const wxString& value, bool& result);

#endif	// __STOAT_PREFS_H
