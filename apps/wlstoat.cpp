/***************************************************************************
                          wlstoat.cpp  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#include "wx/wxprec.h"

#ifndef WX_PRECOMP
	#include "wx/wx.h"
#endif

#include "wx/app.h"
#include "wx/cmdline.h"
#include "wx/log.h"

#include <curl/curl.h>
#include <signal.h>
#include <pthread.h>
#include <string.h>
#include <errno.h>

#include <iostream>

#include "dispatch.h"
#include "qsopool.h"
#include "stoat_prefs.h"
#include "stoatapp.h"
#include "stoatexcept.h"
#include "stoatlog.h"
#include "stoattrace.h"
#include "udpserver.h"
#include "wavelog.h"

using std::cerr;
using std::cout;
using std::endl;

static volatile sig_atomic_t stopRequested = 0;

static void
onSignal(int) {
	stopRequested = 1;
}

static void
printUsage() {
	cout << STOAT_APP_DESC << "\n"
	     << "\n"
	     << "Usage:\n"
	     << "  wlstoat [options] [config.ini]\n"
	     << "  wlstoat --help\n"
	     << "\n"
	     << "Options:\n"
	     << "  -h, --help           Show this help message\n"
	     << "  -t, --test           Test WaveLog connection\n"
	     << "  -c, --config FILE    Use specified config file\n"
	     << "  -d, --diagnose FILE  Write a diagnostic trace to FILE\n"
	     << "  -v, --version        Display the version information and exit\n"
	     << "\n"
	     << "Default config file: config.ini\n"
	     << "\n"
	     << "Example config.ini:\n"
	     << "[wavelog]\n"
	     << "url = https://wavelog.example.com\n"
	     << "api_key = your-api-key\n"
	     << "station_profile_id = 1\n"
	     << "timeout = 5000\n"
	     << "\n"
	     << "[server]\n"
	     << "port = 2333\n"
	     << "verbose = true\n"
	     << "workers = 4\n"
	     << "queue_limit = 64\n";
}

/////////// Application //////////////

class StoatApp : public wxAppConsole {
 public:
	StoatApp() : _status(STOAT_EXIT_SUCCESS), _done(false), _testMode(false), _log(0) {}
	virtual ~StoatApp();
	virtual bool OnInit();
	virtual int OnRun();
 private:
	int Serve();
	int _status;			// Exit status when _done
	bool _done;			// Nothing left to do after OnInit
	bool _testMode;
	wxString _configFile;
	LogTee *_log;
	StoatPrefs _prefs;
};

StoatApp::~StoatApp() {
	wxLog::SetActiveTarget(NULL);
	delete _log;
	stoat_closeDiagFile();
}

wxIMPLEMENT_APP_CONSOLE(StoatApp);

bool
StoatApp::OnInit() {
	static const wxCmdLineEntryDesc cmdLineDesc[] = {
		{ wxCMD_LINE_OPTION, "c", "config",	"Configuration file" },
		{ wxCMD_LINE_OPTION, "d", "diagnose",	"File name for diagnostic tracking log" },
		{ wxCMD_LINE_SWITCH, "h", "help",	"Display command line help", wxCMD_LINE_VAL_NONE, wxCMD_LINE_OPTION_HELP },
		{ wxCMD_LINE_SWITCH, "t", "test",	"Test the WaveLog connection and exit" },
		{ wxCMD_LINE_SWITCH, "v", "version",	"Display the version information and exit" },
		{ wxCMD_LINE_PARAM,  NULL, NULL,	"Configuration file", wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_OPTIONAL },
		{ wxCMD_LINE_NONE }
	};

	wxCmdLineParser parser;
	parser.SetCmdLine(argc, argv);
	parser.SetDesc(cmdLineDesc);
	// only allow "-" for options
	parser.SetSwitchChars(wxT("-"));
	// Usage is printed by printUsage(), which includes an example config
	int parseStatus = parser.Parse(false);
	if (parseStatus == -1) {	// said "-h"
		printUsage();
		_done = true;
		return true;
	}
	if (parseStatus != 0) {
		printUsage();
		_status = STOAT_EXIT_COMMAND_ERROR;
		_done = true;
		return true;
	}
	if (parser.Found(wxT("v"))) {
		cout << STOAT_APP_NAME " Version " STOATLIB_VERSION << endl;
		_done = true;
		return true;
	}

	wxString diagFile;
	if (parser.Found(wxT("d"), &diagFile)) {
		if (stoat_openDiagFile(diagFile.ToUTF8())) {
			cerr << "Error opening diagnostic log " << diagFile.ToUTF8() << ": " << strerror(errno) << endl;
		} else {
			stoatTrace(NULL, STOAT_APP_NAME " Version " STOATLIB_VERSION);
		}
	}

	_configFile = DEFAULT_CONFIG_FILE;
	if (parser.GetParamCount() > 0)
		_configFile = parser.GetParam(0);
	parser.Found(wxT("c"), &_configFile);
	_testMode = parser.Found(wxT("t"));

	_log = new LogTee();
	if (!_log->Open(wxString::FromAscii(STOAT_LOG_FILE))) {
		cerr << "Failed to open log file " STOAT_LOG_FILE ": " << strerror(errno) << endl;
		_status = STOAT_EXIT_LOG_ERROR;
		_done = true;
		return true;
	}
	wxLog::SetActiveTarget(_log);
	wxLog::SetTimestamp(wxEmptyString);
	return true;
}

int
StoatApp::OnRun() {
	if (_done)
		return _status;

	try {
		LoadPrefs(_configFile, _prefs);
	}
	catch(StoatException& x) {
		wxLogMessage(wxT("Failed to load configuration: %hs"), x.what());
		return STOAT_EXIT_CONFIG_ERROR;
	}
	wxLog::SetVerbose(_prefs.verbose);

	if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
		wxLogMessage(wxT("Failed to initialize libcurl"));
		return STOAT_EXIT_UNKNOWN;
	}

	int status;
	if (_testMode) {
		wxLogMessage(wxT("Running in test mode"));
		WaveLogClient client(_prefs);
		try {
			client.TestConnection();
			wxLogMessage(wxT("WaveLog connection test passed"));
			status = STOAT_EXIT_SUCCESS;
		}
		catch(StoatException& x) {
			wxLogMessage(wxT("WaveLog connection test failed: %hs"), x.what());
			status = STOAT_EXIT_CONNECTION_FAILED;
		}
	} else {
		status = Serve();
	}
	curl_global_cleanup();
	return status;
}

int
StoatApp::Serve() {
	wxLogMessage(wxT("Starting WaveLog Transport CLI on port %ld"), _prefs.port);

	// The stop signals stay blocked except while the listener waits for a
	// datagram. Workers inherit the blocked mask.
	sigset_t stopSignals, oldMask;
	sigemptyset(&stopSignals);
	sigaddset(&stopSignals, SIGINT);
	sigaddset(&stopSignals, SIGTERM);
	pthread_sigmask(SIG_BLOCK, &stopSignals, &oldMask);
	sigset_t waitMask = oldMask;
	sigdelset(&waitMask, SIGINT);
	sigdelset(&waitMask, SIGTERM);

	struct sigaction sa;
	memset(&sa, 0, sizeof sa);
	sa.sa_handler = onSignal;
	sigemptyset(&sa.sa_mask);
	sa.sa_flags = 0;		// no SA_RESTART: ppoll must return EINTR
	if (sigaction(SIGINT, &sa, NULL) < 0 || sigaction(SIGTERM, &sa, NULL) < 0) {
		wxLogMessage(wxT("Can't install signal handlers: %hs"), strerror(errno));
		pthread_sigmask(SIG_SETMASK, &oldMask, NULL);
		return STOAT_EXIT_UNKNOWN;
	}

	UDPServer server(static_cast<int>(_prefs.port));
	try {
		server.Open();
	}
	catch(StoatException& x) {
		wxLogMessage(wxT("Failed to start UDP server: %hs"), x.what());
		pthread_sigmask(SIG_SETMASK, &oldMask, NULL);
		return STOAT_EXIT_SOCKET_ERROR;
	}

	WaveLogClient client(_prefs);
	stoatlib::LogContext ctx(_prefs.verbose, stoat_wxLogBridge, NULL);
	stoatlib::RecordPipeline pipeline(client, ctx);
	QSOPool pool(pipeline, static_cast<int>(_prefs.workers), static_cast<int>(_prefs.queueLimit), _log);

	if (!pool.Start()) {
		wxLogMessage(wxT("Failed to start worker threads"));
		pthread_sigmask(SIG_SETMASK, &oldMask, NULL);
		return STOAT_EXIT_UNKNOWN;
	}

	server.Run(pool, _prefs.verbose, stopRequested, waitMask);

	wxLogMessage(wxT("Shutting down, %d payloads pending"), pool.Pending());
	server.Close();
	pool.Shutdown();
	pthread_sigmask(SIG_SETMASK, &oldMask, NULL);
	return STOAT_EXIT_SUCCESS;
}
