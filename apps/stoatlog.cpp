/***************************************************************************
                          stoatlog.cpp  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#include "stoatlog.h"

#include "wx/datetime.h"

#include "stoatapp.h"
#include "stoattrace.h"
#include "wxutil.h"

wxString
StoatLogFormatter::Format(wxLogLevel level, const wxString& msg, const wxLogRecordInfo& info) const {
	wxString stamp = wxDateTime::UNow().Format(wxT("%Y/%m/%d %H:%M:%S.%l"));
	return wxString::FromAscii(STOAT_LOG_PREFIX) + stamp + wxT(" ") + msg;
}

LogTee::LogTee() : wxLog(), _file(0) {
	SetFormatter(new StoatLogFormatter);
}

LogTee::~LogTee() {
	if (_file)
		fclose(_file);
}

bool
LogTee::Open(const wxString& filename) {
	_file = fopen(filename.ToUTF8(), "a");
	return _file != 0;
}

void
LogTee::DoLogText(const wxString& msg) {
	const wxScopedCharBuffer smsg = msg.ToUTF8();
	wxCriticalSectionLocker locker(_lock);

	if (stoat_diagFileOpen())
		stoatTrace(NULL, "%s", smsg.data());
	fprintf(stdout, "%s\n", smsg.data());
	fflush(stdout);
	if (_file) {
		fprintf(_file, "%s\n", smsg.data());
		fflush(_file);
	}
}

void
stoat_wxLogBridge(void *userdata, int level, const char *msg) {
	wxString text = DecodeBytes(msg);
	if (level == STOAT_LOG_VERBOSE)
		wxLogVerbose(wxT("%s"), text);
	else
		wxLogMessage(wxT("%s"), text);
}
