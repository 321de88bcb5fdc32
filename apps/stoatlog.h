/***************************************************************************
                          stoatlog.h  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#ifndef __stoatlog_h
#define __stoatlog_h

#include "wx/wxprec.h"

#ifndef WX_PRECOMP
	#include "wx/wx.h"
#endif

#include "wx/log.h"
#include "wx/thread.h"

#include <stdio.h>

/** Prefixes each line with STOAT_LOG_PREFIX and a millisecond timestamp */
class StoatLogFormatter : public wxLogFormatter {
	virtual wxString Format(wxLogLevel level, const wxString& msg, const wxLogRecordInfo& info) const;
};

/** Writes log lines to stdout and appends them to a log file.
  *
  * Every line is also copied to the diagnostic trace file. One instance
  * is shared by the main thread and the workers, so writes are
  * serialized.
  */
class LogTee : public wxLog {
 public:
	LogTee();
	virtual ~LogTee();
	/// Open the log file for appending. Returns false on failure.
	bool Open(const wxString& filename);
 protected:
	virtual void DoLogText(const wxString& msg);
 private:
	FILE *_file;
	wxCriticalSection _lock;
};

/** stoat_log_fn that forwards library log lines to wxLog */
void stoat_wxLogBridge(void *userdata, int level, const char *msg);

#endif	// __stoatlog_h
