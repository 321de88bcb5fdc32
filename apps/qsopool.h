/***************************************************************************
                          qsopool.h  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#ifndef __qsopool_h
#define __qsopool_h

#include "wx/wxprec.h"

#ifndef WX_PRECOMP
	#include "wx/wx.h"
#endif

#include "wx/thread.h"
#include "wx/msgqueue.h"

#include <string>
#include <vector>

#include "dispatch.h"

using std::string;
using std::vector;

/// One unit of work for a worker
struct QSOJob {
	QSOJob() : quit(false) {}
	explicit QSOJob(const string& p) : payload(p), quit(false) {}
	string payload;
	bool quit;		///< Tells the worker to exit
};

class QSOPool;

class QSOWorker : public wxThread {
 public:
	QSOWorker(QSOPool *pool, wxLog *logTarget) : wxThread(wxTHREAD_JOINABLE), _pool(pool), _logTarget(logTarget) {}
 protected:
	virtual wxThread::ExitCode Entry();
 private:
	QSOPool *_pool;
	wxLog *_logTarget;
};

/** A fixed set of worker threads draining one queue of payloads.
  *
  * At most \c limit payloads may be waiting or in progress; Post()
  * refuses more. Each payload is handed to the pipeline on one worker.
  */
class QSOPool {
 public:
	QSOPool(const stoatlib::RecordPipeline& pipeline, int workers, int limit, wxLog *logTarget);
	~QSOPool();
	/// Start the workers. Returns false if none could be started.
	bool Start();
	/// Queue a payload. Returns false if the pool is full.
	bool Post(const string& payload);
	/// Let queued work finish, then stop and join every worker
	void Shutdown();
	/// Payloads waiting or in progress
	int Pending();

 private:
	friend class QSOWorker;
	void Process(const string& payload);
	void Done();
	const stoatlib::RecordPipeline& _pipeline;
	int _nworkers;
	int _limit;
	wxLog *_logTarget;
	wxMessageQueue<QSOJob> _queue;
	vector<QSOWorker *> _workers;
	wxCriticalSection _pendingLock;
	int _pending;
};

#endif	// __qsopool_h
