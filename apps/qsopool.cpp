/***************************************************************************
                          qsopool.cpp  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#include "qsopool.h"

#include "wx/log.h"

#include "stoattrace.h"

wxThread::ExitCode
QSOWorker::Entry() {
	if (_logTarget)
		wxLog::SetThreadActiveTarget(_logTarget);
	for (;;) {
		QSOJob job;
		if (_pool->_queue.Receive(job) != wxMSGQUEUE_NO_ERROR)
			break;
		if (job.quit)
			break;
		_pool->Process(job.payload);
		_pool->Done();
	}
	if (_logTarget)
		wxLog::SetThreadActiveTarget(NULL);
	return (wxThread::ExitCode)0;
}

QSOPool::QSOPool(const stoatlib::RecordPipeline& pipeline, int workers, int limit, wxLog *logTarget)
	: _pipeline(pipeline), _nworkers(workers), _limit(limit), _logTarget(logTarget), _pending(0) {
}

QSOPool::~QSOPool() {
	Shutdown();
}

bool
QSOPool::Start() {
	stoatTrace("QSOPool::Start", "workers=%d limit=%d", _nworkers, _limit);
	for (int i = 0; i < _nworkers; i++) {
		QSOWorker *w = new QSOWorker(this, _logTarget);
		if (w->Create() != wxTHREAD_NO_ERROR || w->Run() != wxTHREAD_NO_ERROR) {
			wxLogError(wxT("Can't start worker thread %d"), i + 1);
			delete w;
			continue;
		}
		_workers.push_back(w);
	}
	return !_workers.empty();
}

bool
QSOPool::Post(const string& payload) {
	{
		wxCriticalSectionLocker locker(_pendingLock);
		if (_pending >= _limit)
			return false;
		_pending++;
	}
	if (_queue.Post(QSOJob(payload)) != wxMSGQUEUE_NO_ERROR) {
		Done();
		return false;
	}
	return true;
}

int
QSOPool::Pending() {
	wxCriticalSectionLocker locker(_pendingLock);
	return _pending;
}

void
QSOPool::Process(const string& payload) {
	// Parse and submit failures are logged by the pipeline
	_pipeline.processMessage(payload);
}

void
QSOPool::Done() {
	wxCriticalSectionLocker locker(_pendingLock);
	_pending--;
}

void
QSOPool::Shutdown() {
	if (_workers.empty())
		return;
	stoatTrace("QSOPool::Shutdown", "pending=%d", Pending());
	// One quit message per worker, queued behind any remaining work
	QSOJob quit;
	quit.quit = true;
	for (size_t i = 0; i < _workers.size(); i++) {
		if (_queue.Post(quit) != wxMSGQUEUE_NO_ERROR)
			wxLogError(wxT("Can't signal worker thread %d to stop"), static_cast<int>(i + 1));
	}
	for (size_t i = 0; i < _workers.size(); i++) {
		_workers[i]->Wait();
		delete _workers[i];
	}
	_workers.clear();
}
