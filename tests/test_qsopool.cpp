/***************************************************************************
                          test_qsopool.cpp  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#include <gtest/gtest.h>

#include "wx/wxprec.h"

#ifndef WX_PRECOMP
	#include "wx/wx.h"
#endif

#include "wx/thread.h"

#include <string>
#include <vector>

#include "qsopool.h"

using std::string;
using std::vector;
using stoatlib::LogContext;
using stoatlib::QSORecord;
using stoatlib::QSOSink;
using stoatlib::RecordPipeline;

/* Records calls from any worker. With gated set, each submit waits for
 * one Release() first.
 */
class GatedSink : public QSOSink {
 public:
	explicit GatedSink(bool gated) : _gated(gated), _gate(0) {}
	virtual void submit(const QSORecord& rec, const string& adif) {
		if (_gated)
			_gate.Wait();
		wxCriticalSectionLocker locker(_lock);
		_calls.push_back(rec.get(STOAT_QSO_CALL));
	}
	void Release() { _gate.Post(); }
	vector<string> Calls() {
		wxCriticalSectionLocker locker(_lock);
		return _calls;
	}
 private:
	bool _gated;
	wxSemaphore _gate;
	wxCriticalSection _lock;
	vector<string> _calls;
};

TEST(QSOPoolTest, FullPoolRefusesPost) {
	GatedSink sink(true);
	LogContext ctx;
	RecordPipeline pipeline(sink, ctx);
	QSOPool pool(pipeline, 1, 2, NULL);
	ASSERT_TRUE(pool.Start());

	// The worker holds the first payload in submit; the second waits
	EXPECT_TRUE(pool.Post("<CALL:5>K1ABC<EOR>"));
	EXPECT_TRUE(pool.Post("<CALL:5>K2DEF<EOR>"));
	EXPECT_EQ(2, pool.Pending());
	EXPECT_FALSE(pool.Post("<CALL:5>K3GHI<EOR>"));
	EXPECT_EQ(2, pool.Pending());

	sink.Release();
	sink.Release();
	pool.Shutdown();

	vector<string> calls = sink.Calls();
	ASSERT_EQ(2u, calls.size());
	EXPECT_EQ("K1ABC", calls[0]);
	EXPECT_EQ("K2DEF", calls[1]);
	EXPECT_EQ(0, pool.Pending());
}

TEST(QSOPoolTest, ShutdownDrainsQueue) {
	GatedSink sink(false);
	LogContext ctx;
	RecordPipeline pipeline(sink, ctx);
	QSOPool pool(pipeline, 1, 8, NULL);
	ASSERT_TRUE(pool.Start());

	EXPECT_TRUE(pool.Post("<CALL:5>K1ABC<EOR><CALL:5>K2DEF<EOR>"));
	EXPECT_TRUE(pool.Post("<CALL:4>W1AW<EOR>"));
	EXPECT_TRUE(pool.Post("<MODE:3>FT8<EOR>"));		// no CALL: logged and skipped
	EXPECT_TRUE(pool.Post("<CALL:5>K3GHI<EOR>"));
	pool.Shutdown();

	vector<string> calls = sink.Calls();
	ASSERT_EQ(4u, calls.size());
	EXPECT_EQ("K1ABC", calls[0]);
	EXPECT_EQ("K2DEF", calls[1]);
	EXPECT_EQ("W1AW", calls[2]);
	EXPECT_EQ("K3GHI", calls[3]);
	EXPECT_EQ(0, pool.Pending());
}

TEST(QSOPoolTest, SeveralWorkersProcessEverything) {
	GatedSink sink(false);
	LogContext ctx;
	RecordPipeline pipeline(sink, ctx);
	QSOPool pool(pipeline, 4, 64, NULL);
	ASSERT_TRUE(pool.Start());

	for (int i = 0; i < 20; i++)
		EXPECT_TRUE(pool.Post("<CALL:5>K1ABC<EOR>"));
	pool.Shutdown();

	EXPECT_EQ(20u, sink.Calls().size());
	EXPECT_EQ(0, pool.Pending());
}

TEST(QSOPoolTest, NoWorkers) {
	GatedSink sink(false);
	LogContext ctx;
	RecordPipeline pipeline(sink, ctx);
	QSOPool pool(pipeline, 0, 4, NULL);
	EXPECT_FALSE(pool.Start());
	pool.Shutdown();
}
