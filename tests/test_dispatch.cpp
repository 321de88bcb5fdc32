/***************************************************************************
                          test_dispatch.cpp  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "dispatch.h"
#include "stoatexc.h"

using std::string;
using std::vector;
using stoatlib::LogContext;
using stoatlib::QSORecord;
using stoatlib::QSOSink;
using stoatlib::RecordPipeline;
using stoatlib::stoatexc;

/* Keeps every submitted record; refuses calls listed in reject */
class RecordingSink : public QSOSink {
 public:
	virtual void submit(const QSORecord& rec, const string& adif) {
		if (rec.get(STOAT_QSO_CALL) == reject)
			throw stoatexc("QSO not added (status: failed): duplicate");
		calls.push_back(rec.get(STOAT_QSO_CALL));
		bands.push_back(rec.get(STOAT_QSO_BAND));
		documents.push_back(adif);
	}
	string reject;
	vector<string> calls;
	vector<string> bands;
	vector<string> documents;
};

static void
collect(void *userdata, int level, const char *msg) {
	vector<string> *lines = static_cast<vector<string> *>(userdata);
	lines->push_back(string(level == STOAT_LOG_VERBOSE ? "V " : "I ") + msg);
}

static bool
logged(const vector<string>& lines, const string& text) {
	for (vector<string>::size_type i = 0; i < lines.size(); i++)
		if (lines[i].find(text) != string::npos)
			return true;
	return false;
}

TEST(DetectFormatTest, Substring) {
	EXPECT_EQ(STOAT_FORMAT_XML, stoat_detectFormat("<?xml version=\"1.0\"?><contactinfo/>"));
	EXPECT_EQ(STOAT_FORMAT_ADIF, stoat_detectFormat("<CALL:5>K1ABC<EOR>"));
	EXPECT_EQ(STOAT_FORMAT_XML, stoat_detectFormat("<CALL:5>K1ABC<COMMENT:8>sent xml<EOR>"));
	EXPECT_EQ(STOAT_FORMAT_ADIF, stoat_detectFormat("<?XML version=\"1.0\"?>"));
}

TEST(SplitBatchTest, TwoRecords) {
	vector<string> records;
	EXPECT_EQ(3, stoat_splitADIFBatch("<CALL:5>K1ABC<EOR><CALL:5>K2DEF<EOR>", records));
	ASSERT_EQ(2u, records.size());
	EXPECT_EQ("<CALL:5>K1ABC<EOR>", records[0]);
	EXPECT_EQ("<CALL:5>K2DEF<EOR>", records[1]);
}

TEST(SplitBatchTest, TrimsAndDropsEmpty) {
	vector<string> records;
	EXPECT_EQ(3, stoat_splitADIFBatch("<ADIF_VER:5>3.1.0<EOH>\n<CALL:5>K1ABC <EOR>\n\n<EOR>\n<CALL:5>K2DEF", records));
	ASSERT_EQ(2u, records.size());
	EXPECT_EQ("<ADIF_VER:5>3.1.0<EOH>\n<CALL:5>K1ABC<EOR>", records[0]);
	EXPECT_EQ("<CALL:5>K2DEF", records[1]);
}

TEST(SplitBatchTest, NoDelimiter) {
	vector<string> records;
	EXPECT_EQ(1, stoat_splitADIFBatch("  <CALL:5>K1ABC  ", records));
	ASSERT_EQ(1u, records.size());
	EXPECT_EQ("  <CALL:5>K1ABC  ", records[0]);
}

TEST(PrepareQSOTest, NormalizesAndSerializes) {
	QSORecord rec;
	string adif = stoatlib::prepareQSO("<CALL:5>K1ABC<FREQ:6>14.074<TX_PWR:4>50mw<EOR>",
		STOAT_FORMAT_ADIF, rec, LogContext());
	EXPECT_EQ("20M", rec.get(STOAT_QSO_BAND));
	EXPECT_EQ("<ADIF_VER:5>5.0<EOH>\n<CALL:5>K1ABC <FREQ:6>14.074 <BAND:3>20M <TX_PWR:5>0.050 <EOR>\n", adif);
}

class PipelineTest : public ::testing::Test {
 protected:
	PipelineTest() : ctx(true, collect, &lines), pipeline(sink, ctx) {}
	RecordingSink sink;
	vector<string> lines;
	LogContext ctx;
	RecordPipeline pipeline;
};

TEST_F(PipelineTest, SingleADIF) {
	EXPECT_EQ(1, pipeline.processMessage("<CALL:5>K1ABC<MODE:3>FT8<FREQ:6>14.074"));
	ASSERT_EQ(1u, sink.calls.size());
	EXPECT_EQ("K1ABC", sink.calls[0]);
	EXPECT_EQ("20M", sink.bands[0]);
	EXPECT_TRUE(logged(lines, "V Parsed ADIF QSO: K1ABC on 14.074 MHz"));
}

TEST_F(PipelineTest, Batch) {
	EXPECT_EQ(2, pipeline.processMessage("<CALL:5>K1ABC<EOR><CALL:5>K2DEF<EOR>"));
	ASSERT_EQ(2u, sink.calls.size());
	EXPECT_EQ("K1ABC", sink.calls[0]);
	EXPECT_EQ("K2DEF", sink.calls[1]);
	EXPECT_TRUE(logged(lines, "V Processing QSO 1 of 2"));
	EXPECT_TRUE(logged(lines, "V Processing QSO 2 of 2"));
	EXPECT_TRUE(logged(lines, "I Successfully processed 2 QSOs from batch payload"));
}

TEST_F(PipelineTest, BadRecordDoesNotStopBatch) {
	EXPECT_EQ(2, pipeline.processMessage("<CALL:5>K1ABC<EOR><MODE:3>FT8<EOR><CALL:5>K3GHI<EOR>"));
	ASSERT_EQ(2u, sink.calls.size());
	EXPECT_EQ("K3GHI", sink.calls[1]);
	EXPECT_TRUE(logged(lines, "I Failed to parse message: Missing required CALL field"));
}

TEST_F(PipelineTest, SinkFailureDoesNotStopBatch) {
	sink.reject = "K2DEF";
	EXPECT_EQ(2, pipeline.processMessage("<CALL:5>K1ABC<EOR><CALL:5>K2DEF<EOR><CALL:5>K3GHI<EOR>"));
	ASSERT_EQ(2u, sink.calls.size());
	EXPECT_TRUE(logged(lines, "I Failed to send QSO to WaveLog: QSO not added (status: failed): duplicate"));
}

TEST_F(PipelineTest, SingleSuccessIsNotSummarized) {
	EXPECT_EQ(1, pipeline.processMessage("<CALL:5>K1ABC<EOR><MODE:3>FT8<EOR>"));
	EXPECT_FALSE(logged(lines, "Successfully processed"));
}

TEST_F(PipelineTest, XMLPayload) {
	EXPECT_EQ(1, pipeline.processMessage(
		"<?xml version=\"1.0\" encoding=\"utf-8\"?><contactinfo>"
		"<timestamp>2024-03-15T12:30:45</timestamp><call>K1ABC</call>"
		"<txfreq>705000</txfreq><rxfreq>705000</rxfreq><mode>LSB</mode>"
		"</contactinfo>"));
	ASSERT_EQ(1u, sink.documents.size());
	EXPECT_EQ("<ADIF_VER:5>5.0<EOH>\n<CALL:5>K1ABC <QSO_DATE:8>20240315 <TIME_ON:6>123045 "
	          "<MODE:3>SSB <FREQ:8>7.050000 <FREQ_RX:8>7.050000 <BAND:3>40M <EOR>\n",
	          sink.documents[0]);
}

TEST_F(PipelineTest, BadXMLIsLogged) {
	EXPECT_EQ(0, pipeline.processMessage("<?xml version=\"1.0\"?><contactinfo><call>K1ABC</call>"));
	EXPECT_TRUE(sink.calls.empty());
	EXPECT_TRUE(logged(lines, "I Failed to parse message: XML parsing failed"));
}

TEST(PipelineQuietTest, DefaultContextIsSilent) {
	RecordingSink sink;
	RecordPipeline pipeline(sink, LogContext());
	EXPECT_TRUE(pipeline.processSingleQSO("<CALL:5>K1ABC", false));
	EXPECT_FALSE(pipeline.processSingleQSO("<CALL:5>K1ABC", true));
	EXPECT_EQ(1u, sink.calls.size());
}
