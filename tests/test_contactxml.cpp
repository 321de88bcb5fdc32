/***************************************************************************
                          test_contactxml.cpp  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#include <gtest/gtest.h>

#include <string>

#include "contactxml.h"
#include "stoaterrno.h"
#include "stoatexc.h"
#include "xml.h"

using std::string;
using stoatlib::LogContext;
using stoatlib::ParseError;
using stoatlib::QSORecord;
using stoatlib::XMLElement;
using stoatlib::XMLParser;

static string
contact(const string& body) {
	return "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<contactinfo>" + body + "</contactinfo>";
}

class XMLParserTest : public ::testing::Test {
 protected:
	void parse(const string& payload) { parser.parse(payload, rec, LogContext()); }
	int parseError(const string& payload) {
		try {
			parse(payload);
		} catch(ParseError& x) {
			return x.error();
		}
		return STOAT_NO_ERROR;
	}
	XMLParser parser;
	QSORecord rec;
};

TEST_F(XMLParserTest, FullContact) {
	parse(contact(
		"<app>N1MM</app><contestname>CQ-WW-SSB</contestname>"
		"<timestamp>2024-03-15T12:30:45</timestamp>"
		"<mycall>N0CAL</mycall><band>14</band>"
		"<rxfreq>1420050</rxfreq><txfreq>1420000</txfreq>"
		"<operator>N0OP</operator><mode>USB</mode>"
		"<call>DL1ABC</call><snt>59</snt><sntnr>12</sntnr>"
		"<rcv>57</rcv><rcvnr>345</rcvnr><gridsquare>JO62</gridsquare>"
		"<comment>tnx</comment><power>100</power>"));
	EXPECT_EQ("DL1ABC", rec.get(STOAT_QSO_CALL));
	EXPECT_EQ("SSB", rec.get(STOAT_QSO_MODE));
	EXPECT_EQ("20240315", rec.get(STOAT_QSO_QSO_DATE));
	EXPECT_EQ("20240315", rec.get(STOAT_QSO_QSO_DATE_OFF));
	EXPECT_EQ("123045", rec.get(STOAT_QSO_TIME_ON));
	EXPECT_EQ("123045", rec.get(STOAT_QSO_TIME_OFF));
	EXPECT_EQ("14.200000", rec.get(STOAT_QSO_FREQ));
	EXPECT_EQ("14.200500", rec.get(STOAT_QSO_FREQ_RX));
	EXPECT_EQ("57", rec.get(STOAT_QSO_RST_RCVD));
	EXPECT_EQ("59", rec.get(STOAT_QSO_RST_SENT));
	EXPECT_EQ("12", rec.get(STOAT_QSO_STX));
	EXPECT_EQ("345", rec.get(STOAT_QSO_RTX));
	EXPECT_EQ("N0OP", rec.get(STOAT_QSO_OPERATOR));
	EXPECT_EQ("N0CAL", rec.get(STOAT_QSO_MYCALL));
	EXPECT_EQ("N0CAL", rec.get(STOAT_QSO_STATION_CALLSIGN));
	EXPECT_EQ("JO62", rec.get(STOAT_QSO_GRIDSQUARE));
	EXPECT_EQ("tnx", rec.get(STOAT_QSO_COMMENT));
	EXPECT_EQ("100", rec.get(STOAT_QSO_POWER));
	EXPECT_FALSE(rec.isSet(STOAT_QSO_BAND));
}

TEST_F(XMLParserTest, FrequencyScaling) {
	parse(contact("<timestamp>2024-01-01T00:00:00</timestamp><call>K1ABC</call>"
	              "<txfreq>1407400</txfreq><rxfreq>1407400</rxfreq>"));
	EXPECT_EQ("14.074000", rec.get(STOAT_QSO_FREQ));
	EXPECT_EQ("14.074000", rec.get(STOAT_QSO_FREQ_RX));
}

TEST_F(XMLParserTest, ModeConversion) {
	parse(contact("<timestamp>2024-01-01T00:00:00</timestamp><call>K1ABC</call>"
	              "<txfreq>0</txfreq><rxfreq>0</rxfreq><mode>LSB</mode>"));
	EXPECT_EQ("SSB", rec.get(STOAT_QSO_MODE));
	parse(contact("<timestamp>2024-01-01T00:00:00</timestamp><call>K1ABC</call>"
	              "<txfreq>0</txfreq><rxfreq>0</rxfreq><mode>CW</mode>"));
	EXPECT_EQ("CW", rec.get(STOAT_QSO_MODE));
}

TEST_F(XMLParserTest, LastDuplicateWins) {
	parse(contact("<timestamp>2024-01-01T00:00:00</timestamp><call>K1ABC</call><call>K2DEF</call>"
	              "<txfreq>0</txfreq><rxfreq>0</rxfreq>"));
	EXPECT_EQ("K2DEF", rec.get(STOAT_QSO_CALL));
}

TEST_F(XMLParserTest, MalformedXML) {
	EXPECT_EQ(STOAT_XML_ERROR, parseError("<?xml version=\"1.0\"?><contactinfo><call>K1ABC</contactinfo>"));
	EXPECT_EQ(STOAT_XML_ERROR, parseError("xml but not a document"));
}

TEST_F(XMLParserTest, WrongRoot) {
	EXPECT_EQ(STOAT_XML_SCHEMA_ERROR,
		parseError("<?xml version=\"1.0\"?><RadioInfo><app>N1MM</app></RadioInfo>"));
	try {
		parse("<?xml version=\"1.0\"?><RadioInfo><app>N1MM</app></RadioInfo>");
		FAIL() << "expected ParseError";
	} catch(ParseError& x) {
		EXPECT_EQ("expected <contactinfo> but found <RadioInfo>", x.detail());
		EXPECT_STREQ("Not a contactinfo record: expected <contactinfo> but found <RadioInfo>", x.what());
	}
}

TEST_F(XMLParserTest, BadTimestamp) {
	EXPECT_EQ(STOAT_INVALID_DATE, parseError(contact("<timestamp>2024-03-15 12:30:45</timestamp><call>K1ABC</call>")));
	EXPECT_EQ(STOAT_INVALID_DATE, parseError(contact("<call>K1ABC</call><txfreq>0</txfreq><rxfreq>0</rxfreq>")));
	EXPECT_EQ(STOAT_INVALID_DATE, parseError(contact("<timestamp>2023-02-29T10:00:00</timestamp><call>K1ABC</call>")));
}

TEST_F(XMLParserTest, BadFrequency) {
	EXPECT_EQ(STOAT_INVALID_FREQ, parseError(contact(
		"<timestamp>2024-01-01T00:00:00</timestamp><call>K1ABC</call><txfreq>14.074MHz</txfreq><rxfreq>0</rxfreq>")));
	EXPECT_EQ(STOAT_INVALID_FREQ, parseError(contact(
		"<timestamp>2024-01-01T00:00:00</timestamp><call>K1ABC</call><txfreq>0</txfreq>")));
}

TEST_F(XMLParserTest, MissingCall) {
	EXPECT_EQ(STOAT_CALL_MISSING, parseError(contact(
		"<timestamp>2024-01-01T00:00:00</timestamp><txfreq>0</txfreq><rxfreq>0</rxfreq>")));
}

TEST(TimestampTest, Valid) {
	string date, time;
	ASSERT_TRUE(stoat_splitTimestamp("2024-02-29T23:59:59", date, time));
	EXPECT_EQ("20240229", date);
	EXPECT_EQ("235959", time);
	ASSERT_TRUE(stoat_splitTimestamp("2000-02-29T00:00:00.250", date, time));
	EXPECT_EQ("20000229", date);
	EXPECT_EQ("000000", time);
}

TEST(TimestampTest, Invalid) {
	string date, time;
	EXPECT_FALSE(stoat_splitTimestamp("", date, time));
	EXPECT_FALSE(stoat_splitTimestamp("2024-03-15 12:30:45", date, time));
	EXPECT_FALSE(stoat_splitTimestamp("2024-13-01T00:00:00", date, time));
	EXPECT_FALSE(stoat_splitTimestamp("1900-02-29T00:00:00", date, time));
	EXPECT_FALSE(stoat_splitTimestamp("2024-01-01T24:00:00", date, time));
	EXPECT_FALSE(stoat_splitTimestamp("2024-01-01T00:00:00Z", date, time));
	EXPECT_FALSE(stoat_splitTimestamp("2024-01-01T00:00:00.", date, time));
}

TEST(XMLElementTest, TreeAndCopy) {
	XMLElement doc;
	ASSERT_EQ(XML_PARSE_NO_ERROR, doc.parseString("<a><b>one</b><c>two</c><b>three</b></a>"));
	XMLElement a;
	ASSERT_TRUE(doc.getFirstElement(a));
	EXPECT_EQ("a", a.getElementName());

	XMLElement copy(a);
	XMLElement b;
	ASSERT_TRUE(copy.getFirstElement("b", b));
	EXPECT_EQ("one", b.getText());
	ASSERT_TRUE(copy.getNextElement(b));
	EXPECT_EQ("three", b.getText());
	EXPECT_FALSE(copy.getNextElement(b));
	EXPECT_FALSE(copy.getFirstElement("d", b));
}

TEST(XMLElementTest, SyntaxError) {
	XMLElement doc;
	EXPECT_EQ(XML_PARSE_SYNTAX_ERROR, doc.parseString("<a><b></a>"));
	EXPECT_NE(string::npos, doc.getParseError().find("line 1"));
}
