/***************************************************************************
                          test_prefs.cpp  -  description
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

#include "wx/filename.h"
#include "wx/ffile.h"
#include "wx/sstream.h"

#include "stoat_prefs.h"
#include "stoatexcept.h"

static void
readString(const char *ini, StoatPrefs& prefs) {
	wxStringInputStream in(wxString::FromUTF8(ini));
	wxFileConfig config(in);
	config.SetExpandEnvVars(false);
	ReadPrefs(config, prefs);
}

class PrefsFileTest : public ::testing::Test {
 protected:
	virtual void SetUp() {
		_file = wxFileName::CreateTempFileName(wxT("stoat"));
		ASSERT_FALSE(_file.IsEmpty());
	}
	virtual void TearDown() {
		if (wxFileName::FileExists(_file))
			wxRemoveFile(_file);
	}
	void write(const char *text) {
		wxFFile f(_file, wxT("w"));
		ASSERT_TRUE(f.IsOpened());
		ASSERT_TRUE(f.Write(wxString::FromUTF8(text)));
	}
	wxString _file;
};

TEST(PrefsTest, Defaults) {
	StoatPrefs prefs;
	readString("[wavelog]\nurl = https://log.example.com/\napi_key = k123\nstation_profile_id = 7\n", prefs);
	EXPECT_EQ(wxT("https://log.example.com/"), prefs.url);
	EXPECT_EQ(wxT("k123"), prefs.apiKey);
	EXPECT_EQ(wxT("7"), prefs.stationProfileId);
	EXPECT_EQ(5000, prefs.timeout);
	EXPECT_EQ(2333, prefs.port);
	EXPECT_FALSE(prefs.verbose);
	EXPECT_EQ(4, prefs.workers);
	EXPECT_EQ(64, prefs.queueLimit);
}

TEST(PrefsTest, AllKeys) {
	StoatPrefs prefs;
	readString("[wavelog]\nurl=http://10.0.0.2/wavelog\napi_key=abc\nstation_profile_id=2\ntimeout=1500\n"
	           "[server]\nport=2237\nverbose=Yes\nworkers=2\nqueue_limit=8\n", prefs);
	EXPECT_EQ(1500, prefs.timeout);
	EXPECT_EQ(2237, prefs.port);
	EXPECT_TRUE(prefs.verbose);
	EXPECT_EQ(2, prefs.workers);
	EXPECT_EQ(8, prefs.queueLimit);
}

TEST(PrefsTest, EnvironmentNotExpanded) {
	StoatPrefs prefs;
	readString("[wavelog]\nurl=https://log.example.com\napi_key=$HOME\nstation_profile_id=1\n", prefs);
	EXPECT_EQ(wxT("$HOME"), prefs.apiKey);
}

TEST(PrefsTest, MissingRequired) {
	StoatPrefs prefs;
	try {
		readString("[wavelog]\nurl=https://log.example.com\nstation_profile_id=1\n", prefs);
		FAIL() << "expected StoatException";
	} catch(StoatException& x) {
		EXPECT_STREQ("missing required WaveLog configuration (url, api_key, station_profile_id)", x.what());
	}
}

TEST(PrefsTest, BadValues) {
	StoatPrefs prefs;
	EXPECT_THROW(readString("[wavelog]\nurl=u\napi_key=k\nstation_profile_id=1\n[server]\nport=abc\n", prefs), StoatException);
	EXPECT_THROW(readString("[wavelog]\nurl=u\napi_key=k\nstation_profile_id=1\n[server]\nport=70000\n", prefs), StoatException);
	EXPECT_THROW(readString("[wavelog]\nurl=u\napi_key=k\nstation_profile_id=1\n[server]\nverbose=maybe\n", prefs), StoatException);
	EXPECT_THROW(readString("[wavelog]\nurl=u\napi_key=k\nstation_profile_id=1\n[server]\nworkers=0\n", prefs), StoatException);
}

TEST(PrefsTest, Booleans) {
	bool b = false;
	EXPECT_TRUE(ParsePrefBool(wxT("TRUE"), b));
	EXPECT_TRUE(b);
	EXPECT_TRUE(ParsePrefBool(wxT(" off "), b));
	EXPECT_FALSE(b);
	EXPECT_TRUE(ParsePrefBool(wxT("1"), b));
	EXPECT_TRUE(b);
	EXPECT_FALSE(ParsePrefBool(wxT("enabled"), b));
	EXPECT_FALSE(ParsePrefBool(wxT(""), b));
}

TEST_F(PrefsFileTest, Load) {
	write("[wavelog]\nurl = https://log.example.com\napi_key = k\nstation_profile_id = 3\n[server]\nport = 2334\n");
	StoatPrefs prefs;
	LoadPrefs(_file, prefs);
	EXPECT_EQ(wxT("3"), prefs.stationProfileId);
	EXPECT_EQ(2334, prefs.port);
}

TEST_F(PrefsFileTest, MissingFileCreatesDefault) {
	wxRemoveFile(_file);
	StoatPrefs prefs;
	try {
		LoadPrefs(_file, prefs);
		FAIL() << "expected StoatException";
	} catch(StoatException& x) {
		EXPECT_STREQ("default config created - please configure and restart", x.what());
	}
	ASSERT_TRUE(wxFileName::FileExists(_file));

	// The placeholder file is complete enough to load
	StoatPrefs created;
	LoadPrefs(_file, created);
	EXPECT_EQ(wxT("https://your-wavelog-url.com"), created.url);
	EXPECT_EQ(wxT("your-api-key-here"), created.apiKey);
	EXPECT_EQ(wxT("1"), created.stationProfileId);
	EXPECT_EQ(5000, created.timeout);
	EXPECT_EQ(2333, created.port);
	EXPECT_TRUE(created.verbose);
}
