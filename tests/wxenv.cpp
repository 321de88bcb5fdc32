/***************************************************************************
                          wxenv.cpp  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#include <gtest/gtest.h>

#include "wx/init.h"
#include "wx/log.h"

/** Initializes the wxWidgets base library around a test run */
class WxEnvironment : public ::testing::Environment {
 public:
	virtual void SetUp() {
		ASSERT_TRUE(wxInitialize());
		wxLog::EnableLogging(false);
	}
	virtual void TearDown() {
		wxUninitialize();
	}
};

static ::testing::Environment * const wxEnv = ::testing::AddGlobalTestEnvironment(new WxEnvironment);
