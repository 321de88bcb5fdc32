/***************************************************************************
                          stoatapp.h  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#ifndef __stoatapp_h
#define __stoatapp_h

#include "stoatlib.h"

#define STOAT_APP_DESC "WaveLog Transport CLI - Lightweight QSO transport from WSJT-X to WaveLog"

#define STOAT_LOG_PREFIX "WL-TRANSPORT: "
#define STOAT_LOG_FILE "wavelog-transport.log"

#define STOAT_USER_AGENT "WL-Transport-v1.0"
#define STOAT_TEST_USER_AGENT "WL-Transport-v1.0-Test"

#define STOAT_UDP_BUFFER_SIZE 4096	///< Largest datagram read

// Exit codes
enum {
	STOAT_EXIT_SUCCESS = 0,
	STOAT_EXIT_CONFIG_ERROR = 1,
	STOAT_EXIT_LOG_ERROR = 2,
	STOAT_EXIT_SOCKET_ERROR = 3,
	STOAT_EXIT_CONNECTION_FAILED = 4,
	STOAT_EXIT_COMMAND_ERROR = 5,
	STOAT_EXIT_UNKNOWN = 6
};

#endif	// __stoatapp_h
