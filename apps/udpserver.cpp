/***************************************************************************
                          udpserver.cpp  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#include "udpserver.h"

#include "wx/wxprec.h"

#ifndef WX_PRECOMP
	#include "wx/wx.h"
#endif

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>
#include <errno.h>
#include <string.h>

#include <string>

#include "qsopool.h"
#include "stoatapp.h"
#include "stoatexcept.h"
#include "stoattrace.h"
#include "wxutil.h"

using std::string;

UDPServer::~UDPServer() {
	Close();
}

void
UDPServer::Open() {
	stoatTrace("UDPServer::Open", "port=%d", _port);
	_sock = socket(AF_INET, SOCK_DGRAM, 0);
	if (_sock < 0)
		throw StoatException(string("failed to create UDP socket: ") + strerror(errno));

	int opt = 1;
	if (setsockopt(_sock, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
		stoatTrace("UDPServer::Open", "SO_REUSEADDR failed: %s", strerror(errno));

	struct sockaddr_in addr;
	memset(&addr, 0, sizeof addr);
	addr.sin_family = AF_INET;
	addr.sin_addr.s_addr = htonl(INADDR_ANY);
	addr.sin_port = htons(static_cast<uint16_t>(_port));
	if (bind(_sock, reinterpret_cast<struct sockaddr *>(&addr), sizeof addr) < 0) {
		int err = errno;
		Close();
		throw StoatException(wxString::Format(wxT("failed to bind to UDP port %d: %hs"), _port, strerror(err)).ToStdString());
	}
	if (_port == 0) {
		socklen_t len = sizeof addr;
		if (getsockname(_sock, reinterpret_cast<struct sockaddr *>(&addr), &len) == 0)
			_port = ntohs(addr.sin_port);
	}
	wxLogMessage(wxT("UDP server listening on port %d"), _port);
}

void
UDPServer::Close() {
	if (_sock >= 0)
		close(_sock);
	_sock = -1;
}

void
UDPServer::Run(QSOPool& pool, bool verbose, volatile sig_atomic_t& stop, const sigset_t& waitMask) {
	char buf[STOAT_UDP_BUFFER_SIZE];

	while (!stop) {
		struct pollfd pfd;
		pfd.fd = _sock;
		pfd.events = POLLIN;
		pfd.revents = 0;
		// Stop signals are only deliverable inside ppoll
		int ready = ppoll(&pfd, 1, NULL, &waitMask);
		if (ready < 0) {
			if (errno == EINTR)
				continue;
			wxLogMessage(wxT("Error waiting for UDP: %hs"), strerror(errno));
			break;
		}
		if (ready == 0)
			continue;

		struct sockaddr_in client;
		socklen_t clientLen = sizeof client;
		ssize_t n = recvfrom(_sock, buf, sizeof buf, MSG_DONTWAIT, reinterpret_cast<struct sockaddr *>(&client), &clientLen);
		if (n < 0) {
			if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
				continue;
			wxLogMessage(wxT("Error reading from UDP: %hs"), strerror(errno));
			continue;
		}

		string message(buf, n);
		char host[INET_ADDRSTRLEN];
		if (inet_ntop(AF_INET, &client.sin_addr, host, sizeof host) == NULL)
			strncpy(host, "?", sizeof host);
		wxLogMessage(wxT("Received %d bytes from %hs:%d"), static_cast<int>(n), host, ntohs(client.sin_port));
		if (verbose)
			wxLogMessage(wxT("Message content: %s"), DecodeBytes(message));

		if (!pool.Post(message))
			wxLogMessage(wxT("Dropping datagram from %hs:%d: %d payloads already pending"), host, ntohs(client.sin_port), pool.Pending());
	}
	stoatTrace("UDPServer::Run", "stopping");
}
