/***************************************************************************
                          udpserver.h  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#ifndef __udpserver_h
#define __udpserver_h

#include <signal.h>

class QSOPool;

/** Receives datagrams on a UDP port and queues them on a QSOPool */
class UDPServer {
 public:
	explicit UDPServer(int port) : _port(port), _sock(-1) {}
	~UDPServer();
	/// Bind the socket. Throws StoatException. Port 0 picks a free port.
	void Open();
	/// The bound port once Open() succeeds
	int Port() const { return _port; }
	/** Receive until \c stop becomes nonzero.
	  *
	  * \c stop is set from a signal handler. The caller keeps the stop
	  * signals blocked; \c waitMask is the signal mask installed while
	  * waiting for a datagram, so a signal raised at any time ends the wait.
	  */
	void Run(QSOPool& pool, bool verbose, volatile sig_atomic_t& stop, const sigset_t& waitMask);
	void Close();
 private:
	int _port;
	int _sock;
};

#endif	// __udpserver_h
