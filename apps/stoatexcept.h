/***************************************************************************
                          stoatexcept.h  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#ifndef __stoatexcept_h
#define __stoatexcept_h

#include <exception>
#include <string>

using std::exception;
using std::string;

/** Startup, configuration and transport failures in the daemon */
class StoatException : public exception {
 public:
	explicit StoatException(const char *msg);
	explicit StoatException(const string& msg);
	~StoatException() throw() {}
	virtual const char *what() const throw () { return _msg.c_str(); }
 private:
	string _msg;
};

inline StoatException::StoatException(const char *msg) : exception() {
	_msg = msg;
}

inline StoatException::StoatException(const string& msg) : exception() {
	_msg = msg;
}

#endif	// __stoatexcept_h
