/***************************************************************************
                          stoatexc.h  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#ifndef __stoatexc_h
#define __stoatexc_h

#include <string>
#include <exception>
#include "stoatlib.h"

using std::exception;
using std::string;

namespace stoatlib {

class stoatexc : public exception {
 public:
	explicit stoatexc(const string& err) : exception() { _err = err; }
	stoatexc(const stoatexc& x) : exception() { _err = x._err; }
	virtual const char *what() const throw () { return _err.c_str(); }
	virtual ~stoatexc() throw() {}
 private:
	string _err;
};

/** Thrown when a payload cannot be turned into a QSO record.
  *
  * \c error() holds one of the stoaterrno.h values; \c detail() holds the
  * text describing the particular failure.
  */
class ParseError : public stoatexc {
 public:
	ParseError(int err, const string& detail)
		: stoatexc(string(stoat_getErrorString_v(err)) + (detail.empty() ? "" : ": " + detail)),
		  _error(err), _detail(detail) {}
	virtual ~ParseError() throw() {}
	int error() const { return _error; }
	const string& detail() const { return _detail; }
 private:
	int _error;
	string _detail;
};

}	// namespace stoatlib

#endif	// __stoatexc_h
