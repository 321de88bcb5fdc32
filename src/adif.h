/***************************************************************************
                          adif.h  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#ifndef __ADIF_H
#define __ADIF_H

#include "stoatlib.h"

#include <string>

using std::string;

/*! \file */

/** \defgroup ADIF ADIF API
  *
  * These functions and classes turn a single ADIF record into a QSORecord
  * and render a QSORecord back into ADIF text.
  */
/** @{ */

#define STOAT_ADIF_HEADER "<ADIF_VER:5>5.0<EOH>\n"	///< Header written before each record
#define STOAT_ADIF_EOR "<EOR>"			///< End of record marker

/** Maps an input ADIF tag name to the record field(s) it fills.
  *
  * \c alias is a second field that receives the same value, or
  * STOAT_QSO_NFIELDS when there is none.
  */
typedef struct {
	const char *name;		///< Tag name, matched case-insensitively
	STOAT_QSO_FIELD field;		///< Field receiving the data
	STOAT_QSO_FIELD alias;		///< Second field receiving the data
} stoat_adifInputField;

namespace stoatlib {

/** Parses one ADIF record.
  *
  * Tags have the form \c <NAME:LENGTH> and are followed by LENGTH bytes
  * of data. Unknown tag names are ignored. Data that runs past the end of
  * the payload is cut short. Throws ParseError when no CALL is found.
  */
class ADIFParser : public QSOParser {
 public:
	ADIFParser() {}
	virtual void parse(const string& payload, QSORecord& rec, const LogContext& ctx) const;
};

}	// namespace stoatlib

/** Find the input field definition for an ADIF tag name.
  *
  * Returns NULL if the name is not one that populates the record.
  */
const stoat_adifInputField *stoat_adifFindInputField(const char *name);

/** Form an ADIF field string: \c <NAME:len>value
  *
  * \c len is the byte length of \c value. An empty value yields \c <NAME>.
  */
string stoat_adifMakeField(const char *fieldname, const string& value);

/** Render a record as an ADIF document.
  *
  * The output is the STOAT_ADIF_HEADER, one field per non-empty record
  * value (each followed by a space), then \c <EOR> and a newline.
  */
string stoat_generateADIF(const stoatlib::QSORecord& rec);

/** @} */

#endif /* __ADIF_H */
