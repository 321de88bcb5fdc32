/***************************************************************************
                          stoaterrno.h  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#ifndef __STOATERRNO_H
#define __STOATERRNO_H

/** \file
  *  stoatlib error values
*/

#define STOAT_NO_ERROR 0		///< No error
#define STOAT_SYSTEM_ERROR 1		///< System Error
#define STOAT_XML_ERROR 2		///< XML syntax errors
#define STOAT_ERROR_ENUM_BASE 16	///< Base for enumerated errors
#define STOAT_CALL_MISSING 16		///< Required CALL field not present
#define STOAT_INVALID_DATE 17		///< Timestamp string invalid
#define STOAT_INVALID_FREQ 18		///< Frequency is not a number
#define STOAT_XML_SCHEMA_ERROR 19	///< XML document is not a contactinfo record

#endif /* __STOATERRNO_H */
