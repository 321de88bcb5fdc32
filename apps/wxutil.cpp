/***************************************************************************
                          wxutil.cpp  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#include "wxutil.h"

#define UTF8_REPLACEMENT "\xef\xbf\xbd"

/* Length of the valid UTF-8 sequence starting at p, or 0 if there is none.
 * Overlong forms, surrogates and code points past U+10FFFF are invalid.
 */
static size_t
utf8SequenceLength(const unsigned char *p, size_t avail) {
	unsigned char c = p[0];
	size_t len;
	unsigned char lo = 0x80, hi = 0xbf;	// bounds for the second byte

	if (c < 0x80)
		return 1;
	if (c >= 0xc2 && c <= 0xdf) {
		len = 2;
	} else if (c >= 0xe0 && c <= 0xef) {
		len = 3;
		if (c == 0xe0) lo = 0xa0;
		if (c == 0xed) hi = 0x9f;
	} else if (c >= 0xf0 && c <= 0xf4) {
		len = 4;
		if (c == 0xf0) lo = 0x90;
		if (c == 0xf4) hi = 0x8f;
	} else {
		return 0;
	}
	if (avail < len)
		return 0;
	if (p[1] < lo || p[1] > hi)
		return 0;
	for (size_t i = 2; i < len; i++)
		if (p[i] < 0x80 || p[i] > 0xbf)
			return 0;
	return len;
}

wxString
DecodeBytes(const string& bytes, bool *lossy) {
	if (lossy)
		*lossy = false;
	wxString out = wxString::FromUTF8(bytes.data(), bytes.size());
	if (!out.IsEmpty() || bytes.empty())
		return out;

	string clean;
	clean.reserve(bytes.size() + 16);
	const unsigned char *p = reinterpret_cast<const unsigned char *>(bytes.data());
	size_t size = bytes.size();
	size_t i = 0;
	while (i < size) {
		size_t len = utf8SequenceLength(p + i, size - i);
		if (len == 0) {
			clean += UTF8_REPLACEMENT;
			i++;
		} else {
			clean.append(bytes, i, len);
			i += len;
		}
	}
	if (lossy)
		*lossy = true;
	return wxString::FromUTF8(clean.data(), clean.size());
}
