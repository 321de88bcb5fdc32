/***************************************************************************
                          normalize.cpp  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#include "normalize.h"

#include <ctype.h>
#include <math.h>
#include <stdio.h>

using stoatlib::QSORecord;
using stoatlib::LogContext;

static const stoat_bandEntry band_table[] = {
	{ "160M", 1.800, 2.000 },
	{ "80M", 3.500, 4.000 },
	{ "60M", 5.330, 5.400 },
	{ "40M", 7.000, 7.300 },
	{ "30M", 10.100, 10.150 },
	{ "20M", 14.000, 14.350 },
	{ "17M", 18.068, 18.168 },
	{ "15M", 21.000, 21.450 },
	{ "12M", 24.890, 24.990 },
	{ "10M", 28.000, 29.700 },
	{ "6M", 50.000, 54.000 },
	{ "2M", 144.000, 148.000 },
	{ "1.25M", 222.000, 225.000 },
	{ "70CM", 420.000, 450.000 },
	{ "33CM", 902.000, 928.000 },
	{ "23CM", 1240.000, 1300.000 }
};

int
stoat_getNumBand(void) {
	return static_cast<int>(sizeof band_table / sizeof band_table[0]);
}

const stoat_bandEntry *
stoat_getBand(int index) {
	if (index < 0 || index >= stoat_getNumBand())
		return NULL;
	return &band_table[index];
}

/* Length of the leading number in s: digits, optionally followed by a
 * decimal point and more digits. Zero if s does not start with a digit.
 */
static string::size_type
leading_number(const string& s) {
	string::size_type i = 0;
	while (i < s.size() && isdigit(static_cast<unsigned char>(s[i])))
		i++;
	if (i == 0)
		return 0;
	if (i + 1 < s.size() && s[i] == '.' && isdigit(static_cast<unsigned char>(s[i+1]))) {
		i++;
		while (i < s.size() && isdigit(static_cast<unsigned char>(s[i])))
			i++;
	}
	return i;
}

string
stoat_normalizePower(const string& power) {
	if (power.empty())
		return power;

	string p = stoat_trimSpace(power);
	for (string::size_type i = 0; i < p.size(); i++)
		p[i] = static_cast<char>(tolower(static_cast<unsigned char>(p[i])));

	string::size_type len = leading_number(p);
	if (len == 0)
		return power;

	double value;
	if (!stoat_parseDecimal(p.substr(0, len), value))
		return power;

	if (p.find("kw") != string::npos)
		value *= 1000;
	else if (p.find("mw") != string::npos)
		value *= 0.001;

	char buf[64];
	if (value == floor(value))
		snprintf(buf, sizeof buf, "%.0f", value);
	else
		snprintf(buf, sizeof buf, "%.3f", value);
	return buf;
}

string
stoat_calculateBand(const string& freq) {
	double f;
	if (!stoat_parseDecimal(freq, f))
		return "";
	for (int i = 0; i < stoat_getNumBand(); i++) {
		if (f >= band_table[i].lower && f <= band_table[i].upper)
			return band_table[i].name;
	}
	return "";
}

void
stoat_normalizeQSO(QSORecord& rec, const LogContext& ctx) {
	string power = rec.get(STOAT_QSO_POWER);
	string npower = stoat_normalizePower(power);
	if (npower != power)
		ctx.verbose("Normalized power %s to %s W", power.c_str(), npower.c_str());
	rec.set(STOAT_QSO_POWER, npower);

	if (rec.isSet(STOAT_QSO_FREQ))
		rec.set(STOAT_QSO_BAND, stoat_calculateBand(rec.get(STOAT_QSO_FREQ)));
}
