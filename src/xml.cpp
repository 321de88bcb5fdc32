/***************************************************************************
                          xml.cpp  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#include "xml.h"
#include "stoatlib.h"
#include <stdio.h>
#include <string.h>
#include <utility>
#include <string>

using std::string;

namespace stoatlib {

XMLElement::XMLElement(const XMLElement& other)
	: _name(other._name), _text(other._text), _iterByName(false) {
	copyElements(other);
	_iter = _elements.end();
}

XMLElement&
XMLElement::operator=(const XMLElement& other) {
	if (this == &other)
		return *this;
	freeElements();
	_name = other._name;
	_text = other._text;
	_parseError = other._parseError;
	copyElements(other);
	_parsingStack.clear();
	_iterByName = false;
	_iterName = "";
	_iter = _elements.end();
	return *this;
}

XMLElement::~XMLElement() {
	freeElements();
}

void
XMLElement::copyElements(const XMLElement& other) {
	XMLElementList::const_iterator it;
	for (it = other._elements.begin(); it != other._elements.end(); ++it)
		_elements.insert(make_pair(it->first, new XMLElement(*it->second)));
}

void
XMLElement::freeElements() {
	XMLElementList::iterator it;
	for (it = _elements.begin(); it != _elements.end(); ++it)
		delete it->second;
	_elements.clear();
}

void
XMLElement::xml_start(void *data, const XML_Char *name, const XML_Char **atts) {
	XMLElement *el = reinterpret_cast<XMLElement *>(data);
	XMLElement *new_el = new XMLElement(name);
	XMLElement *parent = el->_parsingStack.empty() ? el : el->_parsingStack.back();
	parent->addElement(new_el);
	el->_parsingStack.push_back(new_el);
}

void
XMLElement::xml_end(void *data, const XML_Char *name) {
	XMLElement *el = reinterpret_cast<XMLElement *>(data);
	if (!(el->_parsingStack.empty()))
		el->_parsingStack.pop_back();
}

void
XMLElement::xml_text(void *data, const XML_Char *text, int len) {
	XMLElement *el = reinterpret_cast<XMLElement *>(data);
	if (el->_parsingStack.empty())
		return;
	el->_parsingStack.back()->_text.append(text, len);
}

int
XMLElement::parseString(const string& xmlstring) {
	XML_Parser xp = XML_ParserCreate(0);
	if (xp == NULL) {
		_parseError = "cannot create XML parser";
		return XML_PARSE_SYSTEM_ERROR;
	}
	XML_SetUserData(xp, reinterpret_cast<void *>(this));
	XML_SetStartElementHandler(xp, &XMLElement::xml_start);
	XML_SetEndElementHandler(xp, &XMLElement::xml_end);
	XML_SetCharacterDataHandler(xp, &XMLElement::xml_text);

	_parsingStack.clear();
	_parseError = "";
	// Process the XML
	if (XML_Parse(xp, xmlstring.data(), static_cast<int>(xmlstring.size()), 1) == XML_STATUS_ERROR) {
		char buf[256];
		snprintf(buf, sizeof buf, "%s at line %lu",
			XML_ErrorString(XML_GetErrorCode(xp)),
			static_cast<unsigned long>(XML_GetCurrentLineNumber(xp)));
		_parseError = buf;
		XML_ParserFree(xp);
		_parsingStack.clear();
		stoatTrace("XMLElement::parseString", "%s", _parseError.c_str());
		return XML_PARSE_SYNTAX_ERROR;
	}
	XML_ParserFree(xp);
	_parsingStack.clear();
	return XML_PARSE_NO_ERROR;
}

}	// namespace stoatlib
