/***************************************************************************
                          xml.h  -  description
                             -------------------
    begin                : Mon Oct 19 2026
    copyright            : (C) 2026 by the WavelogStoat Developers
    revision             : $Id$
 ***************************************************************************/

#ifndef __xml_h
#define __xml_h

#include <string>
#include <map>
#include <vector>
#include <utility>
#include <expat.h>

using std::string;
using std::multimap;
using std::vector;

namespace stoatlib {

class XMLElement;

typedef multimap<string, XMLElement*> XMLElementList;

/** Encapsulates an XML element
  *
  * An XMLElement comprises a name, the enclosed text and a list of
  * contained elements, which it owns. Copying an element copies the
  * whole subtree.
  *
  * In most cases, the structure will be populated by a call to
  * parseString().
  */
class XMLElement {
 public:
	XMLElement() : _name(""), _text(""), _iterByName(false) { _iter = _elements.end(); }
	/// Constructor initializes element name
	explicit XMLElement(const string& name) : _text(""), _iterByName(false) { _name = name; _iter = _elements.end(); }
	XMLElement(const XMLElement& other);
	XMLElement& operator=(const XMLElement& other);
	~XMLElement();
	/// Get the element name
	string getElementName() const { return _name; }
	/// Add an element to the list of contained subelements. Takes ownership.
	XMLElementList::iterator addElement(XMLElement* element);
#define XML_PARSE_NO_ERROR 0
#define XML_PARSE_SYSTEM_ERROR 1
#define XML_PARSE_SYNTAX_ERROR 2
	/// Parse an XML string and add its element tree to this element
	/** On XML_PARSE_SYNTAX_ERROR, getParseError() describes the problem. */
	int parseString(const string& xmlstring);
	/// Description of the last parse failure
	string getParseError() const { return _parseError; }
	/// Get the first contained element named \c name.
    /** Returns \c false if the element contains no elements named \c name */
	bool getFirstElement(const string& name, XMLElement&);
	/// Get the first contained element.
    /** Returns \c false if the element contains no elements */
	bool getFirstElement(XMLElement&);
	/// Get the next contained element.
    /** Should be called only after calling getFirstElement and getting
      * a return value of \c true. If the getFirstElement that takes an
      * element name was called, getNextElement will return \c false when there
      * are no more elements of that name in the element list.
	  *
      * Returns \c false if the element contains no more elements */
	bool getNextElement(XMLElement&);
	/// Get the contained text string.
	/** Note that this string comprises the text contained in this
      * element only, not any text contained in elements on the
      * element list; they each have their own contained text.
      */
	string getText() const { return _text; }

 private:
	static void xml_start(void *data, const XML_Char *name, const XML_Char **atts);
	static void xml_end(void *data, const XML_Char *name);
	static void xml_text(void *data, const XML_Char *text, int len);
	void copyElements(const XMLElement& other);
	void freeElements();
	string _name, _text;
	string _parseError;
	XMLElementList _elements;
	vector<XMLElement *> _parsingStack;
	XMLElementList::iterator _iter;
	bool _iterByName;
	string _iterName;
};

inline XMLElementList::iterator
XMLElement::addElement(XMLElement* element) {
	XMLElementList::iterator it = _elements.insert(make_pair(element->getElementName(), element));
	return it;
}

inline bool
XMLElement::getFirstElement(XMLElement& element) {
	_iterByName = false;
	_iter = _elements.begin();
	return getNextElement(element);
}

inline bool
XMLElement::getFirstElement(const string& name, XMLElement& element) {
	_iterName = name;
	_iterByName = true;
	_iter = _elements.find(_iterName);
	return getNextElement(element);
}

inline bool
XMLElement::getNextElement(XMLElement& element) {
	if (_iter == _elements.end())
		return false;
	if (_iterByName && _iter->second->getElementName() != _iterName)
		return false;
	element = *_iter->second;
	++_iter;
	return true;
}

}	// namespace stoatlib

#endif // __xml_h
