// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef XML_WRAP_H_3094817265510938274
#define XML_WRAP_H_3094817265510938274

#include <optional>
#include <fbase/file_error.h>


//-------------------------------------------------
#include <libxml/parser.h>
#include <libxml/tree.h>
//-------------------------------------------------

namespace fbase
{
//RAII wrapper for a parsed libxml2 document
class XmlDocument
{
public:
    explicit XmlDocument(xmlDocPtr doc) : doc_(doc) {} //take ownership
    XmlDocument(XmlDocument&& tmp) noexcept : doc_(tmp.doc_) { tmp.doc_ = nullptr; }
    ~XmlDocument() { if (doc_) ::xmlFreeDoc(doc_); }

    const xmlNode* getRoot() const { return doc_ ? ::xmlDocGetRootElement(doc_) : nullptr; } //nullptr if document is empty

private:
    XmlDocument           (const XmlDocument&) = delete;
    XmlDocument& operator=(const XmlDocument&) = delete;

    xmlDocPtr doc_ = nullptr;
};

//no network access, no external entities
XmlDocument loadXml(const Zstring& filePath); //throw FileError


std::string getElementName(const xmlNode& element);

//first child element with the given name or nullptr
const xmlNode* getChildElement(const xmlNode& parent, const std::string& name);

//entity-decoded attribute value
std::optional<std::string> getAttribute(const xmlNode& element, const std::string& name);
}

#else
#error Why is this header already defined? Do not include in other headers: encapsulate the gory details!
#endif //XML_WRAP_H_3094817265510938274
