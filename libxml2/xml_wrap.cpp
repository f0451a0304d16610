// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#include "xml_wrap.h"
#include <climits>
#include <fbase/file_io.h>

using namespace fbase;


XmlDocument fbase::loadXml(const Zstring& filePath) //throw FileError
{
    const std::string stream = getFileContent(filePath, nullptr /*notifyUnbufferedIO*/); //throw FileError

    if (stream.size() > static_cast<size_t>(INT_MAX))
        throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)),
                        formatSystemError("xmlCtxtReadMemory", L"", L"File is too large."));

    xmlParserCtxtPtr ctxt = ::xmlNewParserCtxt();
    if (!ctxt)
        throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)),
                        formatSystemError("xmlNewParserCtxt", L"", L"Failed to allocate parser context."));
    FBASE_ON_SCOPE_EXIT(::xmlFreeParserCtxt(ctxt));

    xmlDocPtr doc = ::xmlCtxtReadMemory(ctxt, stream.c_str(), static_cast<int>(stream.size()), filePath.c_str(), nullptr /*encoding*/,
                                        XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
    if (!doc)
    {
        const xmlError* lastError = ::xmlCtxtGetLastError(ctxt); //may be nullptr
        const int row = lastError ? lastError->line : 0;
        const int col = lastError ? lastError->int2 : 0;

        throw FileError(replaceCpy(replaceCpy(replaceCpy(_("Error parsing file %x, row %y, column %z."),
                                                         L"%x", fmtPath(filePath)),
                                              L"%y", numberTo<std::wstring>(row)),
                                   L"%z", numberTo<std::wstring>(col)),
                        lastError && lastError->message ? utfTo<std::wstring>(trimCpy(std::string(lastError->message))) : std::wstring());
    }
    return XmlDocument(doc);
}


std::string fbase::getElementName(const xmlNode& element)
{
    return element.name ? reinterpret_cast<const char*>(element.name) : "";
}


const xmlNode* fbase::getChildElement(const xmlNode& parent, const std::string& name)
{
    for (const xmlNode* child = parent.children; child; child = child->next)
        if (child->type == XML_ELEMENT_NODE && getElementName(*child) == name)
            return child;
    return nullptr;
}


std::optional<std::string> fbase::getAttribute(const xmlNode& element, const std::string& name)
{
    xmlChar* value = ::xmlGetProp(&element, reinterpret_cast<const xmlChar*>(name.c_str()));
    if (!value)
        return std::nullopt;
    FBASE_ON_SCOPE_EXIT(::xmlFree(value));

    return std::string(reinterpret_cast<const char*>(value));
}
