// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CURL_WRAP_H_8720394516273049182
#define CURL_WRAP_H_8720394516273049182

#include <optional>
#include <fbase/sys_error.h>


//-------------------------------------------------
#include <curl/curl.h>
//-------------------------------------------------

#ifndef CURLINC_CURL_H
    #error curl.h header guard changed
#endif

namespace fbase
{
void libcurlInit();
void libcurlTearDown();


//RAII wrapper for libcurl's URL API
class CurlUrl
{
public:
    explicit CurlUrl(const std::string& url); //throw SysError
    ~CurlUrl();

    //return std::nullopt if the URL does not contain this part, e.g. CURLUPART_USER
    std::optional<std::string> getPart(CURLUPart part, unsigned int flags) const; //throw SysError

private:
    CurlUrl           (const CurlUrl&) = delete;
    CurlUrl& operator=(const CurlUrl&) = delete;

    CURLU* urlHandle_ = nullptr;
};


std::wstring formatCurlUrlCode(CURLUcode ec);
}

#else
#error Why is this header already defined? Do not include in other headers: encapsulate the gory details!
#endif //CURL_WRAP_H_8720394516273049182
