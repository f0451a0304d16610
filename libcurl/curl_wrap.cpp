// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "curl_wrap.h"

using namespace fbase;


namespace
{
int curlInitLevel = 0; //support interleaving initialization calls!
//zero-initialized POD => not subject to static initialization order fiasco
}


void fbase::libcurlInit()
{
    assert(curlInitLevel >= 0);
    if (++curlInitLevel != 1) //non-atomic => require call from main thread
        return;

    try
    {
        ASSERT_SYSERROR(::curl_global_init(CURL_GLOBAL_NOTHING /*no TLS needed*/) == CURLE_OK);
    }
    catch (const SysError& e) { logExtraError(_("Error during process initialization.") + L"\n\n" + e.toString()); }
}


void fbase::libcurlTearDown()
{
    assert(curlInitLevel >= 1);
    if (--curlInitLevel != 0)
        return;

    ::curl_global_cleanup();
}


CurlUrl::CurlUrl(const std::string& url) //throw SysError
{
    urlHandle_ = ::curl_url();
    if (!urlHandle_)
        throw SysError(formatSystemError("curl_url", L"", L"Failed to allocate URL handle."));
    FBASE_ON_SCOPE_FAIL(::curl_url_cleanup(urlHandle_));

    const CURLUcode rc = ::curl_url_set(urlHandle_, CURLUPART_URL, url.c_str(), 0 /*flags*/);
    if (rc != CURLUE_OK)
        throw SysError(formatSystemError("curl_url_set", formatCurlUrlCode(rc), utfTo<std::wstring>(::curl_url_strerror(rc))));
}


CurlUrl::~CurlUrl()
{
    ::curl_url_cleanup(urlHandle_);
}


std::optional<std::string> CurlUrl::getPart(CURLUPart part, unsigned int flags) const //throw SysError
{
    char* partText = nullptr;
    const CURLUcode rc = ::curl_url_get(urlHandle_, part, &partText, flags);
    FBASE_ON_SCOPE_EXIT(if (partText) ::curl_free(partText));

    switch (rc)
    {
        case CURLUE_OK:
            return std::string(partText);

        case CURLUE_NO_USER:
        case CURLUE_NO_PASSWORD:
        case CURLUE_NO_PORT:
        case CURLUE_NO_HOST:
        case CURLUE_NO_QUERY:
        case CURLUE_NO_FRAGMENT:
            return std::nullopt;

        default:
            throw SysError(formatSystemError("curl_url_get", formatCurlUrlCode(rc), utfTo<std::wstring>(::curl_url_strerror(rc))));
    }
}


std::wstring fbase::formatCurlUrlCode(CURLUcode ec)
{
    switch (ec)
    {
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_OK);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_HANDLE);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_PARTPOINTER);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_MALFORMED_INPUT);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_PORT_NUMBER);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_UNSUPPORTED_SCHEME);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_URLDECODE);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_OUT_OF_MEMORY);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_USER_NOT_ALLOWED);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_UNKNOWN_PART);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_SCHEME);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_USER);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_PASSWORD);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_OPTIONS);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_HOST);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_PORT);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_QUERY);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_FRAGMENT);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_ZONEID);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_FILE_URL);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_FRAGMENT);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_HOSTNAME);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_IPV6);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_LOGIN);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_PASSWORD);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_PATH);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_QUERY);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_SCHEME);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_SLASHES);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_USER);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_LACKS_IDN);
            FBASE_CHECK_CASE_FOR_CONSTANT(CURLUE_LAST);
    }
    return replaceCpy<std::wstring>(L"Curl URL status %x", L"%x", numberTo<std::wstring>(static_cast<int>(ec)));
}
