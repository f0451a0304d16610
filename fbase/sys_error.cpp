// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "sys_error.h"

using namespace fbase;


namespace
{
std::wstring formatSystemErrorCode(ErrorCode ec)
{
    switch (ec) //codes showing up for sockets and plain file access
    {
            FBASE_CHECK_CASE_FOR_CONSTANT(EPERM);
            FBASE_CHECK_CASE_FOR_CONSTANT(ENOENT);
            FBASE_CHECK_CASE_FOR_CONSTANT(EINTR);
            FBASE_CHECK_CASE_FOR_CONSTANT(EIO);
            FBASE_CHECK_CASE_FOR_CONSTANT(EBADF);
            FBASE_CHECK_CASE_FOR_CONSTANT(EAGAIN);
            FBASE_CHECK_CASE_FOR_CONSTANT(ENOMEM);
            FBASE_CHECK_CASE_FOR_CONSTANT(EACCES);
            FBASE_CHECK_CASE_FOR_CONSTANT(EEXIST);
            FBASE_CHECK_CASE_FOR_CONSTANT(EXDEV);
            FBASE_CHECK_CASE_FOR_CONSTANT(ENOTDIR);
            FBASE_CHECK_CASE_FOR_CONSTANT(EISDIR);
            FBASE_CHECK_CASE_FOR_CONSTANT(EINVAL);
            FBASE_CHECK_CASE_FOR_CONSTANT(EMFILE);
            FBASE_CHECK_CASE_FOR_CONSTANT(EFBIG);
            FBASE_CHECK_CASE_FOR_CONSTANT(ENOSPC);
            FBASE_CHECK_CASE_FOR_CONSTANT(EROFS);
            FBASE_CHECK_CASE_FOR_CONSTANT(EPIPE);
            FBASE_CHECK_CASE_FOR_CONSTANT(ENAMETOOLONG);
            FBASE_CHECK_CASE_FOR_CONSTANT(ENOTEMPTY);
            FBASE_CHECK_CASE_FOR_CONSTANT(ENOTSOCK);
            FBASE_CHECK_CASE_FOR_CONSTANT(EADDRINUSE);
            FBASE_CHECK_CASE_FOR_CONSTANT(EADDRNOTAVAIL);
            FBASE_CHECK_CASE_FOR_CONSTANT(ENETDOWN);
            FBASE_CHECK_CASE_FOR_CONSTANT(ENETUNREACH);
            FBASE_CHECK_CASE_FOR_CONSTANT(ENETRESET);
            FBASE_CHECK_CASE_FOR_CONSTANT(ECONNABORTED);
            FBASE_CHECK_CASE_FOR_CONSTANT(ECONNRESET);
            FBASE_CHECK_CASE_FOR_CONSTANT(ENOTCONN);
            FBASE_CHECK_CASE_FOR_CONSTANT(ETIMEDOUT);
            FBASE_CHECK_CASE_FOR_CONSTANT(ECONNREFUSED);
            FBASE_CHECK_CASE_FOR_CONSTANT(EHOSTDOWN);
            FBASE_CHECK_CASE_FOR_CONSTANT(EHOSTUNREACH);
            FBASE_CHECK_CASE_FOR_CONSTANT(EALREADY);
            FBASE_CHECK_CASE_FOR_CONSTANT(EINPROGRESS);
        default:
            return replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec));
    }
}
}


std::wstring fbase::formatGlibError(const std::string& functionName, GError* error)
{
    if (!error)
        return formatSystemError(functionName, L"", _("Error description not available.") + L" null GError");

    if (error->domain == G_FILE_ERROR) //"values corresponding to errno codes"
        return formatSystemError(functionName, error->code);

    //g-convert-error-quark => g-convert-error
    std::wstring domain = utfTo<std::wstring>(::g_quark_to_string(error->domain));
    if (endsWith(domain, L"-quark"))
        domain = beforeLast(domain, L"-", IfNotFoundReturn::none);

    const std::wstring errorCode = domain + L' ' + numberTo<std::wstring>(error->code); //e.g. "g-convert-error 1"
    const std::wstring errorMsg = utfTo<std::wstring>(error->message); //e.g. "Invalid byte sequence in conversion input"

    return formatSystemError(functionName, errorCode, errorMsg);
}


std::wstring fbase::getSystemErrorDescription(ErrorCode ec) //return empty string on error
{
    const ErrorCode ecCurrent = getLastError(); //not necessarily == ec
    FBASE_ON_SCOPE_EXIT(errno = ecCurrent);

    std::wstring errorMsg = utfTo<std::wstring>(::g_strerror(ec)); //... vs strerror(): "marginally improves thread safety, and marginally improves consistency"

    trim(errorMsg);
    return errorMsg;
}


std::wstring fbase::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


std::wstring fbase::formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg)
{
    std::wstring output = trimCpy(errorCode);

    const std::wstring errorMsgFmt = trimCpy(errorMsg);
    if (!output.empty() && !errorMsgFmt.empty())
        output += L": ";

    output += errorMsgFmt;

    if (!functionName.empty())
        output += L" [" + utfTo<std::wstring>(functionName) + L']';

    return trimCpy(output);
}
