// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#include "listing.h"

using namespace fbase;
using namespace ferry;


std::string ferry::getListingAsUtf8(const std::string& listing) //throw SysError
{
    if (::g_utf8_validate(listing.c_str(), listing.size(), nullptr)) //caveat: embedded null chars are invalid UTF-8 for glib
        return listing;

    GError* error = nullptr;
    FBASE_ON_SCOPE_EXIT(if (error) ::g_error_free(error));

    gsize bytesWritten = 0;
    gchar* utfBuf = ::g_convert(listing.c_str(),  //const gchar* str
                                listing.size(),   //gssize len
                                "UTF-8",          //const gchar* to_codeset
                                "LATIN1",         //const gchar* from_codeset
                                nullptr,          //gsize* bytes_read
                                &bytesWritten,    //gsize* bytes_written
                                &error);          //GError** error
    if (!utfBuf)
        throw SysError(formatGlibError("g_convert(LATIN1)", error));
    FBASE_ON_SCOPE_EXIT(::g_free(utfBuf));

    return std::string(utfBuf, bytesWritten);
}
