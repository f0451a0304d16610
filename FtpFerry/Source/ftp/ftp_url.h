// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef FTP_URL_H_2039485761203948576
#define FTP_URL_H_2039485761203948576

#include "ftp_endpoint.h"
#include "ftp_error.h"


namespace ferry
{
const char ftpPrefix[] = "ftp:";

//"ftp://..." (case-insensitive) => remote, everything else is a local path
bool isFtpUrl(const std::string& path);

//ftp://[user[:password]@]host[:port][/path]
//missing user => "anonymous", missing password => "", missing port => 21; escapes in user, password and path are decoded
FtpEndpoint parseFtpUrl(const std::string& url); //throw ErrorInvalidOperation

//"ftp://user@server:2121/path" - never shows the password
std::wstring getDisplayPath(const FtpEndpoint& endpoint);
}

#endif //FTP_URL_H_2039485761203948576
