// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef FTP_ENDPOINT_H_8810293847561029384
#define FTP_ENDPOINT_H_8810293847561029384

#include <fbase/zstring.h>


namespace ferry
{
const int DEFAULT_PORT_FTP = 21;


//resolved connection target: immutable after construction
struct FtpEndpoint
{
    Zstring     server;
    int         port = DEFAULT_PORT_FTP;
    std::string username = "anonymous";
    std::string password; //empty for anonymous access
    std::string remotePath = "/"; //server-relative, decoded

    bool operator==(const FtpEndpoint&) const = default;
};
}

#endif //FTP_ENDPOINT_H_8810293847561029384
