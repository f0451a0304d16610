// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef FTP_SESSION_H_9910283746501928374
#define FTP_SESSION_H_9910283746501928374

#include "ftp_transfer.h"


namespace ferry
{
/*  one logged-in control connection serving exactly one logical operation

    - constructor connects and authenticates
    - destructor sends QUIT (if no reply is outstanding) and closes all sockets
    - never reused: create a new session per operation                    */
class FtpSession
{
public:
    FtpSession(const FtpEndpoint& endpoint, const FtpSessionCfg& cfg); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol, ErrorFtpAuth
    virtual ~FtpSession() {}

    FtpControlChannel& getControlChannel() { return ctrl_; }
    FtpTransfer&       getTransfer()       { return transfer_; }

private:
    FtpSession           (const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    FtpControlChannel ctrl_;
    FtpTransfer transfer_{ctrl_};
};
}

#endif //FTP_SESSION_H_9910283746501928374
