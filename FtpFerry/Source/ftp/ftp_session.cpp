// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#include "ftp_session.h"

using namespace fbase;
using namespace ferry;


FtpSession::FtpSession(const FtpEndpoint& endpoint, const FtpSessionCfg& cfg) : //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol, ErrorFtpAuth
    ctrl_(cfg)
{
    ctrl_.connect(endpoint); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
    ctrl_.authenticate(endpoint.username, endpoint.password); //throw ErrorFtpAuth, ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
}
