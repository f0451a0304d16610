// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef DATA_CHANNEL_H_4471029384756102938
#define DATA_CHANNEL_H_4471029384756102938

#include <memory>
#include "control_channel.h"


namespace ferry
{
struct DataChannelDescriptor
{
    Zstring ip; //dotted quad
    int port = 0;

    bool operator==(const DataChannelDescriptor&) const = default;
};

//227 Entering Passive Mode (a,b,c,d,p1,p2)
DataChannelDescriptor parsePasvReply(const FtpReply& reply); //throw SysErrorFtpProtocol


//short-lived connection carrying the payload of a single LIST/RETR/STOR
class FtpDataConnection
{
public:
    FtpDataConnection(const DataChannelDescriptor& desc, int timeoutSec); //throw SysError, SysErrorTimeout

    fbase::SocketType get() const { return socket_.get(); }

    const DataChannelDescriptor& getDescriptor() const { return desc_; }

private:
    FtpDataConnection           (const FtpDataConnection&) = delete;
    FtpDataConnection& operator=(const FtpDataConnection&) = delete;

    const DataChannelDescriptor desc_;
    fbase::Socket socket_;
};


//PASV + connect: the channel must be ready, no payload is read or written
std::unique_ptr<FtpDataConnection> negotiatePassiveDataChannel(FtpControlChannel& ctrl); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
}

#endif //DATA_CHANNEL_H_4471029384756102938
