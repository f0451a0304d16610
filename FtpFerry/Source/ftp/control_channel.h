// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef CONTROL_CHANNEL_H_1203984756102938475
#define CONTROL_CHANNEL_H_1203984756102938475

#include <memory>
#include <fbase/error_log.h>
#include <fbase/socket.h>
#include "ftp_endpoint.h"
#include "ftp_reply.h"


namespace ferry
{
struct FtpSessionCfg
{
    int timeoutSec = 15; //applies to each connect, read and write on control and data connection
    bool pasvUseControlHost = false; //ignore the address of the 227 reply, connect to the control connection's peer instead
    size_t transferBlockSize = 64 * 1024;
    fbase::ErrorLog* protocolLog = nullptr; //optional: raw lines sent and received
};


/*  persistent control connection: commands + CRLF, replies with 3-digit status codes

    disconnected -> connecting -> ready -> authenticating -> ready <-> busy -> closed

    - only one command may be outstanding: no new command before the complete reply was read
    - a preliminary reply (1xx) keeps the channel busy until readNextReply() returns the final one
    - any socket error, time-out or malformed reply is fatal: the channel is closed          */
class FtpControlChannel
{
public:
    enum class State
    {
        disconnected,
        connecting,
        authenticating,
        ready,
        busy,
        closed,
    };

    explicit FtpControlChannel(const FtpSessionCfg& cfg) : cfg_(cfg) {}
    ~FtpControlChannel() { close(); }

    //expects greeting 220
    void connect(const FtpEndpoint& endpoint); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol

    //USER -> 331 -> PASS -> 230, or USER -> 230
    void authenticate(const std::string& username, const std::string& password); //throw ErrorFtpAuth, ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol

    //write one command, read one complete reply
    FtpReply sendCommand(const std::string& command); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol

    //read the reply following a preliminary (1xx) reply
    FtpReply readNextReply(); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol

    //send QUIT if no exchange is pending, then disconnect; errors are only logged
    void close(); //noexcept

    State getState() const { return state_; }

    const FtpSessionCfg& getConfig() const { return cfg_; }

    std::wstring getServerDisplayName() const { return fbase::fmtPath(serverName_); }

    Zstring getPeerAddress() const; //throw ErrorFtpConnection

private:
    FtpControlChannel           (const FtpControlChannel&) = delete;
    FtpControlChannel& operator=(const FtpControlChannel&) = delete;

    template <class Function>
    auto runFatalOnError(const std::wstring& errorMsg, Function fun); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol

    FtpReply exchange(const std::string& command); //throw SysError, SysErrorTimeout, SysErrorFtpProtocol
    FtpReply readReply(); //throw SysError, SysErrorTimeout, SysErrorFtpProtocol
    std::string readLine(); //throw SysError, SysErrorTimeout
    void writeLine(const std::string& line); //throw SysError, SysErrorTimeout

    void logLine(bool outgoing, const std::string& line);

    const FtpSessionCfg cfg_;
    std::unique_ptr<fbase::Socket> socket_;
    std::string recvBuf_; //bytes received after the last complete line
    State state_ = State::disconnected;
    Zstring serverName_;
};
}

#endif //CONTROL_CHANNEL_H_1203984756102938475
