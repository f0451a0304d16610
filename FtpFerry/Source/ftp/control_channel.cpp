// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#include "control_channel.h"

using namespace fbase;
using namespace ferry;


namespace
{
const size_t FTP_LINE_LENGTH_MAX = 64 * 1024; //protect against servers sending garbage without line breaks
const size_t SOCKET_READ_BLOCK = 4096;


std::string getLogText(const std::string& command) //don't leak the password into logs or error messages
{
    if (startsWithAsciiNoCase(command, "PASS "))
        return "PASS ****";
    return command;
}
}


template <class Function>
auto FtpControlChannel::runFatalOnError(const std::wstring& errorMsg, Function fun) //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
{
    try
    {
        return fun(); //throw SysError, SysErrorTimeout, SysErrorFtpProtocol
    }
    catch (const SysErrorTimeout& e)
    {
        socket_.reset();
        state_ = State::closed;
        throw ErrorFtpTimeout(errorMsg, e.toString());
    }
    catch (const SysErrorFtpProtocol& e)
    {
        socket_.reset();
        state_ = State::closed;
        throw ErrorFtpProtocol(errorMsg, e.toString(), e.ftpReplyCode);
    }
    catch (const SysError& e)
    {
        socket_.reset();
        state_ = State::closed;
        throw ErrorFtpConnection(errorMsg, e.toString());
    }
}


void FtpControlChannel::connect(const FtpEndpoint& endpoint) //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
{
    if (state_ != State::disconnected)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    serverName_ = endpoint.server;
    state_ = State::connecting;

    const std::wstring errorMsg = replaceCpy(_("Unable to connect to %x."), L"%x", getServerDisplayName());

    runFatalOnError(errorMsg, [&]
    {
        socket_ = std::make_unique<Socket>(endpoint.server, numberTo<Zstring>(endpoint.port), cfg_.timeoutSec); //throw SysError, SysErrorTimeout

        FtpReply greeting = readReply(); //throw SysError, SysErrorTimeout, SysErrorFtpProtocol
        while (greeting.code == 120) //"Service ready in nnn minutes."
            greeting = readReply(); //throw SysError, SysErrorTimeout, SysErrorFtpProtocol

        if (greeting.code != 220)
            throw SysErrorFtpProtocol(_("Unexpected server greeting.") + L' ' + formatFtpReply(greeting), greeting.code);
    });
    state_ = State::ready;
}


void FtpControlChannel::authenticate(const std::string& username, const std::string& password) //throw ErrorFtpAuth, ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
{
    if (state_ != State::ready)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    const std::wstring errorMsg = replaceCpy(replaceCpy(_("Unable to log in to %x as user %y."),
                                                        L"%x", getServerDisplayName()),
                                             L"%y", fmtPath(utfTo<std::wstring>(username)));
    state_ = State::authenticating;

    const FtpReply userReply = runFatalOnError(errorMsg, [&] { return exchange("USER " + username); }); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
    if (userReply.code == 230) //no password required
    {
        state_ = State::ready;
        return;
    }
    if (userReply.code != 331)
    {
        state_ = userReply.isFinal() ? State::ready : State::busy;
        throw ErrorFtpAuth(errorMsg, formatFtpReply(userReply), userReply.code);
    }

    const FtpReply passReply = runFatalOnError(errorMsg, [&] { return exchange("PASS " + password); }); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
    state_ = passReply.isFinal() ? State::ready : State::busy;

    if (passReply.code != 230)
        throw ErrorFtpAuth(errorMsg, formatFtpReply(passReply), passReply.code);
}


FtpReply FtpControlChannel::sendCommand(const std::string& command) //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
{
    if (state_ != State::ready)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    const std::wstring errorMsg = replaceCpy(replaceCpy(_("Cannot execute command %x on %y."),
                                                        L"%x", fmtPath(utfTo<std::wstring>(getLogText(command)))),
                                             L"%y", getServerDisplayName());

    //a line break would smuggle in a second command
    if (std::any_of(command.begin(), command.end(), [](char c) { return isLineBreak(c) || c == '\0'; }))
        throw ErrorFtpProtocol(errorMsg, _("Command must not contain line breaks."), 0);

    state_ = State::busy;
    const FtpReply reply = runFatalOnError(errorMsg, [&] { return exchange(command); }); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
    if (reply.isFinal())
        state_ = State::ready;
    return reply;
}


FtpReply FtpControlChannel::readNextReply() //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
{
    if (state_ != State::busy)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    const FtpReply reply = runFatalOnError(replaceCpy(_("Cannot read server reply from %x."), L"%x", getServerDisplayName()),
    [&] { return readReply(); }); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
    if (reply.isFinal())
        state_ = State::ready;
    return reply;
}


void FtpControlChannel::close() //noexcept
{
    if (state_ == State::ready) //sending QUIT while another reply is outstanding would mix up the replies
        try
        {
            const FtpReply reply = sendCommand("QUIT"); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
            if (reply.code != 221)
                logExtraError(replaceCpy(_("Cannot close connection to %x."), L"%x", getServerDisplayName()) + L"\n\n" + formatFtpReply(reply));
        }
        catch (const FileError& e) { logExtraError(e.toString()); }

    socket_.reset();
    recvBuf_.clear();
    state_ = State::closed;
}


Zstring FtpControlChannel::getPeerAddress() const //throw ErrorFtpConnection
{
    try
    {
        if (!socket_)
            throw SysError(L"Contract error: getPeerAddress() called without connection.");

        return fbase::getPeerAddress(socket_->get()); //throw SysError
    }
    catch (const SysError& e) { throw ErrorFtpConnection(replaceCpy(_("Cannot determine address of %x."), L"%x", getServerDisplayName()), e.toString()); }
}


FtpReply FtpControlChannel::exchange(const std::string& command) //throw SysError, SysErrorTimeout, SysErrorFtpProtocol
{
    writeLine(command); //throw SysError, SysErrorTimeout
    return readReply(); //throw SysError, SysErrorTimeout, SysErrorFtpProtocol
}


FtpReply FtpControlChannel::readReply() //throw SysError, SysErrorTimeout, SysErrorFtpProtocol
{
    FtpReplyParser parser;
    while (!parser.addLine(readLine())) //throw SysError, SysErrorTimeout, SysErrorFtpProtocol
        ;
    return parser.getReply();
}


std::string FtpControlChannel::readLine() //throw SysError, SysErrorTimeout
{
    for (;;)
    {
        if (const size_t pos = recvBuf_.find('\n');
            pos != std::string::npos)
        {
            std::string line = recvBuf_.substr(0, pos);
            recvBuf_.erase(0, pos + 1);

            if (endsWith(line, '\r'))
                line.pop_back();

            logLine(false /*outgoing*/, line);
            return line;
        }

        if (recvBuf_.size() > FTP_LINE_LENGTH_MAX)
            throw SysError(_("Server reply line is too long."));

        char buffer[SOCKET_READ_BLOCK];
        const size_t bytesRead = tryReadSocket(socket_->get(), buffer, sizeof(buffer), cfg_.timeoutSec); //throw SysError, SysErrorTimeout
        if (bytesRead == 0)
            throw SysError(_("Connection closed by server."));

        recvBuf_.append(buffer, bytesRead);
    }
}


void FtpControlChannel::writeLine(const std::string& line) //throw SysError, SysErrorTimeout
{
    logLine(true /*outgoing*/, line);

    const std::string buf = line + "\r\n";
    writeSocket(socket_->get(), buf.data(), buf.size(), cfg_.timeoutSec); //throw SysError, SysErrorTimeout
}


void FtpControlChannel::logLine(bool outgoing, const std::string& line)
{
    if (cfg_.protocolLog)
        logMsg(*cfg_.protocolLog, utfTo<std::wstring>((outgoing ? "> " : "< ") + getLogText(line)), MSG_TYPE_INFO);
}
