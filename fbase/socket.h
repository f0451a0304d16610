// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SOCKET_H_4418203957162093847561
#define SOCKET_H_4418203957162093847561

#include <exception>
#include <algorithm>
#include <climits>
#include <cstdint>
#include "sys_error.h"
    #include <unistd.h> //close
    #include <fcntl.h>
    #include <poll.h>
    #include <sys/socket.h>
    #include <netinet/in.h>
    #include <netinet/tcp.h> //TCP_NODELAY
    #include <netdb.h> //getaddrinfo


namespace fbase
{
#define THROW_LAST_SYS_ERROR_GAI(rcGai)                        \
    do {                                                       \
        if (rcGai == EAI_SYSTEM) /*"check errno for details"*/ \
            THROW_LAST_SYS_ERROR("getaddrinfo");               \
        \
        throw fbase::SysError(fbase::formatSystemError("getaddrinfo", fbase::formatGaiErrorCode(rcGai), fbase::utfTo<std::wstring>(::gai_strerror(rcGai)))); \
    } while (false)

inline
std::wstring formatGaiErrorCode(int ec)
{
    switch (ec)
    {
            FBASE_CHECK_CASE_FOR_CONSTANT(EAI_ADDRFAMILY);
            FBASE_CHECK_CASE_FOR_CONSTANT(EAI_AGAIN);
            FBASE_CHECK_CASE_FOR_CONSTANT(EAI_BADFLAGS);
            FBASE_CHECK_CASE_FOR_CONSTANT(EAI_FAIL);
            FBASE_CHECK_CASE_FOR_CONSTANT(EAI_FAMILY);
            FBASE_CHECK_CASE_FOR_CONSTANT(EAI_MEMORY);
            FBASE_CHECK_CASE_FOR_CONSTANT(EAI_NODATA);
            FBASE_CHECK_CASE_FOR_CONSTANT(EAI_NONAME);
            FBASE_CHECK_CASE_FOR_CONSTANT(EAI_SERVICE);
            FBASE_CHECK_CASE_FOR_CONSTANT(EAI_SOCKTYPE);
            FBASE_CHECK_CASE_FOR_CONSTANT(EAI_SYSTEM);
            FBASE_CHECK_CASE_FOR_CONSTANT(EAI_OVERFLOW);
        default:
            return replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec));
    }
}

using SocketType = int;
const SocketType invalidSocket = -1;
inline void closeSocket(SocketType s) { ::close(s); }

void setNonBlocking(SocketType socket, bool value); //throw SysError


enum class SocketWait
{
    read,
    write,
};
//block until socket is readable/writable, or throw SysErrorTimeout
void waitForSocket(SocketType socket, SocketWait direction, int timeoutSec); //throw SysError, SysErrorTimeout

//seconds -> poll() milliseconds, clamped to [0, INT_MAX]
int getPollTimeoutMs(int timeoutSec);


class Socket //throw SysError, SysErrorTimeout
{
public:
    Socket(const Zstring& server, const Zstring& serviceName, int timeoutSec) //throw SysError, SysErrorTimeout
    {
        if (trimCpy(server).empty())
            throw SysError(_("Server name must not be empty."));

        const addrinfo hints
        {
            .ai_flags = AI_ADDRCONFIG, //save a AAAA lookup on machines that can't use the returned data anyhow
            .ai_socktype = SOCK_STREAM, //we *do* care about this one!
        };

        addrinfo* servinfo = nullptr;
        FBASE_ON_SCOPE_EXIT(if (servinfo) ::freeaddrinfo(servinfo));

        const int rcGai = ::getaddrinfo(server.c_str(), serviceName.c_str(), &hints, &servinfo);
        if (rcGai != 0)
            THROW_LAST_SYS_ERROR_GAI(rcGai);
        if (!servinfo)
            throw SysError(formatSystemError("getaddrinfo", L"", L"Empty server info."));

        const auto getConnectedSocket = [timeoutSec](const auto& /*addrinfo*/ ai)
        {
            SocketType testSocket = ::socket(ai.ai_family,    //int socket_family
                                             SOCK_CLOEXEC | SOCK_NONBLOCK |
                                             ai.ai_socktype,  //int socket_type
                                             ai.ai_protocol); //int protocol
            if (testSocket == invalidSocket)
                THROW_LAST_SYS_ERROR("socket");
            FBASE_ON_SCOPE_FAIL(closeSocket(testSocket));

            if (::connect(testSocket, ai.ai_addr, ai.ai_addrlen) != 0)
            {
                if (errno != EINPROGRESS)
                    THROW_LAST_SYS_ERROR("connect");

                waitForSocket(testSocket, SocketWait::write, timeoutSec); //throw SysError, SysErrorTimeout

                int error = 0;
                socklen_t optLen = sizeof(error);
                if (::getsockopt(testSocket, SOL_SOCKET, SO_ERROR, &error, &optLen) != 0)
                    THROW_LAST_SYS_ERROR("getsockopt(SO_ERROR)");

                if (error != 0)
                    throw SysError(formatSystemError("connect, SO_ERROR", static_cast<ErrorCode>(error)));
            }

            setNonBlocking(testSocket, false); //throw SysError
            //-----------------------------------------------------------

            int noDelay = 1; //disable Nagle algorithm: command/reply exchange is latency-bound
            if (::setsockopt(testSocket, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)) != 0)
                THROW_LAST_SYS_ERROR("setsockopt(TCP_NODELAY)");

            return testSocket;
        };

        //getaddrinfo() may return more than one address (e.g. AF_INET6 + AF_INET) => try each, report the first failure
        std::exception_ptr firstError;
        for (const auto* /*::addrinfo*/ si = servinfo; si; si = si->ai_next)
            try
            {
                socket_ = getConnectedSocket(*si); //throw SysError, SysErrorTimeout; pass ownership
                return;
            }
            catch (const SysError&) { if (!firstError) firstError = std::current_exception(); }

        std::rethrow_exception(firstError); //list was not empty, so there must have been an error!
    }

    ~Socket() { closeSocket(socket_); }

    SocketType get() const { return socket_; }

private:
    Socket           (const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    SocketType socket_ = invalidSocket;
};


//more socket helper functions:
inline
size_t tryReadSocket(SocketType socket, void* buffer, size_t bytesToRead) //throw SysError; may return short, only 0 means EOF!
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    ssize_t bytesReceived = 0;
    for (;;)
    {
        bytesReceived = ::recv(socket, buffer, bytesToRead, 0);
        if (bytesReceived >= 0 || errno != EINTR)
            break;
    }
    if (bytesReceived < 0)
        THROW_LAST_SYS_ERROR("recv");

    ASSERT_SYSERROR(static_cast<size_t>(bytesReceived) <= bytesToRead); //better safe than sorry

    return bytesReceived; //"zero indicates end of file"
}


inline
size_t tryWriteSocket(SocketType socket, const void* buffer, size_t bytesToWrite) //throw SysError; may return short! CONTRACT: bytesToWrite > 0
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    ssize_t bytesWritten = 0;
    for (;;)
    {
        bytesWritten = ::send(socket, buffer, bytesToWrite, MSG_NOSIGNAL); //no SIGPIPE: report EPIPE instead
        if (bytesWritten >= 0 || errno != EINTR)
            break;
    }
    if (bytesWritten < 0)
        THROW_LAST_SYS_ERROR("send");

    if (bytesWritten == 0)
        throw SysError(formatSystemError("send", L"", L"Zero bytes processed."));

    ASSERT_SYSERROR(static_cast<size_t>(bytesWritten) <= bytesToWrite); //better safe than sorry

    return bytesWritten;
}


//same as tryReadSocket(), but give up after "timeoutSec" without data
inline
size_t tryReadSocket(SocketType socket, void* buffer, size_t bytesToRead, int timeoutSec) //throw SysError, SysErrorTimeout
{
    waitForSocket(socket, SocketWait::read, timeoutSec); //throw SysError, SysErrorTimeout
    return tryReadSocket(socket, buffer, bytesToRead); //throw SysError
}


inline
void writeSocket(SocketType socket, const void* buffer, size_t bytesToWrite, int timeoutSec) //throw SysError, SysErrorTimeout
{
    const char* it = static_cast<const char*>(buffer);
    const char* const itEnd = it + bytesToWrite;
    while (it != itEnd)
    {
        waitForSocket(socket, SocketWait::write, timeoutSec); //throw SysError, SysErrorTimeout
        it += tryWriteSocket(socket, it, itEnd - it); //throw SysError
    }
}


//initiate termination of connection by sending TCP FIN package
inline
void shutdownSocketSend(SocketType socket) //throw SysError
{
    if (::shutdown(socket, SHUT_WR) != 0)
        THROW_LAST_SYS_ERROR("shutdown");
}


//numeric address of the remote end, e.g. "192.168.0.1" or "::1"
inline
Zstring getPeerAddress(SocketType socket) //throw SysError
{
    sockaddr_storage addr{};
    socklen_t addrLen = sizeof(addr);
    if (::getpeername(socket, reinterpret_cast<sockaddr*>(&addr), &addrLen) != 0)
        THROW_LAST_SYS_ERROR("getpeername");

    char host[NI_MAXHOST] = {};
    const int rcGai = ::getnameinfo(reinterpret_cast<const sockaddr*>(&addr), addrLen, host, sizeof(host), nullptr, 0, NI_NUMERICHOST);
    if (rcGai != 0)
        THROW_LAST_SYS_ERROR_GAI(rcGai);

    return host;
}


inline
int getPollTimeoutMs(int timeoutSec)
{
    const int64_t timeoutMs = static_cast<int64_t>(timeoutSec) * 1000;
    return static_cast<int>(std::clamp<int64_t>(timeoutMs, 0, INT_MAX));
}


inline
void waitForSocket(SocketType socket, SocketWait direction, int timeoutSec) //throw SysError, SysErrorTimeout
{
    pollfd fds
    {
        .fd = socket,
        .events = static_cast<short>(direction == SocketWait::read ? POLLIN : POLLOUT),
    };

    int rv = 0;
    for (;;)
    {
        rv = ::poll(&fds, 1, getPollTimeoutMs(timeoutSec));
        if (rv >= 0 || errno != EINTR)
            break;
    }
    if (rv < 0)
        THROW_LAST_SYS_ERROR("poll");

    if (rv == 0) //time-out!
        throw SysErrorTimeout(formatSystemError("poll, " + utfTo<std::string>(_P("1 sec", "%x sec", timeoutSec)), ETIMEDOUT));
    //POLLERR/POLLHUP: let the subsequent recv()/send()/getsockopt() report the details
}


inline
void setNonBlocking(SocketType socket, bool nonBlocking) //throw SysError
{
    int flags = ::fcntl(socket, F_GETFL);
    if (flags == -1)
        THROW_LAST_SYS_ERROR("fcntl(F_GETFL)");

    if (nonBlocking)
        flags |= O_NONBLOCK;
    else
        flags &= ~O_NONBLOCK;

    if (::fcntl(socket, F_SETFL, flags) != 0)
        THROW_LAST_SYS_ERROR(nonBlocking ? "fcntl(F_SETFL, O_NONBLOCK)" : "fcntl(F_SETFL, ~O_NONBLOCK)");
}
}

#endif //SOCKET_H_4418203957162093847561
