// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SOCKET_H_4408127365019283
#define SOCKET_H_4408127365019283

#include "sys_error.h"
    #include <fcntl.h>  //fcntl
    #include <unistd.h> //close
    #include <sys/select.h>
    #include <sys/socket.h>
    #include <netinet/in.h>
    #include <netinet/tcp.h> //TCP_NODELAY
    #include <netdb.h> //getaddrinfo


namespace zen
{
#define THROW_LAST_SYS_ERROR_GAI(rcGai)                        \
    do {                                                       \
        if (rcGai == EAI_SYSTEM) /*"check errno for details"*/ \
            THROW_LAST_SYS_ERROR("getaddrinfo");               \
        \
        throw SysError(formatSystemError("getaddrinfo", formatGaiErrorCode(rcGai), utfTo<std::wstring>(std::string(::gai_strerror(rcGai))))); \
    } while (false)

inline
std::wstring formatGaiErrorCode(int ec)
{
    switch (ec)
    {
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_AGAIN);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_BADFLAGS);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_FAIL);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_FAMILY);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_MEMORY);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_NONAME);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_SERVICE);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_SOCKTYPE);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_SYSTEM);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAI_OVERFLOW);
        default:
            return replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec));
    }
}

using SocketType = int;
const SocketType invalidSocket = -1;

void setNonBlocking(SocketType socket, bool value); //throw SysError


//blocking TCP connection to the first reachable address of "server"
class Socket //throw SysError
{
public:
    Socket(const Zstring& server, const Zstring& serviceName, int timeoutSec) //throw SysError
    {
        if (trimCpy(server).empty())
            throw SysError(_("Server name must not be empty."));

        const addrinfo hints
        {
            .ai_flags = AI_ADDRCONFIG, //save a AAAA lookup on machines that can't use the returned data anyhow
            .ai_socktype = SOCK_STREAM,
        };

        addrinfo* servinfo = nullptr;
        ZEN_ON_SCOPE_EXIT(if (servinfo) ::freeaddrinfo(servinfo));

        const int rcGai = ::getaddrinfo(server.c_str(), serviceName.c_str(), &hints, &servinfo);
        if (rcGai != 0)
            THROW_LAST_SYS_ERROR_GAI(rcGai);
        if (!servinfo)
            throw SysError(formatSystemError("getaddrinfo", L"", L"Empty server info."));

        //try all addresses: e.g. 1 x AF_INET6 + 3 x AF_INET
        std::optional<SysError> firstError;
        for (const addrinfo* ai = servinfo; ai; ai = ai->ai_next)
            try
            {
                socket_ = connectWithTimeout(*ai, timeoutSec); //throw SysError; pass ownership
                return;
            }
            catch (const SysError& e) { if (!firstError) firstError = e; }

        throw* firstError; //list was not empty, so there must have been an error!
    }

    ~Socket() { ::close(socket_); }

    SocketType get() const { return socket_; }

private:
    Socket           (const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    static SocketType connectWithTimeout(const addrinfo& ai, int timeoutSec) //throw SysError
    {
        const SocketType testSocket = ::socket(ai.ai_family, SOCK_CLOEXEC | SOCK_NONBLOCK | ai.ai_socktype, ai.ai_protocol);
        if (testSocket == invalidSocket)
            THROW_LAST_SYS_ERROR("socket");
        ZEN_ON_SCOPE_FAIL(::close(testSocket));

        if (::connect(testSocket, ai.ai_addr, ai.ai_addrlen) != 0)
        {
            if (errno != EINPROGRESS)
                THROW_LAST_SYS_ERROR("connect");

            fd_set writefds{};
            fd_set exceptfds{};
            FD_SET(testSocket, &writefds);
            FD_SET(testSocket, &exceptfds);

            timeval tv{.tv_sec = timeoutSec};

            const int rv = ::select(testSocket + 1, nullptr, &writefds, &exceptfds, &tv);
            if (rv < 0)
                THROW_LAST_SYS_ERROR("select");

            if (rv == 0) //time-out!
                throw SysError(formatSystemError("select, " + utfTo<std::string>(_P("1 sec", "%x sec", timeoutSec)), ETIMEDOUT));

            int error = 0;
            socklen_t optLen = sizeof(error);
            if (::getsockopt(testSocket, SOL_SOCKET, SO_ERROR, &error, &optLen) != 0)
                THROW_LAST_SYS_ERROR("getsockopt(SO_ERROR)");

            if (error != 0)
                throw SysError(formatSystemError("connect, SO_ERROR", static_cast<ErrorCode>(error)));
        }

        setNonBlocking(testSocket, false); //throw SysError

        int noDelay = 1; //disable Nagle algorithm: SFTP is request/response-driven
        if (::setsockopt(testSocket, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)) != 0)
            THROW_LAST_SYS_ERROR("setsockopt(TCP_NODELAY)");

        return testSocket;
    }

    SocketType socket_ = invalidSocket;
};


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

#endif //SOCKET_H_4408127365019283
