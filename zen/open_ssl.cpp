// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "open_ssl.h"
#include <openssl/err.h>
#include <openssl/ssl.h>

using namespace zen;


namespace
{
#ifndef OPENSSL_THREADS
    #error OpenSSL must be built with thread support!
#endif

static_assert(OPENSSL_VERSION_NUMBER >= 0x30000000L, "OpenSSL version is too old!");


std::wstring formatOpenSSLError(const char* functionName, unsigned long ec)
{
    char errorBuf[256] = {}; //same size as used by ERR_error_string()
    ::ERR_error_string_n(ec, errorBuf, sizeof(errorBuf)); //includes null-termination

    return formatSystemError(functionName, replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec)), utfTo<std::wstring>(errorBuf));
}


struct OpenSslThreadCleanUp
{
    ~OpenSslThreadCleanUp() { ::OPENSSL_thread_stop(); }
};
thread_local OpenSslThreadCleanUp tearDownOpenSslThreadData;
}


std::wstring zen::formatLastOpenSSLError(const char* functionName)
{
    const auto ec = ::ERR_peek_last_error(); //latest error code, queue is left untouched
    ::ERR_clear_error(); //clean up for next OpenSSL operation on this thread
    return formatOpenSSLError(functionName, ec);
}


void zen::openSslInit()
{
    //initializes atomically, but do it explicitly on the main thread anyway
    if (::OPENSSL_init_ssl(OPENSSL_INIT_SSL_DEFAULT | OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) != 1)
        logExtraError(_("Error during process initialization.") + L"\n\n" + formatLastOpenSSLError("OPENSSL_init_ssl"));
}


//OpenSSL 1.1.0+ deprecates all clean up functions
void zen::openSslTearDown() {}
