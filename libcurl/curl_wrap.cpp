// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "curl_wrap.h"
#include <zen/open_ssl.h>
#include <zen/thread.h>
    #include <fcntl.h>

using namespace zen;


namespace
{
int curlInitLevel = 0; //support interleaving initialization calls!
//zero-initialized POD => not subject to static initialization order fiasco
}

void zen::libcurlInit()
{
    assert(curlInitLevel >= 0);
    if (++curlInitLevel != 1) //non-atomic => require call from main thread
        return;

    openSslInit();

    if (const CURLcode rc = ::curl_global_init(CURL_GLOBAL_NOTHING /*OpenSSL already initialized*/);
        rc != CURLE_OK)
        logExtraError(_("Error during process initialization.") + L"\n\n" +
                      formatSystemError("curl_global_init", formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
}


void zen::libcurlTearDown()
{
    assert(curlInitLevel >= 1);
    if (--curlInitLevel != 0)
        return;

    ::curl_global_cleanup();
    openSslTearDown();
}


CurlSession::CurlSession(const std::string& urlPrefix) : urlPrefix_(urlPrefix) {}


CurlSession::~CurlSession()
{
    if (easyHandle_)
        ::curl_easy_cleanup(easyHandle_);
}


std::string CurlSession::perform(const std::string& serverRelPath,
                                 const std::vector<CurlOption>& extraOptions,
                                 const std::function<void  (std::span<const char> buf)>& writeResponse /*throw X*/, //optional
                                 const std::function<size_t(std::span<      char> buf)>& readRequest   /*throw X*/, //optional
                                 int timeoutSec) //throw SysError, SysErrorPassword, SysErrorCurlProtocol, X
{
    if (!easyHandle_)
    {
        easyHandle_ = ::curl_easy_init();
        if (!easyHandle_)
            throw SysError(formatSystemError("curl_easy_init", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
    }
    else
        ::curl_easy_reset(easyHandle_);

    auto setCurlOption = [easyHandle = easyHandle_](const CurlOption& curlOpt) //throw SysError
    {
        if (const CURLcode rc = ::curl_easy_setopt(easyHandle, curlOpt.option, curlOpt.value);
            rc != CURLE_OK)
            throw SysError(formatSystemError("curl_easy_setopt(" + numberTo<std::string>(static_cast<int>(curlOpt.option)) + ")",
                                             formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
    };

    char curlErrorBuf[CURL_ERROR_SIZE] = {};
    setCurlOption({CURLOPT_ERRORBUFFER, curlErrorBuf}); //throw SysError

    setCurlOption({CURLOPT_URL, (urlPrefix_ + serverRelPath).c_str()}); //throw SysError

    setCurlOption({CURLOPT_NOSIGNAL, 1}); //throw SysError
    //thread-safety: https://curl.se/libcurl/c/threadsafe.html

    setCurlOption({CURLOPT_CONNECTTIMEOUT, timeoutSec}); //throw SysError

    //CURLOPT_TIMEOUT is a hard limit for the whole transfer => use a minimum speed instead
    setCurlOption({CURLOPT_LOW_SPEED_TIME, timeoutSec}); //throw SysError
    setCurlOption({CURLOPT_LOW_SPEED_LIMIT, 1 /*[bytes]*/}); //throw SysError
    //"0" means "inactive"

    setCurlOption({CURLOPT_SERVER_RESPONSE_TIMEOUT, timeoutSec}); //throw SysError
    //FTP only: not a limit on the total transfer time

    //long-running uploads need keep-alives on the control connection
    setCurlOption({CURLOPT_TCP_KEEPALIVE, 1}); //throw SysError

    std::exception_ptr userCallbackException;

    //libcurl does *not* set FD_CLOEXEC for us! https://github.com/curl/curl/issues/2252
    auto onSocketCreate = [&](curl_socket_t curlfd, curlsocktype purpose)
    {
        if (::fcntl(curlfd, F_SETFD, FD_CLOEXEC) == -1)
        {
            userCallbackException = std::make_exception_ptr(SysError(formatSystemError("fcntl(FD_CLOEXEC)", errno)));
            return CURL_SOCKOPT_ERROR;
        }
        return CURL_SOCKOPT_OK;
    };

    using SocketCbType = decltype(onSocketCreate);
    using SocketCbWrapperType =            int (*)(SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose); //needed for cdecl function pointer cast
    SocketCbWrapperType onSocketCreateWrapper = [](SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose)
    {
        return (*clientp)(curlfd, purpose); //redirect C callback to the lambda
    };

    setCurlOption({CURLOPT_SOCKOPTFUNCTION, onSocketCreateWrapper}); //throw SysError
    setCurlOption({CURLOPT_SOCKOPTDATA, &onSocketCreate}); //throw SysError

    //---------------------------------------------------
    std::string headerData;
    curl_write_callback onHeaderReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        static_cast<std::string*>(callbackData)->append(buffer, size * nitems);
        return size * nitems;
    };
    setCurlOption({CURLOPT_HEADERDATA, &headerData}); //throw SysError
    setCurlOption({CURLOPT_HEADERFUNCTION, onHeaderReceived}); //throw SysError
    //---------------------------------------------------
    auto onBytesReceived = [&](const char* buffer, size_t bytesToWrite)
    {
        try
        {
            writeResponse({buffer, bytesToWrite}); //throw X
            return bytesToWrite;
        }
        catch (...)
        {
            userCallbackException = std::current_exception();
            return bytesToWrite + 1; //signal error condition => CURLE_WRITE_ERROR
        }
    };
    curl_write_callback onBytesReceivedWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        return (*static_cast<decltype(onBytesReceived)*>(callbackData))(buffer, size * nitems);
    };
    //---------------------------------------------------
    auto getBytesToSend = [&](char* buffer, size_t bytesToRead) -> size_t
    {
        try
        {
            //libcurl calls back until 0 bytes are returned
            return readRequest({buffer, bytesToRead}); //throw X
        }
        catch (...)
        {
            userCallbackException = std::current_exception();
            return CURL_READFUNC_ABORT; //signal error condition => CURLE_ABORTED_BY_CALLBACK
        }
    };
    curl_read_callback getBytesToSendWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        return (*static_cast<decltype(getBytesToSend)*>(callbackData))(buffer, size * nitems);
    };
    //---------------------------------------------------
    if (writeResponse)
    {
        setCurlOption({CURLOPT_WRITEDATA, &onBytesReceived}); //throw SysError
        setCurlOption({CURLOPT_WRITEFUNCTION, onBytesReceivedWrapper}); //throw SysError
    }
    if (readRequest)
    {
        setCurlOption({CURLOPT_UPLOAD, 1}); //throw SysError
        setCurlOption({CURLOPT_READDATA, &getBytesToSend}); //throw SysError
        setCurlOption({CURLOPT_READFUNCTION, getBytesToSendWrapper}); //throw SysError
    }

    if (std::any_of(extraOptions.begin(), extraOptions.end(), [](const CurlOption& o) { return o.option == CURLOPT_WRITEFUNCTION || o.option == CURLOPT_READFUNCTION; }))
    /**/ throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!"); //Option already used here!

    for (const CurlOption& option : extraOptions)
        setCurlOption(option); //throw SysError

    //=======================================================================================================
    const CURLcode rcPerf = ::curl_easy_perform(easyHandle_);
    //curl_easy_perform() considers FTP response codes >= 400 as failure

    if (userCallbackException)
        std::rethrow_exception(userCallbackException); //throw X
    //=======================================================================================================

    if (rcPerf != CURLE_OK)
    {
        std::wstring errorMsg = trimCpy(utfTo<std::wstring>(std::string(curlErrorBuf))); //optional

        if (const std::vector<std::string_view>& headerLines = splitCurlResponse(headerData);
            !headerLines.empty())
            if (const std::string_view response = trimCpy(headerLines.back()); //that *should* be the server's error response
                !response.empty())
                errorMsg += (errorMsg.empty() ? L"" : L"\n") + utfTo<std::wstring>(response);

        if (rcPerf == CURLE_LOGIN_DENIED)
            throw SysErrorPassword(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));

        long serverStatus = 0; //optional
        /*const CURLcode rc =*/ ::curl_easy_getinfo(easyHandle_, CURLINFO_RESPONSE_CODE, &serverStatus);
        if (serverStatus != 0)
            throw SysErrorCurlProtocol(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg), serverStatus);

        throw SysError(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));
    }

    lastSuccessfulUseTime_ = std::chrono::steady_clock::now();
    return headerData;
}


std::vector<std::string_view> zen::splitCurlResponse(std::string_view buf)
{
    std::vector<std::string_view> lines;

    split(buf, '\n', [&](std::string_view line)
    {
        if (endsWith(line, '\r'))
            line.remove_suffix(1);
        if (!line.empty())
            lines.push_back(line);
    });
    return lines;
}


std::string zen::curlEscapePathSegment(std::string_view segment)
{
    //libcurl expects encoded paths, except for the '/' separator
    char* fmt = ::curl_easy_escape(nullptr, segment.data(), static_cast<int>(segment.size()));
    if (!fmt)
        throw std::bad_alloc();
    ZEN_ON_SCOPE_EXIT(::curl_free(fmt));
    return fmt;
}


std::wstring zen::formatCurlStatusCode(CURLcode sc)
{
    switch (sc)
    {
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_OK);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_UNSUPPORTED_PROTOCOL);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_FAILED_INIT);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_URL_MALFORMAT);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_NOT_BUILT_IN);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_PROXY);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_HOST);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_CONNECT);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_WEIRD_SERVER_REPLY);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_ACCESS_DENIED);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_ACCEPT_FAILED);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_PASS_REPLY);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_ACCEPT_TIMEOUT);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_PASV_REPLY);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_227_FORMAT);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_CANT_GET_HOST);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_SET_TYPE);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_PARTIAL_FILE);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_RETR_FILE);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_QUOTE_ERROR);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_WRITE_ERROR);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_UPLOAD_FAILED);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_READ_ERROR);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_OUT_OF_MEMORY);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_OPERATION_TIMEDOUT);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_PORT_FAILED);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_USE_REST);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CONNECT_ERROR);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_ABORTED_BY_CALLBACK);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_FUNCTION_ARGUMENT);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_INTERFACE_FAILED);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_UNKNOWN_OPTION);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_GOT_NOTHING);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_SEND_ERROR);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_RECV_ERROR);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CERTPROBLEM);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CIPHER);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_PEER_FAILED_VERIFICATION);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_FILESIZE_EXCEEDED);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_USE_SSL_FAILED);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_LOGIN_DENIED);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_DISK_FULL);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_FILE_EXISTS);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_FILE_NOT_FOUND);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_SHUTDOWN_FAILED);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_AGAIN);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_PRET_FAILED);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_BAD_FILE_LIST);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_NO_CONNECTION_AVAILABLE);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_RECURSIVE_API_CALL);
            ZEN_CHECK_CASE_FOR_CONSTANT(CURLE_AUTH_ERROR);
        default:
            break;
    }
    return replaceCpy<std::wstring>(L"Curl status %x", L"%x", numberTo<std::wstring>(static_cast<int>(sc)));
}
