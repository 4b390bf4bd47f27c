// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CURL_WRAP_H_6610482957302185
#define CURL_WRAP_H_6610482957302185

#include <chrono>
#include <span>
#include <functional>
#include <vector>
#include <zen/sys_error.h>


//-------------------------------------------------
#include <curl/curl.h>
//-------------------------------------------------

#ifndef CURLINC_CURL_H
    #error curl.h header guard changed
#endif

namespace zen
{
void libcurlInit();
void libcurlTearDown();


struct CurlOption
{
    template <class T>
    CurlOption(CURLoption o, T val) : option(o), value(static_cast<uint64_t>(val)) { static_assert(sizeof(val) <= sizeof(value)); }

    template <class T>
    CurlOption(CURLoption o, T* val) : option(o), value(reinterpret_cast<uint64_t>(val)) { static_assert(sizeof(val) <= sizeof(value)); }

    CURLoption option = CURLOPT_LASTENTRY;
    uint64_t value = 0;
};


DEFINE_NEW_SYS_ERROR(SysErrorPassword)

class SysErrorCurlProtocol : public SysError
{
public:
    SysErrorCurlProtocol(const std::wstring& msg, long sc) : SysError(msg), serverStatus(sc) {}

    const long serverStatus; //e.g. FTP "550 Requested action not taken"
};


//one easy handle, reused for consecutive requests against the same server
class CurlSession
{
public:
    explicit CurlSession(const std::string& urlPrefix); //e.g. "ftp://example.com:21"
    ~CurlSession();

    //returns server response (header data)
    std::string perform(const std::string& serverRelPath, //URL-encoded, starting with '/'
                        const std::vector<CurlOption>& extraOptions,
                        const std::function<void  (std::span<const char> buf)>& writeResponse /*throw X*/, //optional
                        const std::function<size_t(std::span<      char> buf)>& readRequest   /*throw X*/, //optional; return "bytesToRead" bytes unless end of stream!
                        int timeoutSec); //throw SysError, SysErrorPassword, SysErrorCurlProtocol, X

    std::chrono::steady_clock::time_point getLastUseTime() const { return lastSuccessfulUseTime_; }

private:
    CurlSession           (const CurlSession&) = delete;
    CurlSession& operator=(const CurlSession&) = delete;

    const std::string urlPrefix_;
    CURL* easyHandle_ = nullptr;
    std::chrono::steady_clock::time_point lastSuccessfulUseTime_ = std::chrono::steady_clock::now();
};


//split server response into lines: "\r\n" or "\n"
std::vector<std::string_view> splitCurlResponse(std::string_view buf);

std::string curlEscapePathSegment(std::string_view segment);

std::wstring formatCurlStatusCode(CURLcode sc);
}

#else
#error Why is this header already defined? Do not include in other headers: encapsulate the gory details!
#endif //CURL_WRAP_H_6610482957302185
