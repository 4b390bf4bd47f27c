// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "init_curl_libssh2.h"
#include <condition_variable>
#include <mutex>
#include <libcurl/curl_wrap.h>    //DON'T include <curl/curl.h> directly!
#include <libssh2/libssh2_wrap.h> //DON'T include <libssh2_sftp.h> directly!

using namespace zen;


namespace
{
class UniSessionCounter
{
public:
    void inc() //throw SysError
    {
        {
            std::unique_lock dummy(lockCount_);
            assert(sessionCount_ >= 0);

            if (!newSessionsAllowed_)
                throw SysError(formatSystemError("UniSessionCounter::inc", L"", L"Function call not allowed during init/shutdown."));

            ++sessionCount_;
        }
        conditionCountChanged_.notify_all();
    }

    void dec() //noexcept
    {
        {
            std::unique_lock dummy(lockCount_);
            assert(sessionCount_ >= 1);
            --sessionCount_;
        }
        conditionCountChanged_.notify_all();
    }

    void setSessionsAllowed(bool allowed) //noexcept
    {
        std::unique_lock dummy(lockCount_);
        newSessionsAllowed_ = allowed;
    }

    void waitUntilNoSessions() //noexcept
    {
        std::unique_lock dummy(lockCount_);
        conditionCountChanged_.wait(dummy, [this] { return sessionCount_ == 0; });
    }

private:
    std::mutex              lockCount_;
    int                     sessionCount_ = 0;
    std::condition_variable conditionCountChanged_;

    bool newSessionsAllowed_ = false;
};

UniSessionCounter& getSessionCounter()
{
    static UniSessionCounter inst; //function-scope static: no static initialization order fiasco
    return inst;
}

int uniInitLevel = 0; //support interleaving initialization calls! (e.g. use for libssh2 and libcurl)
}


void zen::libsshCurlUnifiedInit()
{
    assert(uniInitLevel >= 0);
    if (++uniInitLevel != 1) //non-atomic => require call from main thread
        return;

    libcurlInit();

    if (const int rc = ::libssh2_init(0); //includes OpenSSL-related initialization
        rc != 0)
        logExtraError(formatSystemError("libssh2_init", formatSshStatusCode(rc), L""));

    getSessionCounter().setSessionsAllowed(true);
}


void zen::libsshCurlUnifiedTearDown()
{
    assert(uniInitLevel >= 1);
    if (--uniInitLevel != 0)
        return;

    //wait until all (S)FTP sessions running on worker threads have ended!
    getSessionCounter().setSessionsAllowed(false);
    getSessionCounter().waitUntilNoSessions();

    ::libssh2_exit();
    libcurlTearDown();
}


class zen::UniCounterCookie
{
public:
    UniCounterCookie() {}
    ~UniCounterCookie() { getSessionCounter().dec(); }

private:
    UniCounterCookie           (const UniCounterCookie&) = delete;
    UniCounterCookie& operator=(const UniCounterCookie&) = delete;
};


std::shared_ptr<UniCounterCookie> zen::getLibsshCurlUnifiedInitCookie() //throw SysError
{
    getSessionCounter().inc(); //throw SysError => ~UniCounterCookie() *not* called!

    //pass "ownership" of having to call UniSessionCounter::dec()
    return std::make_shared<UniCounterCookie>();
}
