// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef EXTRA_LOG_H_9027316458201937
#define EXTRA_LOG_H_9027316458201937

#include <functional>
#include "error_log.h"
#include "thread.h"

/*  process-wide log for messages without a caller-provided channel, e.g.
    - decisions taken by the transfer engine on behalf of a progress handler
    - cleanup errors while an exception is in flight
    - session setup/teardown problems of the network backends          */

namespace zen
{
namespace impl
{
class ExtraLog
{
public:
    ~ExtraLog()
    {
        if (!log_.empty() && reportOutstandingLog_)
            reportOutstandingLog_(log_);
    }

    void init(const std::function<void(const ErrorLog& log)>& reportOutstandingLog) { reportOutstandingLog_ = reportOutstandingLog; }

    ErrorLog fetchLog() { return std::exchange(log_, ErrorLog()); }

    void log(const std::wstring& msg, MessageType type) { logMsg(log_, msg, type); } //nothrow!

private:
    ErrorLog log_;
    std::function<void(const ErrorLog& log)> reportOutstandingLog_;
};

inline constinit Global<Protected<ExtraLog>> globalExtraLog;

template <class Function>
void accessExtraLog(Function fun)
{
    globalExtraLog.setOnce([] { return std::make_unique<Protected<ExtraLog>>(); });

    if (auto protExtraLog = impl::globalExtraLog.get())
        protExtraLog->access([&](ExtraLog& log) { fun(log); });
    else
        assert(false); //access after global shutdown!?
}
}

inline
void initExtraLog(const std::function<void(const ErrorLog& log)>& reportOutstandingLog /*nothrow! runs during global shutdown!*/)
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.init(reportOutstandingLog); });
}


inline
ErrorLog fetchExtraLog()
{
    ErrorLog output;
    impl::accessExtraLog([&](impl::ExtraLog& el) { output = el.fetchLog(); });
    return output;
}


inline void logExtraInfo   (const std::wstring& msg) { impl::accessExtraLog([&](impl::ExtraLog& el) { el.log(msg, MSG_TYPE_INFO); }); }
inline void logExtraWarning(const std::wstring& msg) { impl::accessExtraLog([&](impl::ExtraLog& el) { el.log(msg, MSG_TYPE_WARNING); }); }
inline void logExtraError  (const std::wstring& msg) { impl::accessExtraLog([&](impl::ExtraLog& el) { el.log(msg, MSG_TYPE_ERROR); }); } //nothrow!
}

#endif //EXTRA_LOG_H_9027316458201937
