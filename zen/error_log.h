// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ERROR_LOG_H_1648203957120384
#define ERROR_LOG_H_1648203957120384

#include <algorithm>
#include <cassert>
#include <iterator>
#include <ctime>
#include <vector>
#include "i18n.h"
#include "zstring.h"


namespace zen
{
enum MessageType
{
    MSG_TYPE_INFO    = 0x1,
    MSG_TYPE_WARNING = 0x2,
    MSG_TYPE_ERROR   = 0x4,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MSG_TYPE_ERROR;
    Zstringc message; //UTF-8
};

std::string formatMessage(const LogEntry& entry);

using ErrorLog = std::vector<LogEntry>;

void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time = std::time(nullptr));

struct ErrorLogStats
{
    int info    = 0;
    int warning = 0;
    int error   = 0;
};
ErrorLogStats getStats(const ErrorLog& log);

//typeFilter: combination of MessageType bits
ErrorLog filterLog(const ErrorLog& log, int typeFilter);
std::string formatLog(const ErrorLog& log, int typeFilter = MSG_TYPE_INFO | MSG_TYPE_WARNING | MSG_TYPE_ERROR);

//most severe entry type or 0 for an empty log
int getMaxSeverity(const ErrorLog& log);







//######################## implementation ##########################
inline
void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time)
{
    log.push_back({time, type, utfTo<Zstringc>(msg)});
}


inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats count;
    for (const LogEntry& entry : log)
        switch (entry.type)
        {
            case MSG_TYPE_INFO:
                ++count.info;
                break;
            case MSG_TYPE_WARNING:
                ++count.warning;
                break;
            case MSG_TYPE_ERROR:
                ++count.error;
                break;
        }
    assert(std::ssize(log) == count.info + count.warning + count.error);
    return count;
}


inline
ErrorLog filterLog(const ErrorLog& log, int typeFilter)
{
    ErrorLog output;
    std::copy_if(log.begin(), log.end(), std::back_inserter(output), [typeFilter](const LogEntry& entry) { return (entry.type & typeFilter) != 0; });
    return output;
}


inline
int getMaxSeverity(const ErrorLog& log)
{
    int severity = 0;
    for (const LogEntry& entry : log)
        severity = std::max<int>(severity, entry.type);
    return severity;
}


inline
std::wstring getMessageTypeLabel(MessageType type)
{
    switch (type)
    {
        case MSG_TYPE_INFO:
            return _("Info");
        case MSG_TYPE_WARNING:
            return _("Warning");
        case MSG_TYPE_ERROR:
            return _("Error");
    }
    assert(false);
    return std::wstring();
}


//"[12:34:56]  Error:  message", continuation lines indented below the message start
inline
std::string formatMessage(const LogEntry& entry)
{
    std::tm localTime = {};
    char timeTag[16] = {};
    if (::localtime_r(&entry.time, &localTime))
        std::strftime(timeTag, sizeof(timeTag), "%H:%M:%S", &localTime);

    std::string msgFmt = std::string("[") + timeTag + "]  " + utfTo<std::string>(getMessageTypeLabel(entry.type)) + ":  ";
    const size_t prefixLen = unicodeLength(msgFmt); //consider Unicode!

    const Zstringc msg = trimCpy(entry.message);

    for (auto it = msg.begin(); it != msg.end(); )
        if (*it == '\n')
        {
            msgFmt += *it++;
            msgFmt.append(prefixLen, ' ');
            //skip duplicate newlines
            for (; it != msg.end() && *it == '\n'; ++it)
                ;
        }
        else
            msgFmt += *it++;

    msgFmt += '\n';
    return msgFmt;
}


inline
std::string formatLog(const ErrorLog& log, int typeFilter)
{
    std::string output;
    for (const LogEntry& entry : log)
        if (entry.type & typeFilter)
            output += formatMessage(entry);
    return output;
}
}

#endif //ERROR_LOG_H_1648203957120384
