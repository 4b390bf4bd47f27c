// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "sys_error.h"
    #include <gio/gio.h>

using namespace zen;


namespace
{
std::wstring formatSystemErrorCode(ErrorCode ec)
{
    switch (ec) //codes a file manager realistically runs into
    {
            ZEN_CHECK_CASE_FOR_CONSTANT(EPERM);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOENT);
            ZEN_CHECK_CASE_FOR_CONSTANT(EINTR);
            ZEN_CHECK_CASE_FOR_CONSTANT(EIO);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENXIO);
            ZEN_CHECK_CASE_FOR_CONSTANT(EBADF);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAGAIN);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOMEM);
            ZEN_CHECK_CASE_FOR_CONSTANT(EACCES);
            ZEN_CHECK_CASE_FOR_CONSTANT(EFAULT);
            ZEN_CHECK_CASE_FOR_CONSTANT(EBUSY);
            ZEN_CHECK_CASE_FOR_CONSTANT(EEXIST);
            ZEN_CHECK_CASE_FOR_CONSTANT(EXDEV);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENODEV);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOTDIR);
            ZEN_CHECK_CASE_FOR_CONSTANT(EISDIR);
            ZEN_CHECK_CASE_FOR_CONSTANT(EINVAL);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENFILE);
            ZEN_CHECK_CASE_FOR_CONSTANT(EMFILE);
            ZEN_CHECK_CASE_FOR_CONSTANT(ETXTBSY);
            ZEN_CHECK_CASE_FOR_CONSTANT(EFBIG);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOSPC);
            ZEN_CHECK_CASE_FOR_CONSTANT(EROFS);
            ZEN_CHECK_CASE_FOR_CONSTANT(EMLINK);
            ZEN_CHECK_CASE_FOR_CONSTANT(EPIPE);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENAMETOOLONG);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOSYS);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOTEMPTY);
            ZEN_CHECK_CASE_FOR_CONSTANT(ELOOP);
            ZEN_CHECK_CASE_FOR_CONSTANT(EOPNOTSUPP);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOTSOCK);
            ZEN_CHECK_CASE_FOR_CONSTANT(EADDRINUSE);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENETDOWN);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENETUNREACH);
            ZEN_CHECK_CASE_FOR_CONSTANT(ECONNABORTED);
            ZEN_CHECK_CASE_FOR_CONSTANT(ECONNRESET);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOTCONN);
            ZEN_CHECK_CASE_FOR_CONSTANT(ETIMEDOUT);
            ZEN_CHECK_CASE_FOR_CONSTANT(ECONNREFUSED);
            ZEN_CHECK_CASE_FOR_CONSTANT(EHOSTUNREACH);
            ZEN_CHECK_CASE_FOR_CONSTANT(EINPROGRESS);
            ZEN_CHECK_CASE_FOR_CONSTANT(EDQUOT);
            ZEN_CHECK_CASE_FOR_CONSTANT(ECANCELED);
        default:
            return replaceCpy<std::wstring>(L"Error %x", L"%x", numberTo<std::wstring>(ec));
    }
}
}


std::wstring zen::formatGlibError(const std::string& functionName, GError* error)
{
    if (!error)
        return formatSystemError(functionName, L"", L"GError == nullptr");

    std::wstring errorCode;
    if (error->domain == G_FILE_ERROR)
        errorCode = formatSystemErrorCode(::g_file_error_to_errno(static_cast<GFileError>(error->code)));

    else if (error->domain == G_IO_ERROR)
        errorCode = [&]() -> std::wstring
    {
        switch (error->code)
        {
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_FAILED);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_NOT_FOUND);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_EXISTS);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_IS_DIRECTORY);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_NOT_DIRECTORY);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_NOT_EMPTY);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_INVALID_FILENAME);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_TOO_MANY_LINKS);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_NO_SPACE);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_INVALID_ARGUMENT);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_PERMISSION_DENIED);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_NOT_SUPPORTED);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_NOT_MOUNTED);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_CANCELLED);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_READ_ONLY);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_BUSY);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_TIMED_OUT);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_HOST_NOT_FOUND);
                ZEN_CHECK_CASE_FOR_CONSTANT(G_IO_ERROR_TOO_MANY_OPEN_FILES);
            default:
                return replaceCpy<std::wstring>(L"GIO error %x", L"%x", numberTo<std::wstring>(error->code));
        }
    }();
    else
    {
        //g-file-error-quark => g-file-error
        std::wstring domain = utfTo<std::wstring>(std::string(::g_quark_to_string(error->domain)));
        if (endsWith(domain, L"-quark"))
            domain = beforeLast(domain, L"-", IfNotFoundReturn::none);

        errorCode = domain + L' ' + numberTo<std::wstring>(error->code); //e.g. "g-io-error 15"
    }

    const std::wstring errorMsg = utfTo<std::wstring>(std::string(error->message)); //e.g. "Unable to find or create trash directory for file.txt"

    return formatSystemError(functionName, errorCode, errorMsg);
}


std::wstring zen::getSystemErrorDescription(ErrorCode ec) //return empty string on error
{
    const ErrorCode ecCurrent = getLastError(); //not necessarily == ec
    ZEN_ON_SCOPE_EXIT(errno = ecCurrent);

    std::wstring errorMsg = utfTo<std::wstring>(std::string(::g_strerror(ec))); //... vs strerror(): "marginally improves thread safety"
    trim(errorMsg);
    return errorMsg;
}


std::wstring zen::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


std::wstring zen::formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg)
{
    std::wstring output = trimCpy(errorCode);

    const std::wstring errorMsgFmt = trimCpy(errorMsg);
    if (!output.empty() && !errorMsgFmt.empty())
        output += L": ";

    output += errorMsgFmt;

    if (!functionName.empty())
        output += L" [" + utfTo<std::wstring>(functionName) + L']';

    return trimCpy(output);
}
