// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ERROR_H_2957301846620175
#define FILE_ERROR_H_2957301846620175

#include "sys_error.h" //we'll need this later anyway!


namespace zen
{
//closed set of failure categories: survives catching by base class
enum class FileErrorKind
{
    ioFailure,            //OS-level I/O failure
    protocolFailure,      //FTP/SFTP session or command failure
    trashFailure,
    targetExisting,
    targetNotExisting,
    fileTypeUnsupported,  //cannot copy/move sockets, fifos, devices, ...
    noFileName,
    notUtf8Path,
    operationUnsupported, //not available for this backend/platform
};


class FileError //A high-level exception class giving detailed context information for end users
{
public:
    explicit FileError(const std::wstring& msg) : msg_(msg) {}
    FileError(const std::wstring& msg, const std::wstring& details) : msg_(msg + L"\n\n" + details) {}
    virtual ~FileError() {}

    const std::wstring& toString() const { return msg_; }

    FileErrorKind getKind() const { return kind_; }
    const Zstring& getItemPath() const { return itemPath_; } //empty if not item-specific

protected:
    FileError(FileErrorKind kind, const std::wstring& msg, const std::wstring& details, const Zstring& itemPath) :
        msg_(details.empty() ? msg : msg + L"\n\n" + details), kind_(kind), itemPath_(itemPath) {}

private:
    std::wstring msg_;
    FileErrorKind kind_ = FileErrorKind::ioFailure;
    Zstring itemPath_;
};

#define DEFINE_NEW_FILE_ERROR(X, KIND) struct X : public zen::FileError { \
        X(const std::wstring& msg) : FileError(KIND, msg, L"", Zstring()) {} \
        X(const std::wstring& msg, const std::wstring& descr) : FileError(KIND, msg, descr, Zstring()) {} \
        X(const std::wstring& msg, const std::wstring& descr, const Zstring& itemPath) : FileError(KIND, msg, descr, itemPath) {} };

DEFINE_NEW_FILE_ERROR(ErrorTargetExisting,       FileErrorKind::targetExisting)
DEFINE_NEW_FILE_ERROR(ErrorTargetNotExisting,    FileErrorKind::targetNotExisting)
DEFINE_NEW_FILE_ERROR(ErrorMoveUnsupported,      FileErrorKind::operationUnsupported) //e.g. rename() across devices
DEFINE_NEW_FILE_ERROR(ErrorOperationUnsupported, FileErrorKind::operationUnsupported)
DEFINE_NEW_FILE_ERROR(RecycleBinUnavailable,     FileErrorKind::operationUnsupported)
DEFINE_NEW_FILE_ERROR(ErrorTrashFailure,         FileErrorKind::trashFailure)
DEFINE_NEW_FILE_ERROR(ErrorProtocolFailure,      FileErrorKind::protocolFailure)
DEFINE_NEW_FILE_ERROR(ErrorNoFileName,           FileErrorKind::noFileName)
DEFINE_NEW_FILE_ERROR(ErrorNotUtf8Path,          FileErrorKind::notUtf8Path)

inline bool isTargetExisting(const FileError& e) { return e.getKind() == FileErrorKind::targetExisting; }


//evaluate errno *before* making any (indirect) system calls, e.g. memory allocation for the exception object
#define THROW_LAST_FILE_ERROR(msg, functionName)                           \
    do { const ErrorCode ecInternal = getLastError(); throw FileError(msg, formatSystemError(functionName, ecInternal)); } while (false)

//----------- facilitate usage of std::wstring for error messages --------------------

inline std::wstring fmtPath(const std::wstring& displayPath) { return L'"' + displayPath + L'"'; }
inline std::wstring fmtPath(const Zstring& displayPath) { return fmtPath(utfTo<std::wstring>(displayPath)); }
inline std::wstring fmtPath(const wchar_t* displayPath) { return fmtPath(std::wstring(displayPath)); } //resolve overload ambiguity
}

#endif //FILE_ERROR_H_2957301846620175
