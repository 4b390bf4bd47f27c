// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_io.h"
#include <atomic>
    #include <fcntl.h>  //open
    #include <unistd.h> //close, read, write

using namespace zen;


const struct stat& FileBase::getStatBuffered() //throw FileError
{
    if (!statBuf_)
        try
        {
            if (hFile_ == invalidFileHandle)
                throw SysError(L"Contract error: getStatBuffered() called after close().");

            struct stat fileInfo = {};
            if (::fstat(hFile_, &fileInfo) != 0)
                THROW_LAST_SYS_ERROR("fstat");
            statBuf_ = fileInfo;
        }
        catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(filePath_)), e.toString()); }

    return *statBuf_;
}


FileBase::~FileBase()
{
    if (hFile_ != invalidFileHandle)
        try
        {
            close(); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); }
}


void FileBase::close() //throw FileError
{
    try
    {
        if (hFile_ == invalidFileHandle)
            throw SysError(L"Contract error: close() called more than once.");
        if (::close(hFile_) != 0)
            THROW_LAST_SYS_ERROR("close");
        hFile_ = invalidFileHandle; //do NOT set on error! => ~FileOutputPlain() still wants to (try to) delete the file!
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

namespace
{
FileBase::FileHandle openHandleForRead(const Zstring& filePath) //throw FileError
{
    try
    {
        //caveat: character devices and named pipes block during open()
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0) //follows symlinks
            THROW_LAST_SYS_ERROR("stat");

        if (!S_ISREG(fileInfo.st_mode) &&
            !S_ISDIR(fileInfo.st_mode)) //open() will fail with "EISDIR: Is a directory" => nice
        {
            const std::wstring typeName = S_ISCHR (fileInfo.st_mode) ? L"character device" :
                                          S_ISBLK (fileInfo.st_mode) ? L"block device" :
                                          S_ISFIFO(fileInfo.st_mode) ? L"FIFO, named pipe" :
                                          S_ISSOCK(fileInfo.st_mode) ? L"socket" : L"unknown";
            throw SysError(_("Unsupported item type.") + L" [" + typeName + L']');
        }

        const int fdFile = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
        if (fdFile == -1) //don't check "< 0" -> docu seems to allow "-2" to be a valid file handle
            THROW_LAST_SYS_ERROR("open");
        return fdFile; //pass ownership
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot open file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}


FileBase::FileHandle openHandleForWrite(const Zstring& filePath, mode_t mode) //throw FileError, ErrorTargetExisting
{
    try
    {
        //O_EXCL contains a race condition on NFS file systems: https://linux.die.net/man/2/open
        const int fdFile = ::open(filePath.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, mode);
        if (fdFile == -1)
        {
            const int ec = errno; //copy before making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath)), formatSystemError("open", ec), filePath);

            THROW_LAST_SYS_ERROR("open");
        }
        return fdFile; //pass ownership
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}
}


FileInputPlain::FileInputPlain(const Zstring& filePath) :
    FileBase(openHandleForRead(filePath), filePath) {} //throw FileError


//may return short, only 0 means EOF! =>  CONTRACT: bytesToRead > 0!
size_t FileInputPlain::tryRead(void* buffer, size_t bytesToRead) //throw FileError
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesRead = 0;
        do
        {
            bytesRead = ::read(getHandle(), buffer, bytesToRead);
        }
        while (bytesRead < 0 && errno == EINTR);

        if (bytesRead < 0)
            THROW_LAST_SYS_ERROR("read");

        return bytesRead; //"zero indicates end of file"
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

FileOutputPlain::FileOutputPlain(const Zstring& filePath, mode_t mode) :
    FileBase(openHandleForWrite(filePath, mode), filePath) {} //throw FileError, ErrorTargetExisting


FileOutputPlain::~FileOutputPlain()
{
    if (getHandle() != invalidFileHandle) //not finalized => clean up garbage
        try
        {
            if (::unlink(getFilePath().c_str()) != 0)
                THROW_LAST_SYS_ERROR("unlink");
        }
        catch (const SysError& e)
        {
            logExtraError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(getFilePath())) + L"\n\n" + e.toString());
        }
}


//may return short! CONTRACT: bytesToWrite > 0
size_t FileOutputPlain::tryWrite(const void* buffer, size_t bytesToWrite) //throw FileError
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesWritten = 0;
        do
        {
            bytesWritten = ::write(getHandle(), buffer, bytesToWrite);
        }
        while (bytesWritten < 0 && errno == EINTR);

        if (bytesWritten <= 0)
        {
            if (bytesWritten == 0) //comment in safe-read.c suggests to treat this as an error due to buggy drivers
                errno = ENOSPC;

            THROW_LAST_SYS_ERROR("write");
        }
        return bytesWritten;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}


void FileOutputPlain::write(std::string_view bytes) //throw FileError
{
    for (size_t pos = 0; pos < bytes.size(); )
        pos += tryWrite(bytes.data() + pos, std::min(bytes.size() - pos, blockSize)); //throw FileError
}

//----------------------------------------------------------------------------------------------------

std::string zen::getFileContent(const Zstring& filePath) //throw FileError
{
    FileInputPlain fileIn(filePath); //throw FileError

    std::string output;
    for (;;)
    {
        const size_t oldSize = output.size();
        output.resize(oldSize + FileBase::blockSize);

        const size_t bytesRead = fileIn.tryRead(output.data() + oldSize, FileBase::blockSize); //throw FileError
        output.resize(oldSize + bytesRead);

        if (bytesRead == 0) //end of file
            return output;
    }
}


void zen::createFileWithContent(const Zstring& filePath, std::string_view bytes) //throw FileError, ErrorTargetExisting
{
    FileOutputPlain fileOut(filePath); //throw FileError, ErrorTargetExisting
    fileOut.write(bytes);              //throw FileError
    fileOut.close();                   //throw FileError
}


void zen::setFileContent(const Zstring& filePath, std::string_view bytes) //throw FileError
{
    const Zstring tmpFilePath = getPathWithTempName(filePath);

    createFileWithContent(tmpFilePath, bytes); //throw FileError, (ErrorTargetExisting)
    //take over ownership:
    ZEN_ON_SCOPE_FAIL( try { removeFilePlain(tmpFilePath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    //operation finished: move temp file transactionally
    moveAndRenameItem(tmpFilePath, filePath, true /*replaceExisting*/); //throw FileError, (ErrorMoveUnsupported), (ErrorTargetExisting)
}


Zstring zen::getPathWithTempName(const Zstring& itemPath)
{
    static std::atomic<unsigned int> tempCounter{0};

    //e.g. "file.txt" -> "file.txt.4711-3.tfs_tmp": ".tfs_tmp" suffix marks leftovers of an aborted operation
    return itemPath + Zstr('.') + numberTo<Zstring>(::getpid()) + Zstr('-') + numberTo<Zstring>(++tempCounter) + Zstr(".tfs_tmp");
}
