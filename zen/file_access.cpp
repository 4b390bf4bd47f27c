// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_access.h"
#include <algorithm>
#include "file_io.h"

    #include <fcntl.h>  //open, close
    #include <unistd.h> //readlink, symlink
    #include <sys/stat.h>

using namespace zen;


ItemType zen::getItemType(const struct stat& itemInfo)
{
    const mode_t m = itemInfo.st_mode;
    if (S_ISREG (m)) return ItemType::file;
    if (S_ISDIR (m)) return ItemType::folder;
    if (S_ISLNK (m)) return ItemType::symlink;
    if (S_ISSOCK(m)) return ItemType::socket;
    if (S_ISFIFO(m)) return ItemType::fifo;
    if (S_ISCHR (m)) return ItemType::charDevice;
    if (S_ISBLK (m)) return ItemType::blockDevice;
    return ItemType::unknown;
}


struct stat zen::getItemInfo(const Zstring& itemPath) //throw FileError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), "lstat");
    return itemInfo;
}


std::optional<struct stat> zen::getItemInfoIfExists(const Zstring& itemPath) //throw FileError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
    {
        const int ec = errno; //copy before making other system calls!
        if (ec == ENOENT || ec == ENOTDIR) //ENOTDIR: some parent is not a folder
            return std::nullopt;

        throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), formatSystemError("lstat", ec));
    }
    return itemInfo;
}


Zstring zen::getTempFolderPath() //throw FileError
{
    if (const std::optional<Zstring> tempDirPath = getEnvironmentVar("TMPDIR"))
        return *tempDirPath;
    //TMPDIR not set on CentOS 7, WTF!
    return P_tmpdir; //usually resolves to "/tmp"
}


void zen::removeFilePlain(const Zstring& filePath) //throw FileError
{
    try
    {
        if (::unlink(filePath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}


void zen::removeDirectoryPlain(const Zstring& dirPath) //throw FileError
{
    try
    {
        if (::rmdir(dirPath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("rmdir");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(dirPath)), e.toString()); }
}


namespace
{
std::wstring generateMoveErrorMsg(const Zstring& pathFrom, const Zstring& pathTo)
{
    if (getParentPath(pathFrom) == getParentPath(pathTo)) //pure "rename"
        return replaceCpy(replaceCpy(_("Cannot rename %x to %y."),
                                     L"%x", fmtPath(pathFrom)),
                          L"%y", fmtPath(getItemName(pathTo)));
    else //"move" or "move + rename"
        return trimCpy(replaceCpy(replaceCpy(_("Cannot move %x to %y."),
                                             L"%x", L'\n' + fmtPath(pathFrom)),
                                  L"%y", L'\n' + fmtPath(pathTo)));
}
}


void zen::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting) //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting
{
    auto getErrorMsg = [&] { return generateMoveErrorMsg(pathFrom, pathTo); };

    //rename() will never fail with EEXIST, but always (atomically) overwrite!
    //Linux: renameat2() with RENAME_NOREPLACE -> not supported by all file systems
    if (!replaceExisting)
    {
        struct stat sourceInfo = {};
        if (::lstat(pathFrom.c_str(), &sourceInfo) != 0)
            throw FileError(getErrorMsg(), formatSystemError("lstat(source)", errno));

        struct stat targetInfo = {};
        if (::lstat(pathTo.c_str(), &targetInfo) != 0)
        {
            if (errno != ENOENT)
                throw FileError(getErrorMsg(), formatSystemError("lstat(target)", errno));
        }
        else
        {
            if (sourceInfo.st_dev != targetInfo.st_dev ||
                sourceInfo.st_ino != targetInfo.st_ino)
                throw ErrorTargetExisting(getErrorMsg(), replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(pathTo))), pathTo);
            //else: same item, e.g. a hard link => continue with rename
        }
    }

    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
    {
        const int ec = errno;
        if (ec == EXDEV)
            throw ErrorMoveUnsupported(getErrorMsg(), formatSystemError("rename", ec));

        throw FileError(getErrorMsg(), formatSystemError("rename", ec));
    }
}


void zen::setItemPermissions(const Zstring& itemPath, mode_t mode) //throw FileError
{
    if (::chmod(itemPath.c_str(), mode) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write permissions of %x."), L"%x", fmtPath(itemPath)), "chmod");
}


void zen::createDirectory(const Zstring& dirPath) //throw FileError, ErrorTargetExisting
{
    try
    {
        //don't allow creating irregular folders!
        const Zstring dirName = getItemName(dirPath);

        if (std::all_of(dirName.begin(), dirName.end(), [](Zchar c) { return c == Zstr('.'); }))
        /**/throw SysError(replaceCpy<std::wstring>(L"Invalid folder name %x.", L"%x", fmtPath(dirName)));

        const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

        if (::mkdir(dirPath.c_str(), mode) != 0)
        {
            const int ec = errno; //copy before directly or indirectly making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), formatSystemError("mkdir", ec), dirPath);
            THROW_LAST_SYS_ERROR("mkdir");
        }
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), e.toString()); }
}


void zen::copySymlink(const Zstring& sourcePath, const Zstring& targetPath) //throw FileError, ErrorTargetExisting
{
    const std::wstring errorMsg = replaceCpy(replaceCpy(_("Cannot copy symbolic link %x to %y."), L"%x", L'\n' + fmtPath(sourcePath)), L"%y", L'\n' + fmtPath(targetPath));
    try
    {
        //accept broken symlinks
        std::string buffer(10000, '\0');
        const ssize_t bytesWritten = ::readlink(sourcePath.c_str(), buffer.data(), buffer.size());
        if (bytesWritten < 0)
            THROW_LAST_SYS_ERROR("readlink");
        if (static_cast<size_t>(bytesWritten) >= buffer.size()) //detect truncation
            throw SysError(formatSystemError("readlink", L"", L"Buffer truncated."));
        buffer.resize(bytesWritten);

        if (::symlink(buffer.c_str(), targetPath.c_str()) != 0)
        {
            const int ec = errno;
            if (ec == EEXIST)
                throw ErrorTargetExisting(errorMsg, formatSystemError("symlink", ec), targetPath);
            THROW_LAST_SYS_ERROR("symlink");
        }
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}


void zen::copyNewFile(const Zstring& sourceFile, const Zstring& targetFile) //throw FileError, ErrorTargetExisting
{
    FileInputPlain fileIn(sourceFile); //throw FileError

    const struct stat& sourceInfo = fileIn.getStatBuffered(); //throw FileError

    //analog to "cp" which copies "mode" (considering umask) by default:
    const mode_t mode = (sourceInfo.st_mode & (S_IRWXU | S_IRWXG | S_IRWXO)) | S_IWUSR;

    FileOutputPlain fileOut(targetFile, mode); //throw FileError, ErrorTargetExisting

    std::string buffer(FileBase::blockSize, '\0');
    for (;;)
    {
        const size_t bytesRead = fileIn.tryRead(buffer.data(), buffer.size()); //throw FileError
        if (bytesRead == 0) //end of file
            break;

        fileOut.write(std::string_view(buffer.data(), bytesRead)); //throw FileError
    }

    //close output file handle: good place to catch errors when closing stream!
    fileOut.close(); //throw FileError
}
