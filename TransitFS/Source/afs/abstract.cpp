// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "abstract.h"
#include <typeindex>
#include <zen/extra_log.h>
#include <zen/file_io.h>
#include <zen/scope_guard.h>
#include <zen/zstring.h>

using namespace zen;
using namespace tfs;


std::wstring tfs::getFileTypeLabel(FileType type)
{
    switch (type)
    {
        //*INDENT-OFF*
        case FileType::file:        return _("File");
        case FileType::dir:         return _("Folder");
        case FileType::symlink:     return _("Symbolic link");
        case FileType::socket:      return _("Socket");
        case FileType::fifo:        return _("Named pipe");
        case FileType::charDevice:  return _("Character device");
        case FileType::blockDevice: return _("Block device");
        case FileType::unknown:     return _("Unknown item type");
        //*INDENT-ON*
    }
    assert(false);
    return _("Unknown item type");
}


FileType tfs::getFileTypeFromFlags(bool isFile, bool isDir, bool isSymlink, bool isSocket, bool isFifo, bool isCharDevice, bool isBlockDevice)
{
    const std::pair<bool, FileType> flags[] =
    {
        {isFile,        FileType::file},
        {isDir,         FileType::dir},
        {isSymlink,     FileType::symlink},
        {isSocket,      FileType::socket},
        {isFifo,        FileType::fifo},
        {isCharDevice,  FileType::charDevice},
        {isBlockDevice, FileType::blockDevice},
    };

    std::optional<FileType> type;
    for (const auto& [isSet, t] : flags)
        if (isSet)
        {
            if (type) //contradicting flags
                return FileType::unknown;
            type = t;
        }
    return type ? *type : FileType::unknown;
}


UnixPermissions tfs::unixPermissionsFromMode(uint32_t mode)
{
    auto actionsFromBits = [](uint32_t bits) //rwx
    {
        return UnixPermissionActions{.read = (bits & 04) != 0, .write = (bits & 02) != 0, .execute = (bits & 01) != 0};
    };
    return {actionsFromBits(mode >> 6), actionsFromBits(mode >> 3), actionsFromBits(mode)};
}


uint32_t tfs::unixPermissionsToMode(const UnixPermissions& perms)
{
    auto bitsFromActions = [](const UnixPermissionActions& a) -> uint32_t
    {
        return (a.read ? 04 : 0) | (a.write ? 02 : 0) | (a.execute ? 01 : 0);
    };
    return bitsFromActions(perms.owner) << 6 | bitsFromActions(perms.group) << 3 | bitsFromActions(perms.other);
}


AfsPath tfs::sanitizeDevicePath(Zstring itemPath)
{
    replace(itemPath, Zstr('\\'), FILE_NAME_SEPARATOR);
    return AfsPath(normalizeItemPath(FILE_NAME_SEPARATOR + itemPath));
}


File tfs::makeFile(const AfsPath& itemPath, const Metadata& metadata) //throw ErrorNoFileName, ErrorNotUtf8Path
{
    if (!isValidUtf(itemPath.value))
        throw ErrorNotUtf8Path(replaceCpy(_("The path %x is not valid UTF-8."), L"%x", fmtPath(itemPath.value)), L"", itemPath.value);

    const Zstring itemName = getItemName(itemPath.value);
    if (itemName.empty() || itemName == Zstr(".") || itemName == Zstr("..") ||
        contains(itemName, FILE_NAME_SEPARATOR)) //root folder: name is "/"
        throw ErrorNoFileName(replaceCpy(_("Cannot determine the file name of %x."), L"%x", fmtPath(itemPath.value)), L"", itemPath.value);

    std::optional<Zstring> extension;
    if (const std::optional<Zstring> ext = getFileExtension(itemName))
        extension = getLowerCase(*ext);

    return {itemPath.value, itemName, extension, metadata};
}


std::weak_ordering AFS::compareDevice(const AbstractFileSystem& lhs, const AbstractFileSystem& rhs)
{
    //caveat: typeid returns static type for pointers, dynamic type for references!!!
    if (const std::strong_ordering cmp = std::type_index(typeid(lhs)) <=> std::type_index(typeid(rhs));
        cmp != std::strong_ordering::equal)
        return cmp;

    return lhs.compareDeviceSameAfsType(rhs);
}


std::optional<AfsPath> AFS::getParentPath(const AfsPath& itemPath)
{
    if (const std::optional<Zstring> parentPath = zen::getParentPath(itemPath.value))
        return AfsPath(*parentPath);
    return {};
}


std::optional<AbstractPath> AFS::getParentPath(const AbstractPath& itemPath)
{
    if (const std::optional<AfsPath> parentPath = getParentPath(itemPath.afsPath))
        return AbstractPath(itemPath.afsDevice, *parentPath);
    return {};
}


AfsPath AFS::appendRelPath(const AfsPath& itemPath, const Zstring& relPath)
{
    return AfsPath(appendPath(itemPath.value, relPath));
}


void AFS::renameItem(const AfsPath& itemPath, const Zstring& newName, bool overwrite) const //throw FileError, ErrorTargetExisting, ErrorNoFileName
{
    const std::optional<AfsPath> parentPath = getParentPath(itemPath);
    if (!parentPath || newName.empty() || contains(newName, FILE_NAME_SEPARATOR))
        throw ErrorNoFileName(replaceCpy(replaceCpy(_("Cannot rename %x to %y."), L"%x", fmtPath(getDisplayPath(itemPath))), L"%y", fmtPath(newName)),
                              L"", itemPath.value);

    moveItem(itemPath, appendRelPath(*parentPath, newName), overwrite); //throw FileError, ErrorTargetExisting
}


void AFS::createFileTransactional(const AfsPath& filePath, bool overwrite, //throw FileError, ErrorTargetExisting
                                  const std::function<void(const AfsPath& tmpFilePath)>& writeNewFile /*throw FileError*/) const
{
    //fail before uploading anything
    if (!overwrite && itemExists(filePath)) //throw FileError
        throw ErrorTargetExisting(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getDisplayPath(filePath))),
                                  replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(filePath))), filePath.value);

    const AfsPath tmpFilePath(getPathWithTempName(filePath.value));

    //a dropped connection may leave a partial temp file
    ZEN_ON_SCOPE_FAIL(try { if (itemExists(tmpFilePath)) removeFile(tmpFilePath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    writeNewFile(tmpFilePath); //throw FileError

    moveItem(tmpFilePath, filePath, overwrite); //throw FileError, ErrorTargetExisting
}


std::vector<File> AFS::retrieveFiles(const std::vector<AfsPath>& itemPaths) const //throw FileError
{
    std::vector<File> files;
    for (const AfsPath& itemPath : itemPaths)
        files.push_back(makeFile(itemPath, getMetadata(itemPath))); //throw FileError
    return files;
}
