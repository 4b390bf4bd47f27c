// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "native.h"
#include <unistd.h>
#include <zen/file_access.h>
#include <zen/file_io.h>
#include <zen/file_traverser.h>
#include <zen/recycler.h>

using namespace zen;
using namespace tfs;


namespace
{
Metadata getMetadataFromStat(const struct stat& details)
{
    Metadata md;
    switch (getItemType(details))
    {
        //*INDENT-OFF*
        case zen::ItemType::file:        md.type = FileType::file;        break;
        case zen::ItemType::folder:      md.type = FileType::dir;         break;
        case zen::ItemType::symlink:     md.type = FileType::symlink;     break;
        case zen::ItemType::socket:      md.type = FileType::socket;      break;
        case zen::ItemType::fifo:        md.type = FileType::fifo;        break;
        case zen::ItemType::charDevice:  md.type = FileType::charDevice;  break;
        case zen::ItemType::blockDevice: md.type = FileType::blockDevice; break;
        case zen::ItemType::unknown:     md.type = FileType::unknown;     break;
        //*INDENT-ON*
    }
    md.modTime    = details.st_mtime;
    md.accessTime = details.st_atime;
    //creation time: not available via lstat()

    if (md.type != FileType::dir)
        md.fileSize = static_cast<uint64_t>(details.st_size);

    md.readOnly = (details.st_mode & (S_IWUSR | S_IWGRP | S_IWOTH)) == 0;
    md.unixPermissions = unixPermissionsFromMode(details.st_mode);
    return md;
}


class NativeFileSystem : public AbstractFileSystem
{
public:
    explicit NativeFileSystem(const Zstring& rootPath) : rootPath_(rootPath) {}

    Zstring getNativePath(const AfsPath& itemPath) const { return rootPath_ == Zstr("/") ? itemPath.value : normalizeItemPath(appendPath(rootPath_, itemPath.value)); }

private:
    Zstring getInitPathPhrase(const AfsPath& itemPath) const override { return getNativePath(itemPath); }

    std::wstring getDisplayPath(const AfsPath& itemPath) const override { return utfTo<std::wstring>(getNativePath(itemPath)); }

    std::weak_ordering compareDeviceSameAfsType(const AbstractFileSystem& afsRhs) const override
    {
        return rootPath_ <=> static_cast<const NativeFileSystem&>(afsRhs).rootPath_;
    }

    void disconnect() const override {} //nothing to close

    //----------------------------------------------------------------------------------------------------------------
    bool itemExists(const AfsPath& itemPath) const override //throw FileError
    {
        return zen::itemExists(getNativePath(itemPath)); //throw FileError
    }

    FileType getFileType(const AfsPath& itemPath) const override //throw FileError
    {
        return getMetadataFromStat(getItemInfo(getNativePath(itemPath))).type; //throw FileError
    }

    Metadata getMetadata(const AfsPath& itemPath) const override //throw FileError
    {
        return getMetadataFromStat(getItemInfo(getNativePath(itemPath))); //throw FileError
    }

    //follows symlinks
    std::string getFileContent(const AfsPath& filePath) const override //throw FileError
    {
        return zen::getFileContent(getNativePath(filePath)); //throw FileError
    }

    std::vector<File> readFolder(const AfsPath& folderPath) const override //throw FileError
    {
        std::vector<File> files;
        traverseFolder(getNativePath(folderPath), [&](const ItemInfo& ii) //throw FileError
        {
            files.push_back(makeFile(AFS::appendRelPath(folderPath, ii.itemName), getMetadataFromStat(ii.details))); //throw ErrorNoFileName, ErrorNotUtf8Path
        });
        return files;
    }

    //----------------------------------------------------------------------------------------------------------------
    void createFile(const AfsPath& filePath, bool overwrite, std::optional<std::string_view> content) const override //throw FileError, ErrorTargetExisting
    {
        const Zstring nativePath = getNativePath(filePath);
        const std::string_view bytes = content ? *content : std::string_view();

        if (overwrite)
            setFileContent(nativePath, bytes); //throw FileError; transactional: temp file + rename
        else
            createFileWithContent(nativePath, bytes); //throw FileError, ErrorTargetExisting
    }

    //already existing: fail
    void createFolder(const AfsPath& folderPath) const override //throw FileError, ErrorTargetExisting
    {
        createDirectory(getNativePath(folderPath)); //throw FileError, ErrorTargetExisting
    }

    void moveItem(const AfsPath& pathFrom, const AfsPath& pathTo, bool overwrite) const override //throw FileError, ErrorTargetExisting
    {
        try
        {
            moveAndRenameItem(getNativePath(pathFrom), getNativePath(pathTo), overwrite); //throw FileError, ErrorTargetExisting, ErrorMoveUnsupported
        }
        catch (const ErrorMoveUnsupported&) //different devices: copy + delete
        {
            const Zstring sourcePath = getNativePath(pathFrom);
            if (getItemType(sourcePath) == zen::ItemType::folder) //throw FileError
                throw;

            copyItem(pathFrom, pathTo, overwrite); //throw FileError, ErrorTargetExisting
            removeFilePlain(sourcePath); //throw FileError
        }
    }

    //symlinks are copied as links
    void copyItem(const AfsPath& pathFrom, const AfsPath& pathTo, bool overwrite) const override //throw FileError, ErrorTargetExisting
    {
        const Zstring sourcePath = getNativePath(pathFrom);
        const Zstring targetPath = getNativePath(pathTo);

        const FileType type = getFileType(pathFrom); //throw FileError
        if (!isTransferableLeaf(type))
            throw ErrorFileTypeUnsupported(replaceCpy(replaceCpy(_("Cannot copy %x to %y."), L"%x", fmtPath(sourcePath)), L"%y", fmtPath(targetPath)),
                                           replaceCpy(_("Unsupported item type: %x"), L"%x", getFileTypeLabel(type)), sourcePath);

        auto copyNew = [&](const Zstring& pathOut)
        {
            if (type == FileType::symlink)
                copySymlink(sourcePath, pathOut); //throw FileError, ErrorTargetExisting
            else
                copyNewFile(sourcePath, pathOut); //throw FileError, ErrorTargetExisting
        };

        if (!overwrite)
            return copyNew(targetPath); //throw FileError, ErrorTargetExisting

        //transactional overwrite
        const Zstring tmpPath = getPathWithTempName(targetPath);
        copyNew(tmpPath); //throw FileError
        ZEN_ON_SCOPE_FAIL(try { removeFilePlain(tmpPath); }
        catch (const FileError& e) { logExtraError(e.toString()); });

        moveAndRenameItem(tmpPath, targetPath, true /*replaceExisting*/); //throw FileError
    }

    void removeFile(const AfsPath& filePath) const override //throw FileError
    {
        removeFilePlain(getNativePath(filePath)); //throw FileError
    }

    void removeFolder(const AfsPath& folderPath) const override //throw FileError
    {
        removeDirectoryPlain(getNativePath(folderPath)); //throw FileError
    }

    void moveToRecycleBin(const std::vector<AfsPath>& itemPaths) const override //throw FileError, RecycleBinUnavailable, ErrorTrashFailure
    {
        for (const AfsPath& itemPath : itemPaths)
            zen::moveToRecycleBin(getNativePath(itemPath)); //throw FileError, RecycleBinUnavailable, ErrorTrashFailure
    }

    //follows symlinks
    void setUnixPermissions(const AfsPath& itemPath, const UnixPermissions& perms) const override //throw FileError
    {
        setItemPermissions(getNativePath(itemPath), static_cast<mode_t>(unixPermissionsToMode(perms))); //throw FileError
    }

    const Zstring rootPath_;
};
}


bool tfs::acceptsItemPathPhraseNative(const Zstring& itemPathPhrase) //noexcept
{
    //don't accept relative paths!
    return startsWith(trimCpy(itemPathPhrase), FILE_NAME_SEPARATOR);
}


AbstractPath tfs::createItemPathNative(const Zstring& itemPathPhrase) //noexcept
{
    Zstring itemPath = trimCpy(itemPathPhrase);

    if (!startsWith(itemPath, FILE_NAME_SEPARATOR)) //relative path: resolve against working directory
        if (char* workDir = ::getcwd(nullptr, 0)) //buffer allocated by glibc
        {
            ZEN_ON_SCOPE_EXIT(::free(workDir));
            itemPath = appendPath(workDir, itemPath);
        }

    return AbstractPath(createNativeDevice(), sanitizeDevicePath(itemPath));
}


AfsDevice tfs::createNativeDevice(const Zstring& rootPath)
{
    return std::make_shared<NativeFileSystem>(normalizeItemPath(rootPath));
}


Zstring tfs::getNativeItemPath(const AbstractPath& itemPath)
{
    if (const auto nativeDevice = dynamic_cast<const NativeFileSystem*>(itemPath.afsDevice.get()))
        return nativeDevice->getNativePath(itemPath.afsPath);
    return {};
}
