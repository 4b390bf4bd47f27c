// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "transit.h"
#include <set>
#include <utility>

using namespace zen;
using namespace tfs;


namespace
{
class AbortTransit {}; //unwind the traversal after TransitProgressResponse::abort


void checkTargetFolderExists(const AbstractPath& targetFolder) //throw FileError, ErrorTargetNotExisting
{
    if (!AFS::itemExists(targetFolder)) //throw FileError
        throw ErrorTargetNotExisting(replaceCpy(_("Target folder %x does not exist."), L"%x", fmtPath(AFS::getDisplayPath(targetFolder))),
                                     L"", targetFolder.afsPath.value);
}


[[noreturn]] void throwFileTypeUnsupported(const AbstractPath& itemPath, FileType type) //throw ErrorFileTypeUnsupported
{
    throw ErrorFileTypeUnsupported(replaceCpy(_("Cannot copy or move %x."), L"%x", fmtPath(AFS::getDisplayPath(itemPath))),
                                   replaceCpy(_("Unsupported item type: %x"), L"%x", getFileTypeLabel(type)),
                                   itemPath.afsPath.value);
}


//type only: no need for a full metadata query
std::vector<File> getTopLevelItems(const AfsDevice& device, const std::vector<AfsPath>& itemPaths) //throw FileError
{
    std::vector<File> items;
    for (const AfsPath& itemPath : itemPaths)
        items.push_back(makeFile(itemPath, {.type = AFS::getFileType({device, itemPath})})); //throw FileError
    return items;
}


using TransferLeafFun = std::function<void(const File& file, const AfsPath& targetPath)>; //throw FileError, X

/*  breadth-first, one folder level at a time:
      - leaf items (file, symlink) go to "transferLeaf"
      - folders are recreated on the target side; "already existing" is fine
    returns source folders in discovery order                                    */
std::vector<AfsPath> transitTree(const AfsDevice& deviceFrom, const std::vector<File>& topItems, const AbstractPath& targetFolder,
                                 const TransferLeafFun& transferLeaf) //throw FileError, X
{
    //fail before touching the target if *any* top-level item cannot be transferred
    for (const File& item : topItems)
        if (!isTransferableLeaf(item.metadata.type) && item.metadata.type != FileType::dir)
            throwFileTypeUnsupported({deviceFrom, AfsPath(item.path)}, item.metadata.type);

    struct FolderPair
    {
        AfsPath sourcePath;
        AfsPath targetPath;
    };
    std::vector<FolderPair> foldersToCopy;

    for (const File& item : topItems)
        if (item.metadata.type == FileType::dir)
            foldersToCopy.push_back({AfsPath(item.path), AFS::appendRelPath(targetFolder.afsPath, item.name)});
        else
            transferLeaf(item, AFS::appendRelPath(targetFolder.afsPath, item.name)); //throw FileError, X

    std::vector<AfsPath> sourceFolders;

    while (!foldersToCopy.empty())
    {
        std::vector<FolderPair> foldersNextLevel;

        for (const auto& [sourcePath, targetPath] : foldersToCopy)
        {
            try
            {
                AFS::createFolder({targetFolder.afsDevice, targetPath}); //throw FileError, ErrorTargetExisting
            }
            catch (const FileError& e) { if (!isTargetExisting(e)) throw; } //reuse existing folder

            for (const File& child : AFS::readFolder({deviceFrom, sourcePath})) //throw FileError
                if (child.metadata.type == FileType::dir)
                    foldersNextLevel.push_back({AfsPath(child.path), AFS::appendRelPath(targetPath, child.name)});
                else if (isTransferableLeaf(child.metadata.type))
                    transferLeaf(child, AFS::appendRelPath(targetPath, child.name)); //throw FileError, X
                else
                    throwFileTypeUnsupported({deviceFrom, AfsPath(child.path)}, child.metadata.type);

            sourceFolders.push_back(sourcePath);
        }
        foldersToCopy.swap(foldersNextLevel);
    }
    return sourceFolders;
}


//reverse discovery order => children before parents
void removeSourceFolders(const AfsDevice& deviceFrom, const std::vector<AfsPath>& sourceFolders, const std::set<AfsPath>& keptFolders) //throw FileError
{
    for (auto it = sourceFolders.rbegin(); it != sourceFolders.rend(); ++it)
        if (!keptFolders.contains(*it))
            AFS::removeFolder({deviceFrom, *it}); //throw FileError
}


using TransferFun = std::function<void(const File& file, const AfsPath& targetPath, bool overwrite)>; //throw FileError


void transitPlain(const AfsDevice& deviceFrom, const std::vector<AfsPath>& itemPaths, const AbstractPath& targetFolder, bool moveSource,
                  const TransferFun& transfer) //throw FileError
{
    checkTargetFolderExists(targetFolder); //throw FileError, ErrorTargetNotExisting

    const std::vector<AfsPath>& sourceFolders = transitTree(deviceFrom, getTopLevelItems(deviceFrom, itemPaths), targetFolder,
                                                            [&](const File& file, const AfsPath& targetPath)
    {
        transfer(file, targetPath, false /*overwrite*/); //throw FileError
    });

    if (moveSource)
        removeSourceFolders(deviceFrom, sourceFolders, {}); //throw FileError
}


void transitWithProgress(const AfsDevice& deviceFrom, const std::vector<AfsPath>& itemPaths, const AbstractPath& targetFolder, bool moveSource,
                         const TransferFun& transfer, const TransitProgressHandler& onProgress) //throw FileError, X
{
    checkTargetFolderExists(targetFolder); //throw FileError, ErrorTargetNotExisting

    const TotalStats totals = calculateTotalStats(deviceFrom, itemPaths); //throw FileError

    TransitProgress progress{.totalBytes = totals.bytes, .totalFiles = totals.files};

    std::set<AfsPath> keptFolders; //contain skipped items => cannot be removed after move

    auto onTransferred = [&](const File& file)
    {
        progress.processedBytes += file.metadata.fileSize ? *file.metadata.fileSize : 0;
        ++progress.processedFiles;
    };

    auto transferLeaf = [&](const File& file, const AfsPath& targetPath) //throw FileError, X
    {
        try
        {
            transfer(file, targetPath, false /*overwrite*/); //throw FileError
            onTransferred(file);
            progress.state = TransitNormal();
        }
        catch (const FileError& e)
        {
            if (isTargetExisting(e))
                progress.state = TransferConflict{file.metadata.type, file.path, targetPath.value};
            else
                progress.state = e;
        }

        const bool attemptFailed = !std::holds_alternative<TransitNormal>(progress.state);

        switch (onProgress(progress)) //throw X
        {
            case TransitProgressResponse::continueOrAbort:
                if (const TransferConflict* conflict = std::get_if<TransferConflict>(&progress.state))
                    throw ErrorTargetExisting(replaceCpy(_("The item %x is already existing."), L"%x", fmtPath(conflict->destination)),
                                              L"", conflict->destination);
                if (const FileError* error = std::get_if<FileError>(&progress.state))
                    throw *error;
                break;

            case TransitProgressResponse::skip:
                if (attemptFailed)
                {
                    logExtraInfo(replaceCpy(_("Skipped %x."), L"%x", fmtPath(file.path)));

                    for (std::optional<AfsPath> parentPath = AFS::getParentPath(AfsPath(file.path));
                         parentPath;
                         parentPath = AFS::getParentPath(*parentPath))
                        keptFolders.insert(*parentPath);
                }
                break;

            case TransitProgressResponse::overwrite:
                if (attemptFailed)
                {
                    transfer(file, targetPath, true /*overwrite*/); //throw FileError
                    onTransferred(file);
                    logExtraInfo(replaceCpy(_("Overwrote %x."), L"%x", fmtPath(targetPath.value)));
                }
                break;

            case TransitProgressResponse::abort:
                throw AbortTransit();
        }
    };

    try
    {
        const std::vector<AfsPath>& sourceFolders = transitTree(deviceFrom, AFS::retrieveFiles(deviceFrom, itemPaths), targetFolder, transferLeaf); //throw FileError, X

        if (moveSource)
            removeSourceFolders(deviceFrom, sourceFolders, keptFolders); //throw FileError
    }
    catch (AbortTransit&)
    {
        logExtraWarning(replaceCpy(replaceCpy(_("Operation aborted after %x of %y items."),
                                              L"%x", numberTo<std::wstring>(progress.processedFiles)),
                                   L"%y", numberTo<std::wstring>(progress.totalFiles)));
    }
}

//------------------------------------------------------------------------------------------

TransferFun getMoveSameDevice(const AfsDevice& device)
{
    return [device](const File& file, const AfsPath& targetPath, bool overwrite)
    {
        AFS::moveItem({device, AfsPath(file.path)}, targetPath, overwrite); //throw FileError, ErrorTargetExisting
    };
}


TransferFun getCopySameDevice(const AfsDevice& device)
{
    return [device](const File& file, const AfsPath& targetPath, bool overwrite)
    {
        AFS::copyItem({device, AfsPath(file.path)}, targetPath, overwrite); //throw FileError, ErrorTargetExisting
    };
}


TransferFun getCopyBetweenDevices(const AfsDevice& deviceFrom, const AfsDevice& deviceTo, bool removeSource)
{
    return [deviceFrom, deviceTo, removeSource](const File& file, const AfsPath& targetPath, bool overwrite)
    {
        const AbstractPath sourcePath(deviceFrom, AfsPath(file.path));

        const std::string content = AFS::getFileContent(sourcePath); //throw FileError
        AFS::createFile({deviceTo, targetPath}, overwrite, content); //throw FileError, ErrorTargetExisting

        if (removeSource)
            AFS::removeFile(sourcePath); //throw FileError
    };
}
}


TotalStats tfs::calculateTotalStats(const AfsDevice& device, const std::vector<AfsPath>& itemPaths) //throw FileError
{
    TotalStats stats;
    std::vector<AfsPath> folders;

    auto evalItem = [&](const File& file)
    {
        if (file.metadata.type == FileType::dir)
            folders.push_back(AfsPath(file.path));
        else
        {
            stats.bytes += file.metadata.fileSize ? *file.metadata.fileSize : 0;
            ++stats.files;
        }
    };

    for (const File& file : AFS::retrieveFiles(device, itemPaths)) //throw FileError
        evalItem(file);

    while (!folders.empty())
    {
        const std::vector<AfsPath> currentLevel = std::exchange(folders, {});

        for (const AfsPath& folderPath : currentLevel)
            for (const File& child : AFS::readFolder({device, folderPath})) //throw FileError
                evalItem(child);
    }
    return stats;
}


void tfs::removeAll(const AfsDevice& device, const std::vector<AfsPath>& itemPaths) //throw FileError
{
    std::vector<AfsPath> foldersVisited; //discovery order
    std::vector<AfsPath> folders;

    auto evalItem = [&](const File& file)
    {
        if (file.metadata.type == FileType::dir)
            folders.push_back(AfsPath(file.path));
        else
            AFS::removeFile({device, AfsPath(file.path)}); //throw FileError
    };

    for (const File& file : AFS::retrieveFiles(device, itemPaths)) //throw FileError
        evalItem(file);

    while (!folders.empty())
    {
        const std::vector<AfsPath> currentLevel = std::exchange(folders, {});

        for (const AfsPath& folderPath : currentLevel)
        {
            foldersVisited.push_back(folderPath);

            for (const File& child : AFS::readFolder({device, folderPath})) //throw FileError
                evalItem(child);
        }
    }

    for (auto it = foldersVisited.rbegin(); it != foldersVisited.rend(); ++it)
        AFS::removeFolder({device, *it}); //throw FileError
}


void tfs::moveFiles(const AfsDevice& device, const std::vector<AfsPath>& itemPaths, const AfsPath& targetFolder) //throw FileError
{
    transitPlain(device, itemPaths, {device, targetFolder}, true /*moveSource*/, getMoveSameDevice(device)); //throw FileError
}


void tfs::copyFiles(const AfsDevice& device, const std::vector<AfsPath>& itemPaths, const AfsPath& targetFolder) //throw FileError
{
    transitPlain(device, itemPaths, {device, targetFolder}, false /*moveSource*/, getCopySameDevice(device)); //throw FileError
}


void tfs::moveFilesWithProgress(const AfsDevice& device, const std::vector<AfsPath>& itemPaths, const AfsPath& targetFolder, const TransitProgressHandler& onProgress) //throw FileError, X
{
    transitWithProgress(device, itemPaths, {device, targetFolder}, true /*moveSource*/, getMoveSameDevice(device), onProgress); //throw FileError, X
}


void tfs::copyFilesWithProgress(const AfsDevice& device, const std::vector<AfsPath>& itemPaths, const AfsPath& targetFolder, const TransitProgressHandler& onProgress) //throw FileError, X
{
    transitWithProgress(device, itemPaths, {device, targetFolder}, false /*moveSource*/, getCopySameDevice(device), onProgress); //throw FileError, X
}


void tfs::moveFilesBetween(const AfsDevice& deviceFrom, const std::vector<AfsPath>& itemPaths, const AbstractPath& targetFolder) //throw FileError
{
    transitPlain(deviceFrom, itemPaths, targetFolder, true /*moveSource*/, getCopyBetweenDevices(deviceFrom, targetFolder.afsDevice, true /*removeSource*/)); //throw FileError
}


void tfs::copyFilesBetween(const AfsDevice& deviceFrom, const std::vector<AfsPath>& itemPaths, const AbstractPath& targetFolder) //throw FileError
{
    transitPlain(deviceFrom, itemPaths, targetFolder, false /*moveSource*/, getCopyBetweenDevices(deviceFrom, targetFolder.afsDevice, false /*removeSource*/)); //throw FileError
}


void tfs::moveFilesBetweenWithProgress(const AfsDevice& deviceFrom, const std::vector<AfsPath>& itemPaths, const AbstractPath& targetFolder, const TransitProgressHandler& onProgress) //throw FileError, X
{
    transitWithProgress(deviceFrom, itemPaths, targetFolder, true /*moveSource*/,
                        getCopyBetweenDevices(deviceFrom, targetFolder.afsDevice, true /*removeSource*/), onProgress); //throw FileError, X
}


void tfs::copyFilesBetweenWithProgress(const AfsDevice& deviceFrom, const std::vector<AfsPath>& itemPaths, const AbstractPath& targetFolder, const TransitProgressHandler& onProgress) //throw FileError, X
{
    transitWithProgress(deviceFrom, itemPaths, targetFolder, false /*moveSource*/,
                        getCopyBetweenDevices(deviceFrom, targetFolder.afsDevice, false /*removeSource*/), onProgress); //throw FileError, X
}
