// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ABSTRACT_H_7146093352810476
#define ABSTRACT_H_7146093352810476

#include <functional>
#include <memory>
#include <vector>
#include <zen/file_error.h>
#include <zen/file_path.h>


namespace tfs
{
enum class FileType : unsigned char
{
    file,
    dir,
    symlink,
    socket,
    fifo,
    charDevice,
    blockDevice,
    unknown,
};

std::wstring getFileTypeLabel(FileType type);

//exactly one flag set => that type; everything else => unknown
FileType getFileTypeFromFlags(bool isFile, bool isDir, bool isSymlink, bool isSocket, bool isFifo, bool isCharDevice, bool isBlockDevice);

//file, symlink: copied as a single item; dir: recursion; everything else cannot be transferred
inline bool isTransferableLeaf(FileType type) { return type == FileType::file || type == FileType::symlink; }


struct UnixPermissionActions
{
    bool read    = false;
    bool write   = false;
    bool execute = false;

    bool operator==(const UnixPermissionActions&) const = default;
};

struct UnixPermissions
{
    UnixPermissionActions owner;
    UnixPermissionActions group;
    UnixPermissionActions other;

    bool operator==(const UnixPermissions&) const = default;
};

//only the low 9 bits (rwxrwxrwx) are considered
UnixPermissions unixPermissionsFromMode(uint32_t mode);
uint32_t unixPermissionsToMode(const UnixPermissions& perms);


struct Metadata
{
    FileType type = FileType::unknown;
    std::optional<time_t> modTime;      //number of seconds since Jan. 1st 1970 GMT
    std::optional<time_t> accessTime;   //
    std::optional<time_t> creationTime; //
    std::optional<uint64_t> fileSize; //only meaningful for FileType::file
    bool readOnly = false;
    std::optional<UnixPermissions> unixPermissions;
};

struct File
{
    Zstring path;
    Zstring name;
    std::optional<Zstring> extension; //lower-case, without '.'
    Metadata metadata;
};

DEFINE_NEW_FILE_ERROR(ErrorFileTypeUnsupported, zen::FileErrorKind::fileTypeUnsupported)

//==============================================================================================================
struct AbstractFileSystem;
using AfsDevice = std::shared_ptr<const AbstractFileSystem>;

struct AfsPath //= absolute path on the device: leading separator, no trailing separator (except for root)
{
    AfsPath() : value(Zstr("/")) {}
    explicit AfsPath(const Zstring& p) : value(p) { assert(zen::startsWith(value, FILE_NAME_SEPARATOR)); }
    Zstring value;

    std::strong_ordering operator<=>(const AfsPath&) const = default;
};

AfsPath sanitizeDevicePath(Zstring itemPath);

//derive name and extension from the path
File makeFile(const AfsPath& itemPath, const Metadata& metadata); //throw ErrorNoFileName, ErrorNotUtf8Path


struct AbstractPath //THREAD-SAFETY: like an int!
{
    AbstractPath(const AfsDevice& deviceIn, const AfsPath& pathIn) : afsDevice(deviceIn), afsPath(pathIn) {}

    AfsDevice afsDevice; //"const AbstractFileSystem" => all accesses expected to be thread-safe!!!
    AfsPath afsPath;
};
//==============================================================================================================

struct AbstractFileSystem //THREAD-SAFETY: "const" member functions must model thread-safe access!
{
    //=============== convenience =================
    static Zstring getItemName(const AfsPath& itemPath) { return zen::getItemName(itemPath.value); }

    static std::optional<AfsPath>      getParentPath(const AfsPath& itemPath);
    static std::optional<AbstractPath> getParentPath(const AbstractPath& itemPath);

    static AfsPath      appendRelPath(const AfsPath& itemPath, const Zstring& relPath);
    static AbstractPath appendRelPath(const AbstractPath& itemPath, const Zstring& relPath) { return {itemPath.afsDevice, appendRelPath(itemPath.afsPath, relPath)}; }
    //=============================================

    static std::weak_ordering compareDevice(const AbstractFileSystem& lhs, const AbstractFileSystem& rhs);
    static bool equalDevice(const AfsDevice& lhs, const AfsDevice& rhs) { return compareDevice(*lhs, *rhs) == std::weak_ordering::equivalent; }

    static std::wstring getDisplayPath   (const AbstractPath& itemPath) { return itemPath.afsDevice->getDisplayPath   (itemPath.afsPath); }
    static Zstring      getInitPathPhrase(const AbstractPath& itemPath) { return itemPath.afsDevice->getInitPathPhrase(itemPath.afsPath); }

    //close cached connections; the device stays usable and reconnects on demand
    static void disconnect(const AfsDevice& afsDevice) { afsDevice->disconnect(); } //throw FileError
    //----------------------------------------------------------------------------------------------------------------

    static bool itemExists(const AbstractPath& itemPath) { return itemPath.afsDevice->itemExists(itemPath.afsPath); } //throw FileError

    //does not follow symlinks
    static FileType getFileType(const AbstractPath& itemPath) { return itemPath.afsDevice->getFileType(itemPath.afsPath); } //throw FileError

    //batch metadata query, result in input order
    static std::vector<File> retrieveFiles(const AfsDevice& afsDevice, const std::vector<AfsPath>& itemPaths) { return afsDevice->retrieveFiles(itemPaths); } //throw FileError

    static std::string getFileContent(const AbstractPath& filePath) { return filePath.afsDevice->getFileContent(filePath.afsPath); } //throw FileError

    //one level, no recursion; backend-native order
    static std::vector<File> readFolder(const AbstractPath& folderPath) { return folderPath.afsDevice->readFolder(folderPath.afsPath); } //throw FileError
    //----------------------------------------------------------------------------------------------------------------

    //CONTRACT for all mutating calls: overwrite == false and target existing => ErrorTargetExisting
    //no content: create empty file
    static void createFile(const AbstractPath& filePath, bool overwrite, std::optional<std::string_view> content) //throw FileError, ErrorTargetExisting
    { filePath.afsDevice->createFile(filePath.afsPath, overwrite, content); }

    //already existing: fail; does NOT create parent directories recursively
    static void createFolder(const AbstractPath& folderPath) { folderPath.afsDevice->createFolder(folderPath.afsPath); } //throw FileError, ErrorTargetExisting

    static void renameItem(const AbstractPath& itemPath, const Zstring& newName, bool overwrite) //throw FileError, ErrorTargetExisting, ErrorNoFileName
    { itemPath.afsDevice->renameItem(itemPath.afsPath, newName, overwrite); }

    //same device only
    static void moveItem(const AbstractPath& pathFrom, const AfsPath& pathTo, bool overwrite) { pathFrom.afsDevice->moveItem(pathFrom.afsPath, pathTo, overwrite); } //throw FileError, ErrorTargetExisting
    static void copyItem(const AbstractPath& pathFrom, const AfsPath& pathTo, bool overwrite) { pathFrom.afsDevice->copyItem(pathFrom.afsPath, pathTo, overwrite); } //throw FileError, ErrorTargetExisting

    static void removeFile  (const AbstractPath& filePath  ) { filePath  .afsDevice->removeFile  (filePath  .afsPath); } //throw FileError
    static void removeFolder(const AbstractPath& folderPath) { folderPath.afsDevice->removeFolder(folderPath.afsPath); } //throw FileError; must be empty

    static void moveToRecycleBin(const AfsDevice& afsDevice, const std::vector<AfsPath>& itemPaths) { afsDevice->moveToRecycleBin(itemPaths); } //throw FileError, RecycleBinUnavailable, ErrorTrashFailure

    static void setUnixPermissions(const AbstractPath& itemPath, const UnixPermissions& perms) { itemPath.afsDevice->setUnixPermissions(itemPath.afsPath, perms); } //throw FileError, ErrorOperationUnsupported
    //----------------------------------------------------------------------------------------------------------------

    virtual ~AbstractFileSystem() {}

protected:
    //default: move within the parent folder
    virtual void renameItem(const AfsPath& itemPath, const Zstring& newName, bool overwrite) const; //throw FileError, ErrorTargetExisting, ErrorNoFileName

    //default: getMetadata() per item
    virtual std::vector<File> retrieveFiles(const std::vector<AfsPath>& itemPaths) const; //throw FileError

    virtual Metadata getMetadata(const AfsPath& itemPath) const = 0; //throw FileError

    //for backends writing straight to the server: upload to a temp name, then move into place
    //=> failed uploads never leave a partial target behind
    void createFileTransactional(const AfsPath& filePath, bool overwrite, //throw FileError, ErrorTargetExisting
                                 const std::function<void(const AfsPath& tmpFilePath)>& writeNewFile /*throw FileError*/) const;

private:
    virtual Zstring getInitPathPhrase(const AfsPath& itemPath) const = 0;

    virtual std::wstring getDisplayPath(const AfsPath& itemPath) const = 0;

    virtual std::weak_ordering compareDeviceSameAfsType(const AbstractFileSystem& afsRhs) const = 0;

    virtual void disconnect() const = 0; //throw FileError

    virtual bool itemExists(const AfsPath& itemPath) const = 0; //throw FileError
    virtual FileType getFileType(const AfsPath& itemPath) const = 0; //throw FileError

    virtual std::string getFileContent(const AfsPath& filePath) const = 0; //throw FileError
    virtual std::vector<File> readFolder(const AfsPath& folderPath) const = 0; //throw FileError

    virtual void createFile(const AfsPath& filePath, bool overwrite, std::optional<std::string_view> content) const = 0; //throw FileError, ErrorTargetExisting
    virtual void createFolder(const AfsPath& folderPath) const = 0; //throw FileError, ErrorTargetExisting

    virtual void moveItem(const AfsPath& pathFrom, const AfsPath& pathTo, bool overwrite) const = 0; //throw FileError, ErrorTargetExisting
    virtual void copyItem(const AfsPath& pathFrom, const AfsPath& pathTo, bool overwrite) const = 0; //throw FileError, ErrorTargetExisting

    virtual void removeFile  (const AfsPath& filePath  ) const = 0; //throw FileError
    virtual void removeFolder(const AfsPath& folderPath) const = 0; //throw FileError

    virtual void moveToRecycleBin(const std::vector<AfsPath>& itemPaths) const = 0; //throw FileError, RecycleBinUnavailable, ErrorTrashFailure

    virtual void setUnixPermissions(const AfsPath& itemPath, const UnixPermissions& perms) const = 0; //throw FileError, ErrorOperationUnsupported
};

using AFS = AbstractFileSystem;
}

#endif //ABSTRACT_H_7146093352810476
