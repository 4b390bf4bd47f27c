// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ACCESS_H_1037462958201746
#define FILE_ACCESS_H_1037462958201746

#include "file_path.h"
#include "file_error.h"
    #include <sys/stat.h>

namespace zen
{
enum class ItemType
{
    file,
    folder,
    symlink,
    socket,
    fifo,
    charDevice,
    blockDevice,
    unknown,
};
ItemType getItemType(const struct stat& itemInfo);

//symlinks are not followed
struct stat getItemInfo(const Zstring& itemPath); //throw FileError
std::optional<struct stat> getItemInfoIfExists(const Zstring& itemPath); //throw FileError; no value if item or parent folder is missing

inline ItemType getItemType(const Zstring& itemPath) { return getItemType(getItemInfo(itemPath)); } //throw FileError
inline bool itemExists(const Zstring& itemPath) { return static_cast<bool>(getItemInfoIfExists(itemPath)); } //throw FileError

//get per-user directory designated for temporary files:
Zstring getTempFolderPath(); //throw FileError

void removeFilePlain     (const Zstring& filePath); //throw FileError; ERROR if not existing
void removeDirectoryPlain(const Zstring& dirPath ); //throw FileError; ERROR if not existing or not empty

void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting); //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting

void setItemPermissions(const Zstring& itemPath, mode_t mode); //throw FileError; follows symlinks

void createDirectory(const Zstring& dirPath); //throw FileError, ErrorTargetExisting

void copySymlink(const Zstring& sourcePath, const Zstring& targetPath); //throw FileError, ErrorTargetExisting

//copy content and permission bits of a regular file (follows symlinks)
void copyNewFile(const Zstring& sourceFile, const Zstring& targetFile); //throw FileError, ErrorTargetExisting
}

#endif //FILE_ACCESS_H_1037462958201746
