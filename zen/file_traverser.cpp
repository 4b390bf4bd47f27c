// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_traverser.h"
#include "file_path.h"

    #include <dirent.h>

using namespace zen;


void zen::traverseFolder(const Zstring& dirPath, const std::function<void(const ItemInfo& ii)>& onItem) //throw FileError
{
    DIR* folder = ::opendir(dirPath.c_str()); //directory must NOT end with path separator, except "/"
    if (!folder)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot open directory %x."), L"%x", fmtPath(dirPath)), "opendir");
    ZEN_ON_SCOPE_EXIT(::closedir(folder)); //never close nullptr handles! -> crash

    for (;;)
    {
        errno = 0;
        const dirent* dirEntry = ::readdir(folder); //don't use readdir_r(): deprecated
        if (!dirEntry)
        {
            if (errno == 0) //errno left unchanged => no more items
                return;

            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(dirPath)), "readdir");
            //don't retry but restart dir traversal on error! https://devblogs.microsoft.com/oldnewthing/20140612-00/?p=753/
        }

        //don't return "." and ".."
        const char* itemNameRaw = dirEntry->d_name;

        if (itemNameRaw[0] == '.' &&
            (itemNameRaw[1] == 0 || (itemNameRaw[1] == '.' && itemNameRaw[2] == 0)))
            continue;

        const Zstring itemName = itemNameRaw;
        if (itemName.empty())
            throw FileError(replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(dirPath)), formatSystemError("readdir", L"", L"Folder contains an item without name."));

        ItemInfo ii{itemName, appendPath(dirPath, itemName)};

        if (::lstat(ii.fullPath.c_str(), &ii.details) != 0) //lstat() does not resolve symlinks
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(ii.fullPath)), "lstat");

        onItem(ii); //throw X
    }
}
