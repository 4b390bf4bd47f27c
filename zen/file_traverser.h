// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_TRAVERSER_H_6620193847561023
#define FILE_TRAVERSER_H_6620193847561023

#include <functional>
#include "file_error.h"
    #include <sys/stat.h>

namespace zen
{
struct ItemInfo
{
    Zstring itemName;
    Zstring fullPath;
    struct stat details = {}; //lstat(): symlinks are not followed
};

//- non-recursive
//- "." and ".." are skipped
void traverseFolder(const Zstring& dirPath, const std::function<void(const ItemInfo& ii)>& onItem); //throw FileError
}

#endif //FILE_TRAVERSER_H_6620193847561023
