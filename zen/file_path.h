// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_PATH_H_7719302846152093
#define FILE_PATH_H_7719302846152093

#include <optional>
#include "zstring.h"


//slash-separated item paths as used by all backends: "/folder/file.txt"
namespace zen
{
    const Zchar FILE_NAME_SEPARATOR = '/';

//final path segment ignoring trailing separators: "/a/b/" -> "b"; "/" -> "/"
Zstring getItemName(const Zstring& itemPath);

//"/a/b" -> "/a"; "/a" -> "/"; no value for "/" and for paths without separator
std::optional<Zstring> getParentPath(const Zstring& itemPath);

//text after the last '.' of the item name, if any: "archive.tar.GZ" -> "GZ"
std::optional<Zstring> getFileExtension(const Zstring& itemPath);

Zstring appendSeparator(Zstring path); //support rvalue references!

Zstring appendPath(const Zstring& basePath, const Zstring& relPath);

//remove duplicate and trailing separators: "//a///b/" -> "/a/b"
Zstring normalizeItemPath(const Zstring& itemPath);

std::optional<Zstring> getEnvironmentVar(const ZstringView name);
}

#endif //FILE_PATH_H_7719302846152093
