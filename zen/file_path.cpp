// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_path.h"
#include <cstdlib>

using namespace zen;


Zstring zen::getItemName(const Zstring& itemPath)
{
    Zstring path = itemPath;
    trim(path, TrimSide::right, [](Zchar c) { return c == FILE_NAME_SEPARATOR; });

    if (path.empty())
        return startsWith(itemPath, FILE_NAME_SEPARATOR) ? Zstring(1, FILE_NAME_SEPARATOR) : Zstring();

    return afterLast(path, FILE_NAME_SEPARATOR, IfNotFoundReturn::all);
}


std::optional<Zstring> zen::getParentPath(const Zstring& itemPath)
{
    Zstring path = itemPath;
    trim(path, TrimSide::right, [](Zchar c) { return c == FILE_NAME_SEPARATOR; });

    if (!contains(path, FILE_NAME_SEPARATOR)) //includes "/" and ""
        return std::nullopt;

    Zstring parentPath = beforeLast(path, FILE_NAME_SEPARATOR, IfNotFoundReturn::none);
    trim(parentPath, TrimSide::right, [](Zchar c) { return c == FILE_NAME_SEPARATOR; });

    if (parentPath.empty() && startsWith(path, FILE_NAME_SEPARATOR))
        return Zstring(1, FILE_NAME_SEPARATOR);
    return parentPath;
}


std::optional<Zstring> zen::getFileExtension(const Zstring& itemPath)
{
    const Zstring itemName = getItemName(itemPath);
    const size_t posDot = itemName.rfind(Zstr('.'));
    if (posDot == Zstring::npos || posDot == 0) //hidden files like ".bashrc" have no extension
        return std::nullopt;

    return afterLast(itemName, Zstr('.'), IfNotFoundReturn::none);
}


Zstring zen::appendSeparator(Zstring path) //support rvalue references!
{
    if (!endsWith(path, FILE_NAME_SEPARATOR))
        path += FILE_NAME_SEPARATOR;
    return path; //returning a by-value parameter => RVO if possible, r-value otherwise!
}


Zstring zen::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    if (relPath.empty())
        return basePath;

    if (basePath.empty()) //basePath might be a relative path, too!
        return relPath;

    Zstring relPathTrm = relPath;
    trim(relPathTrm, TrimSide::left, [](Zchar c) { return c == FILE_NAME_SEPARATOR; });

    if (endsWith(basePath, FILE_NAME_SEPARATOR))
        return basePath + relPathTrm;

    Zstring output = basePath;
    output.reserve(basePath.size() + 1 + relPathTrm.size());     //append all three strings using a single memory allocation
    return std::move(output) + FILE_NAME_SEPARATOR + relPathTrm; //
}


Zstring zen::normalizeItemPath(const Zstring& itemPath)
{
    Zstring output;
    output.reserve(itemPath.size());

    for (const Zchar c : itemPath)
        if (c != FILE_NAME_SEPARATOR || !endsWith(output, FILE_NAME_SEPARATOR))
            output += c;

    if (output.size() > 1 && endsWith(output, FILE_NAME_SEPARATOR))
        output.pop_back();
    return output;
}


std::optional<Zstring> zen::getEnvironmentVar(const ZstringView name)
{
    const char* buffer = ::getenv(Zstring(name).c_str()); //no extended error reporting
    if (!buffer)
        return {};

    Zstring value(buffer);

    //some errors are not detected by the shell, e.g. quotes around the value
    if (value.size() >= 2 && startsWith(value, Zstr('"')) && endsWith(value, Zstr('"')))
        value = value.substr(1, value.size() - 2);

    return value;
}
