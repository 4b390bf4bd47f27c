// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef NATIVE_H_5230968147720395
#define NATIVE_H_5230968147720395

#include "abstract.h"

namespace tfs
{
bool  acceptsItemPathPhraseNative(const Zstring& itemPathPhrase); //noexcept
AbstractPath createItemPathNative(const Zstring& itemPathPhrase); //noexcept

//all item paths are resolved relative to "rootPath" (default: file system root)
AfsDevice createNativeDevice(const Zstring& rootPath = Zstr("/"));

//return empty, if not a native path
Zstring getNativeItemPath(const AbstractPath& itemPath);
}

#endif //NATIVE_H_5230968147720395
