// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef RECYCLER_H_8810263745190284
#define RECYCLER_H_8810263745190284

#include "file_error.h"


namespace zen
{
/* --------------------
   |Recycle Bin Access|
   --------------------
    freedesktop.org trash via GIO:
           Compiler flags: `pkg-config --cflags gio-2.0`
           Linker   flags: `pkg-config --libs gio-2.0`              */

//fails if item is not existing (anymore)
void moveToRecycleBin(const Zstring& itemPath); //throw FileError, RecycleBinUnavailable, ErrorTrashFailure
}

#endif //RECYCLER_H_8810263745190284
