// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CONCRETE_H_3487873295732430
#define CONCRETE_H_3487873295732430

#include "abstract.h"

namespace tfs
{
//global libcurl/libssh2/OpenSSL setup + (S)FTP session caches; call from the main thread
void initAfs();
void teardownAfs(); //closes all cached sessions

//"ftp://...", "sftp://...", everything else: native path
AbstractPath createAbstractPath(const Zstring& itemPathPhrase); //noexcept
}

#endif //CONCRETE_H_3487873295732430
