// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef OPEN_SSL_H_3390517862094417
#define OPEN_SSL_H_3390517862094417

#include "sys_error.h"


namespace zen
{
//init OpenSSL before use! (libcurl FTPS and libssh2 both run on top of it)
void openSslInit();
void openSslTearDown();

std::wstring formatLastOpenSSLError(const char* functionName);
}

#endif //OPEN_SSL_H_3390517862094417
