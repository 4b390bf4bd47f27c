// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef INIT_CURL_LIBSSH2_H_4570285702375915
#define INIT_CURL_LIBSSH2_H_4570285702375915

#include <memory>
#include <zen/sys_error.h>


namespace zen
{
//(S)FTP initialization/shutdown dance:

//1. initialize libcurl + libssh2 once per process before creating any (S)FTP session; nested calls are counted
void libsshCurlUnifiedInit();

//3. blocks until all session cookies are released, then cleans up (if last level)
void libsshCurlUnifiedTearDown();


//2. count number of existing (S)FTP sessions => tie to (S)FTP session instances!
class UniCounterCookie;
std::shared_ptr<UniCounterCookie> getLibsshCurlUnifiedInitCookie(); //throw SysError
}

#endif //INIT_CURL_LIBSSH2_H_4570285702375915
