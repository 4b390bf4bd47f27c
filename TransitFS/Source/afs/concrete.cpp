// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "concrete.h"
#include "native.h"
#include "ftp.h"
#include "sftp.h"
#include "init_curl_libssh2.h"

using namespace tfs;
using namespace zen;


void tfs::initAfs()
{
    libsshCurlUnifiedInit();
    ftpInit();
    sftpInit();
}


void tfs::teardownAfs()
{
    sftpTeardown();
    ftpTeardown();
    libsshCurlUnifiedTearDown(); //waits for sessions still held by worker threads
}


AbstractPath tfs::createAbstractPath(const Zstring& itemPathPhrase) //noexcept
{
    //greedy: try native evaluation first
    if (acceptsItemPathPhraseNative(itemPathPhrase)) //noexcept
        return createItemPathNative(itemPathPhrase); //noexcept

    //then the rest:
    if (acceptsItemPathPhraseFtp(itemPathPhrase)) //noexcept
        return createItemPathFtp(itemPathPhrase); //noexcept

    if (acceptsItemPathPhraseSftp(itemPathPhrase)) //noexcept
        return createItemPathSftp(itemPathPhrase); //noexcept

    //no idea? => native!
    return createItemPathNative(itemPathPhrase);
}
