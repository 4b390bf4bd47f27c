// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_H_745895742383425326568678
#define FTP_H_745895742383425326568678

#include "abstract.h"

namespace tfs
{
bool  acceptsItemPathPhraseFtp(const Zstring& itemPathPhrase); //noexcept
AbstractPath createItemPathFtp(const Zstring& itemPathPhrase); //noexcept

void ftpInit();
void ftpTeardown();
//-------------------------------------------------------

const int DEFAULT_PORT_FTP = 21; //TLS: explicit FTPS on the same port

struct FtpLogin
{
    Zstring server;
    int portCfg = 0; //use if > 0, DEFAULT_PORT_FTP otherwise
    Zstring username;
    Zstring password;
    bool useTls = false;
    //other settings not specific to FTP session:
    int timeoutSec = 10;
};
AfsDevice condenseToFtpDevice(const FtpLogin& login); //noexcept; potentially messy user input
FtpLogin extractFtpLogin(const AfsDevice& afsDevice); //noexcept

//render login + path as a phrase, password omitted
Zstring condenseFtpPathPhrase(const FtpLogin& login, const AfsPath& itemPath); //noexcept

//according to the FTP path syntax, the username must not contain raw @ and :
Zstring encodeFtpUsername(Zstring name);
Zstring decodeFtpUsername(Zstring name);
}

#endif //FTP_H_745895742383425326568678
