// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SFTP_H_5392187498172458
#define SFTP_H_5392187498172458

#include "abstract.h"


namespace tfs
{
bool  acceptsItemPathPhraseSftp(const Zstring& itemPathPhrase); //noexcept
AbstractPath createItemPathSftp(const Zstring& itemPathPhrase); //noexcept

void sftpInit();
void sftpTeardown();

//-------------------------------------------------------

enum class SftpAuthType
{
    password,
    keyFile,
    agent,
};

const int DEFAULT_PORT_SFTP = 22;

struct SftpLogin
{
    Zstring server;
    int portCfg = 0; //use if > 0, DEFAULT_PORT_SFTP otherwise
    Zstring username;
    SftpAuthType authType = SftpAuthType::password;
    Zstring password;           //authType == password; authType == keyFile: passphrase of the private key
    Zstring privateKeyFilePath; //authType == keyFile: PEM-encoded private key
    bool allowZlib = false;
    //other settings not specific to SFTP session:
    int timeoutSec = 10; //valid range: [1, inf)
};
AfsDevice condenseToSftpDevice(const SftpLogin& login); //noexcept; potentially messy user input
SftpLogin extractSftpLogin(const AfsDevice& afsDevice); //noexcept

//render login + path as a phrase, password omitted
Zstring condenseSftpPathPhrase(const SftpLogin& login, const AfsPath& itemPath); //noexcept
}

#endif //SFTP_H_5392187498172458
