// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include <TransitFS/Source/afs/ftp.h>
#include <TransitFS/Source/afs/sftp.h>

using namespace zen;
using namespace tfs;

//capabilities rejected without contacting the server

namespace
{
void expectUnsupported(const std::function<void()>& operation)
{
    try
    {
        operation();
        FAIL() << "expected ErrorOperationUnsupported";
    }
    catch (const FileError& e)
    {
        EXPECT_EQ(e.getKind(), FileErrorKind::operationUnsupported) << utfTo<std::string>(e.toString());
    }
}
}


TEST(FtpFileSystem, TrashIsUnsupported)
{
    const AbstractPath ap = createItemPathFtp(Zstr("ftp://user@ftp.example.com/backup/report.txt"));

    expectUnsupported([&] { AFS::moveToRecycleBin(ap.afsDevice, {ap.afsPath}); });
    expectUnsupported([&] { AFS::moveToRecycleBin(ap.afsDevice, {}); });
}

TEST(FtpFileSystem, PermissionsAreUnsupported)
{
    const AbstractPath ap = createItemPathFtp(Zstr("ftp://user@ftp.example.com/backup/report.txt"));

    expectUnsupported([&] { AFS::setUnixPermissions(ap, unixPermissionsFromMode(0644)); });
}

TEST(SftpFileSystem, TrashIsUnsupported)
{
    const AbstractPath ap = createItemPathSftp(Zstr("sftp://user@sftp.example.com/backup/report.txt"));

    expectUnsupported([&] { AFS::moveToRecycleBin(ap.afsDevice, {ap.afsPath}); });
    expectUnsupported([&] { AFS::moveToRecycleBin(ap.afsDevice, {}); });
}
