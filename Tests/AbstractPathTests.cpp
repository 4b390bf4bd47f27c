// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include <TransitFS/Source/afs/native.h>
#include "TestHelpers/MemoryFileSystem.h"

using namespace zen;
using namespace tfs;
using tfs::test::MemoryFileSystem;
using tfs::test::MemOp;


TEST(AbstractPath, ParentPath)
{
    EXPECT_EQ(AFS::getParentPath(AfsPath(Zstr("/a/b"))), AfsPath(Zstr("/a")));
    EXPECT_EQ(AFS::getParentPath(AfsPath(Zstr("/a"))), AfsPath(Zstr("/")));
    EXPECT_FALSE(AFS::getParentPath(AfsPath()));

    const auto device = MemoryFileSystem::create();
    const std::optional<AbstractPath> parent = AFS::getParentPath(AbstractPath(device, AfsPath(Zstr("/a/b"))));
    ASSERT_TRUE(parent);
    EXPECT_EQ(parent->afsPath, AfsPath(Zstr("/a")));
    EXPECT_EQ(parent->afsDevice, device);
}

TEST(AbstractPath, AppendRelPath)
{
    EXPECT_EQ(AFS::appendRelPath(AfsPath(), Zstr("x")), AfsPath(Zstr("/x")));
    EXPECT_EQ(AFS::appendRelPath(AfsPath(Zstr("/a")), Zstr("b/c")), AfsPath(Zstr("/a/b/c")));
    EXPECT_EQ(AFS::getItemName(AfsPath(Zstr("/a/b/c"))), Zstr("c"));
}

TEST(AbstractPath, DeviceIdentity)
{
    const auto mem1 = MemoryFileSystem::create();
    const auto mem2 = MemoryFileSystem::create();

    EXPECT_TRUE (AFS::equalDevice(mem1, mem1));
    EXPECT_FALSE(AFS::equalDevice(mem1, mem2));

    EXPECT_TRUE (AFS::equalDevice(createNativeDevice(Zstr("/tmp")), createNativeDevice(Zstr("/tmp/"))));
    EXPECT_FALSE(AFS::equalDevice(createNativeDevice(Zstr("/tmp")), createNativeDevice(Zstr("/var"))));
    EXPECT_FALSE(AFS::equalDevice(createNativeDevice(), mem1));

    //strict weak ordering: exactly one direction is "less"
    const std::weak_ordering cmp = AFS::compareDevice(*createNativeDevice(), *mem1);
    EXPECT_EQ(cmp < 0, AFS::compareDevice(*mem1, *createNativeDevice()) > 0);
}

TEST(AbstractPath, DisplayPathAndPhrase)
{
    const auto device = MemoryFileSystem::create();
    const AbstractPath itemPath(device, AfsPath(Zstr("/a/b.txt")));

    EXPECT_EQ(AFS::getDisplayPath(itemPath), L"mem:/a/b.txt");
    EXPECT_EQ(AFS::getInitPathPhrase(itemPath), Zstr("mem:/a/b.txt"));
}

TEST(AbstractPath, RetrieveFilesKeepsInputOrder)
{
    const auto device = MemoryFileSystem::create();
    device->addFile(Zstr("/z.txt"), "zz");
    device->addFolder(Zstr("/a"));
    device->addSymlink(Zstr("/m.LNK"), "target");

    const std::vector<File> files = AFS::retrieveFiles(device, {AfsPath(Zstr("/z.txt")), AfsPath(Zstr("/a")), AfsPath(Zstr("/m.LNK"))});

    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].name, Zstr("z.txt"));
    EXPECT_EQ(files[0].metadata.type, FileType::file);
    EXPECT_EQ(files[0].metadata.fileSize, 2u);
    EXPECT_EQ(files[1].name, Zstr("a"));
    EXPECT_EQ(files[1].metadata.type, FileType::dir);
    EXPECT_EQ(files[2].metadata.type, FileType::symlink);
    EXPECT_EQ(files[2].extension, Zstr("lnk"));
}

TEST(AbstractPath, RetrieveFilesOfMissingItemFails)
{
    const auto device = MemoryFileSystem::create();
    try
    {
        AFS::retrieveFiles(device, {AfsPath(Zstr("/missing"))});
        FAIL() << "expected ErrorTargetNotExisting";
    }
    catch (const FileError& e) { EXPECT_EQ(e.getKind(), FileErrorKind::targetNotExisting); }
}

TEST(AbstractPath, RenameIsMoveWithinParent)
{
    const auto device = MemoryFileSystem::create();
    device->addFile(Zstr("/docs/old.txt"), "content");

    AFS::renameItem({device, AfsPath(Zstr("/docs/old.txt"))}, Zstr("new.txt"), false /*overwrite*/);

    EXPECT_FALSE(device->contains(Zstr("/docs/old.txt")));
    EXPECT_EQ(device->contentOf(Zstr("/docs/new.txt")), "content");
    ASSERT_EQ(device->getCalls().size(), 1u);
    EXPECT_EQ(device->getCalls()[0], (tfs::test::MemCall{MemOp::moveItem, Zstr("/docs/old.txt"), Zstr("/docs/new.txt"), false}));
}

TEST(AbstractPath, RenameRespectsOverwriteFlag)
{
    const auto device = MemoryFileSystem::create();
    device->addFile(Zstr("/a.txt"), "a");
    device->addFile(Zstr("/b.txt"), "b");

    EXPECT_THROW(AFS::renameItem({device, AfsPath(Zstr("/a.txt"))}, Zstr("b.txt"), false), ErrorTargetExisting);
    EXPECT_EQ(device->contentOf(Zstr("/b.txt")), "b");

    AFS::renameItem({device, AfsPath(Zstr("/a.txt"))}, Zstr("b.txt"), true);
    EXPECT_EQ(device->contentOf(Zstr("/b.txt")), "a");
}

TEST(AbstractPath, RenameRejectsInvalidNames)
{
    const auto device = MemoryFileSystem::create();
    device->addFile(Zstr("/a.txt"), "a");

    EXPECT_THROW(AFS::renameItem({device, AfsPath(Zstr("/a.txt"))}, Zstr("sub/b.txt"), false), ErrorNoFileName);
    EXPECT_THROW(AFS::renameItem({device, AfsPath(Zstr("/a.txt"))}, Zstr(""), false), ErrorNoFileName);
    EXPECT_THROW(AFS::renameItem({device, AfsPath()}, Zstr("root"), false), ErrorNoFileName);
    EXPECT_TRUE(device->getCalls().empty());
}

TEST(AbstractPath, CreateFileRespectsOverwriteFlag)
{
    const auto device = MemoryFileSystem::create();
    const AbstractPath filePath(device, AfsPath(Zstr("/f.txt")));

    AFS::createFile(filePath, false, std::nullopt);
    EXPECT_EQ(device->contentOf(Zstr("/f.txt")), "");

    EXPECT_THROW(AFS::createFile(filePath, false, "new"), ErrorTargetExisting);
    AFS::createFile(filePath, true, "new");
    EXPECT_EQ(device->contentOf(Zstr("/f.txt")), "new");
}

TEST(AbstractPath, TrashAndPermissions)
{
    const auto device = MemoryFileSystem::create();
    device->addFile(Zstr("/f.txt"), "x");

    EXPECT_THROW(AFS::moveToRecycleBin(device, {AfsPath(Zstr("/f.txt"))}), RecycleBinUnavailable);

    AFS::setUnixPermissions({device, AfsPath(Zstr("/f.txt"))}, unixPermissionsFromMode(0640));
    EXPECT_EQ(device->permissionsOf(Zstr("/f.txt")), unixPermissionsFromMode(0640));

    AFS::disconnect(device);
    EXPECT_EQ(device->disconnectCount(), 1);
}
