// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include <zen/extra_log.h>
#include <TransitFS/Source/base/transit.h>
#include "TestHelpers/MemoryFileSystem.h"

using namespace zen;
using namespace tfs;
using tfs::test::MemoryFileSystem;
using tfs::test::MemCall;
using tfs::test::MemOp;


namespace
{
AfsPath path(const Zstring& itemPath) { return AfsPath(itemPath); }

//records every snapshot, answers conflicts and errors with a fixed response
struct RecordingHandler
{
    explicit RecordingHandler(TransitProgressResponse onIssue) : onIssue_(onIssue) {}

    TransitProgressHandler get()
    {
        return [this](const TransitProgress& progress)
        {
            snapshots.push_back(progress);
            return std::holds_alternative<TransitNormal>(progress.state) ? TransitProgressResponse::continueOrAbort : onIssue_;
        };
    }

    std::vector<TransitProgress> snapshots;

private:
    const TransitProgressResponse onIssue_;
};

std::vector<AfsPath> makeFiveFiles(MemoryFileSystem& device)
{
    std::vector<AfsPath> itemPaths;
    for (int i = 1; i <= 5; ++i)
    {
        const Zstring filePath = Zstr("/src/f") + numberTo<Zstring>(i);
        device.addFile(filePath, std::string(i, 'x'));
        itemPaths.push_back(path(filePath));
    }
    device.addFolder(Zstr("/dst"));
    return itemPaths;
}
}


TEST(TransitProgress, OverwriteResolvesConflict)
{
    const auto device = MemoryFileSystem::create();
    device->addFile(Zstr("/src/existing.txt"), "source bytes");
    device->addFile(Zstr("/dst/existing.txt"), "old");

    RecordingHandler handler(TransitProgressResponse::overwrite);
    copyFilesWithProgress(device, {path(Zstr("/src/existing.txt"))}, path(Zstr("/dst")), handler.get());

    EXPECT_EQ(device->contentOf(Zstr("/dst/existing.txt")), "source bytes");

    ASSERT_EQ(handler.snapshots.size(), 1u);
    const TransferConflict* conflict = std::get_if<TransferConflict>(&handler.snapshots[0].state);
    ASSERT_TRUE(conflict);
    EXPECT_EQ(conflict->fileType, FileType::file);
    EXPECT_EQ(conflict->origin, Zstr("/src/existing.txt"));
    EXPECT_EQ(conflict->destination, Zstr("/dst/existing.txt"));

    //retry is the same operation with overwrite = true
    const std::vector<MemCall> copies = device->getCalls(MemOp::copyItem);
    ASSERT_EQ(copies.size(), 1u);
    EXPECT_EQ(copies[0], (MemCall{MemOp::copyItem, Zstr("/src/existing.txt"), Zstr("/dst/existing.txt"), true}));
}

TEST(TransitProgress, AbortOnThirdOfFiveFiles)
{
    const auto device = MemoryFileSystem::create();
    const std::vector<AfsPath> itemPaths = makeFiveFiles(*device);
    device->addFile(Zstr("/dst/f3"), "occupied");

    fetchExtraLog(); //discard entries of previous tests

    RecordingHandler handler(TransitProgressResponse::abort);
    moveFilesWithProgress(device, itemPaths, path(Zstr("/dst")), handler.get()); //no exception: abort is not an error

    EXPECT_EQ(device->getCalls(MemOp::moveItem).size(), 2u);
    EXPECT_EQ(device->contentOf(Zstr("/dst/f1")), "x");
    EXPECT_EQ(device->contentOf(Zstr("/dst/f2")), "xx");
    EXPECT_EQ(device->contentOf(Zstr("/dst/f3")), "occupied");
    for (const Zstring& untouched : {Zstr("/src/f3"), Zstr("/src/f4"), Zstr("/src/f5")})
        EXPECT_TRUE(device->contains(untouched)) << untouched;
    EXPECT_FALSE(device->contains(Zstr("/dst/f4")));

    ASSERT_EQ(handler.snapshots.size(), 3u);
    EXPECT_EQ(handler.snapshots.back().processedFiles, 2u);

    const ErrorLog log = fetchExtraLog();
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].type, MSG_TYPE_WARNING);
}

TEST(TransitProgress, CountersAdvanceAfterEachTransfer)
{
    const auto device = MemoryFileSystem::create();
    const std::vector<AfsPath> itemPaths = makeFiveFiles(*device);

    RecordingHandler handler(TransitProgressResponse::continueOrAbort);
    copyFilesWithProgress(device, itemPaths, path(Zstr("/dst")), handler.get());

    ASSERT_EQ(handler.snapshots.size(), 5u);
    uint64_t expectedBytes = 0;
    for (size_t i = 0; i < handler.snapshots.size(); ++i)
    {
        const TransitProgress& p = handler.snapshots[i];
        expectedBytes += i + 1;

        EXPECT_TRUE(std::holds_alternative<TransitNormal>(p.state));
        EXPECT_EQ(p.totalBytes, 15u);
        EXPECT_EQ(p.totalFiles, 5u);
        EXPECT_EQ(p.processedFiles, i + 1);
        EXPECT_EQ(p.processedBytes, expectedBytes);
    }
}

TEST(TransitProgress, TotalsMatchCalculateTotalSize)
{
    const auto device = MemoryFileSystem::create();
    device->addFile(Zstr("/a/file1"), "1234");
    device->addFile(Zstr("/a/b/file2"), "123456");
    device->addFolder(Zstr("/dst"));

    RecordingHandler handler(TransitProgressResponse::continueOrAbort);
    copyFilesWithProgress(device, {path(Zstr("/a"))}, path(Zstr("/dst")), handler.get());

    ASSERT_EQ(handler.snapshots.size(), 2u);
    EXPECT_EQ(handler.snapshots[0].totalBytes, calculateTotalSize(device, {path(Zstr("/a"))}));
    EXPECT_EQ(handler.snapshots.back().processedBytes, 10u);
    EXPECT_EQ(device->contentOf(Zstr("/dst/a/b/file2")), "123456");
}

TEST(TransitProgress, SkipLeavesConflictAndContinues)
{
    const auto device = MemoryFileSystem::create();
    const std::vector<AfsPath> itemPaths = makeFiveFiles(*device);
    device->addFile(Zstr("/dst/f2"), "occupied");

    RecordingHandler handler(TransitProgressResponse::skip);
    copyFilesWithProgress(device, itemPaths, path(Zstr("/dst")), handler.get());

    EXPECT_EQ(device->contentOf(Zstr("/dst/f2")), "occupied");
    EXPECT_EQ(device->contentOf(Zstr("/dst/f5")), "xxxxx");
    ASSERT_EQ(handler.snapshots.size(), 5u);

    //skipped item is not counted as processed
    EXPECT_EQ(handler.snapshots.back().processedFiles, 4u);
    EXPECT_EQ(handler.snapshots.back().processedBytes, 15u - 2u);
}

TEST(TransitProgress, SkipKeepsSourceFoldersOnMove)
{
    const auto device = MemoryFileSystem::create();
    device->addFile(Zstr("/a/file1"), "1234");
    device->addFile(Zstr("/a/b/file2"), "123456");
    device->addFile(Zstr("/a/c/file3"), "12");
    device->addFile(Zstr("/dst/a/b/file2"), "occupied");

    RecordingHandler handler(TransitProgressResponse::skip);
    moveFilesWithProgress(device, {path(Zstr("/a"))}, path(Zstr("/dst")), handler.get());

    EXPECT_EQ(device->contentOf(Zstr("/dst/a/file1")), "1234");
    EXPECT_EQ(device->contentOf(Zstr("/dst/a/c/file3")), "12");
    EXPECT_EQ(device->contentOf(Zstr("/a/b/file2")), "123456");

    //ancestors of the skipped item stay, everything else is cleaned up
    EXPECT_TRUE (device->contains(Zstr("/a/b")));
    EXPECT_TRUE (device->contains(Zstr("/a")));
    EXPECT_FALSE(device->contains(Zstr("/a/c")));
}

TEST(TransitProgress, ContinueOrAbortRaisesConflict)
{
    const auto device = MemoryFileSystem::create();
    const std::vector<AfsPath> itemPaths = makeFiveFiles(*device);
    device->addFile(Zstr("/dst/f2"), "occupied");

    RecordingHandler handler(TransitProgressResponse::continueOrAbort);
    try
    {
        copyFilesWithProgress(device, itemPaths, path(Zstr("/dst")), handler.get());
        FAIL() << "expected ErrorTargetExisting";
    }
    catch (const FileError& e)
    {
        EXPECT_TRUE(isTargetExisting(e));
        EXPECT_EQ(e.getItemPath(), Zstr("/dst/f2"));
    }
    EXPECT_EQ(handler.snapshots.size(), 2u);
    EXPECT_FALSE(device->contains(Zstr("/dst/f3")));
}

TEST(TransitProgress, ContinueOrAbortRaisesOtherError)
{
    const auto device = MemoryFileSystem::create();
    const std::vector<AfsPath> itemPaths = makeFiveFiles(*device);
    device->injectFailure(MemOp::copyItem, Zstr("/src/f4"));

    RecordingHandler handler(TransitProgressResponse::continueOrAbort);
    try
    {
        copyFilesWithProgress(device, itemPaths, path(Zstr("/dst")), handler.get());
        FAIL() << "expected FileError";
    }
    catch (const FileError& e) { EXPECT_EQ(e.getKind(), FileErrorKind::ioFailure); }

    ASSERT_EQ(handler.snapshots.size(), 4u);
    EXPECT_TRUE(std::holds_alternative<FileError>(handler.snapshots.back().state));
}

TEST(TransitProgress, SkipOtherError)
{
    const auto device = MemoryFileSystem::create();
    const std::vector<AfsPath> itemPaths = makeFiveFiles(*device);
    device->injectFailure(MemOp::copyItem, Zstr("/src/f1"));

    RecordingHandler handler(TransitProgressResponse::skip);
    copyFilesWithProgress(device, itemPaths, path(Zstr("/dst")), handler.get());

    EXPECT_FALSE(device->contains(Zstr("/dst/f1")));
    EXPECT_TRUE(device->contains(Zstr("/dst/f5")));
}

TEST(TransitProgress, OverwriteRetryErrorPropagates)
{
    const auto device = MemoryFileSystem::create();
    device->addFile(Zstr("/src/f"), "new");
    device->addFolder(Zstr("/dst/f")); //folders are never overwritten

    RecordingHandler handler(TransitProgressResponse::overwrite);
    EXPECT_THROW(copyFilesWithProgress(device, {path(Zstr("/src/f"))}, path(Zstr("/dst")), handler.get()), FileError);
    EXPECT_EQ(device->typeOf(Zstr("/dst/f")), FileType::dir);
}

TEST(TransitProgress, OverwriteAfterSuccessDoesNothing)
{
    const auto device = MemoryFileSystem::create();
    const std::vector<AfsPath> itemPaths = makeFiveFiles(*device);

    copyFilesWithProgress(device, itemPaths, path(Zstr("/dst")), [](const TransitProgress&) { return TransitProgressResponse::overwrite; });

    for (const MemCall& c : device->getCalls(MemOp::copyItem))
        EXPECT_FALSE(c.overwrite);
    EXPECT_EQ(device->getCalls(MemOp::copyItem).size(), 5u);
}

TEST(TransitProgress, HandlerExceptionPropagates)
{
    struct UserCancel {};

    const auto device = MemoryFileSystem::create();
    const std::vector<AfsPath> itemPaths = makeFiveFiles(*device);

    EXPECT_THROW(copyFilesWithProgress(device, itemPaths, path(Zstr("/dst")),
                                       [](const TransitProgress&) -> TransitProgressResponse { throw UserCancel(); }), UserCancel);
    EXPECT_EQ(device->getCalls(MemOp::copyItem).size(), 1u);
}

TEST(TransitProgress, UnsupportedTypeIsNotRoutedToHandler)
{
    const auto device = MemoryFileSystem::create();
    device->addFile(Zstr("/a/file1"), "1");
    device->addSpecial(Zstr("/a/pipe"), FileType::fifo);
    device->addFolder(Zstr("/dst"));

    RecordingHandler handler(TransitProgressResponse::skip);
    EXPECT_THROW(copyFilesWithProgress(device, {path(Zstr("/a"))}, path(Zstr("/dst")), handler.get()), ErrorFileTypeUnsupported);
}

TEST(TransitProgress, BetweenDevicesWithOverwrite)
{
    const auto source = MemoryFileSystem::create();
    source->addFile(Zstr("/src/existing.txt"), "source bytes");
    source->addFile(Zstr("/src/fresh.txt"), "fresh");
    const auto target = MemoryFileSystem::create();
    target->addFile(Zstr("/dst/existing.txt"), "old");

    RecordingHandler handler(TransitProgressResponse::overwrite);
    moveFilesBetweenWithProgress(source, {path(Zstr("/src/existing.txt")), path(Zstr("/src/fresh.txt"))},
                                 AbstractPath(target, path(Zstr("/dst"))), handler.get());

    EXPECT_EQ(target->contentOf(Zstr("/dst/existing.txt")), "source bytes");
    EXPECT_EQ(target->contentOf(Zstr("/dst/fresh.txt")), "fresh");
    EXPECT_FALSE(source->contains(Zstr("/src/existing.txt")));
    EXPECT_FALSE(source->contains(Zstr("/src/fresh.txt")));
    EXPECT_TRUE(source->contains(Zstr("/src"))); //top-level items were files: no folder cleanup

    ASSERT_EQ(handler.snapshots.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<TransferConflict>(handler.snapshots[0].state));
    EXPECT_TRUE(std::holds_alternative<TransitNormal>(handler.snapshots[1].state));
}

TEST(TransitProgress, CopyBetweenDevicesKeepsSource)
{
    const auto source = MemoryFileSystem::create();
    source->addFile(Zstr("/a/file1"), "1234");
    const auto target = MemoryFileSystem::create();

    RecordingHandler handler(TransitProgressResponse::continueOrAbort);
    copyFilesBetweenWithProgress(source, {path(Zstr("/a"))}, AbstractPath(target, AfsPath()), handler.get());

    EXPECT_EQ(target->contentOf(Zstr("/a/file1")), "1234");
    EXPECT_TRUE(source->contains(Zstr("/a/file1")));
    ASSERT_EQ(handler.snapshots.size(), 1u);
    EXPECT_EQ(handler.snapshots[0].processedBytes, 4u);
}
