// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include <gtest/gtest.h>
#include "base/sync_manager.h"
#include "fake_object_store.h"
#include "test_utils.h"

using namespace zen;
using namespace s3m;
using namespace s3m::test;


namespace
{
struct SyncFixture : public ::testing::Test
{
    //throw FileError, MultiError
    StatisticsSnapshot runSync(const Zstring& source, const Zstring& target, const SyncConfig& cfg = SyncConfig(),
                               const std::vector<std::string>& filterPatterns = {})
    {
        SyncManager syncMgr(store, nullptr, log, cfg);
        syncMgr.synchronize(source, target, filterPatterns, std::stop_token());
        return syncMgr.getStatistics();
    }

    TempFolder tmp;
    FakeObjectStore store;
    LogCollector log;
};
}


TEST_F(SyncFixture, LocalToRemoteIsIdempotent)
{
    writeFile(tmp / "src/a.txt",       "aaa",   1600000000);
    writeFile(tmp / "src/sub/b.txt",   "bbbb",  1600000000);
    writeFile(tmp / "src/sub/c/d.bin", "ddddd", 1600000000);

    const StatisticsSnapshot snap = runSync(tmp / "src", "s3://bucket/backup");
    EXPECT_EQ(snap.filesTransferred, 3);
    EXPECT_EQ(snap.bytesTransferred, 12);
    EXPECT_EQ(snap.filesDeleted, 0);
    EXPECT_EQ(store.getKeys("bucket"), (std::vector<std::string>{"backup/a.txt", "backup/sub/b.txt", "backup/sub/c/d.bin"}));

    const int callsAfterFirstRun = store.mutatingCalls();
    const StatisticsSnapshot snap2 = runSync(tmp / "src", "s3://bucket/backup");
    EXPECT_EQ(snap2.filesTransferred, 0);
    EXPECT_EQ(store.mutatingCalls(), callsAfterFirstRun);
}


TEST_F(SyncFixture, LocalToRemoteUpdatesChangedFilesOnly)
{
    writeFile(tmp / "src/same.txt",    "same",    1600000000);
    writeFile(tmp / "src/changed.txt", "changed", 1600000000);
    store.setClock(1600000000);
    runSync(tmp / "src", "s3://bucket/");
    ASSERT_EQ(store.putCalls, 2);

    writeFile(tmp / "src/changed.txt", "changed!", 1600000000);
    const StatisticsSnapshot snap = runSync(tmp / "src", "s3://bucket/");
    EXPECT_EQ(snap.filesTransferred, 1);
    EXPECT_EQ(store.putCalls, 3);
    EXPECT_EQ(store.findObject("bucket", "changed.txt")->content, "changed!");
}


TEST_F(SyncFixture, RemoteToLocal)
{
    store.addObject("bucket", "photos/2020/a.jpg", "jpeg-a", 1577836800);
    store.addObject("bucket", "photos/2021/b.jpg", "jpeg-bb", 1609459200);
    store.addObject("bucket", "photos/",           "",        0); //folder marker
    store.addObject("bucket", "unrelated.txt",     "x",       0);

    const StatisticsSnapshot snap = runSync("s3://bucket/photos/", tmp / "dst");
    EXPECT_EQ(snap.filesTransferred, 2);
    EXPECT_EQ(snap.bytesTransferred, 13);

    EXPECT_EQ(getFileContent(tmp / "dst/2020/a.jpg"), "jpeg-a");
    EXPECT_EQ(getFileContent(tmp / "dst/2021/b.jpg"), "jpeg-bb");
    EXPECT_EQ(getFileDetails(tmp / "dst/2021/b.jpg").modTime, 1609459200);
    EXPECT_FALSE(getItemTypeIfExists(tmp / "dst/unrelated.txt"));

    const int getCallsAfterFirstRun = store.getCalls;
    EXPECT_EQ(runSync("s3://bucket/photos/", tmp / "dst").filesTransferred, 0);
    EXPECT_EQ(store.getCalls, getCallsAfterFirstRun);
}


TEST_F(SyncFixture, RemoteToRemoteWithDeletion)
{
    store.addObject("src", "a.txt",     "a",  100);
    store.addObject("src", "dir/b.txt", "bb", 100);
    store.addObject("dst", "mirror/stale.txt", "s", 100);
    store.addObject("dst", "keep-outside.txt", "k", 100);

    SyncConfig cfg;
    cfg.deleteExtraneous = true;
    const StatisticsSnapshot snap = runSync("s3://src", "s3://dst/mirror/", cfg);

    EXPECT_EQ(snap.filesTransferred, 2);
    EXPECT_EQ(snap.filesDeleted, 1);
    EXPECT_EQ(store.copyCalls, 2);
    EXPECT_EQ(store.getCalls, 0);
    EXPECT_EQ(store.getKeys("dst"), (std::vector<std::string>{"keep-outside.txt", "mirror/a.txt", "mirror/dir/b.txt"}));

    const int callsAfterFirstRun = store.mutatingCalls();
    runSync("s3://src", "s3://dst/mirror/", cfg);
    EXPECT_EQ(store.mutatingCalls(), callsAfterFirstRun);
}


TEST_F(SyncFixture, ExtraneousFilesKeptByDefault)
{
    writeFile(tmp / "src/a.txt", "a");
    store.addObject("bucket", "old.txt", "old", 0);

    EXPECT_EQ(runSync(tmp / "src", "s3://bucket").filesDeleted, 0);
    EXPECT_TRUE(store.findObject("bucket", "old.txt"));

    SyncConfig cfg;
    cfg.deleteExtraneous = true;
    EXPECT_EQ(runSync(tmp / "src", "s3://bucket", cfg).filesDeleted, 1);
    EXPECT_FALSE(store.findObject("bucket", "old.txt"));
}


TEST_F(SyncFixture, RemoteToLocalDeletesLocalFiles)
{
    store.addObject("bucket", "a.txt", "a", 100);
    writeFile(tmp / "dst/a.txt",      "a", 100);
    writeFile(tmp / "dst/sub/x.txt",  "x");

    SyncConfig cfg;
    cfg.deleteExtraneous = true;
    const StatisticsSnapshot snap = runSync("s3://bucket", tmp / "dst", cfg);
    EXPECT_EQ(snap.filesTransferred, 0);
    EXPECT_EQ(snap.filesDeleted, 1);
    EXPECT_TRUE (getItemTypeIfExists(tmp / "dst/a.txt"));
    EXPECT_FALSE(getItemTypeIfExists(tmp / "dst/sub/x.txt"));
}


TEST_F(SyncFixture, FilterRestrictsBothSides)
{
    writeFile(tmp / "src/a.txt", "a");
    writeFile(tmp / "src/b.jpg", "b");
    store.addObject("bucket", "old.jpg", "o", 0);
    store.addObject("bucket", "old.txt", "o", 0);

    SyncConfig cfg;
    cfg.deleteExtraneous = true;
    const StatisticsSnapshot snap = runSync(tmp / "src", "s3://bucket", cfg, {"\\.txt$"});

    EXPECT_EQ(snap.filesTransferred, 1);
    EXPECT_EQ(snap.filesDeleted, 1);
    EXPECT_EQ(store.getKeys("bucket"), (std::vector<std::string>{"a.txt", "old.jpg"}));
}


TEST_F(SyncFixture, SingleFileSource)
{
    writeFile(tmp / "report.pdf", "%PDF");

    runSync(tmp / "report.pdf", "s3://bucket/docs/");
    runSync(tmp / "report.pdf", "s3://bucket/archive/renamed.pdf");

    EXPECT_EQ(store.getKeys("bucket"), (std::vector<std::string>{"archive/renamed.pdf", "docs/report.pdf"}));
}


TEST_F(SyncFixture, SingleFileToRenamedObjectIsStable)
{
    writeFile(tmp / "a.txt", "aaa", 1600000000);
    store.setClock(1600000000);

    SyncConfig cfg;
    cfg.deleteExtraneous = true;

    const StatisticsSnapshot snap = runSync(tmp / "a.txt", "s3://bucket/backup.txt", cfg);
    EXPECT_EQ(snap.filesTransferred, 1);
    EXPECT_EQ(snap.filesDeleted, 0);

    for (int i = 0; i < 3; ++i)
    {
        const StatisticsSnapshot snapAgain = runSync(tmp / "a.txt", "s3://bucket/backup.txt", cfg);
        EXPECT_EQ(snapAgain.filesTransferred, 0);
        EXPECT_EQ(snapAgain.filesDeleted, 0);
    }
    EXPECT_EQ(store.getKeys("bucket"), std::vector<std::string>{"backup.txt"});
    EXPECT_EQ(store.deleteCalls, 0);

    writeFile(tmp / "a.txt", "changed", 1600000000);
    EXPECT_EQ(runSync(tmp / "a.txt", "s3://bucket/backup.txt", cfg).filesTransferred, 1);
    EXPECT_EQ(store.findObject("bucket", "backup.txt")->content, "changed");
    EXPECT_EQ(store.deleteCalls, 0);
}


TEST_F(SyncFixture, SingleObjectIntoExistingFolder)
{
    store.addObject("bucket", "a.txt", "remote", 100);
    writeFile(tmp / "dst/other.txt", "x", 100);

    const StatisticsSnapshot snap = runSync("s3://bucket/a.txt", tmp / "dst");
    EXPECT_EQ(snap.filesTransferred, 1);
    EXPECT_EQ(getFileContent(tmp / "dst/a.txt"), "remote");

    const int getCallsAfterFirstRun = store.getCalls;
    EXPECT_EQ(runSync("s3://bucket/a.txt", tmp / "dst").filesTransferred, 0);
    EXPECT_EQ(store.getCalls, getCallsAfterFirstRun);
}


TEST_F(SyncFixture, DryRunChangesNothing)
{
    writeFile(tmp / "src/a.txt", "a");
    store.addObject("bucket", "old.txt", "old", 0);

    SyncConfig cfg;
    cfg.dryRun = true;
    cfg.deleteExtraneous = true;
    const StatisticsSnapshot snap = runSync(tmp / "src", "s3://bucket", cfg);

    EXPECT_EQ(store.mutatingCalls(), 0);
    EXPECT_EQ(snap.filesTransferred, 0);
    EXPECT_EQ(snap.filesDeleted, 0);
    EXPECT_EQ(log.countContaining(" [dry run]"), 2u);
}


TEST_F(SyncFixture, ManyFilesWithLimitedParallelism)
{
    for (int i = 0; i < 200; ++i)
        writeFile(tmp / ("src/f" + numberTo<Zstring>(i)), "data" + numberTo<std::string>(i));

    SyncConfig cfg;
    cfg.parallel = 3;
    const StatisticsSnapshot snap = runSync(tmp / "src", "s3://bucket/many", cfg);
    EXPECT_EQ(snap.filesTransferred, 200);
    EXPECT_EQ(store.getKeys("bucket").size(), 200u);
}


TEST_F(SyncFixture, TargetListingFailureBlocksAllActions)
{
    writeFile(tmp / "src/a.txt", "a");
    store.addObject("bucket", "old.txt", "old", 0);
    store.setListingFailure("bucket");

    SyncConfig cfg;
    cfg.deleteExtraneous = true;
    try
    {
        runSync(tmp / "src", "s3://bucket", cfg);
        FAIL() << "MultiError expected";
    }
    catch (const MultiError& e)
    {
        ASSERT_EQ(e.getErrors().size(), 1u);
        EXPECT_TRUE(contains(e.getErrors()[0], "s3://bucket/"));
    }
    EXPECT_EQ(store.mutatingCalls(), 0);
    EXPECT_EQ(log.getLog().empty(), false);
}


TEST_F(SyncFixture, IndividualFailuresDontStopOtherTransfers)
{
    store.addObject("bucket", "ok1.txt", "1", 100);
    store.addObject("bucket", "ok2.txt", "2", 100);
    store.addObject("bucket", "blocked/x.txt", "x", 100);
    writeFile(tmp / "dst/blocked", "a file where a folder is needed", 200);

    try
    {
        runSync("s3://bucket", tmp / "dst");
        FAIL() << "MultiError expected";
    }
    catch (const MultiError& e)
    {
        EXPECT_EQ(e.getErrors().size(), 1u);
    }
    EXPECT_EQ(getFileContent(tmp / "dst/ok1.txt"), "1");
    EXPECT_EQ(getFileContent(tmp / "dst/ok2.txt"), "2");
}


TEST_F(SyncFixture, StopRequestCancels)
{
    writeFile(tmp / "src/a.txt", "a");

    std::stop_source stopSource;
    stopSource.request_stop();

    SyncManager syncMgr(store, nullptr, log, SyncConfig());
    try
    {
        syncMgr.synchronize(tmp / "src", "s3://bucket", {}, stopSource.get_token());
        FAIL() << "MultiError expected";
    }
    catch (const MultiError& e)
    {
        ASSERT_EQ(e.getErrors().size(), 1u);
        EXPECT_TRUE(contains(e.getErrors()[0], "cancelled"));
    }
    EXPECT_EQ(store.mutatingCalls(), 0);
}


TEST_F(SyncFixture, StopRequestEndsFilteredListing)
{
    FakeObjectStore pagedStore(1 /*pageSize*/);
    for (int i = 0; i < 500; ++i)
        pagedStore.addObject("bucket", "k" + numberTo<std::string>(i) + ".bin", "", 0);

    std::stop_source stopSource;
    stopSource.request_stop();

    SyncManager syncMgr(pagedStore, nullptr, log, SyncConfig());
    EXPECT_THROW(syncMgr.synchronize("s3://bucket", tmp / "dst", {"\\.txt$"}, stopSource.get_token()), MultiError);
    EXPECT_LE(pagedStore.listCalls, 1);
}


TEST_F(SyncFixture, FatalErrorsBeforeAnyWork)
{
    writeFile(tmp / "src/a.txt", "a");

    EXPECT_THROW(runSync(tmp / "src", tmp / "dst"), FileError);                    //local to local
    EXPECT_THROW(runSync(tmp / "src", "s3://"),     FileError);                    //missing bucket
    EXPECT_THROW(runSync(tmp / "src", "s3://bucket", SyncConfig(), {"("}), FileError); //invalid filter
    EXPECT_EQ(store.listCalls, 0);
    EXPECT_EQ(store.mutatingCalls(), 0);

    SyncConfig cfg;
    cfg.parallel = 0;
    EXPECT_THROW(SyncManager(store, nullptr, log, cfg), std::logic_error);
}


TEST(SyncDirection, FromLocations)
{
    const Location local  = LocalPath{"/tmp/a", false};
    const Location remote = S3Path{"bucket", "prefix"};

    EXPECT_EQ(getSyncDirection(local,  remote), SyncDirection::localToRemote);
    EXPECT_EQ(getSyncDirection(remote, local),  SyncDirection::remoteToLocal);
    EXPECT_EQ(getSyncDirection(remote, remote), SyncDirection::remoteToRemote);
    EXPECT_THROW(getSyncDirection(local, local), FileError);
}
