// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include <map>
#include <gtest/gtest.h>
#include "base/diff_filter.h"

using namespace zen;
using namespace s3m;


namespace
{
FileEntry makeFile(const Zstring& name, uint64_t fileSize, time_t modTime)
{
    return FileEntry{name, Zstr("/full/") + name, fileSize, modTime, false, false};
}


FileEntry makeSingleFile(const Zstring& name, uint64_t fileSize, time_t modTime)
{
    FileEntry fe = makeFile(name, fileSize, modTime);
    fe.isSingleEntry = true;
    return fe;
}


std::unique_ptr<EnumStream> makeStream(std::vector<EnumItem> items)
{
    return std::make_unique<EnumStream>([items = std::move(items)](const EnumStream::EmitFun& emit)
    {
        for (EnumItem item : items)
            emit(std::move(item)); //throw ThreadStopRequest
    }, 4 /*capacity*/, std::stop_token(), Zstr("Test stream"));
}


struct DiffResult
{
    std::map<Zstring, FileEntry> updates;
    std::map<Zstring, FileEntry> removals;
    std::vector<std::string> errors;
};


DiffResult runDiff(std::vector<EnumItem> source, std::vector<EnumItem> target, bool deleteExtraneous)
{
    std::unique_ptr<EnumStream> sourceStream = makeStream(std::move(source));
    std::unique_ptr<EnumStream> targetStream = makeStream(std::move(target));

    DiffResult result;
    diffFileSets(*sourceStream, *targetStream, deleteExtraneous, std::stop_token(), [&](DiffItem&& item)
    {
        if (const EnumerationError* error = std::get_if<EnumerationError>(&item))
            result.errors.push_back(error->msg);
        else
        {
            const SyncAction& action = std::get<SyncAction>(item);
            (action.op == SyncOperation::update ? result.updates : result.removals).emplace(action.entry.name, action.entry);
        }
    });
    return result;
}
}


TEST(NeedsUpdate, SizeOrNewerSource)
{
    EXPECT_FALSE(needsUpdate(makeFile("a", 10, 100), makeFile("a", 10, 100)));
    EXPECT_TRUE (needsUpdate(makeFile("a", 11, 100), makeFile("a", 10, 100)));
    EXPECT_TRUE (needsUpdate(makeFile("a", 9,  100), makeFile("a", 10, 200))); //size wins over time
    EXPECT_TRUE (needsUpdate(makeFile("a", 10, 101), makeFile("a", 10, 100)));
    EXPECT_FALSE(needsUpdate(makeFile("a", 10, 100), makeFile("a", 10, 101))); //target newer
}


TEST(DiffFileSets, NewChangedAndUnchanged)
{
    const DiffResult result = runDiff(
    {
        makeFile("new.txt",       5, 100),
        makeFile("changed.txt",   7, 100),
        makeFile("same.txt",      3, 100),
        makeFile("newer.txt",     3, 200),
        makeFile("older.txt",     3, 100),
    },
    {
        makeFile("changed.txt",   6, 100),
        makeFile("same.txt",      3, 100),
        makeFile("newer.txt",     3, 100),
        makeFile("older.txt",     3, 300),
        makeFile("extra.txt",     1, 100),
    }, false);

    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.removals.empty());
    ASSERT_EQ(result.updates.size(), 3u);
    EXPECT_TRUE(result.updates.contains("new.txt"));
    EXPECT_TRUE(result.updates.contains("changed.txt"));
    EXPECT_TRUE(result.updates.contains("newer.txt"));

    //update carries the source entry
    EXPECT_EQ(result.updates.at("changed.txt").fileSize, 7u);
    EXPECT_EQ(result.updates.at("changed.txt").fullPath, "/full/changed.txt");
}


TEST(DiffFileSets, RemovalsOnlyWhenRequested)
{
    const std::vector<EnumItem> source{makeFile("keep.txt", 1, 1), makeFile("update.txt", 2, 5)};
    const std::vector<EnumItem> target{makeFile("keep.txt", 1, 1), makeFile("update.txt", 1, 1), makeFile("old.txt", 1, 1), makeFile("dir/old2.txt", 1, 1)};

    const DiffResult noDelete = runDiff(source, target, false);
    EXPECT_TRUE(noDelete.removals.empty());
    EXPECT_EQ(noDelete.updates.size(), 1u);

    const DiffResult withDelete = runDiff(source, target, true);
    EXPECT_EQ(withDelete.updates.size(), 1u);
    ASSERT_EQ(withDelete.removals.size(), 2u);
    EXPECT_TRUE(withDelete.removals.contains("old.txt"));
    EXPECT_TRUE(withDelete.removals.contains("dir/old2.txt"));
    EXPECT_FALSE(withDelete.removals.at("old.txt").existsInSource);
}


TEST(DiffFileSets, EmptyTargetUpdatesEverything)
{
    const DiffResult result = runDiff({makeFile("a", 1, 1), makeFile("b/c", 2, 2)}, {}, true);
    EXPECT_EQ(result.updates.size(), 2u);
    EXPECT_TRUE(result.removals.empty());
}


TEST(DiffFileSets, EmptySourceRemovesEverything)
{
    const DiffResult result = runDiff({}, {makeFile("a", 1, 1), makeFile("b", 2, 2)}, true);
    EXPECT_TRUE(result.updates.empty());
    EXPECT_EQ(result.removals.size(), 2u);
}


TEST(DiffFileSets, TargetErrorSuppressesAllActions)
{
    std::vector<EnumItem> source;
    for (int i = 0; i < 50; ++i)
        source.push_back(makeFile("file" + numberTo<Zstring>(i), 1, 1));

    const DiffResult result = runDiff(source,
    {
        makeFile("stale.txt", 1, 1),
        EnumerationError{"target listing failed"},
    }, true);

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "target listing failed");
    EXPECT_TRUE(result.updates.empty());
    EXPECT_TRUE(result.removals.empty());
}


TEST(DiffFileSets, SourceErrorIsReportedAndDiffContinues)
{
    const DiffResult result = runDiff(
    {
        makeFile("a.txt", 1, 1),
        EnumerationError{"source folder unreadable"},
    },
    {
        makeFile("stale.txt", 1, 1),
    }, true);

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "source folder unreadable");
    EXPECT_EQ(result.updates.size(), 1u);
    EXPECT_EQ(result.removals.size(), 1u);
}


TEST(DiffFileSets, StopRequestSuppressesRemovals)
{
    std::unique_ptr<EnumStream> source = makeStream({makeFile("a.txt", 1, 1)});
    std::unique_ptr<EnumStream> target = makeStream({makeFile("stale.txt", 1, 1)});

    std::stop_source stopSource;
    stopSource.request_stop();

    size_t itemCount = 0;
    diffFileSets(*source, *target, true, stopSource.get_token(), [&](DiffItem&&) { ++itemCount; });
    EXPECT_EQ(itemCount, 0u);
}


TEST(DiffFileSets, SingleFileComparedWithSingleFileOfOtherName)
{
    const DiffResult unchanged = runDiff({makeSingleFile("a.txt", 4, 100)}, {makeSingleFile("backup.txt", 4, 100)}, true);
    EXPECT_TRUE(unchanged.updates .empty());
    EXPECT_TRUE(unchanged.removals.empty());

    const DiffResult changed = runDiff({makeSingleFile("a.txt", 5, 100)}, {makeSingleFile("backup.txt", 4, 100)}, true);
    EXPECT_TRUE(changed.updates.contains("a.txt"));
    EXPECT_TRUE(changed.removals.empty()); //the update replaces it
}


TEST(DiffFileSets, SingleFileIntoFolderIsWrittenBelowIt)
{
    const DiffResult result = runDiff({makeSingleFile("a.txt", 4, 100)},
    {
        makeFile("a.txt",     4, 100),
        makeFile("other.txt", 1, 100),
    }, true);

    EXPECT_TRUE(result.updates.empty());
    ASSERT_EQ(result.removals.size(), 1u);
    EXPECT_TRUE(result.removals.contains("other.txt"));

    const DiffResult changed = runDiff({makeSingleFile("a.txt", 5, 100)}, {makeFile("a.txt", 4, 100)}, true);
    ASSERT_TRUE(changed.updates.contains("a.txt"));
    EXPECT_FALSE(changed.updates.at("a.txt").isSingleEntry);
    EXPECT_TRUE(changed.removals.empty());
}
