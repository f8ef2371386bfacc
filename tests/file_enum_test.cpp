// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include <map>
#include <unistd.h>
#include <gtest/gtest.h>
#include "base/file_enum.h"
#include "fake_object_store.h"
#include "test_utils.h"

using namespace zen;
using namespace s3m;
using namespace s3m::test;


namespace
{
struct EnumResult
{
    std::map<Zstring, FileEntry> files; //by relative name
    std::vector<std::string> errors;
};


EnumResult collect(const std::function<void(const EnumStream::EmitFun& emit)>& traverse)
{
    EnumResult result;
    traverse([&](EnumItem&& item)
    {
        if (const EnumerationError* error = std::get_if<EnumerationError>(&item))
            result.errors.push_back(error->msg);
        else
        {
            FileEntry& fe = std::get<FileEntry>(item);
            result.files.emplace(fe.name, fe);
        }
    });
    return result;
}


EnumResult collectLocal(const LocalPath& root, const NameFilter& filter = NameFilter())
{
    return collect([&](const EnumStream::EmitFun& emit) { traverseLocalFiles(root, filter, std::stop_token(), emit); });
}


EnumResult collectRemote(ObjectStore& store, const S3Path& root, const NameFilter& filter = NameFilter())
{
    return collect([&](const EnumStream::EmitFun& emit) { traverseRemoteFiles(store, root, filter, std::stop_token(), emit); });
}


//requests a stop while answering the n-th listing call
class StoppingObjectStore : public FakeObjectStore
{
public:
    StoppingObjectStore(int stopAtListCall, std::stop_source& stopSource) :
        FakeObjectStore(1 /*pageSize*/), stopAtListCall_(stopAtListCall), stopSource_(stopSource) {}

    ObjectListing listObjects(const std::string& bucket, const std::string& keyPrefix,
                              const std::optional<std::string>& continuationToken) override //throw SysError
    {
        ObjectListing listing = FakeObjectStore::listObjects(bucket, keyPrefix, continuationToken); //throw SysError
        if (listCalls == stopAtListCall_)
            stopSource_.request_stop();
        return listing;
    }

private:
    const int stopAtListCall_;
    std::stop_source& stopSource_;
};
}


TEST(LocalEnumeration, RecursiveWithRelativeNames)
{
    TempFolder tmp;
    writeFile(tmp / "a.txt", "123", 1600000000);
    writeFile(tmp / "sub/b.txt", "hello");
    writeFile(tmp / "sub/deeper/c.bin", "");
    createDirectoryIfMissingRecursion(tmp / "empty");

    const EnumResult result = collectLocal({tmp.path(), false});

    EXPECT_TRUE(result.errors.empty());
    ASSERT_EQ(result.files.size(), 3u);
    ASSERT_TRUE(result.files.contains("a.txt"));
    ASSERT_TRUE(result.files.contains("sub/b.txt"));
    ASSERT_TRUE(result.files.contains("sub/deeper/c.bin"));

    const FileEntry& a = result.files.at("a.txt");
    EXPECT_EQ(a.fullPath, tmp / "a.txt");
    EXPECT_EQ(a.fileSize, 3u);
    EXPECT_EQ(a.modTime, 1600000000);
    EXPECT_FALSE(a.isSingleEntry);

    EXPECT_EQ(result.files.at("sub/b.txt").fileSize, 5u);
}


TEST(LocalEnumeration, MissingRootIsEmpty)
{
    TempFolder tmp;
    const EnumResult result = collectLocal({tmp / "not-existing", false});
    EXPECT_TRUE(result.files.empty());
    EXPECT_TRUE(result.errors.empty());
}


TEST(LocalEnumeration, FileRootIsSingleEntry)
{
    TempFolder tmp;
    writeFile(tmp / "report.pdf", "%PDF", 1500000000);

    const EnumResult result = collectLocal({tmp / "report.pdf", false});
    ASSERT_EQ(result.files.size(), 1u);
    const FileEntry& fe = result.files.begin()->second;
    EXPECT_EQ(fe.name, "report.pdf");
    EXPECT_EQ(fe.fullPath, tmp / "report.pdf");
    EXPECT_TRUE(fe.isSingleEntry);
    EXPECT_EQ(fe.modTime, 1500000000);
}


TEST(LocalEnumeration, FilterAppliesToRelativePath)
{
    TempFolder tmp;
    writeFile(tmp / "keep.txt", "1");
    writeFile(tmp / "skip.jpg", "2");
    writeFile(tmp / "txt/skip.jpg", "3"); //folder name must not matter for "\.txt$"
    writeFile(tmp / "dir/keep2.txt", "4");

    const EnumResult result = collectLocal({tmp.path(), false}, NameFilter({"\\.txt$"}));
    ASSERT_EQ(result.files.size(), 2u);
    EXPECT_TRUE(result.files.contains("keep.txt"));
    EXPECT_TRUE(result.files.contains("dir/keep2.txt"));
}


TEST(LocalEnumeration, SymlinksToFilesAreFollowedSymlinksToFoldersSkipped)
{
    TempFolder tmp;
    writeFile(tmp / "outside/target.txt", "target");
    createDirectoryIfMissingRecursion(tmp / "root");
    ASSERT_EQ(::symlink((tmp / "outside/target.txt").c_str(), (tmp / "root/link.txt").c_str()), 0);
    ASSERT_EQ(::symlink((tmp / "outside").c_str(),            (tmp / "root/linkdir").c_str()), 0);

    const EnumResult result = collectLocal({tmp / "root", false});
    EXPECT_TRUE(result.errors.empty());
    ASSERT_EQ(result.files.size(), 1u);
    ASSERT_TRUE(result.files.contains("link.txt"));
    EXPECT_EQ(result.files.at("link.txt").fileSize, 6u);
}


TEST(LocalEnumeration, BrokenSymlinkIsError)
{
    TempFolder tmp;
    createDirectoryIfMissingRecursion(tmp / "root");
    ASSERT_EQ(::symlink((tmp / "nowhere").c_str(), (tmp / "root/dangling").c_str()), 0);

    const EnumResult result = collectLocal({tmp / "root", false});
    EXPECT_EQ(result.errors.size(), 1u);
}


TEST(RemoteEnumeration, ListsBelowPrefixWithRelativeNames)
{
    FakeObjectStore store;
    store.addObject("b", "dir/a.txt",     "aa",  100);
    store.addObject("b", "dir/sub/b.txt", "bbb", 200);
    store.addObject("b", "dir/",          "",    300); //folder marker
    store.addObject("b", "dirt/x.txt",    "x",   400); //beside the prefix
    store.addObject("b", "other.txt",     "o",   500);

    for (const char* prefix : {"dir", "dir/"})
    {
        const EnumResult result = collectRemote(store, {"b", prefix});
        EXPECT_TRUE(result.errors.empty());
        ASSERT_EQ(result.files.size(), 2u) << prefix;

        const FileEntry& a = result.files.at("a.txt");
        EXPECT_EQ(a.fullPath, "dir/a.txt");
        EXPECT_EQ(a.fileSize, 2u);
        EXPECT_EQ(a.modTime, 100);
        EXPECT_FALSE(a.isSingleEntry);

        EXPECT_EQ(result.files.at("sub/b.txt").fullPath, "dir/sub/b.txt");
    }
}


TEST(RemoteEnumeration, EmptyPrefixListsWholeBucket)
{
    FakeObjectStore store;
    store.addObject("b", "a.txt",   "1", 1);
    store.addObject("b", "d/b.txt", "2", 2);
    store.addObject("other", "c.txt", "3", 3);

    const EnumResult result = collectRemote(store, {"b", ""});
    ASSERT_EQ(result.files.size(), 2u);
    EXPECT_TRUE(result.files.contains("a.txt"));
    EXPECT_TRUE(result.files.contains("d/b.txt"));
}


TEST(RemoteEnumeration, KeyEqualToPrefixIsSingleEntry)
{
    FakeObjectStore store;
    store.addObject("b", "docs/report.pdf", "pdf", 42);

    const EnumResult result = collectRemote(store, {"b", "docs/report.pdf"});
    ASSERT_EQ(result.files.size(), 1u);
    const FileEntry& fe = result.files.begin()->second;
    EXPECT_EQ(fe.name, "report.pdf");
    EXPECT_EQ(fe.fullPath, "docs/report.pdf");
    EXPECT_TRUE(fe.isSingleEntry);
}


TEST(RemoteEnumeration, FollowsPagination)
{
    FakeObjectStore store(2 /*pageSize*/);
    for (int i = 0; i < 7; ++i)
        store.addObject("b", "p/file" + numberTo<std::string>(i), "x", i);

    const EnumResult result = collectRemote(store, {"b", "p/"});
    EXPECT_EQ(result.files.size(), 7u);
    EXPECT_EQ(store.listCalls, 4);
}


TEST(RemoteEnumeration, ListingFailureIsSingleError)
{
    FakeObjectStore store;
    store.addObject("b", "a.txt", "1", 1);
    store.setListingFailure("b");

    const EnumResult result = collectRemote(store, {"b", ""});
    EXPECT_TRUE(result.files.empty());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("s3://b/"), std::string::npos);
}


TEST(RemoteEnumeration, FilterAppliesToRelativeName)
{
    FakeObjectStore store;
    store.addObject("b", "data/a.txt", "1", 1);
    store.addObject("b", "data/b.jpg", "2", 2);

    const EnumResult result = collectRemote(store, {"b", "data"}, NameFilter({"^a\\."}));
    ASSERT_EQ(result.files.size(), 1u);
    EXPECT_TRUE(result.files.contains("a.txt"));
}


TEST(AsyncEnumeration, StreamDeliversAllItemsThenEnds)
{
    FakeObjectStore store;
    for (int i = 0; i < 2500; ++i) //more than the queue capacity
        store.addObject("b", "k" + numberTo<std::string>(i), "", 0);

    std::stop_source stopSource;
    const std::unique_ptr<EnumStream> stream = enumerateFiles(store, S3Path{"b", ""}, NameFilter(), stopSource.get_token());

    size_t count = 0;
    while (std::optional<EnumItem> item = stream->next())
    {
        ASSERT_TRUE(std::holds_alternative<FileEntry>(*item));
        ++count;
    }
    EXPECT_EQ(count, 2500u);
    EXPECT_FALSE(stream->next()); //stays at end
}


TEST(AsyncEnumeration, StopRequestEndsStream)
{
    FakeObjectStore store;
    for (int i = 0; i < 5000; ++i)
        store.addObject("b", "k" + numberTo<std::string>(i), "", 0);

    std::stop_source stopSource;
    const std::unique_ptr<EnumStream> stream = enumerateFiles(store, S3Path{"b", ""}, NameFilter(), stopSource.get_token());

    ASSERT_TRUE(stream->next());
    stopSource.request_stop();

    size_t count = 1;
    while (stream->next())
        ++count;
    EXPECT_LT(count, 5000u);
}


TEST(AsyncEnumeration, StopRequestEndsListingOfFilteredPages)
{
    std::stop_source stopSource;
    StoppingObjectStore store(3, stopSource);
    for (int i = 0; i < 500; ++i)
        store.addObject("b", "k" + numberTo<std::string>(i) + ".bin", "", 0);

    //no key passes the filter: emit() is never reached
    const std::unique_ptr<EnumStream> stream = enumerateFiles(store, S3Path{"b", ""}, NameFilter({"\\.txt$"}), stopSource.get_token());

    EXPECT_FALSE(stream->next());
    EXPECT_EQ(store.listCalls, 3);
}


TEST(RemoteEnumeration, StoppedBeforeStartListsNothing)
{
    FakeObjectStore store;
    store.addObject("b", "a.txt", "1", 1);

    std::stop_source stopSource;
    stopSource.request_stop();

    EXPECT_THROW(traverseRemoteFiles(store, {"b", ""}, NameFilter(), stopSource.get_token(), [](EnumItem&&) {}), ThreadStopRequest);
    EXPECT_EQ(store.listCalls, 0);
}


TEST(LocalEnumeration, StopRequestEndsTraversalBeforeNextFolder)
{
    TempFolder tmp;
    writeFile(tmp / "src/a/b/c/deep.bin", "x");

    std::stop_source stopSource;
    stopSource.request_stop();

    std::vector<Zstring> names;
    EXPECT_THROW(traverseLocalFiles({tmp / "src", false}, NameFilter(), stopSource.get_token(),
                                    [&](EnumItem&& item) { names.push_back(std::get<FileEntry>(item).name); }), ThreadStopRequest);
    EXPECT_TRUE(names.empty());
}
