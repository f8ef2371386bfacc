// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef FAKE_OBJECT_STORE_H_6610293847561092
#define FAKE_OBJECT_STORE_H_6610293847561092

#include <atomic>
#include <map>
#include <set>
#include <zen/thread.h>
#include "afs/object_store.h"


namespace s3m::test
{
struct FakeObject
{
    std::string content;
    time_t lastModified = 0;
    std::string contentType;
    std::string acl;
};


//in-memory object store: buckets exist implicitly
class FakeObjectStore : public ObjectStore
{
public:
    explicit FakeObjectStore(size_t pageSize = 1000) : pageSize_(pageSize) {}

    ObjectListing listObjects(const std::string& bucket, const std::string& keyPrefix,
                              const std::optional<std::string>& continuationToken) override //throw SysError
    {
        ++listCalls;
        return state_.access([&](State& state)
        {
            if (state.failingListBuckets.contains(bucket))
                throw zen::SysError("Simulated listing failure for bucket " + bucket + '.');

            const std::map<std::string, FakeObject>& objects = state.buckets[bucket];

            //continuation token: last key of previous page
            auto it = continuationToken ? objects.upper_bound(*continuationToken) : objects.lower_bound(keyPrefix);

            ObjectListing listing;
            for (; it != objects.end() && zen::startsWith(it->first, keyPrefix); ++it)
            {
                if (listing.objects.size() == pageSize_)
                {
                    listing.continuationToken = listing.objects.back().key;
                    break;
                }
                listing.objects.push_back({it->first, it->second.content.size(), it->second.lastModified});
            }
            return listing;
        });
    }

    uint64_t getObject(const std::string& bucket, const std::string& key,
                       const std::function<void(std::span<const char> buf)>& writeBlock) override //throw SysError, X
    {
        ++getCalls;
        const std::string content = getObjectOrThrow(bucket, key).content; //throw SysError

        //deliver in several blocks
        const size_t blockSize = 7;
        for (size_t pos = 0; pos < content.size(); pos += blockSize)
            writeBlock({content.data() + pos, std::min(blockSize, content.size() - pos)}); //throw X

        return content.size();
    }

    void putObject(const std::string& bucket, const std::string& key,
                   const std::function<size_t(std::span<char> buf)>& readBlock, uint64_t streamSize,
                   const PutObjectOptions& options) override //throw SysError, X
    {
        ++putCalls;
        std::string content;
        std::vector<char> buf(4096);
        while (content.size() < streamSize)
        {
            const size_t bytesRead = readBlock({buf.data(), std::min<uint64_t>(buf.size(), streamSize - content.size())}); //throw X
            if (bytesRead == 0)
                throw zen::SysError("Unexpected end of stream.");
            content.append(buf.data(), bytesRead);
        }

        state_.access([&](State& state)
        {
            state.buckets[bucket][key] = {content, now(), options.contentType, options.acl};
        });
    }

    void copyObject(const std::string& bucket, const std::string& copySource, const std::string& destKey,
                    const std::string& acl) override //throw SysError
    {
        ++copyCalls;
        const std::string srcBucket = zen::beforeFirst(copySource, '/', zen::IfNotFoundReturn::none);
        const std::string srcKey    = zen::afterFirst (copySource, '/', zen::IfNotFoundReturn::none);

        FakeObject obj = getObjectOrThrow(srcBucket, srcKey); //throw SysError
        obj.lastModified = now();
        obj.acl = acl;

        state_.access([&](State& state) { state.buckets[bucket][destKey] = obj; });
    }

    void deleteObject(const std::string& bucket, const std::string& key) override //throw SysError
    {
        ++deleteCalls;
        state_.access([&](State& state) { state.buckets[bucket].erase(key); }); //S3: deleting a missing key succeeds
    }

    //-------------------------------------------------------------
    void addObject(const std::string& bucket, const std::string& key, const std::string& content, time_t lastModified)
    {
        state_.access([&](State& state) { state.buckets[bucket][key] = {content, lastModified, "", ""}; });
    }

    std::optional<FakeObject> findObject(const std::string& bucket, const std::string& key)
    {
        return state_.access([&](State& state) -> std::optional<FakeObject>
        {
            const std::map<std::string, FakeObject>& objects = state.buckets[bucket];
            if (auto it = objects.find(key); it != objects.end())
                return it->second;
            return {};
        });
    }

    std::vector<std::string> getKeys(const std::string& bucket)
    {
        return state_.access([&](State& state)
        {
            std::vector<std::string> keys;
            for (const auto& [key, obj] : state.buckets[bucket])
                keys.push_back(key);
            return keys;
        });
    }

    void setListingFailure(const std::string& bucket) { state_.access([&](State& state) { state.failingListBuckets.insert(bucket); }); }

    //modification time assigned by put and copy; default: current time
    void setClock(time_t fixedTime) { fixedTime_ = fixedTime; }

    std::atomic<int> listCalls{0};
    std::atomic<int> getCalls{0};
    std::atomic<int> putCalls{0};
    std::atomic<int> copyCalls{0};
    std::atomic<int> deleteCalls{0};

    int mutatingCalls() const { return putCalls + copyCalls + deleteCalls; }

private:
    struct State
    {
        std::map<std::string, std::map<std::string, FakeObject>> buckets;
        std::set<std::string> failingListBuckets;
    };

    FakeObject getObjectOrThrow(const std::string& bucket, const std::string& key) //throw SysError
    {
        return state_.access([&](State& state)
        {
            const std::map<std::string, FakeObject>& objects = state.buckets[bucket];
            auto it = objects.find(key);
            if (it == objects.end())
                throw zen::SysError("NoSuchKey: The specified key does not exist.");
            return it->second;
        });
    }

    time_t now() const { return fixedTime_ != 0 ? fixedTime_.load() : std::time(nullptr); }

    const size_t pageSize_;
    std::atomic<time_t> fixedTime_{0};
    zen::Protected<State> state_;
};
}

#endif //FAKE_OBJECT_STORE_H_6610293847561092
