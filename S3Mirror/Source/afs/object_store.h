// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef OBJECT_STORE_H_2378465283746523
#define OBJECT_STORE_H_2378465283746523

#include <functional>
#include <optional>
#include <span>
#include <zen/sys_error.h>


namespace s3m
{
struct ObjectInfo
{
    std::string key;
    uint64_t size = 0;
    time_t lastModified = 0; //UTC
};

struct ObjectListing
{
    std::vector<ObjectInfo> objects;
    std::optional<std::string> continuationToken; //no value: last page
};

struct PutObjectOptions
{
    std::string contentType; //optional
    std::string acl;         //optional, canned ACL e.g. "private", "public-read"
    uint64_t partSize = 0;   //0: use client default; multipart upload for larger streams
};

//blocking calls, all methods must be thread-safe
class ObjectStore
{
public:
    virtual ~ObjectStore() {}

    virtual ObjectListing listObjects(const std::string& bucket, const std::string& keyPrefix,
                                      const std::optional<std::string>& continuationToken) = 0; //throw SysError

    //returns number of bytes written
    virtual uint64_t getObject(const std::string& bucket, const std::string& key,
                               const std::function<void(std::span<const char> buf)>& writeBlock /*throw X*/) = 0; //throw SysError, X

    //readBlock: fill buffer completely unless end of stream
    virtual void putObject(const std::string& bucket, const std::string& key,
                           const std::function<size_t(std::span<char> buf)>& readBlock /*throw X*/, uint64_t streamSize,
                           const PutObjectOptions& options) = 0; //throw SysError, X

    //copySource: "<source bucket>/<source key>"
    virtual void copyObject(const std::string& bucket, const std::string& copySource, const std::string& destKey,
                            const std::string& acl /*optional*/) = 0; //throw SysError

    virtual void deleteObject(const std::string& bucket, const std::string& key) = 0; //throw SysError
};
}

#endif //OBJECT_STORE_H_2378465283746523
