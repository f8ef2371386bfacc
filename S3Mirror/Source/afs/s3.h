// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef S3_H_5682734658237465
#define S3_H_5682734658237465

#include <memory>
#include "object_store.h"
#include "s3_auth.h"


namespace s3m
{
const uint64_t S3_DEFAULT_PART_SIZE = 64 * 1024 * 1024;
const uint64_t S3_MIN_PART_SIZE     =  5 * 1024 * 1024; //all parts but the last one
const int      S3_MAX_PART_COUNT    = 10000;

struct S3Login
{
    std::string endpoint = "s3.amazonaws.com"; //[host][:port]
    std::string region;                        //empty: read from environment, fallback "us-east-1"
    bool useTls = true;
    bool pathStyle = false; //"endpoint/bucket/key" instead of "bucket.endpoint/key"
    Zstring caCertFilePath; //optional
    int timeoutSec = 20;
    uint64_t partSize = S3_DEFAULT_PART_SIZE;
    AwsCredentials credentials;
};

//AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY, AWS_SESSION_TOKEN (optional)
AwsCredentials getCredentialsFromEnvironment(); //throw SysError

//AWS_REGION, AWS_DEFAULT_REGION
std::string getRegionFromEnvironment(); //empty if not set

void s3Init();     //call from main thread, before using S3Client
void s3Teardown(); //


class S3Client : public ObjectStore
{
public:
    explicit S3Client(const S3Login& login);
    ~S3Client();

    ObjectListing listObjects(const std::string& bucket, const std::string& keyPrefix,
                              const std::optional<std::string>& continuationToken) override; //throw SysError

    uint64_t getObject(const std::string& bucket, const std::string& key,
                       const std::function<void(std::span<const char> buf)>& writeBlock /*throw X*/) override; //throw SysError, X

    void putObject(const std::string& bucket, const std::string& key,
                   const std::function<size_t(std::span<char> buf)>& readBlock /*throw X*/, uint64_t streamSize,
                   const PutObjectOptions& options) override; //throw SysError, X

    void copyObject(const std::string& bucket, const std::string& copySource, const std::string& destKey,
                    const std::string& acl) override; //throw SysError

    void deleteObject(const std::string& bucket, const std::string& key) override; //throw SysError

private:
    S3Client           (const S3Client&) = delete;
    S3Client& operator=(const S3Client&) = delete;

    class Impl;
    const std::unique_ptr<Impl> pimpl_;
};

//---------------------------------------------------------------------------------------
//S3 XML responses:
ObjectListing parseListObjectsResponse(const std::string& response); //throw SysError

std::string parseInitiateMultipartResponse(const std::string& response); //throw SysError; return upload ID

std::string buildCompleteMultipartRequest(const std::vector<std::string>& partETags); //part numbers: 1, 2, ...

//error description, if response is an S3 <Error> document
std::optional<std::string> parseS3Error(const std::string& response);

std::string formatS3Error(const std::string& response, int httpStatus);
}

#endif //S3_H_5682734658237465
