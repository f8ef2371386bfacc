// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include <gtest/gtest.h>
#include <zen/http.h>
#include "afs/s3.h"

using namespace zen;
using namespace s3m;


TEST(S3Response, ListObjectsTruncated)
{
    const std::string response =
        R"(<?xml version="1.0" encoding="UTF-8"?>)"
        R"(<ListBucketResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">)"
        "<Name>bucket</Name>"
        "<Prefix>photos/</Prefix>"
        "<KeyCount>2</KeyCount>"
        "<MaxKeys>2</MaxKeys>"
        "<IsTruncated>true</IsTruncated>"
        "<Contents>"
        "<Key>photos/2006/January/sample.jpg</Key>"
        "<LastModified>2009-10-12T17:50:30.000Z</LastModified>"
        "<ETag>&quot;fba9dede5f27731c9771645a39863328&quot;</ETag>"
        "<Size>434234</Size>"
        "<StorageClass>STANDARD</StorageClass>"
        "</Contents>"
        "<Contents>"
        "<Key>photos/R&amp;D/notes.txt</Key>"
        "<LastModified>2009-10-12T17:50:31Z</LastModified>"
        "<Size>0</Size>"
        "</Contents>"
        "<NextContinuationToken>1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM=</NextContinuationToken>"
        "</ListBucketResult>";

    const ObjectListing listing = parseListObjectsResponse(response);

    ASSERT_EQ(listing.objects.size(), 2u);
    EXPECT_EQ(listing.objects[0].key, "photos/2006/January/sample.jpg");
    EXPECT_EQ(listing.objects[0].size, 434234u);
    EXPECT_EQ(listing.objects[0].lastModified, 1255369830);
    EXPECT_EQ(listing.objects[1].key, "photos/R&D/notes.txt");
    EXPECT_EQ(listing.objects[1].size, 0u);
    EXPECT_EQ(listing.objects[1].lastModified, 1255369831);

    ASSERT_TRUE(listing.continuationToken);
    EXPECT_EQ(*listing.continuationToken, "1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM=");
}


TEST(S3Response, ListObjectsComplete)
{
    const ObjectListing listing = parseListObjectsResponse(
        R"(<ListBucketResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">)"
        "<Name>bucket</Name><KeyCount>0</KeyCount><IsTruncated>false</IsTruncated>"
        "</ListBucketResult>");

    EXPECT_TRUE(listing.objects.empty());
    EXPECT_FALSE(listing.continuationToken);
}


TEST(S3Response, ListObjectsInvalid)
{
    //not XML
    EXPECT_THROW(parseListObjectsResponse("<html><body>Bad Gateway"), SysError);

    //wrong document
    EXPECT_THROW(parseListObjectsResponse("<InitiateMultipartUploadResult/>"), SysError);

    //missing value
    EXPECT_THROW(parseListObjectsResponse(
                     "<ListBucketResult><Contents><Key>a</Key>"
                     "<LastModified>2009-10-12T17:50:30.000Z</LastModified></Contents></ListBucketResult>"), SysError);

    //unreadable value
    EXPECT_THROW(parseListObjectsResponse(
                     "<ListBucketResult><Contents><Key>a</Key><Size>many</Size>"
                     "<LastModified>2009-10-12T17:50:30.000Z</LastModified></Contents></ListBucketResult>"), SysError);

    //invalid time stamp
    EXPECT_THROW(parseListObjectsResponse(
                     "<ListBucketResult><Contents><Key>a</Key><Size>1</Size>"
                     "<LastModified>yesterday</LastModified></Contents></ListBucketResult>"), SysError);
}


TEST(S3Response, ErrorDocument)
{
    const std::string response =
        R"(<?xml version="1.0" encoding="UTF-8"?>)"
        "<Error>"
        "<Code>NoSuchBucket</Code>"
        "<Message>The specified bucket does not exist</Message>"
        "<BucketName>missing</BucketName>"
        "<RequestId>4442587FB7D0A2F9</RequestId>"
        "</Error>";

    ASSERT_TRUE(parseS3Error(response));
    EXPECT_EQ(*parseS3Error(response), "NoSuchBucket: The specified bucket does not exist");

    EXPECT_EQ(formatS3Error(response, 404), "HTTP status 404: NoSuchBucket: The specified bucket does not exist");

    //error document in place of a listing
    try
    {
        parseListObjectsResponse(response);
        FAIL() << "SysError expected";
    }
    catch (const SysError& e) { EXPECT_TRUE(contains(e.toString(), "NoSuchBucket")); }
}


TEST(S3Response, NoErrorDocument)
{
    EXPECT_FALSE(parseS3Error(""));
    EXPECT_FALSE(parseS3Error("<ListBucketResult/>"));
    EXPECT_FALSE(parseS3Error("<Error>unterminated"));

    EXPECT_EQ(formatS3Error("", 503), formatHttpError(503));
}


TEST(S3Response, InitiateMultipartUpload)
{
    EXPECT_EQ(parseInitiateMultipartResponse(
                  R"(<?xml version="1.0" encoding="UTF-8"?>)"
                  R"(<InitiateMultipartUploadResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">)"
                  "<Bucket>example-bucket</Bucket>"
                  "<Key>example-object</Key>"
                  "<UploadId>VXBsb2FkIElEIGZvciA2aWWpbmcncyBteS1tb3ZpZS5tMnRzIHVwbG9hZA</UploadId>"
                  "</InitiateMultipartUploadResult>"),
              "VXBsb2FkIElEIGZvciA2aWWpbmcncyBteS1tb3ZpZS5tMnRzIHVwbG9hZA");

    EXPECT_THROW(parseInitiateMultipartResponse("<InitiateMultipartUploadResult><Bucket>b</Bucket></InitiateMultipartUploadResult>"), SysError);
}


TEST(S3Response, CompleteMultipartRequest)
{
    const std::string request = buildCompleteMultipartRequest({"\"etag-1\"", "\"etag-2\""});

    EXPECT_TRUE(contains(request, R"(<CompleteMultipartUpload xmlns="http://s3.amazonaws.com/doc/2006-03-01/">)"));
    EXPECT_TRUE(contains(request, "<PartNumber>1</PartNumber>"));
    EXPECT_TRUE(contains(request, "<PartNumber>2</PartNumber>"));
    EXPECT_TRUE(contains(request, "<ETag>&quot;etag-1&quot;</ETag>") ||
                contains(request, "<ETag>\"etag-1\"</ETag>"));

    //parts are listed in order
    EXPECT_LT(request.find("etag-1"), request.find("etag-2"));
    EXPECT_LT(request.find("<PartNumber>1<"), request.find("<PartNumber>2<"));
}
