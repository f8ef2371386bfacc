// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef S3_AUTH_H_8923475692834756
#define S3_AUTH_H_8923475692834756

#include <vector>
#include <zen/sys_error.h>


namespace s3m
{
struct AwsCredentials
{
    std::string accessKeyId;
    std::string secretAccessKey;
    std::string sessionToken; //optional
};

struct HttpHeader
{
    std::string name;
    std::string value;
};

//AWS Signature Version 4: https://docs.aws.amazon.com/AmazonS3/latest/API/sig-v4-header-based-auth.html
struct SigV4Request
{
    std::string method;       //e.g. "GET"
    std::string canonicalUri; //URI-encoded absolute path, e.g. "/bucket/my%20file.txt"
    std::vector<std::pair<std::string, std::string>> queryParams; //raw: encoded during canonicalization
    std::vector<HttpHeader> headers; //all headers are signed; must contain "host" and "x-amz-date"
    std::string payloadHash;  //lower-case hex SHA256 of body or "UNSIGNED-PAYLOAD"
};

const char UNSIGNED_PAYLOAD[] = "UNSIGNED-PAYLOAD";

std::string formatAmzDate(time_t utc); //e.g. "20130524T000000Z"

std::string buildCanonicalQueryString(const std::vector<std::pair<std::string, std::string>>& queryParams);

std::string getSignedHeaders(const std::vector<HttpHeader>& headers); //e.g. "host;range;x-amz-date"

std::string buildCanonicalRequest(const SigV4Request& request);

//value of "Authorization" header
std::string getAuthorizationV4(const SigV4Request& request,
                               const AwsCredentials& credentials,
                               const std::string& region,
                               const std::string& service, //"s3"
                               time_t requestTime); //throw SysError
}

#endif //S3_AUTH_H_8923475692834756
