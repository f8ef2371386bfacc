// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include "s3_auth.h"
#include <map>
#include <zen/http.h>
#include <zen/open_ssl.h>
#include <zen/time.h>

using namespace zen;
using namespace s3m;


namespace
{
//lower-case name => trimmed value with sequential spaces collapsed
std::map<std::string, std::string> getCanonicalHeaders(const std::vector<HttpHeader>& headers)
{
    std::map<std::string, std::string> output;
    for (const HttpHeader& header : headers)
    {
        std::string value;
        for (const char c : trimCpy(header.value))
            if (c != ' ' || !endsWith(value, ' '))
                value += c;

        std::string& item = output[asciiToLowerCpy(trimCpy(header.name))];
        if (!item.empty()) //repeated header names are joined by comma
            item += ',';
        item += value;
    }
    return output;
}


std::string getCredentialScope(const std::string& dateStamp, const std::string& region, const std::string& service)
{
    return dateStamp + '/' + region + '/' + service + "/aws4_request";
}
}


std::string s3m::formatAmzDate(time_t utc)
{
    return formatTime("%Y%m%dT%H%M%SZ", getUtcTime(utc));
}


std::string s3m::buildCanonicalQueryString(const std::vector<std::pair<std::string, std::string>>& queryParams)
{
    std::vector<std::pair<std::string, std::string>> encodedParams;
    for (const auto& [name, value] : queryParams)
        encodedParams.emplace_back(uriEncode(name, true /*encodeSlash*/), uriEncode(value, true /*encodeSlash*/));

    std::sort(encodedParams.begin(), encodedParams.end()); //by encoded name, then value

    std::string output;
    for (const auto& [name, value] : encodedParams)
    {
        if (!output.empty())
            output += '&';
        output += name + '=' + value;
    }
    return output;
}


std::string s3m::getSignedHeaders(const std::vector<HttpHeader>& headers)
{
    std::string output;
    for (const auto& [name, value] : getCanonicalHeaders(headers))
    {
        if (!output.empty())
            output += ';';
        output += name;
    }
    return output;
}


/*  <HTTPMethod>\n
    <CanonicalURI>\n
    <CanonicalQueryString>\n
    <CanonicalHeaders>\n
    <SignedHeaders>\n
    <HashedPayload>                 */
std::string s3m::buildCanonicalRequest(const SigV4Request& request)
{
    std::string canonicalHeaders;
    for (const auto& [name, value] : getCanonicalHeaders(request.headers))
        canonicalHeaders += name + ':' + value + '\n';

    return request.method + '\n' +
           (request.canonicalUri.empty() ? std::string("/") : request.canonicalUri) + '\n' +
           buildCanonicalQueryString(request.queryParams) + '\n' +
           canonicalHeaders + '\n' +
           getSignedHeaders(request.headers) + '\n' +
           request.payloadHash;
}


std::string s3m::getAuthorizationV4(const SigV4Request& request,
                                    const AwsCredentials& credentials,
                                    const std::string& region,
                                    const std::string& service,
                                    time_t requestTime) //throw SysError
{
    const std::string amzDate   = formatAmzDate(requestTime);
    const std::string dateStamp = amzDate.substr(0, 8);
    const std::string scope = getCredentialScope(dateStamp, region, service);

    const std::string stringToSign = std::string("AWS4-HMAC-SHA256") + '\n' +
                                     amzDate + '\n' +
                                     scope + '\n' +
                                     getSha256Hex(buildCanonicalRequest(request)); //throw SysError

    const std::string dateKey              = hmacSha256("AWS4" + credentials.secretAccessKey, dateStamp); //throw SysError
    const std::string dateRegionKey        = hmacSha256(dateKey,              region);                 //
    const std::string dateRegionServiceKey = hmacSha256(dateRegionKey,        service);                //
    const std::string signingKey           = hmacSha256(dateRegionServiceKey, "aws4_request");         //

    const std::string signature = formatAsHexString(hmacSha256(signingKey, stringToSign)); //throw SysError

    return "AWS4-HMAC-SHA256 Credential=" + credentials.accessKeyId + '/' + scope +
           ",SignedHeaders=" + getSignedHeaders(request.headers) +
           ",Signature=" + signature;
}
