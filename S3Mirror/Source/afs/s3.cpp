// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include "s3.h"
#include <unordered_map>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include <zen/extra_log.h>
#include <zen/file_error.h>
#include <zen/file_path.h>
#include <zen/http.h>
#include <zen/open_ssl.h>
#include <zen/scope_guard.h>
#include <zen/thread.h>
#include <zen/time.h>
#include <zenxml/xml.h>

using namespace zen;
using namespace s3m;


namespace
{
const std::chrono::seconds HTTP_SESSION_MAX_IDLE_TIME(20);

const char S3_XML_NAMESPACE[] = "http://s3.amazonaws.com/doc/2006-03-01/";


class HttpSessionManager //reuse (healthy) HTTP sessions
{
public:
    HttpSessionManager(bool useTls, const Zstring& caCertFilePath) : useTls_(useTls), caCertFilePath_(caCertFilePath) {}

    void access(const std::string& server, const std::function<void(HttpSession& session)>& useHttpSession /*throw X*/) //throw SysError, X
    {
        Protected<HttpSessionCache>& sessionCache = getSessionCache(server);

        std::unique_ptr<HttpSession> httpSession;

        sessionCache.access([&](HttpSessionCache& sessions)
        {
            while (!sessions.empty())
            {
                std::unique_ptr<HttpSession> idleSession = std::move(sessions.back());
                /**/                                                sessions.pop_back();

                if (isHealthy(*idleSession)) //server may have closed the connection in the meantime
                {
                    httpSession = std::move(idleSession);
                    break;
                }
            }
        });

        //create new HTTP session outside the lock: non-atomic regarding "sessionCache" => one session too many is not a problem!
        if (!httpSession)
            httpSession = std::make_unique<HttpSession>(server, useTls_, caCertFilePath_); //throw SysError

        ZEN_ON_SCOPE_EXIT(
            if (isHealthy(*httpSession))
        sessionCache.access([&](HttpSessionCache& sessions) { sessions.push_back(std::move(httpSession)); }); );

        useHttpSession(*httpSession); //throw SysError, X
    }

private:
    HttpSessionManager           (const HttpSessionManager&) = delete;
    HttpSessionManager& operator=(const HttpSessionManager&) = delete;

    static bool isHealthy(const HttpSession& s) { return std::chrono::steady_clock::now() - s.getLastUseTime() <= HTTP_SESSION_MAX_IDLE_TIME; }

    using HttpSessionCache = std::vector<std::unique_ptr<HttpSession>>;

    Protected<HttpSessionCache>& getSessionCache(const std::string& server)
    {
        Protected<HttpSessionCache>* sessionCache = nullptr;

        globalSessionCache_.access([&](SessionsByServer& sessionsByServer)
        {
            sessionCache = &sessionsByServer[server]; //get or create
        });
        static_assert(std::is_same_v<SessionsByServer, std::unordered_map<std::string, Protected<HttpSessionCache>>>, "require std::unordered_map so that the pointers we return remain stable");

        return *sessionCache;
    }

    using SessionsByServer = std::unordered_map<std::string, Protected<HttpSessionCache>>;

    Protected<SessionsByServer> globalSessionCache_;
    const bool useTls_;
    const Zstring caCertFilePath_;
};


XmlDoc parseS3Response(const std::string& response) //throw SysError
{
    try
    {
        return parseXml(response); //throw XmlParsingError
    }
    catch (const XmlParsingError& e)
    {
        throw SysError(replaceCpy(replaceCpy("Invalid XML response (row %x, column %y).",
                                             "%x", numberTo<std::string>(e.row + 1)),
                                  "%y", numberTo<std::string>(e.col + 1)));
    }
}


void checkResponseRoot(const std::string& response, const XmlDoc& doc, const std::string& expectedRoot) //throw SysError
{
    if (const std::optional<std::string> errorMsg = parseS3Error(response))
        throw SysError(*errorMsg);

    if (doc.root().getName() != expectedRoot)
        throw SysError(replaceCpy("Unexpected response: <%x> element missing.", "%x", expectedRoot));
}


bool isSuccess(int httpStatus) { return httpStatus / 100 == 2; }
}


ObjectListing s3m::parseListObjectsResponse(const std::string& response) //throw SysError
{
    const XmlDoc doc = parseS3Response(response); //throw SysError
    checkResponseRoot(response, doc, "ListBucketResult"); //throw SysError

    XmlIn in(doc);
    ObjectListing listing;

    in.visitChildren([&](XmlIn contents)
    {
        ObjectInfo obj;
        std::string lastModified;
        contents["Key" ](obj.key);
        contents["Size"](obj.size);

        if (contents["LastModified"](lastModified))
        {
            const auto [modTime, timeValid] = parseIsoUtcTime(lastModified);
            if (!timeValid)
                throw SysError(replaceCpy("Invalid modification time %x.", "%x", fmtPath(lastModified)));
            obj.lastModified = modTime;
        }
        listing.objects.push_back(std::move(obj));
    }, "Contents");

    bool isTruncated = false;
    if (XmlIn truncated = in["IsTruncated"])
        truncated(isTruncated);

    if (isTruncated)
    {
        std::string nextToken;
        in["NextContinuationToken"](nextToken);
        listing.continuationToken = nextToken;
    }

    if (!in.getErrors().empty())
        throw SysError(replaceCpy("Unexpected response: cannot read %x.", "%x", in.getErrors()));

    return listing;
}


std::string s3m::parseInitiateMultipartResponse(const std::string& response) //throw SysError
{
    const XmlDoc doc = parseS3Response(response); //throw SysError
    checkResponseRoot(response, doc, "InitiateMultipartUploadResult"); //throw SysError

    std::string uploadId;
    XmlIn in(doc);
    if (!in["UploadId"](uploadId) || uploadId.empty())
        throw SysError("Unexpected response: upload ID missing.");

    return uploadId;
}


std::string s3m::buildCompleteMultipartRequest(const std::vector<std::string>& partETags)
{
    XmlDoc doc("CompleteMultipartUpload");
    doc.root().setAttribute("xmlns", std::string(S3_XML_NAMESPACE));

    XmlOut out(doc);
    size_t partNumber = 0;
    for (const std::string& etag : partETags)
    {
        XmlOut part = out.addChild("Part");
        part["PartNumber"](++partNumber);
        part["ETag"](etag);
    }
    return serializeXml(doc);
}


std::optional<std::string> s3m::parseS3Error(const std::string& response)
{
    if (!contains(response, "<Error>")) //S3 error documents have no namespace
        return {};
    try
    {
        const XmlDoc doc = parseXml(response); //throw XmlParsingError
        if (doc.root().getName() != "Error")
            return {};

        XmlIn in(doc);
        std::string code;
        std::string message;
        in["Code"   ](code);
        in["Message"](message);

        if (code.empty())
            return message;
        if (message.empty())
            return code;
        return code + ": " + message;
    }
    catch (const XmlParsingError&) { return {}; } //not an S3 error document
}


std::string s3m::formatS3Error(const std::string& response, int httpStatus)
{
    if (const std::optional<std::string> errorMsg = parseS3Error(response))
        return formatSystemError("", "HTTP status " + numberTo<std::string>(httpStatus), *errorMsg);

    return formatHttpError(httpStatus);
}


AwsCredentials s3m::getCredentialsFromEnvironment() //throw SysError
{
    AwsCredentials creds;
    if (const std::optional<Zstring> val = getEnvironmentVar("AWS_ACCESS_KEY_ID"))
        creds.accessKeyId = trimCpy(*val);
    if (const std::optional<Zstring> val = getEnvironmentVar("AWS_SECRET_ACCESS_KEY"))
        creds.secretAccessKey = trimCpy(*val);
    if (const std::optional<Zstring> val = getEnvironmentVar("AWS_SESSION_TOKEN"))
        creds.sessionToken = trimCpy(*val);

    if (creds.accessKeyId.empty() || creds.secretAccessKey.empty())
        throw SysError("AWS credentials not found. Set environment variables AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY.");

    return creds;
}


std::string s3m::getRegionFromEnvironment()
{
    for (const Zstring& varName : {Zstr("AWS_REGION"), Zstr("AWS_DEFAULT_REGION")})
        if (const std::optional<Zstring> val = getEnvironmentVar(varName))
            if (const Zstring region = trimCpy(*val);
                !region.empty())
                return region;
    return {};
}


void s3m::s3Init()
{
    libcurlInit();
}


void s3m::s3Teardown()
{
    libcurlTearDown();
}

//===========================================================================================================================

class S3Client::Impl
{
public:
    explicit Impl(const S3Login& login) :
        login_(login),
        region_([&]
    {
        if (!login.region.empty())
            return login.region;
        if (const std::string region = getRegionFromEnvironment();
            !region.empty())
            return region;
        return std::string("us-east-1");
    }()),
    sessionMgr_(login.useTls, login.caCertFilePath) {}

    ObjectListing listObjects(const std::string& bucket, const std::string& keyPrefix,
                              const std::optional<std::string>& continuationToken) //throw SysError
    {
        S3Request req;
        req.bucket = bucket;
        req.queryParams = {{"list-type", "2"}, {"prefix", keyPrefix}};
        if (continuationToken)
            req.queryParams.emplace_back("continuation-token", *continuationToken);

        return parseListObjectsResponse(requestBuffered(req)); //throw SysError
    }

    uint64_t getObject(const std::string& bucket, const std::string& key,
                       const std::function<void(std::span<const char> buf)>& writeBlock /*throw X*/) //throw SysError, X
    {
        S3Request req;
        req.bucket = bucket;
        req.key    = key;

        int responseStatus = 0;
        std::string errorResponse;
        uint64_t bytesReceived = 0;

        const int httpStatus = request(req, [&](std::span<const char> buf)
        {
            if (isSuccess(responseStatus))
            {
                writeBlock(buf); //throw X
                bytesReceived += buf.size();
            }
            else
                errorResponse.append(buf.data(), buf.size());
        },
        nullptr /*readRequest*/,
        [&](const std::string_view& header)
        {
            //"HTTP/1.1 200 OK", "HTTP/2 404": the last status line wins
            if (startsWith(header, "HTTP/"))
                responseStatus = stringTo<int>(beforeFirst(afterFirst(header, ' ', IfNotFoundReturn::none), ' ', IfNotFoundReturn::all));
        }); //throw SysError, X

        if (!isSuccess(httpStatus))
            throw SysError(formatS3Error(errorResponse, httpStatus));

        return bytesReceived;
    }

    void putObject(const std::string& bucket, const std::string& key,
                   const std::function<size_t(std::span<char> buf)>& readBlock /*throw X*/, uint64_t streamSize,
                   const PutObjectOptions& options) //throw SysError, X
    {
        uint64_t partSize = std::max(options.partSize != 0 ? options.partSize : login_.partSize, S3_MIN_PART_SIZE);
        //stay within the part count limit:
        partSize = std::max(partSize, (streamSize + S3_MAX_PART_COUNT - 1) / S3_MAX_PART_COUNT);

        std::vector<HttpHeader> headers;
        if (!options.contentType.empty())
            headers.push_back({"Content-Type", options.contentType});
        if (!options.acl.empty())
            headers.push_back({"x-amz-acl", options.acl});

        if (streamSize <= partSize)
        {
            S3Request req;
            req.method  = "PUT";
            req.bucket  = bucket;
            req.key     = key;
            req.headers = headers;
            req.payloadHash = UNSIGNED_PAYLOAD;

            uploadPart(req, readBlock, streamSize); //throw SysError, X
            return;
        }

        //---------------------------------------------------------------------------------
        S3Request initReq;
        initReq.method  = "POST";
        initReq.bucket  = bucket;
        initReq.key     = key;
        initReq.queryParams = {{"uploads", ""}};
        initReq.headers = headers;

        const std::string uploadId = parseInitiateMultipartResponse(requestBuffered(initReq)); //throw SysError

        ZEN_ON_SCOPE_FAIL(abortMultipartUpload(bucket, key, uploadId)); //nothrow

        std::vector<std::string> partETags;
        for (uint64_t offset = 0; offset < streamSize; offset += partSize)
        {
            S3Request partReq;
            partReq.method = "PUT";
            partReq.bucket = bucket;
            partReq.key    = key;
            partReq.queryParams = {{"partNumber", numberTo<std::string>(partETags.size() + 1)}, {"uploadId", uploadId}};
            partReq.payloadHash = UNSIGNED_PAYLOAD;

            const std::string etag = uploadPart(partReq, readBlock, std::min(partSize, streamSize - offset)); //throw SysError, X
            if (etag.empty())
                throw SysError("Unexpected response: ETag missing for part " + numberTo<std::string>(partETags.size() + 1) + '.');

            partETags.push_back(etag);
        }

        S3Request completeReq;
        completeReq.method = "POST";
        completeReq.bucket = bucket;
        completeReq.key    = key;
        completeReq.queryParams = {{"uploadId", uploadId}};
        completeReq.postBody = buildCompleteMultipartRequest(partETags);

        //S3 may report failure with status 200 and an <Error> document
        const std::string response = requestBuffered(completeReq); //throw SysError
        if (const std::optional<std::string> errorMsg = parseS3Error(response))
            throw SysError(*errorMsg);
    }

    void copyObject(const std::string& bucket, const std::string& copySource, const std::string& destKey, const std::string& acl) //throw SysError
    {
        S3Request req;
        req.method = "PUT";
        req.bucket = bucket;
        req.key    = destKey;
        req.headers.push_back({"x-amz-copy-source", '/' + uriEncode(copySource, false /*encodeSlash*/)});
        if (!acl.empty())
            req.headers.push_back({"x-amz-acl", acl});

        //S3 may report failure with status 200 and an <Error> document
        std::string response;
        const int httpStatus = request(req, [&](std::span<const char> buf) { response.append(buf.data(), buf.size()); },
        [](std::span<char> /*buf*/) { return size_t(0); } /*empty body*/, nullptr); //throw SysError

        if (!isSuccess(httpStatus))
            throw SysError(formatS3Error(response, httpStatus));

        if (const std::optional<std::string> errorMsg = parseS3Error(response))
            throw SysError(*errorMsg);
    }

    void deleteObject(const std::string& bucket, const std::string& key) //throw SysError
    {
        S3Request req;
        req.method = "DELETE";
        req.bucket = bucket;
        req.key    = key;
        requestBuffered(req); //throw SysError
    }

private:
    struct S3Request
    {
        std::string method = "GET";
        std::string bucket;
        std::string key; //empty for bucket-level requests
        std::vector<std::pair<std::string, std::string>> queryParams;
        std::vector<HttpHeader> headers;
        std::string payloadHash; //empty: SHA256 of postBody
        std::string postBody;    //"POST" only
    };

    void abortMultipartUpload(const std::string& bucket, const std::string& key, const std::string& uploadId) //nothrow
    {
        try
        {
            S3Request req;
            req.method = "DELETE";
            req.bucket = bucket;
            req.key    = key;
            req.queryParams = {{"uploadId", uploadId}};
            requestBuffered(req); //throw SysError
        }
        catch (const SysError& e)
        {
            logExtraError(replaceCpy("Cannot abort multipart upload of %x.", "%x", fmtPath(displayKey(bucket, key))) + "\n\n" + e.toString());
        }
    }

    static std::string displayKey(const std::string& bucket, const std::string& key) { return "s3://" + bucket + '/' + key; }

    //return ETag
    std::string uploadPart(const S3Request& req, const std::function<size_t(std::span<char> buf)>& readBlock /*throw X*/, uint64_t bytesToSend) //throw SysError, X
    {
        uint64_t bytesRemaining = bytesToSend;
        std::string response;
        std::string etag;

        const int httpStatus = request(req, [&](std::span<const char> buf) { response.append(buf.data(), buf.size()); },
                                       [&](std::span<char> buf)
        {
            if (bytesRemaining == 0)
                return size_t(0);

            const size_t bytesRead = readBlock(buf.first(static_cast<size_t>(std::min<uint64_t>(buf.size(), bytesRemaining)))); //throw X
            bytesRemaining -= bytesRead;
            return bytesRead;
        },
        [&](const std::string_view& header)
        {
            if (equalAsciiNoCase(trimCpy(beforeFirst(header, ':', IfNotFoundReturn::none)), "ETag"))
                etag = trimCpy(std::string(afterFirst(header, ':', IfNotFoundReturn::none)));
        },
        bytesToSend); //throw SysError, X

        if (!isSuccess(httpStatus))
            throw SysError(formatS3Error(response, httpStatus));

        if (bytesRemaining != 0)
            throw SysError("Unexpected end of stream: " + numberTo<std::string>(bytesRemaining) + " bytes missing.");

        return etag;
    }

    std::string requestBuffered(const S3Request& req) //throw SysError
    {
        std::string response;
        const int httpStatus = request(req, [&](std::span<const char> buf) { response.append(buf.data(), buf.size()); },
        nullptr /*readRequest*/, nullptr /*receiveHeader*/); //throw SysError

        if (!isSuccess(httpStatus))
            throw SysError(formatS3Error(response, httpStatus));

        return response;
    }

    //return HTTP status
    int request(const S3Request& req,
                const std::function<void  (std::span<const char> buf)>& writeResponse /*throw X*/,
                const std::function<size_t(std::span<      char> buf)>& readRequest   /*throw X*/, //"PUT" only
                const std::function<void(const std::string_view& header)>& receiveHeader /*throw X*/,
                uint64_t uploadSize = 0) //throw SysError, X
    {
        //virtual-hosted style: "bucket.endpoint/key", path style: "endpoint/bucket/key"
        std::string server = login_.endpoint;
        std::string path = '/' + uriEncode(req.key, false /*encodeSlash*/);
        if (login_.pathStyle)
            path = '/' + uriEncode(req.bucket, true /*encodeSlash*/) + (req.key.empty() ? std::string() : path);
        else
            server = req.bucket + '.' + server;

        const time_t now = std::time(nullptr);

        SigV4Request sigReq;
        sigReq.method       = req.method;
        sigReq.canonicalUri = path;
        sigReq.queryParams  = req.queryParams;
        sigReq.headers      = req.headers;
        sigReq.payloadHash  = !req.payloadHash.empty() ? req.payloadHash : getSha256Hex(req.postBody); //throw SysError

        sigReq.headers.push_back({"Host", server});
        sigReq.headers.push_back({"x-amz-date", formatAmzDate(now)});
        sigReq.headers.push_back({"x-amz-content-sha256", sigReq.payloadHash});
        if (!login_.credentials.sessionToken.empty())
            sigReq.headers.push_back({"x-amz-security-token", login_.credentials.sessionToken});

        std::vector<std::string> headerLines;
        for (const HttpHeader& header : sigReq.headers)
            headerLines.push_back(header.name + ": " + header.value);
        headerLines.push_back("Authorization: " + getAuthorizationV4(sigReq, login_.credentials, region_, "s3", now)); //throw SysError

        std::vector<CurlOption> options
        {
            {CURLOPT_PATH_AS_IS, 1}, //keys may contain "/../"
        };
        if (req.method == "PUT")
            options.emplace_back(CURLOPT_INFILESIZE_LARGE, uploadSize);
        else if (req.method == "POST")
        {
            options.emplace_back(CURLOPT_POST, 1);
            options.emplace_back(CURLOPT_POSTFIELDS, req.postBody.c_str());
            options.emplace_back(CURLOPT_POSTFIELDSIZE_LARGE, req.postBody.size());
        }
        else if (req.method != "GET")
            options.emplace_back(CURLOPT_CUSTOMREQUEST, req.method.c_str());

        const std::string queryString = buildCanonicalQueryString(req.queryParams);
        const std::string serverRelPath = queryString.empty() ? path : path + '?' + queryString;

        HttpSession::Result httpResult;
        sessionMgr_.access(server, [&](HttpSession& session)
        {
            httpResult = session.perform(serverRelPath, headerLines, options,
                                         writeResponse, req.method == "PUT" ? readRequest : nullptr, receiveHeader, login_.timeoutSec); //throw SysError, X
        }); //throw SysError, X

        return httpResult.statusCode;
    }

    const S3Login login_;
    const std::string region_;
    HttpSessionManager sessionMgr_;
};

//===========================================================================================================================

S3Client::S3Client(const S3Login& login) : pimpl_(std::make_unique<Impl>(login)) {}

S3Client::~S3Client() {}


ObjectListing S3Client::listObjects(const std::string& bucket, const std::string& keyPrefix,
                                    const std::optional<std::string>& continuationToken) //throw SysError
{
    return pimpl_->listObjects(bucket, keyPrefix, continuationToken); //throw SysError
}


uint64_t S3Client::getObject(const std::string& bucket, const std::string& key,
                             const std::function<void(std::span<const char> buf)>& writeBlock /*throw X*/) //throw SysError, X
{
    return pimpl_->getObject(bucket, key, writeBlock); //throw SysError, X
}


void S3Client::putObject(const std::string& bucket, const std::string& key,
                         const std::function<size_t(std::span<char> buf)>& readBlock /*throw X*/, uint64_t streamSize,
                         const PutObjectOptions& options) //throw SysError, X
{
    pimpl_->putObject(bucket, key, readBlock, streamSize, options); //throw SysError, X
}


void S3Client::copyObject(const std::string& bucket, const std::string& copySource, const std::string& destKey,
                          const std::string& acl) //throw SysError
{
    pimpl_->copyObject(bucket, copySource, destKey, acl); //throw SysError
}


void S3Client::deleteObject(const std::string& bucket, const std::string& key) //throw SysError
{
    pimpl_->deleteObject(bucket, key); //throw SysError
}
