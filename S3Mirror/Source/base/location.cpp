// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include "location.h"
#include <zen/file_access.h>
#include <zen/http.h>

using namespace zen;
using namespace s3m;


namespace
{
const size_t s3PrefixLen = std::string_view(s3Prefix).size();


bool isValidBucketChar(char c)
{
    return isAsciiAlpha(c) || isDigit(c) || c == '-' || c == '.' || c == '_';
}


S3Path parseS3Location(const std::string& locationPhrase) //throw SysError
{
    const std::string_view fullPath = std::string_view(locationPhrase).substr(s3PrefixLen);

    if (std::any_of(fullPath.begin(), fullPath.end(), [](char c) { return static_cast<unsigned char>(c) < 0x20 || c == 0x7f; }))
        throw SysError("Control characters are not supported.");

    const std::string_view bucket  = beforeFirst(fullPath, '/', IfNotFoundReturn::all);
    const std::string_view keyPath =  afterFirst(fullPath, '/', IfNotFoundReturn::none);

    if (bucket.empty())
        throw SysError("Bucket name is missing.");

    if (!std::all_of(bucket.begin(), bucket.end(), isValidBucketChar))
        throw SysError("Bucket name " + fmtPath(bucket) + " contains unsupported characters.");

    if (contains(keyPath, '?') || contains(keyPath, '#'))
        throw SysError("Query strings and fragments are not supported. Use percent-encoding for '?' and '#'.");

    return {std::string(bucket), uriDecode(keyPath)};
}
}


bool s3m::isRemoteLocation(const Zstring& locationPhrase)
{
    const Zstring path = trimCpy(locationPhrase);
    return path.size() >= s3PrefixLen && equalAsciiNoCase(std::string_view(path).substr(0, s3PrefixLen), s3Prefix);
}


Location s3m::parseLocation(const Zstring& locationPhrase) //throw FileError
{
    const Zstring pathPhrase = trimCpy(locationPhrase);

    if (isRemoteLocation(pathPhrase))
        try
        {
            return parseS3Location(pathPhrase); //throw SysError
        }
        catch (const SysError& e) { throw FileError(replaceCpy("Invalid location %x.", "%x", fmtPath(pathPhrase)), e.toString()); }

    if (pathPhrase.empty())
        throw FileError("Location is missing.");

    Zstring absPath = pathPhrase;
    if (!startsWith(absPath, FILE_NAME_SEPARATOR))
        absPath = appendPath(getCurrentWorkingDirectory(), absPath); //throw FileError

    absPath = normalizePath(absPath);

    bool isFolder = endsWith(pathPhrase, FILE_NAME_SEPARATOR);
    if (!isFolder)
        if (const std::optional<ItemType> type = getItemTypeIfExists(absPath)) //throw FileError
            isFolder = *type == ItemType::folder ||
                       (*type == ItemType::symlink && getFileDetails(absPath).isFolder); //throw FileError

    return LocalPath{absPath, isFolder};
}


std::string s3m::displayS3Path(const std::string& bucket, const std::string& key)
{
    return s3Prefix + bucket + '/' + key;
}


std::string s3m::displayLocation(const Location& loc)
{
    if (const LocalPath* lp = std::get_if<LocalPath>(&loc))
        return lp->rootPath;

    const S3Path& sp = std::get<S3Path>(loc);
    return displayS3Path(sp.bucket, sp.keyPrefix);
}


std::string s3m::joinKey(const std::string& keyPrefix, const std::string& relName)
{
    if (keyPrefix.empty())
        return relName;
    if (endsWith(keyPrefix, '/'))
        return keyPrefix + relName;
    return keyPrefix + '/' + relName;
}


Zstring s3m::getLocalTargetPath(const LocalPath& destRoot, const FileEntry& entry)
{
    if (!destRoot.isFolder && entry.isSingleEntry)
        return destRoot.rootPath;

    return appendPath(destRoot.rootPath, entry.name);
}


std::string s3m::getRemoteTargetKey(const S3Path& destRoot, const FileEntry& entry)
{
    if (!destRoot.keyPrefix.empty() && !endsWith(destRoot.keyPrefix, '/') && entry.isSingleEntry)
        return destRoot.keyPrefix;

    return joinKey(destRoot.keyPrefix, entry.name);
}
