// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include "file_enum.h"
#include <zen/file_access.h>
#include <zen/file_traverser.h>

using namespace zen;
using namespace s3m;


namespace
{
class LocalTraverser
{
public:
    LocalTraverser(const NameFilter& filter, const std::stop_token& stopToken, const EnumStream::EmitFun& emit) :
        filter_(filter), stopToken_(stopToken), emit_(emit) {}

    void traverse(const Zstring& dirPath, const Zstring& relPath) //throw FileError, ThreadStopRequest
    {
        if (stopToken_.stop_requested()) //don't start reading another folder
            throw ThreadStopRequest();

        std::vector<std::pair<Zstring /*folder path*/, Zstring /*rel path*/>> subFolders;

        traverseFolder(dirPath, [&](const FileInfo& fi) //throw FileError
        {
            onFile(appendRelPath(relPath, fi.itemName), fi.fullPath, fi.fileSize, fi.modTime);
        },
        [&](const FolderInfo& fi)
        {
            subFolders.emplace_back(fi.fullPath, appendRelPath(relPath, fi.itemName));
        },
        [&](const SymlinkInfo& si)
        {
            const FileDetails details = getFileDetails(si.fullPath); //throw FileError
            if (!details.isFolder) //don't follow symlinks to folders
                onFile(appendRelPath(relPath, si.itemName), si.fullPath, details.fileSize, details.modTime);
        }); //throw FileError

        interruptionPoint(); //throw ThreadStopRequest

        for (const auto& [folderPath, folderRelPath] : subFolders)
            traverse(folderPath, folderRelPath); //throw FileError, ThreadStopRequest
    }

private:
    static Zstring appendRelPath(const Zstring& relPath, const Zstring& itemName)
    {
        return relPath.empty() ? itemName : relPath + FILE_NAME_SEPARATOR + itemName;
    }

    void onFile(const Zstring& relPath, const Zstring& filePath, uint64_t fileSize, time_t modTime) //throw ThreadStopRequest
    {
        if (filter_.passFileFilter(relPath))
            emit_(FileEntry{relPath, filePath, fileSize, modTime, false /*isSingleEntry*/, false /*existsInSource*/}); //throw ThreadStopRequest
    }

    const NameFilter& filter_;
    const std::stop_token& stopToken_;
    const EnumStream::EmitFun& emit_;
};


Zstring stripTrailingSeparators(Zstring keyPrefix)
{
    while (endsWith(keyPrefix, '/'))
        keyPrefix.pop_back();
    return keyPrefix;
}
}


void s3m::traverseLocalFiles(const LocalPath& root, const NameFilter& filter, const std::stop_token& stopToken,
                             const EnumStream::EmitFun& emit) //throw ThreadStopRequest
{
    try
    {
        const std::optional<ItemType> type = getItemTypeIfExists(root.rootPath); //throw FileError
        if (!type)
            return; //nothing to enumerate => not an error

        const bool isFolder = *type == ItemType::folder ||
                              (*type == ItemType::symlink && getFileDetails(root.rootPath).isFolder); //throw FileError
        if (!isFolder)
        {
            const FileDetails details = getFileDetails(root.rootPath); //throw FileError
            const Zstring itemName = getItemName(root.rootPath);

            if (filter.passFileFilter(itemName))
                emit(FileEntry{itemName, root.rootPath, details.fileSize, details.modTime, true /*isSingleEntry*/, false /*existsInSource*/}); //throw ThreadStopRequest
            return;
        }

        LocalTraverser(filter, stopToken, emit).traverse(root.rootPath, Zstring()); //throw FileError, ThreadStopRequest
    }
    catch (const FileError& e) { emit(EnumerationError{e.toString()}); } //throw ThreadStopRequest
}


void s3m::traverseRemoteFiles(ObjectStore& store, const S3Path& root, const NameFilter& filter, const std::stop_token& stopToken,
                              const EnumStream::EmitFun& emit) //throw ThreadStopRequest
{
    const std::string rootKey = stripTrailingSeparators(root.keyPrefix);

    std::optional<std::string> continuationToken;
    do
    {
        //a page may be filtered out completely: emit() alone won't notice the stop request
        if (stopToken.stop_requested())
            throw ThreadStopRequest();

        ObjectListing listing;
        try
        {
            listing = store.listObjects(root.bucket, root.keyPrefix, continuationToken); //throw SysError
        }
        catch (const SysError& e)
        {
            emit(EnumerationError{FileError(replaceCpy("Cannot read directory %x.", "%x", fmtPath(displayS3Path(root.bucket, root.keyPrefix))),
                                            e.toString()).toString()}); //throw ThreadStopRequest
            return;
        }

        for (const ObjectInfo& obj : listing.objects)
        {
            if (endsWith(obj.key, '/')) //folder marker object
                continue;

            if (obj.key == rootKey)
            {
                const std::string itemName = getItemName(obj.key);
                if (filter.passFileFilter(itemName))
                    emit(FileEntry{itemName, obj.key, obj.size, obj.lastModified, true /*isSingleEntry*/, false /*existsInSource*/}); //throw ThreadStopRequest
                continue;
            }

            std::string relPath;
            if (rootKey.empty())
                relPath = obj.key;
            else if (startsWith(obj.key, rootKey + '/'))
                relPath = obj.key.substr(rootKey.size() + 1);
            else
                continue; //beside, not below the prefix

            if (filter.passFileFilter(relPath))
                emit(FileEntry{relPath, obj.key, obj.size, obj.lastModified, false /*isSingleEntry*/, false /*existsInSource*/}); //throw ThreadStopRequest
        }

        continuationToken = std::move(listing.continuationToken);
    }
    while (continuationToken);
}


std::unique_ptr<EnumStream> s3m::enumerateLocalFiles(const LocalPath& root, const NameFilter& filter, const std::stop_token& stopToken)
{
    return std::make_unique<EnumStream>([root, filter, stopToken](const EnumStream::EmitFun& emit)
    {
        traverseLocalFiles(root, filter, stopToken, emit); //throw ThreadStopRequest
    }, ENUM_QUEUE_CAPACITY, stopToken, Zstr("Enum local"));
}


std::unique_ptr<EnumStream> s3m::enumerateRemoteFiles(ObjectStore& store, const S3Path& root, const NameFilter& filter, const std::stop_token& stopToken)
{
    return std::make_unique<EnumStream>([&store, root, filter, stopToken](const EnumStream::EmitFun& emit)
    {
        traverseRemoteFiles(store, root, filter, stopToken, emit); //throw ThreadStopRequest
    }, ENUM_QUEUE_CAPACITY, stopToken, Zstr("Enum remote"));
}


std::unique_ptr<EnumStream> s3m::enumerateFiles(ObjectStore& store, const Location& root, const NameFilter& filter, const std::stop_token& stopToken)
{
    if (const LocalPath* lp = std::get_if<LocalPath>(&root))
        return enumerateLocalFiles(*lp, filter, stopToken);

    return enumerateRemoteFiles(store, std::get<S3Path>(root), filter, stopToken);
}
