// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include "diff_filter.h"
#include <unordered_map>

using namespace zen;
using namespace s3m;


bool s3m::needsUpdate(const FileEntry& source, const FileEntry& target)
{
    return source.fileSize != target.fileSize ||
           source.modTime > target.modTime; //equal time: no update
}


void s3m::diffFileSets(EnumStream& source, EnumStream& target, bool deleteExtraneous, const std::stop_token& stopToken,
                       const std::function<void(DiffItem&& item)>& onItem) //throw X
{
    std::unordered_map<Zstring, FileEntry> targetFiles;
    std::optional<FileEntry> targetSingleFile; //destination root names a file

    while (std::optional<EnumItem> item = target.next())
    {
        if (EnumerationError* error = std::get_if<EnumerationError>(&*item))
        {
            //target set must be complete, or we can't tell what needs to be updated or deleted
            source.requestStop();
            onItem(std::move(*error)); //throw X
            return;
        }
        FileEntry& fe = std::get<FileEntry>(*item);
        if (fe.isSingleEntry)
            targetSingleFile = std::move(fe);
        else
            targetFiles.insert_or_assign(fe.name, std::move(fe)); //duplicate name: last one wins
    }
    if (stopToken.stop_requested())
        return;

    while (std::optional<EnumItem> item = source.next())
    {
        if (stopToken.stop_requested())
            return;

        if (EnumerationError* error = std::get_if<EnumerationError>(&*item))
        {
            onItem(std::move(*error)); //throw X
            continue;
        }
        FileEntry& sourceFile = std::get<FileEntry>(*item);

        FileEntry* targetFile = nullptr;
        if (sourceFile.isSingleEntry && targetSingleFile)
            targetFile = &*targetSingleFile; //file to file: names may differ, the update is written there verbatim
        else
        {
            if (sourceFile.isSingleEntry && !targetFiles.empty())
                sourceFile.isSingleEntry = false; //destination root is a folder: write below it, not in its place

            if (auto it = targetFiles.find(sourceFile.name); it != targetFiles.end())
                targetFile = &it->second;
        }

        if (targetFile)
            targetFile->existsInSource = true; //mark even if updated: never delete what is being updated

        if (!targetFile || needsUpdate(sourceFile, *targetFile))
            onItem(SyncAction{std::move(sourceFile), SyncOperation::update}); //throw X
    }
    //stopped source enumeration looks like regular end of stream: don't delete based on a partial source set!
    if (stopToken.stop_requested())
        return;

    if (deleteExtraneous)
    {
        if (targetSingleFile && !targetSingleFile->existsInSource)
            onItem(SyncAction{*targetSingleFile, SyncOperation::remove}); //throw X

        for (auto& [name, targetFile] : targetFiles)
            if (!targetFile.existsInSource)
            {
                if (stopToken.stop_requested())
                    return;
                onItem(SyncAction{targetFile, SyncOperation::remove}); //throw X
            }
    }
}
