// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef FILE_ENUM_H_9823475629834756
#define FILE_ENUM_H_9823475629834756

#include <memory>
#include "entry_stream.h"
#include "location.h"
#include "path_filter.h"
#include "../afs/object_store.h"


namespace s3m
{
using EnumStream = AsyncItemStream<EnumItem>;

const size_t ENUM_QUEUE_CAPACITY = 1000;

/*  local enumeration:
        - root not existing: empty sequence
        - root is a file:    single entry named after the file
        - root is a folder:  recursive, names relative to root; symlinks to files are followed, symlinks to folders are skipped
        - first error ends the traversal
        - stop request: checked before each folder                                                                        */
void traverseLocalFiles(const LocalPath& root, const NameFilter& filter, const std::stop_token& stopToken,
                        const EnumStream::EmitFun& emit); //throw ThreadStopRequest

/*  remote enumeration:
        - paginated listing, folder marker objects ("key/") are skipped
        - key equal to prefix: single entry named after the key's last component
        - keys not located below the prefix (prefix "di" vs key "dir/a") are skipped
        - first error ends the listing
        - stop request: checked before each page                                   */
void traverseRemoteFiles(ObjectStore& store, const S3Path& root, const NameFilter& filter, const std::stop_token& stopToken,
                         const EnumStream::EmitFun& emit); //throw ThreadStopRequest

//asynchronous variants: run on a separate thread
std::unique_ptr<EnumStream> enumerateLocalFiles(const LocalPath& root, const NameFilter& filter, const std::stop_token& stopToken);

//"store" must outlive the returned stream
std::unique_ptr<EnumStream> enumerateRemoteFiles(ObjectStore& store, const S3Path& root, const NameFilter& filter, const std::stop_token& stopToken);

std::unique_ptr<EnumStream> enumerateFiles(ObjectStore& store, const Location& root, const NameFilter& filter, const std::stop_token& stopToken);
}

#endif //FILE_ENUM_H_9823475629834756
