// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef LOCATION_H_0923847502934875
#define LOCATION_H_0923847502934875

#include <variant>
#include <zen/file_error.h>
#include "file_entry.h"


namespace s3m
{
const Zchar s3Prefix[] = Zstr("s3://");

struct LocalPath
{
    Zstring rootPath; //absolute, normalized
    bool isFolder = false; //existing folder, or trailing separator as written by the user (folder not yet existing)
};

struct S3Path
{
    std::string bucket;
    std::string keyPrefix; //no leading '/', may be empty
};

using Location = std::variant<LocalPath, S3Path>;

/* syntax: s3://<bucket>[/<key-prefix>]  (percent-encoding allowed in key prefix)
           everything else is a local path, relative paths are resolved against the working directory */
Location parseLocation(const Zstring& locationPhrase); //throw FileError

bool isRemoteLocation(const Zstring& locationPhrase); //noexcept

std::string displayLocation(const Location& loc);
std::string displayS3Path(const std::string& bucket, const std::string& key);

//target of an action on the destination side:
//use destination verbatim if it names a single item and the source is single-entry, else join root and relative name
Zstring getLocalTargetPath(const LocalPath& destRoot, const FileEntry& entry);
std::string getRemoteTargetKey(const S3Path& destRoot, const FileEntry& entry);

std::string joinKey(const std::string& keyPrefix, const std::string& relName);
}

#endif //LOCATION_H_0923847502934875
