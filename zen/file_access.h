// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ACCESS_H_8017341345614857
#define FILE_ACCESS_H_8017341345614857

#include "file_path.h"
#include "file_error.h"
#include <sys/stat.h>


namespace zen
{
enum class ItemType
{
    file,
    folder,
    symlink,
};
//does not distinguish between error/not existing
ItemType getItemType(const Zstring& itemPath); //throw FileError
//distinguish error/not existing: no value if item (or one of its parents) is missing
std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath); //throw FileError

inline bool itemExists(const Zstring& itemPath) { return static_cast<bool>(getItemTypeIfExists(itemPath)); } //throw FileError

//symlink handling: follow
struct FileDetails
{
    uint64_t fileSize = 0;
    time_t modTime = 0; //UTC, rounded down to full seconds
    bool isFolder = false;
};
FileDetails getFileDetails(const Zstring& itemPath); //throw FileError

//symlink handling: follow
void setFileTime(const Zstring& filePath, time_t modTime); //throw FileError

//symlink handling: follow
uint64_t getFileSize(const Zstring& filePath); //throw FileError

Zstring getCurrentWorkingDirectory(); //throw FileError

void removeFilePlain(const Zstring& filePath); //throw FileError; ERROR if not existing

void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting); //throw FileError, ErrorTargetExisting

void createDirectory(const Zstring& dirPath); //throw FileError, ErrorTargetExisting

//creates directories recursively if not existing
void createDirectoryIfMissingRecursion(const Zstring& dirPath); //throw FileError
}

#endif //FILE_ACCESS_H_8017341345614857
