// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef FILE_ENTRY_H_3874562837456283476
#define FILE_ENTRY_H_3874562837456283476

#include <variant>
#include <zen/zstring.h>


namespace s3m
{
//one file below a synchronization root, local or remote
struct FileEntry
{
    Zstring name;     //relative to root, '/'-separated: identity for comparison
    Zstring fullPath; //absolute file path or full object key: used for execution
    uint64_t fileSize = 0;
    time_t modTime = 0; //UTC, seconds since epoch
    bool isSingleEntry = false; //root denotes exactly this file
    bool existsInSource = false; //destination entry was matched by name
};


struct EnumerationError
{
    std::string msg;
};

using EnumItem = std::variant<FileEntry, EnumerationError>;


enum class SyncOperation
{
    update,
    remove,
};

struct SyncAction
{
    FileEntry entry;
    SyncOperation op = SyncOperation::update;
};

using DiffItem = std::variant<SyncAction, EnumerationError>;


inline
std::string getOperationLabel(SyncOperation op)
{
    switch (op)
    {
        case SyncOperation::update:
            return "update";
        case SyncOperation::remove:
            return "delete";
    }
    assert(false);
    return std::string();
}
}

#endif //FILE_ENTRY_H_3874562837456283476
