// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef TRANSFER_H_8347562983475629
#define TRANSFER_H_8347562983475629

#include <optional>
#include "location.h"
#include "process_callback.h"
#include "sync_statistics.h"
#include "../afs/object_store.h"
#include "../afs/mime.h"


namespace s3m
{
struct TransferConfig
{
    bool dryRun = false;
    std::string acl;                        //optional
    std::optional<std::string> contentType; //overrides MIME detection
    bool guessMimeType = true;
    uint64_t partSize = 0;                  //0: object store default
};


/*  perform a single action:
        - log before doing anything
        - dry run: log only
        - statistics are updated on success only        */
class TransferExecutor
{
public:
    TransferExecutor(ObjectStore& store,
                     MimeSniffer* mimeSniffer, //optional
                     SyncStatistics& stats,
                     SyncCallback& cb,
                     const TransferConfig& cfg) :
        store_(store), mimeSniffer_(mimeSniffer), stats_(stats), cb_(cb), cfg_(cfg) {}

    void copyObjectToObject(const FileEntry& file, const S3Path& sourceRoot, const S3Path& targetRoot); //throw FileError
    void download          (const FileEntry& file, const S3Path& sourceRoot, const LocalPath& targetRoot); //throw FileError
    void upload            (const FileEntry& file, const LocalPath& sourceRoot, const S3Path& targetRoot); //throw FileError

    void deleteLocal (const FileEntry& file, const LocalPath& targetRoot); //throw FileError
    void deleteRemote(const FileEntry& file, const S3Path&    targetRoot); //throw FileError

private:
    void logAction(const std::string& msg);

    std::string getContentType(const Zstring& filePath); //throw SysError

    ObjectStore& store_;
    MimeSniffer* const mimeSniffer_;
    SyncStatistics& stats_;
    SyncCallback& cb_;
    const TransferConfig cfg_;
};
}

#endif //TRANSFER_H_8347562983475629
