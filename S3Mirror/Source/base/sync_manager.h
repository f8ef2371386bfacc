// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef SYNC_MANAGER_H_0394857203948572
#define SYNC_MANAGER_H_0394857203948572

#include <stop_token>
#include "multi_error.h"
#include "transfer.h"


namespace s3m
{
const size_t DEFAULT_PARALLEL = 16;

struct SyncConfig
{
    size_t parallel = DEFAULT_PARALLEL;
    bool deleteExtraneous = false;
    bool dryRun = false;
    std::string acl;                        //optional
    std::optional<std::string> contentType; //optional
    bool guessMimeType = true;
    uint64_t partSize = 0;                  //passed to the object store, 0: default
};


enum class SyncDirection
{
    localToRemote,
    remoteToLocal,
    remoteToRemote,
};

SyncDirection getSyncDirection(const Location& source, const Location& target); //throw FileError


class SyncManager
{
public:
    SyncManager(ObjectStore& store, MimeSniffer* mimeSniffer /*optional*/, SyncCallback& cb, const SyncConfig& cfg);

    /*  fatal errors (invalid location, invalid filter, local to local): FileError before any work starts
        all other errors are collected and thrown at the end: MultiError
        stop request: enumeration and diffing stop, queued actions are skipped, MultiError with "cancelled" entry   */
    void synchronize(const Zstring& source, const Zstring& target,
                     const std::vector<std::string>& filterPatterns, //optional
                     const std::stop_token& stopToken); //throw FileError, MultiError

    StatisticsSnapshot getStatistics() { return stats_.getSnapshot(); }

private:
    SyncManager           (const SyncManager&) = delete;
    SyncManager& operator=(const SyncManager&) = delete;

    ObjectStore& store_;
    MimeSniffer* const mimeSniffer_;
    SyncCallback& cb_;
    const SyncConfig cfg_;
    SyncStatistics stats_;
};
}

#endif //SYNC_MANAGER_H_0394857203948572
