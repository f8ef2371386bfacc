// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include "sync_manager.h"
#include "diff_filter.h"
#include "worker_pool.h"

using namespace zen;
using namespace s3m;


namespace
{
void executeAction(TransferExecutor& exec, const SyncAction& action, SyncDirection direction,
                   const Location& source, const Location& target) //throw FileError
{
    switch (direction)
    {
        case SyncDirection::localToRemote:
            switch (action.op)
            {
                case SyncOperation::update:
                    return exec.upload(action.entry, std::get<LocalPath>(source), std::get<S3Path>(target)); //throw FileError
                case SyncOperation::remove:
                    return exec.deleteRemote(action.entry, std::get<S3Path>(target)); //throw FileError
            }
            break;

        case SyncDirection::remoteToLocal:
            switch (action.op)
            {
                case SyncOperation::update:
                    return exec.download(action.entry, std::get<S3Path>(source), std::get<LocalPath>(target)); //throw FileError
                case SyncOperation::remove:
                    return exec.deleteLocal(action.entry, std::get<LocalPath>(target)); //throw FileError
            }
            break;

        case SyncDirection::remoteToRemote:
            switch (action.op)
            {
                case SyncOperation::update:
                    return exec.copyObjectToObject(action.entry, std::get<S3Path>(source), std::get<S3Path>(target)); //throw FileError
                case SyncOperation::remove:
                    return exec.deleteRemote(action.entry, std::get<S3Path>(target)); //throw FileError
            }
            break;
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}
}


SyncDirection s3m::getSyncDirection(const Location& source, const Location& target) //throw FileError
{
    const bool sourceRemote = std::holds_alternative<S3Path>(source);
    const bool targetRemote = std::holds_alternative<S3Path>(target);

    if (sourceRemote)
        return targetRemote ? SyncDirection::remoteToRemote : SyncDirection::remoteToLocal;
    if (targetRemote)
        return SyncDirection::localToRemote;

    throw FileError("Local to local synchronization is not supported.");
}


SyncManager::SyncManager(ObjectStore& store, MimeSniffer* mimeSniffer, SyncCallback& cb, const SyncConfig& cfg) :
    store_(store), mimeSniffer_(mimeSniffer), cb_(cb), cfg_(cfg)
{
    if (cfg.parallel == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


void SyncManager::synchronize(const Zstring& source, const Zstring& target,
                              const std::vector<std::string>& filterPatterns,
                              const std::stop_token& stopToken) //throw FileError, MultiError
{
    //fatal errors first: nothing has been started yet
    const Location sourceLoc = parseLocation(source); //throw FileError
    const Location targetLoc = parseLocation(target); //
    const SyncDirection direction = getSyncDirection(sourceLoc, targetLoc); //throw FileError
    const NameFilter filter(filterPatterns); //throw FileError

    TransferConfig transferCfg;
    transferCfg.dryRun        = cfg_.dryRun;
    transferCfg.acl           = cfg_.acl;
    transferCfg.contentType   = cfg_.contentType;
    transferCfg.guessMimeType = cfg_.guessMimeType;
    transferCfg.partSize      = cfg_.partSize;

    TransferExecutor exec(store_, mimeSniffer_, stats_, cb_, transferCfg);
    ErrorCollector errors;

    auto reportError = [&](const std::string& msg)
    {
        cb_.logMessage(msg, MSG_TYPE_ERROR);
        errors.add(msg);
    };

    {
        WorkerPool workers(cfg_.parallel, 0 /*queueCapacity: hand-off only*/, Zstr("Sync worker"));

        const std::unique_ptr<EnumStream> sourceFiles = enumerateFiles(store_, sourceLoc, filter, stopToken);
        const std::unique_ptr<EnumStream> targetFiles = enumerateFiles(store_, targetLoc, filter, stopToken);

        diffFileSets(*sourceFiles, *targetFiles, cfg_.deleteExtraneous, stopToken, [&](DiffItem&& item)
        {
            workers.run([&, item = std::move(item)]
            {
                if (const EnumerationError* error = std::get_if<EnumerationError>(&item))
                    return reportError(error->msg);

                if (stopToken.stop_requested()) //don't start new work
                    return;

                try
                {
                    executeAction(exec, std::get<SyncAction>(item), direction, sourceLoc, targetLoc); //throw FileError
                }
                catch (const FileError& e) { reportError(e.toString()); }
            });
        });

        workers.wait();
    }

    if (stopToken.stop_requested())
        reportError("Synchronization was cancelled.");

    errors.throwIfErrors(); //throw MultiError
}
