// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include <clocale>
#include <signal.h>
#include <iostream>
#include <zen/extra_log.h>
#include <zen/scope_guard.h>
#include "config.h"
#include "log_file.h"
#include "afs/mime.h"

using namespace zen;
using namespace s3m;


namespace
{
S3mReturnCode runMirror(const std::vector<Zstring>& commandArgs, const sigset_t& stopSignals) //throw FileError, SysError
{
    const CommandLine cmdLine = parseCommandLine(commandArgs); //throw FileError
    if (cmdLine.showHelp)
    {
        std::cout << getSyntaxHelp();
        return S3M_RC_SUCCESS;
    }
    const MirrorConfig& cfg = cmdLine.cfg;

    S3Login login = cfg.login;
    if (isRemoteLocation(cmdLine.sourcePath) || isRemoteLocation(cmdLine.targetPath))
        login.credentials = getCredentialsFromEnvironment(); //throw SysError

    s3Init();
    ZEN_ON_SCOPE_EXIT(s3Teardown());

    S3Client objectStore(login);
    ConsoleStatusHandler statusHandler(std::cout);

    std::unique_ptr<MimeSniffer> mimeSniffer;
    if (cfg.syncCfg.guessMimeType && !cfg.syncCfg.contentType)
        try
        {
            mimeSniffer = std::make_unique<LibMagicSniffer>(); //throw SysError
        }
        catch (const SysError& e)
        {
            statusHandler.logMessage("Content type detection is not available.\n\n" + e.toString(), MSG_TYPE_WARNING);
        }

    //stop gracefully: active transfers finish, no new ones are started
    std::stop_source stopSource;
    InterruptibleThread signalWatcher([&]
    {
        setCurrentThreadName(Zstr("Signal watcher"));
        for (;;)
        {
            interruptionPoint(); //throw ThreadStopRequest

            const timespec timeout{0, 100'000'000};
            if (const int sigNo = ::sigtimedwait(&stopSignals, nullptr, &timeout);
                sigNo == SIGINT || sigNo == SIGTERM)
                if (stopSource.request_stop())
                    statusHandler.logMessage("Stop requested: waiting for active transfers to finish...", MSG_TYPE_WARNING);
        }
    });

    ProcessSummary summary;
    summary.startTime  = std::chrono::system_clock::now();
    summary.sourcePath = cmdLine.sourcePath;
    summary.targetPath = cmdLine.targetPath;
    const auto startTime = std::chrono::steady_clock::now();

    SyncManager syncMgr(objectStore, mimeSniffer.get(), statusHandler, cfg.syncCfg);

    statusHandler.logMessage("Synchronizing " + fmtPath(cmdLine.sourcePath) + " -> " + fmtPath(cmdLine.targetPath) +
                             (cfg.syncCfg.dryRun ? " [dry run]" : ""), MSG_TYPE_INFO);
    try
    {
        syncMgr.synchronize(cmdLine.sourcePath, cmdLine.targetPath, cfg.filterPatterns, stopSource.get_token()); //throw FileError, MultiError
        summary.resultStatus = SyncResult::finishedSuccess;
    }
    catch (const MultiError&) //individual errors have been logged already
    {
        summary.resultStatus = stopSource.stop_requested() ? SyncResult::aborted : SyncResult::finishedError;
    }

    summary.stats     = syncMgr.getStatistics();
    summary.totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);

    std::cout << '\n' << formatSummary(summary);

    S3mReturnCode rc = mapToReturnCode(summary.resultStatus);

    if (!cfg.logFilePath.empty())
        try
        {
            saveLogFile(cfg.logFilePath, summary, statusHandler.getLog()); //throw FileError
        }
        catch (const FileError& e)
        {
            std::cerr << e.toString() << '\n';
            raiseReturnCode(rc, S3M_RC_ERROR);
        }

    return rc;
}
}


int main(int argc, char* argv[])
{
    std::setlocale(LC_ALL, ""); //thousands separator

    //handle stop signals synchronously: block them before starting any thread (signal mask is inherited)
    sigset_t stopSignals;
    ::sigemptyset(&stopSignals);
    ::sigaddset(&stopSignals, SIGINT);
    ::sigaddset(&stopSignals, SIGTERM);

    if (const int rv = ::pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);
        rv != 0)
    {
        std::cerr << formatSystemError("pthread_sigmask", rv) << '\n';
        return S3M_RC_EXCEPTION;
    }

    S3mReturnCode rc = S3M_RC_SUCCESS;
    {
        ZEN_ON_SCOPE_EXIT(flushExtraLog(std::cerr));

        const std::vector<Zstring> commandArgs(argv + 1, argv + argc);
        try
        {
            rc = runMirror(commandArgs, stopSignals); //throw FileError, SysError
        }
        catch (const FileError& e)
        {
            std::cerr << e.toString() << '\n';
            rc = S3M_RC_EXCEPTION;
        }
        catch (const SysError& e)
        {
            std::cerr << e.toString() << '\n';
            rc = S3M_RC_EXCEPTION;
        }
        catch (const std::exception& e)
        {
            std::cerr << e.what() << '\n';
            rc = S3M_RC_EXCEPTION;
        }
    }
    return rc;
}
