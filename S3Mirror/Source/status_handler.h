// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef STATUS_HANDLER_H_2093847561029384
#define STATUS_HANDLER_H_2093847561029384

#include <chrono>
#include <iosfwd>
#include <zen/thread.h>
#include "base/process_callback.h"
#include "base/return_codes.h"
#include "base/sync_statistics.h"


namespace s3m
{
struct ProcessSummary
{
    std::chrono::system_clock::time_point startTime;
    SyncResult resultStatus = SyncResult::aborted;
    std::string sourcePath;
    std::string targetPath;
    StatisticsSnapshot stats;
    std::chrono::milliseconds totalTime{};
};


//print log entries as they arrive and keep the complete log
class ConsoleStatusHandler : public SyncCallback
{
public:
    explicit ConsoleStatusHandler(std::ostream& os) : os_(os) {}

    void logMessage(const std::string& msg, zen::MessageType type) override; //thread-safe

    zen::ErrorLog getLog() { return log_.access([](const zen::ErrorLog& log) { return log; }); }

private:
    ConsoleStatusHandler           (const ConsoleStatusHandler&) = delete;
    ConsoleStatusHandler& operator=(const ConsoleStatusHandler&) = delete;

    std::ostream& os_;
    zen::Protected<zen::ErrorLog> log_; //also serializes output to os_
};


std::string formatSummary(const ProcessSummary& summary); //console output at the end of a run
}

#endif //STATUS_HANDLER_H_2093847561029384
