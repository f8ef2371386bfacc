// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include "status_handler.h"
#include <ostream>
#include <zen/format_unit.h>

using namespace zen;
using namespace s3m;


void ConsoleStatusHandler::logMessage(const std::string& msg, MessageType type)
{
    log_.access([&](ErrorLog& log)
    {
        logMsg(log, msg, type);
        os_ << formatMessage(log.back()) << std::flush;
    });
}


std::string s3m::formatSummary(const ProcessSummary& summary)
{
    const int64_t totalTimeSec = std::chrono::duration_cast<std::chrono::seconds>(summary.totalTime).count();

    return getFinalStatusLabel(summary.resultStatus) + '\n' +
           "Files transferred: " + formatNumber(summary.stats.filesTransferred) +
           " (" + formatFilesizeShort(summary.stats.bytesTransferred) + ")\n" +
           "Files deleted: " + formatNumber(summary.stats.filesDeleted) + '\n' +
           "Total time: " + formatTimeSpan(totalTimeSec) + '\n';
}
