// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include "log_file.h"
#include <zen/file_access.h>
#include <zen/file_io.h>
#include <zen/file_path.h>
#include <zen/format_unit.h>

using namespace zen;
using namespace s3m;


std::string s3m::generateLogHeader(const ProcessSummary& s, const ErrorLog& log)
{
    //assemble summary box
    std::vector<std::string> summary;

    const std::string tabSpace(4, ' ');

    const time_t startTime = std::chrono::system_clock::to_time_t(s.startTime);
    summary.push_back(formatTime(formatIsoDateTimeTag, getLocalTime(startTime)) + "  " + s.sourcePath + " -> " + s.targetPath);
    summary.push_back("");
    summary.push_back(tabSpace + getFinalStatusLabel(s.resultStatus));

    const ErrorLogStats logCount = getStats(log);

    if (logCount.error   > 0) summary.push_back(tabSpace + "Errors: "   + formatNumber(logCount.error));
    if (logCount.warning > 0) summary.push_back(tabSpace + "Warnings: " + formatNumber(logCount.warning));

    summary.push_back(tabSpace + "Files transferred: " + formatNumber(s.stats.filesTransferred) +
                      " (" + formatFilesizeShort(s.stats.bytesTransferred) + ')'); //show always, even if 0!
    summary.push_back(tabSpace + "Files deleted: " + formatNumber(s.stats.filesDeleted));

    const int64_t totalTimeSec = std::chrono::duration_cast<std::chrono::seconds>(s.totalTime).count();
    summary.push_back(tabSpace + "Total time: " + formatTimeSpan(totalTimeSec));

    size_t sepLineLen = 0;
    for (const std::string& str : summary) sepLineLen = std::max(sepLineLen, str.size());

    std::string output(sepLineLen + 1, '_');
    output += '\n';

    for (const std::string& str : summary) { output += '|'; output += str; output += '\n'; }

    output += '|';
    output.append(sepLineLen, '_');
    output += '\n';

    return output;
}


void s3m::saveLogFile(const Zstring& filePath, const ProcessSummary& summary, const ErrorLog& log) //throw FileError
{
    std::string buffer = generateLogHeader(summary, log);
    buffer += '\n';

    for (const LogEntry& entry : log)
    {
        buffer += formatMessage(entry);
        buffer += '\n';
    }

    if (const std::optional<Zstring> parentPath = getParentFolderPath(filePath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    setFileContent(filePath, buffer); //throw FileError
}
