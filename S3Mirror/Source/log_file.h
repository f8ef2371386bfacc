// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef LOG_FILE_H_5610293847561029
#define LOG_FILE_H_5610293847561029

#include <zen/file_error.h>
#include "status_handler.h"


namespace s3m
{
std::string generateLogHeader(const ProcessSummary& summary, const zen::ErrorLog& log);

//summary box followed by all log entries; replaces an existing file
void saveLogFile(const Zstring& filePath, const ProcessSummary& summary, const zen::ErrorLog& log); //throw FileError
}

#endif //LOG_FILE_H_5610293847561029
