// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef TEST_UTILS_H_7712093845610293
#define TEST_UTILS_H_7712093845610293

#include <filesystem>
#include <stdlib.h>
#include <gtest/gtest.h>
#include <zen/file_access.h>
#include <zen/file_io.h>
#include <zen/thread.h>
#include "base/process_callback.h"


namespace s3m::test
{
//fresh folder below the system temp folder, removed recursively at scope exit
class TempFolder
{
public:
    TempFolder()
    {
        std::string pathTmpl = (std::filesystem::temp_directory_path() / "s3mirror_test_XXXXXX").string();
        if (!::mkdtemp(pathTmpl.data()))
            throw std::runtime_error("mkdtemp failed: " + pathTmpl);
        path_ = pathTmpl;
    }

    ~TempFolder()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec); //best effort
    }

    const Zstring& path() const { return path_; }

    Zstring operator/(const Zstring& relPath) const { return zen::appendPath(path_, relPath); }

private:
    TempFolder           (const TempFolder&) = delete;
    TempFolder& operator=(const TempFolder&) = delete;

    Zstring path_;
};


inline
void writeFile(const Zstring& filePath, const std::string& content, time_t modTime = 0)
{
    if (const std::optional<Zstring> parentPath = zen::getParentFolderPath(filePath))
        zen::createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    zen::setFileContent(filePath, content); //throw FileError
    if (modTime != 0)
        zen::setFileTime(filePath, modTime); //throw FileError
}


//thread-safe log sink
class LogCollector : public SyncCallback
{
public:
    void logMessage(const std::string& msg, zen::MessageType type) override
    {
        log_.access([&](zen::ErrorLog& log) { zen::logMsg(log, msg, type); });
    }

    zen::ErrorLog getLog() { return log_.access([](const zen::ErrorLog& log) { return log; }); }

    size_t countContaining(const std::string& term)
    {
        return log_.access([&](const zen::ErrorLog& log)
        {
            return std::count_if(log.begin(), log.end(), [&](const zen::LogEntry& entry) { return zen::contains(entry.message, term); });
        });
    }

private:
    zen::Protected<zen::ErrorLog> log_;
};
}

#endif //TEST_UTILS_H_7712093845610293
