// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef MULTI_ERROR_H_7823465827346582
#define MULTI_ERROR_H_7823465827346582

#include <vector>
#include <zen/file_error.h>
#include <zen/thread.h>


namespace s3m
{
//all independent errors of one synchronization run
class MultiError : public zen::FileError
{
public:
    explicit MultiError(const std::vector<std::string>& errors) : FileError(formatErrors(errors)), errors_(errors) {}

    const std::vector<std::string>& getErrors() const { return errors_; }

private:
    static std::string formatErrors(const std::vector<std::string>& errors)
    {
        std::string msg = zen::numberTo<std::string>(errors.size()) + (errors.size() == 1 ? " error occurred:" : " errors occurred:");
        for (const std::string& error : errors)
            msg += "\n\n" + error;
        return msg;
    }

    std::vector<std::string> errors_;
};


//thread-safe
class ErrorCollector
{
public:
    void add(const std::string& msg) { errors_.access([&](std::vector<std::string>& errors) { errors.push_back(msg); }); }

    size_t size() { return errors_.access([](const std::vector<std::string>& errors) { return errors.size(); }); }

    void throwIfErrors() //throw MultiError
    {
        std::vector<std::string> errors = errors_.access([](std::vector<std::string>& errs) { return std::exchange(errs, {}); });
        if (!errors.empty())
            throw MultiError(errors);
    }

private:
    zen::Protected<std::vector<std::string>> errors_;
};
}

#endif //MULTI_ERROR_H_7823465827346582
