// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef PROCESS_CALLBACK_H_5019283746501928
#define PROCESS_CALLBACK_H_5019283746501928

#include <string>
#include <zen/error_log.h>


namespace s3m
{
//interface for synchronization status updates (used by console front end and tests)
struct SyncCallback
{
    virtual ~SyncCallback() {}

    //context of worker threads: implementation must be thread-safe!
    virtual void logMessage(const std::string& msg, zen::MessageType type) = 0; //noexcept
};
}

#endif //PROCESS_CALLBACK_H_5019283746501928
