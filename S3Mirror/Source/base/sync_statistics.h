// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef SYNC_STATISTICS_H_2384756234875623
#define SYNC_STATISTICS_H_2384756234875623

#include <cstdint>
#include <zen/thread.h>


namespace s3m
{
struct StatisticsSnapshot
{
    int64_t bytesTransferred = 0;
    int64_t filesTransferred = 0;
    int64_t filesDeleted     = 0;
};


//shared by all workers of one synchronization run
class SyncStatistics
{
public:
    void addTransfer(int64_t bytes);
    void addDeletion();

    StatisticsSnapshot getSnapshot();

private:
    zen::Protected<StatisticsSnapshot> stats_;
};
}

#endif //SYNC_STATISTICS_H_2384756234875623
