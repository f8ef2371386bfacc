// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef WORKER_POOL_H_2983475029384752
#define WORKER_POOL_H_2983475029384752

#include <deque>
#include <functional>
#include <vector>
#include <zen/thread.h>


namespace s3m
{
/*  fixed number of worker threads draining a shared FIFO:
        - run() blocks until a worker is idle to take the task (queueCapacity == 0) or a queue slot is free => backpressure
        - wait() blocks until all submitted tasks have completed
        - destructor: remaining tasks are still executed, then all workers are joined

    tasks must not throw                                                                                                   */
class WorkerPool
{
public:
    WorkerPool(size_t threadCount, size_t queueCapacity, const Zstring& groupName);
    ~WorkerPool();

    //context of controlling thread, blocking:
    void run(std::function<void()>&& task);

    //context of controlling thread, blocking:
    void wait();

    size_t getThreadCount() const { return worker_.size(); }

private:
    WorkerPool           (const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    struct WorkLoad
    {
        std::mutex lock;
        std::deque<std::function<void()>> tasks; //FIFO
        size_t idleWorkers  = 0;
        size_t tasksPending = 0; //queued + running
        bool closed = false;
        std::condition_variable conditionNewTask;
        std::condition_variable conditionSlotFree;
        std::condition_variable conditionAllDone;
    };

    const size_t queueCapacity_;
    const std::shared_ptr<WorkLoad> workLoad_ = std::make_shared<WorkLoad>();
    std::vector<zen::InterruptibleThread> worker_;
};








//###################### implementation ######################

inline
WorkerPool::WorkerPool(size_t threadCount, size_t queueCapacity, const Zstring& groupName) : queueCapacity_(queueCapacity)
{
    if (threadCount == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + zen::numberTo<std::string>(__LINE__) + "] Contract violation!");

    for (size_t i = 0; i < threadCount; ++i)
    {
        Zstring threadName = groupName + Zstr('[') + zen::numberTo<Zstring>(i + 1) + Zstr('/') + zen::numberTo<Zstring>(threadCount) + Zstr(']');

        worker_.emplace_back([workLoad = workLoad_ /*share ownership!*/, threadName = std::move(threadName)]
        {
            zen::setCurrentThreadName(threadName);
            WorkLoad& wl = *workLoad;

            std::unique_lock dummy(wl.lock);
            for (;;)
            {
                ++wl.idleWorkers;
                wl.conditionSlotFree.notify_all();

                zen::interruptibleWait(wl.conditionNewTask, dummy, [&wl] { return !wl.tasks.empty() || wl.closed; }); //throw ThreadStopRequest
                --wl.idleWorkers;

                if (wl.tasks.empty()) //=> closed and drained
                    return;

                std::function<void()> task = std::move(wl.tasks.front()); //noexcept thanks to move
                /**/                                   wl.tasks.pop_front();  //
                dummy.unlock();
                task();
                dummy.lock();

                if (--wl.tasksPending == 0)
                    wl.conditionAllDone.notify_all();
            }
        });
    }
}


inline
WorkerPool::~WorkerPool()
{
    {
        std::lock_guard dummy(workLoad_->lock);
        workLoad_->closed = true;
    }
    workLoad_->conditionNewTask.notify_all();

    //join before ~InterruptibleThread() gets a chance to interrupt queued work
    for (zen::InterruptibleThread& w : worker_)
        w.join();
}


inline
void WorkerPool::run(std::function<void()>&& task)
{
    {
        std::unique_lock dummy(workLoad_->lock);
        workLoad_->conditionSlotFree.wait(dummy, [&] { return workLoad_->tasks.size() < workLoad_->idleWorkers + queueCapacity_; });

        workLoad_->tasks.push_back(std::move(task));
        ++workLoad_->tasksPending;
    }
    workLoad_->conditionNewTask.notify_one();
}


inline
void WorkerPool::wait()
{
    std::unique_lock dummy(workLoad_->lock);
    workLoad_->conditionAllDone.wait(dummy, [&] { return workLoad_->tasksPending == 0; });
}
}

#endif //WORKER_POOL_H_2983475029384752
