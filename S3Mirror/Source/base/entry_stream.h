// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef ENTRY_STREAM_H_4387562873465234
#define ENTRY_STREAM_H_4387562873465234

#include <deque>
#include <functional>
#include <optional>
#include <stop_token>
#include <zen/thread.h>


namespace s3m
{
/*  single-pass sequence of items generated asynchronously:
        - producer runs on a worker thread and blocks while "capacity" items are waiting
        - consumer blocks in next() until an item is available or the producer has finished
        - stop request: producer is interrupted at the next emit(), next() reports end of stream  */
template <class T>
class AsyncItemStream
{
public:
    //emit() throws ThreadStopRequest when cancelled: no need to catch!
    using EmitFun  = std::function<void(T&& item)>;
    using Producer = std::function<void(const EmitFun& emit)>;

    AsyncItemStream(Producer producer, size_t capacity, const std::stop_token& stopToken, const Zstring& threadName);

    //context of consumer thread, blocking: no value at end of stream
    std::optional<T> next();

    void requestStop() { producerThread_.requestStop(); }

private:
    AsyncItemStream           (const AsyncItemStream&) = delete;
    AsyncItemStream& operator=(const AsyncItemStream&) = delete;

    struct SharedState
    {
        std::mutex lockQueue;
        std::deque<T> items;
        bool producerDone = false;
        std::condition_variable conditionItemAdded;
        std::condition_variable conditionItemRemoved;
    };

    const std::shared_ptr<SharedState> state_ = std::make_shared<SharedState>();
    zen::InterruptibleThread producerThread_; //declare last: join before "state_" is destroyed
};








//###################### implementation ######################

template <class T> inline
AsyncItemStream<T>::AsyncItemStream(Producer producer, size_t capacity, const std::stop_token& stopToken, const Zstring& threadName)
{
    if (capacity == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + zen::numberTo<std::string>(__LINE__) + "] Contract violation!");

    producerThread_ = zen::InterruptibleThread([state = state_, producer = std::move(producer), capacity, stopToken, threadName]
    {
        zen::setCurrentThreadName(threadName);

        ZEN_ON_SCOPE_EXIT(
        {
            {
                std::lock_guard dummy(state->lockQueue);
                state->producerDone = true;
            }
            state->conditionItemAdded.notify_all();
        });

        producer([&](T&& item) //throw ThreadStopRequest
        {
            {
                std::unique_lock dummy(state->lockQueue);
                zen::interruptibleWait(state->conditionItemRemoved, dummy, [&] //throw ThreadStopRequest
                {
                    return state->items.size() < capacity || stopToken.stop_requested();
                });
                if (stopToken.stop_requested())
                    throw zen::ThreadStopRequest();

                state->items.push_back(std::move(item));
            }
            state->conditionItemAdded.notify_all();
        }); //throw ThreadStopRequest
    });
}


template <class T> inline
std::optional<T> AsyncItemStream<T>::next()
{
    std::optional<T> item;
    {
        std::unique_lock dummy(state_->lockQueue);
        state_->conditionItemAdded.wait(dummy, [&] { return !state_->items.empty() || state_->producerDone; });

        if (state_->items.empty()) //=> producerDone
            return {};

        item = std::move(state_->items.front());
        state_->items.pop_front();
    }
    state_->conditionItemRemoved.notify_all();
    return item;
}
}

#endif //ENTRY_STREAM_H_4387562873465234
