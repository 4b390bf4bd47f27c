// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef ASYNC_TRANSIT_H_8831602279451063
#define ASYNC_TRANSIT_H_8831602279451063

#include <condition_variable>
#include <zen/thread.h>
#include "transit.h"


namespace tfs
{
class AsyncTransitCallback //actor pattern
{
public:
    AsyncTransitCallback() {}

    //blocking call: context of worker thread
    TransitProgressResponse reportProgress(const TransitProgress& progress)
    {
        std::unique_lock dummy(lockRequest_);
        conditionReadyForNewRequest_.wait(dummy, [this] { return (!progressRequest_ && !progressResponse_) || cancelled_; });
        if (cancelled_)
            return TransitProgressResponse::abort;

        progressRequest_ = progress;
        conditionNewRequest_.notify_all();

        conditionHaveResponse_.wait(dummy, [this] { return static_cast<bool>(progressResponse_) || cancelled_; });
        if (cancelled_)
            return TransitProgressResponse::abort;

        const TransitProgressResponse rv = *progressResponse_;

        progressRequest_  = std::nullopt;
        progressResponse_ = std::nullopt;

        dummy.unlock(); //optimization for condition_variable::notify_all()
        conditionReadyForNewRequest_.notify_all();
        return rv;
    }

    //context of worker thread
    void notifyAllDone() //noexcept
    {
        {
            std::lock_guard dummy(lockRequest_);
            finishNowRequest_ = true;
        }
        conditionNewRequest_.notify_all();
    }

    //context of calling thread: handler exception => worker gets "abort" for all further requests
    void cancel() //noexcept
    {
        {
            std::lock_guard dummy(lockRequest_);
            cancelled_ = true;
        }
        conditionReadyForNewRequest_.notify_all();
        conditionHaveResponse_.notify_all();
    }

    //context of calling thread
    void waitUntilDone(const TransitProgressHandler& onProgress) //throw X
    {
        for (std::unique_lock dummy(lockRequest_);;)
        {
            conditionNewRequest_.wait(dummy, [this] { return (progressRequest_ && !progressResponse_) || finishNowRequest_; });

            if (progressRequest_ && !progressResponse_)
            {
                const TransitProgress progress = *progressRequest_;

                dummy.unlock(); //call back outside of mutex scope:
                const TransitProgressResponse response = onProgress(progress); //throw X
                dummy.lock();

                progressResponse_ = response;
                conditionHaveResponse_.notify_all();
            }
            else if (finishNowRequest_)
                return;
        }
    }

private:
    AsyncTransitCallback           (const AsyncTransitCallback&) = delete;
    AsyncTransitCallback& operator=(const AsyncTransitCallback&) = delete;

    std::mutex lockRequest_;
    std::condition_variable conditionReadyForNewRequest_;
    std::condition_variable conditionNewRequest_;
    std::condition_variable conditionHaveResponse_;
    std::optional<TransitProgress>         progressRequest_;
    std::optional<TransitProgressResponse> progressResponse_;
    bool finishNowRequest_ = false;
    bool cancelled_ = false;
};


/*  run a progress-tracked transit on a worker thread: only the traversal job waits for the handler's decision,
    while "onProgress" runs on the calling thread

    Example:
        runTransitAsync([&](const TransitProgressHandler& onProgressAsync)
        {
            copyFilesWithProgress(device, itemPaths, targetFolder, onProgressAsync);
        }, onProgress);                                                                                 */
template <class Function> inline
void runTransitAsync(Function runTransit /*throw FileError*/, const TransitProgressHandler& onProgress /*throw X*/) //throw FileError, X
{
    AsyncTransitCallback acb;

    std::future<void> ft = zen::runAsync([&acb, runTransit = std::move(runTransit)]
    {
        ZEN_ON_SCOPE_EXIT(acb.notifyAllDone());
        runTransit([&acb](const TransitProgress& progress) { return acb.reportProgress(progress); }); //throw FileError
    });
    {
        ZEN_ON_SCOPE_FAIL(acb.cancel(); ft.wait()); //worker references "acb"
        acb.waitUntilDone(onProgress); //throw X
    }
    ft.get(); //throw FileError
}
}

#endif //ASYNC_TRANSIT_H_8831602279451063
