// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef GLOBALS_H_3391820475610293
#define GLOBALS_H_3391820475610293

#include <atomic>
#include <memory>
#include <utility>
#include "scope_guard.h"


namespace zen
{
/*  Solve static destruction order fiasco by providing shared ownership and serialized access to global variables
    => e.g. a detached worker thread logging an error while the process shuts down
    => use trivially-destructible POD only!                                            */
class PodSpinMutex
{
public:
    bool tryLock() { return !flag_.test_and_set(std::memory_order_acquire); }

    void lock()
    {
        while (!tryLock())
            flag_.wait(true, std::memory_order_relaxed);
    }

    void unlock()
    {
        flag_.clear(std::memory_order_release);
        flag_.notify_one();
    }

private:
    std::atomic_flag flag_{}; //C++20: static storage duration => static initialization to "clear"
};


template <class T>
class Global //don't use for function-scope statics!
{
public:
    consteval Global() {}; //demand static zero-initialization!

    ~Global()
    {
        static_assert(std::is_trivially_destructible_v<Pod>, "this memory needs to live forever");

        pod_.spinLock.lock();
        std::shared_ptr<T>* oldInst = std::exchange(pod_.inst, nullptr);
        pod_.destroyed = true;
        pod_.spinLock.unlock();

        delete oldInst;
    }

    std::shared_ptr<T> get() //=> instance life time is shared with caller
    {
        pod_.spinLock.lock();
        ZEN_ON_SCOPE_EXIT(pod_.spinLock.unlock());

        if (pod_.inst)
            return *pod_.inst;
        return nullptr;
    }

    void set(std::unique_ptr<T>&& newInst)
    {
        std::shared_ptr<T>* tmpInst = nullptr;
        if (newInst)
            tmpInst = new std::shared_ptr<T>(std::move(newInst));
        {
            pod_.spinLock.lock();
            ZEN_ON_SCOPE_EXIT(pod_.spinLock.unlock());

            if (!pod_.destroyed)
                std::swap(pod_.inst, tmpInst);
            else
                assert(false);

            pod_.initialized = true;
        }
        delete tmpInst;
    }

    //for lazy initialization from functions possibly running on parallel threads
    template <class Function>
    void setOnce(Function getInitialValue /*-> std::unique_ptr<T>*/)
    {
        pod_.spinLock.lock();
        ZEN_ON_SCOPE_EXIT(pod_.spinLock.unlock());

        if (!pod_.initialized)
        {
            if (!pod_.destroyed)
            {
                if (std::unique_ptr<T> newInst = getInitialValue())
                    pod_.inst = new std::shared_ptr<T>(std::move(newInst));
            }
            else
                assert(false);

            pod_.initialized = true;
        }
    }

private:
    struct Pod
    {
        PodSpinMutex spinLock; //can't use std::mutex: has non-trival destructor
        std::shared_ptr<T>* inst = nullptr;
        bool initialized = false;
        bool destroyed = false;
    } pod_;
};
}

#endif //GLOBALS_H_3391820475610293
