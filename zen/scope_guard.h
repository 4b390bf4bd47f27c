// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_5518209374162038
#define SCOPE_GUARD_H_5518209374162038

#include <cassert>
#include <exception>
#include <type_traits>
#include <utility>


namespace zen
{
/*  Scope Guard

        auto guardDir = zen::makeGuard<ScopeGuardRunMode::onFail>([&] { ::rmdir(dirPath.c_str()); });
            ...
        guardDir.dismiss();

    Scope Exit:
        ZEN_ON_SCOPE_EXIT   (cleanUp());
        ZEN_ON_SCOPE_FAIL   (undoTemporaryWork());                */

enum class ScopeGuardRunMode
{
    onExit,
    onFail
};


template <ScopeGuardRunMode runMode, typename F>
class ScopeGuard
{
public:
    explicit ScopeGuard(const F&  fun) : fun_(fun) {}
    explicit ScopeGuard(      F&& fun) : fun_(std::move(fun)) {}

    ScopeGuard(ScopeGuard&& tmp) :
        fun_(std::move(tmp.fun_)),
        exceptionCount_(tmp.exceptionCount_),
        dismissed_(tmp.dismissed_) { tmp.dismissed_ = true; }

    ~ScopeGuard() noexcept(runMode == ScopeGuardRunMode::onFail)
    {
        if (dismissed_)
            return;

        const bool failed = std::uncaught_exceptions() > exceptionCount_;

        if constexpr (runMode == ScopeGuardRunMode::onExit)
        {
            if (!failed)
                fun_(); //throw X
            else
                try { fun_(); }
                catch (...) { assert(false); } //exception already in flight
        }
        else if (failed)
            try { fun_(); }
            catch (...) { assert(false); }
    }

    void dismiss() { dismissed_ = true; }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    const F fun_;
    const int exceptionCount_ = std::uncaught_exceptions();
    bool dismissed_ = false;
};


template <ScopeGuardRunMode runMode, class F> inline
auto makeGuard(F&& fun) { return ScopeGuard<runMode, std::decay_t<F>>(std::forward<F>(fun)); }
}

#define ZEN_CONCAT_SUB(X, Y) X ## Y
#define ZEN_CONCAT(X, Y) ZEN_CONCAT_SUB(X, Y)

#define ZEN_CHECK_CASE_FOR_CONSTANT(X) case X: return ZEN_CHECK_CASE_FOR_CONSTANT_IMPL(#X)
#define ZEN_CHECK_CASE_FOR_CONSTANT_IMPL(X) L ## X

#define ZEN_ON_SCOPE_EXIT(X) [[maybe_unused]] auto ZEN_CONCAT(scopeGuard, __LINE__) = zen::makeGuard<zen::ScopeGuardRunMode::onExit   >([&]{ X; });
#define ZEN_ON_SCOPE_FAIL(X) [[maybe_unused]] auto ZEN_CONCAT(scopeGuard, __LINE__) = zen::makeGuard<zen::ScopeGuardRunMode::onFail   >([&]{ X; });

#endif //SCOPE_GUARD_H_5518209374162038
