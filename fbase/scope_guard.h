// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_4705891237461038524
#define SCOPE_GUARD_H_4705891237461038524

#include <cassert>
#include <exception>
#include <type_traits>
#include <utility>


namespace fbase
{
/*  Scope Guard

        auto guardSock = fbase::makeGuard<ScopeGuardRunMode::onExit>([&] { ::close(sock); });
            ...
        guardSock.dismiss();

    Scope Exit:
        FBASE_ON_SCOPE_EXIT   (cleanUp());
        FBASE_ON_SCOPE_FAIL   (undoTemporaryWork());
        FBASE_ON_SCOPE_SUCCESS(notifySuccess());                    */

enum class ScopeGuardRunMode
{
    onExit,
    onSuccess,
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
                catch (...) { assert(false); } //never throw while another exception is in flight
        }
        else if constexpr (runMode == ScopeGuardRunMode::onSuccess)
        {
            if (!failed)
                fun_(); //throw X
        }
        else
        {
            if (failed)
                try { fun_(); }
                catch (...) { assert(false); }
        }
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

#define FBASE_CONCAT_SUB(X, Y) X ## Y
#define FBASE_CONCAT(X, Y) FBASE_CONCAT_SUB(X, Y)

#define FBASE_CHECK_CASE_FOR_CONSTANT(X) case X: return FBASE_CHECK_CASE_FOR_CONSTANT_IMPL(#X)
#define FBASE_CHECK_CASE_FOR_CONSTANT_IMPL(X) L ## X


#define FBASE_ON_SCOPE_EXIT(X)    [[maybe_unused]] auto FBASE_CONCAT(scopeGuard, __LINE__) = fbase::makeGuard<fbase::ScopeGuardRunMode::onExit   >([&]{ X; });
#define FBASE_ON_SCOPE_FAIL(X)    [[maybe_unused]] auto FBASE_CONCAT(scopeGuard, __LINE__) = fbase::makeGuard<fbase::ScopeGuardRunMode::onFail   >([&]{ X; });
#define FBASE_ON_SCOPE_SUCCESS(X) [[maybe_unused]] auto FBASE_CONCAT(scopeGuard, __LINE__) = fbase::makeGuard<fbase::ScopeGuardRunMode::onSuccess>([&]{ X; });

#endif //SCOPE_GUARD_H_4705891237461038524
