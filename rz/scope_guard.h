// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_2847610928374651
#define SCOPE_GUARD_H_2847610928374651

#include <exception>
#include <type_traits>
#include <utility>


namespace rz
{
/*  Scope Guard

        auto guardDir = rz::makeGuard<ScopeGuardRunMode::onExit>([&] { ::closedir(folder); });
            ...
        guardDir.dismiss();

    Scope Exit:
        RZ_ON_SCOPE_EXIT   (cleanUp());
        RZ_ON_SCOPE_FAIL   (undoTemporaryWork());

    the guarded code must not throw while an exception is in flight    */

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
        if (!dismissed_)
        {
            const bool failed = std::uncaught_exceptions() > exceptionCount_;

            if constexpr (runMode == ScopeGuardRunMode::onExit)
                fun_(); //throw X (only if !failed)
            else
            {
                if (failed)
                    fun_(); //noexcept!
            }
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

#define RZ_CONCAT_SUB(X, Y) X ## Y
#define RZ_CONCAT(X, Y) RZ_CONCAT_SUB(X, Y)

#define RZ_CHECK_CASE_FOR_CONSTANT(X) case X: return #X


#define RZ_ON_SCOPE_EXIT(X) [[maybe_unused]] auto RZ_CONCAT(scopeGuard, __LINE__) = rz::makeGuard<rz::ScopeGuardRunMode::onExit>([&]{ X; });
#define RZ_ON_SCOPE_FAIL(X) [[maybe_unused]] auto RZ_CONCAT(scopeGuard, __LINE__) = rz::makeGuard<rz::ScopeGuardRunMode::onFail>([&]{ X; });

#endif //SCOPE_GUARD_H_2847610928374651
