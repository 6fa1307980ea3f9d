// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef PROCESS_CALLBACK_H_0293847561029384
#define PROCESS_CALLBACK_H_0293847561029384

#include <string>
#include <atomic>


namespace rpl
{
struct LogCallback
{
    virtual ~LogCallback() {}

    enum class MsgType
    {
        info,
        warning,
        error,
    };
    //called from any worker thread: implementations must be thread-safe and noexcept
    virtual void logMessage(const std::string& msg, MsgType type, const std::string& correlationId) = 0;
};


//per-run state passed explicitly to all components: no global logger!
class RunContext
{
public:
    RunContext(const std::string& correlationId, LogCallback& log) : correlationId_(correlationId), log_(log) {}

    const std::string& getCorrelationId() const { return correlationId_; }

    void logInfo   (const std::string& msg) const { log_.logMessage(msg, LogCallback::MsgType::info,    correlationId_); }
    void logWarning(const std::string& msg) const { log_.logMessage(msg, LogCallback::MsgType::warning, correlationId_); }
    void logError  (const std::string& msg) const { log_.logMessage(msg, LogCallback::MsgType::error,   correlationId_); }

private:
    const std::string correlationId_;
    LogCallback& log_;
};


//cancellation requested by user: set from signal handler, polled by the controlling thread
class AbortFlag
{
public:
    void requestAbort() { aborted_ = true; } //async-signal-safe
    bool isAborted() const { return aborted_; }

private:
    std::atomic<bool> aborted_{false};
    static_assert(std::atomic<bool>::is_always_lock_free);
};


//thrown by the copy engine after cancellation
class AbortProcess {};
}

#endif //PROCESS_CALLBACK_H_0293847561029384
