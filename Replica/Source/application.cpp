// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include <iostream>
#include <csignal>
#include <rz/guid.h>
#include <rz/file_error.h>
#include "base/copy_engine.h"
#include "base/file_counter.h"
#include "base/return_codes.h"
#include "command_line.h"
#include "log_sink.h"

using namespace rz;
using namespace rpl;


namespace
{
AbortFlag globalAbortFlag; //set by SIGINT handler


void onInterruptSignal(int /*signum*/)
{
    globalAbortFlag.requestAbort();
}


void notifyAppError(const std::string& msg)
{
    std::cerr << "Error: " + msg + '\n';
}


std::vector<Zstring> getCommandlineArgs(int argc, char* argv[])
{
    std::vector<Zstring> args;
    for (int i = 1; i < argc; ++i) //skip first arg: application path
        args.push_back(argv[i]);
    return args;
}


void installAbortHandler() //throw SysError
{
    struct sigaction sa = {};
    sa.sa_handler = onInterruptSignal;
    ::sigemptyset(&sa.sa_mask);
    if (::sigaction(SIGINT, &sa, nullptr) != 0)
        THROW_LAST_SYS_ERROR("sigaction(SIGINT)");
}


CopyResult runCopy(const CommandLineConfig& cfg, LogSink& logSink, const RunContext& ctx)
{
    try
    {
        const int totalFiles = countTotalFiles(cfg.job, FILE_COUNTER_PARALLELISM, ctx); //throw FileError
        ctx.logInfo(replaceCpy("Files to copy: %x", "%x", numberTo<std::string>(totalFiles)));

        ProgressAggregator progress(totalFiles, [&](int percent)
        {
            ctx.logInfo(replaceCpy("Progress: %x%", "%x", numberTo<std::string>(percent)));
        });

        EngineSettings settings;
        if (!cfg.parallel)
            settings.threadCount = 1;

        copyDirectoryTree(cfg.job, settings, progress, globalAbortFlag, ctx); //throw FileError, AbortProcess
    }
    catch (AbortProcess&)
    {
        ctx.logWarning("Stopped by user.");
        return CopyResult::aborted;
    }
    catch (const FileError& e)
    {
        ctx.logError(e.toString());
        return CopyResult::finishedError;
    }

    //per-file errors (e.g. locked files) don't stop the run: evaluate log
    const ErrorLogStats stats = getStats(logSink.getLog());
    if (stats.error > 0)
        return CopyResult::finishedError;
    if (stats.warning > 0)
        return CopyResult::finishedWarning;
    return CopyResult::finishedSuccess;
}
}


int main(int argc, char* argv[])
{
    try
    {
        CommandLineConfig cfg;
        try
        {
            cfg = parseCommandLine(getCommandlineArgs(argc, argv)); //throw FileError
        }
        catch (const FileError& e)
        {
            notifyAppError(e.toString() + "\n\n" + getSyntaxHelp());
            return RPL_RC_ERROR;
        }

        if (cfg.showHelp)
        {
            std::cout << getSyntaxHelp();
            return RPL_RC_SUCCESS;
        }

        try
        {
            installAbortHandler(); //throw SysError
        }
        catch (const SysError& e) { logExtraError(e.toString()); } //not critical: Ctrl+C will terminate instead

        const auto startTime = std::chrono::system_clock::now();
        const std::string correlationId = formatAsHexString(generateGUID()); //throw std::runtime_error

        LogSink logSink(cfg.consoleLevel);
        const RunContext ctx(correlationId, logSink);

        const CopyResult result = runCopy(cfg, logSink, ctx);

        //errors that could not be reported any other way
        for (const LogEntry& entry : fetchExtraLog())
            ctx.logWarning(entry.message);

        ctx.logInfo(getFinalStatusLabel(result));

        try
        {
            const Zstring logFilePath = saveLogFile(cfg.logFolderPath, logSink.getLog(), correlationId, result, startTime, LOG_FILES_MAX_COUNT); //throw FileError
            if (cfg.consoleLevel == ConsoleLevel::verbose)
                std::cout << "Log file: " << logFilePath << '\n';
        }
        catch (const FileError& e) { notifyAppError(e.toString()); } //the copy result is still valid

        if (result != CopyResult::finishedSuccess)
            std::cerr << getFinalStatusLabel(result) << '\n';

        return mapToReturnCode(result);
    }
    catch (const std::exception& e)
    {
        notifyAppError(e.what());
        return RPL_RC_EXCEPTION;
    }
}
