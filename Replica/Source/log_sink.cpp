// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include "log_sink.h"
#include <algorithm>
#include <rz/file_io.h>
#include <rz/file_traverser.h>

using namespace rz;
using namespace rpl;


namespace
{
MessageType toMessageType(LogCallback::MsgType type)
{
    switch (type)
    {
        case LogCallback::MsgType::info:
            return MSG_TYPE_INFO;
        case LogCallback::MsgType::warning:
            return MSG_TYPE_WARNING;
        case LogCallback::MsgType::error:
            return MSG_TYPE_ERROR;
    }
    assert(false);
    return MSG_TYPE_ERROR;
}


bool showOnConsole(MessageType type, ConsoleLevel level)
{
    switch (level)
    {
        case ConsoleLevel::errorOnly:
            return type == MSG_TYPE_ERROR;
        case ConsoleLevel::warning:
            return type != MSG_TYPE_INFO;
        case ConsoleLevel::verbose:
            return true;
    }
    assert(false);
    return true;
}
}


void LogSink::logMessage(const std::string& msg, MsgType type, const std::string& correlationId)
{
    const LogEntry entry{std::time(nullptr), toMessageType(type), msg};

    log_.access([&](ErrorLog& log)
    {
        log.push_back(entry);

        if (showOnConsole(entry.type, consoleLevel_))
            console_ << '[' << correlationId << "] " << formatMessage(entry) << std::flush;
    });
}

//------------------------------------------------------------------------------------------

namespace
{
const char logFilePrefix[] = "Replica ";
const char logFileExt[]    = ".log";


std::string generateLogHeader(const ErrorLog& log, const std::string& correlationId, CopyResult finalStatus, std::chrono::system_clock::time_point startTime)
{
    const ErrorLogStats stats = getStats(log);
    const std::string tabSpace(4, ' ');

    std::vector<std::string> summary;
    summary.push_back(formatTime(formatDateTag, std::chrono::system_clock::to_time_t(startTime)) + "  Replica");
    summary.push_back("");
    summary.push_back(tabSpace + getFinalStatusLabel(finalStatus));
    summary.push_back(tabSpace + "Run ID: " + correlationId);
    if (stats.error   > 0) summary.push_back(tabSpace + "Errors: "   + numberTo<std::string>(stats.error));
    if (stats.warning > 0) summary.push_back(tabSpace + "Warnings: " + numberTo<std::string>(stats.warning));

    const int64_t totalTimeSec = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now() - startTime).count();
    summary.push_back(tabSpace + "Total time: " + numberTo<std::string>(totalTimeSec) + " s");

    size_t sepLineLen = 0;
    for (const std::string& str : summary) sepLineLen = std::max(sepLineLen, str.size());

    std::string output(sepLineLen + 1, '_');
    output += '\n';

    for (const std::string& str : summary) { output += '|'; output += str; output += '\n'; }

    output += '|';
    output.append(sepLineLen, '_');
    output += '\n';
    return output;
}


void limitLogfileCount(const Zstring& logFolderPath, int logfilesMaxCount) //throw FileError
{
    if (logfilesMaxCount <= 0)
        return;

    std::vector<Zstring> logFilePaths;
    traverseFolder(logFolderPath, [&](const FileInfo& fi) //throw FileError
    {
        if (startsWith(fi.itemName, logFilePrefix) && endsWith(fi.itemName, logFileExt))
            logFilePaths.push_back(fi.fullPath);
    },
    nullptr /*onFolder*/, //traverse only one level deep
    nullptr /*onSymlink*/);

    if (logFilePaths.size() <= static_cast<size_t>(logfilesMaxCount))
        return;

    //file name starts with time stamp => sort by name == sort by time
    std::sort(logFilePaths.begin(), logFilePaths.end());

    std::exception_ptr firstError;
    std::for_each(logFilePaths.begin(), logFilePaths.end() - logfilesMaxCount, [&](const Zstring& filePath)
    {
        try
        {
            removeFilePlain(filePath); //throw FileError
        }
        catch (const FileError&) { if (!firstError) firstError = std::current_exception(); };
    });

    if (firstError) //late failure!
        std::rethrow_exception(firstError);
}
}


Zstring rpl::saveLogFile(const Zstring& logFolderPath, //throw FileError
                         const ErrorLog& log,
                         const std::string& correlationId,
                         CopyResult finalStatus,
                         std::chrono::system_clock::time_point startTime,
                         int logfilesMaxCount)
{
    createDirectoryIfMissingRecursion(logFolderPath); //throw FileError

    const Zstring logFilePath = appendPath(logFolderPath, logFilePrefix + formatTime(formatFileNameTag, std::chrono::system_clock::to_time_t(startTime)) +
                                           " [" + correlationId.substr(0, 8) + ']' + logFileExt);

    std::string logContent = generateLogHeader(log, correlationId, finalStatus, startTime) + '\n';
    for (const LogEntry& entry : log)
        logContent += '[' + correlationId + "] " + formatMessage(entry);

    std::exception_ptr firstError;
    try
    {
        setFileContent(logFilePath, logContent); //throw FileError
    }
    catch (const FileError&) { if (!firstError) firstError = std::current_exception(); };

    try
    {
        limitLogfileCount(logFolderPath, logfilesMaxCount); //throw FileError
    }
    catch (const FileError&) { if (!firstError) firstError = std::current_exception(); };

    if (firstError) //late failure!
        std::rethrow_exception(firstError);

    return logFilePath;
}
