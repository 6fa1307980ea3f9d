// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef LOG_SINK_H_8475610293847561
#define LOG_SINK_H_8475610293847561

#include <iostream>
#include <chrono>
#include <rz/error_log.h>
#include <rz/thread.h>
#include <rz/file_error.h>
#include "base/process_callback.h"
#include "base/return_codes.h"


namespace rpl
{
enum class ConsoleLevel
{
    errorOnly,
    warning,
    verbose,
};

//collects all messages of a run; echoes those at or above "consoleLevel" to console
class LogSink : public LogCallback
{
public:
    explicit LogSink(ConsoleLevel consoleLevel, std::ostream& console = std::cerr) : consoleLevel_(consoleLevel), console_(console) {}

    void logMessage(const std::string& msg, MsgType type, const std::string& correlationId) override; //thread-safe

    rz::ErrorLog getLog() { return log_.access([](const rz::ErrorLog& log) { return log; }); }

private:
    const ConsoleLevel consoleLevel_;
    std::ostream& console_;
    rz::Protected<rz::ErrorLog> log_; //also serializes console output
};


const int LOG_FILES_MAX_COUNT = 7;

//write log file "Replica <date> <time> [<run id>].log" into "logFolderPath" and delete the oldest beyond "logfilesMaxCount"
Zstring saveLogFile(const Zstring& logFolderPath, //throw FileError
                    const rz::ErrorLog& log,
                    const std::string& correlationId,
                    CopyResult finalStatus,
                    std::chrono::system_clock::time_point startTime,
                    int logfilesMaxCount /*<= 0 := no limit*/);
}

#endif //LOG_SINK_H_8475610293847561
