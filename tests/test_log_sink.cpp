// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include <catch2/catch.hpp>
#include <algorithm>
#include <sstream>
#include <rz/file_traverser.h>
#include "log_sink.h"
#include "test_tools.h"

using namespace rz;
using namespace rpl;
using namespace rpl::test;


namespace
{
void logAllTypes(LogCallback& log)
{
    log.logMessage("info message",    LogCallback::MsgType::info,    "run-1");
    log.logMessage("warning message", LogCallback::MsgType::warning, "run-1");
    log.logMessage("error message",   LogCallback::MsgType::error,   "run-1");
}


std::vector<Zstring> getLogFileNames(const Zstring& folderPath)
{
    std::vector<Zstring> names;
    traverseFolder(folderPath, [&](const FileInfo& fi) { names.push_back(fi.itemName); }, nullptr, nullptr);
    std::sort(names.begin(), names.end());
    return names;
}
}


TEST_CASE("console shows errors only by default", "[log]")
{
    std::ostringstream console;
    LogSink sink(ConsoleLevel::errorOnly, console);
    logAllTypes(sink);

    const std::string output = console.str();
    CHECK(output.find("info message")    == std::string::npos);
    CHECK(output.find("warning message") == std::string::npos);
    CHECK(output.find("[run-1] ")        != std::string::npos);
    CHECK(output.find("Error:  error message") != std::string::npos);

    const ErrorLog log = sink.getLog(); //file log keeps everything
    REQUIRE(log.size() == 3);
    CHECK(getStats(log).info    == 1);
    CHECK(getStats(log).warning == 1);
    CHECK(getStats(log).error   == 1);
}


TEST_CASE("console level warning and verbose", "[log]")
{
    std::ostringstream consoleWarning;
    std::ostringstream consoleVerbose;
    LogSink sinkWarning(ConsoleLevel::warning, consoleWarning);
    LogSink sinkVerbose(ConsoleLevel::verbose, consoleVerbose);
    logAllTypes(sinkWarning);
    logAllTypes(sinkVerbose);

    CHECK(consoleWarning.str().find("info message")    == std::string::npos);
    CHECK(consoleWarning.str().find("warning message") != std::string::npos);
    CHECK(consoleWarning.str().find("error message")   != std::string::npos);

    CHECK(consoleVerbose.str().find("info message") != std::string::npos);
}


TEST_CASE("log file is written", "[log]")
{
    TempFolder tmp;
    std::ostringstream console;
    LogSink sink(ConsoleLevel::errorOnly, console);
    logAllTypes(sink);

    const std::string correlationId = "0123456789abcdef0123456789abcdef";
    const Zstring logFilePath = saveLogFile(tmp / "logs", sink.getLog(), correlationId, CopyResult::finishedError,
                                            std::chrono::system_clock::now(), LOG_FILES_MAX_COUNT);

    CHECK(startsWith(getItemName(logFilePath), "Replica "));
    CHECK(endsWith(getItemName(logFilePath), " [01234567].log"));

    const std::string content = readFile(logFilePath);
    CHECK(content.find("Completed with errors")    != std::string::npos);
    CHECK(content.find("Run ID: " + correlationId) != std::string::npos);
    CHECK(content.find("Errors: 1")                != std::string::npos);
    CHECK(content.find("Warnings: 1")              != std::string::npos);
    CHECK(content.find("info message")             != std::string::npos);

    //every entry carries the run id, same as on console
    for (const char* msg : {"info message", "warning message", "error message"})
    {
        const size_t pos = content.find(msg);
        REQUIRE(pos != std::string::npos);
        const size_t lineBegin = content.rfind('\n', pos) + 1;
        CHECK(startsWith(std::string_view(content).substr(lineBegin), "[" + correlationId + "] ["));
    }
}


TEST_CASE("only the newest log files are kept", "[log]")
{
    TempFolder tmp;
    const Zstring logFolder = tmp / "logs";
    for (int i = 1; i <= 9; ++i)
        writeFile(appendPath(logFolder, "Replica 2001-01-0" + numberTo<Zstring>(i) + " 000000 [00000000].log"), "old");
    writeFile(appendPath(logFolder, "notes.txt"), "unrelated");

    const Zstring logFilePath = saveLogFile(logFolder, ErrorLog(), "feedbeef", CopyResult::finishedSuccess,
                                            std::chrono::system_clock::now(), LOG_FILES_MAX_COUNT);

    const std::vector<Zstring> names = getLogFileNames(logFolder);
    REQUIRE(names.size() == static_cast<size_t>(LOG_FILES_MAX_COUNT) + 1);
    CHECK(names[0] == "Replica 2001-01-04 000000 [00000000].log"); //oldest three deleted
    CHECK(std::find(names.begin(), names.end(), getItemName(logFilePath)) != names.end());
    CHECK(std::find(names.begin(), names.end(), "notes.txt") != names.end());
}
