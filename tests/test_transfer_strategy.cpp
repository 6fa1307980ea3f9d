// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include <catch2/catch.hpp>
#include "base/transfer_strategy.h"
#include "test_tools.h"

using namespace rz;
using namespace rpl;
using namespace rpl::test;


TEST_CASE("sequential transfer", "[transfer]")
{
    TempFolder tmp;
    TestLog log;
    const RunContext ctx("seq", log);

    const std::string content = makeTestContent(1000 * 1000);
    writeFile(tmp / "source.bin", content);

    CHECK(transferFile(tmp / "source.bin", tmp / "target.bin", content.size(), 0, ctx) == content.size());
    CHECK(readFile(tmp / "target.bin") == content);

    //progress logged in 10% steps
    size_t progressMessages = 0;
    for (const TestLog::Entry& e : log.getEntries())
        if (e.msg.find('%') != std::string::npos)
            ++progressMessages;
    CHECK(progressMessages == 9);
}


TEST_CASE("empty file", "[transfer]")
{
    TempFolder tmp;
    TestLog log;
    const RunContext ctx("empty", log);

    writeFile(tmp / "empty", "");
    CHECK(transferFile(tmp / "empty", tmp / "copy", 0, 0, ctx) == 0);
    CHECK(getItemType(tmp / "copy") == ItemType::file);
    CHECK(getFileSize(tmp / "copy") == 0);
}


TEST_CASE("sequential transfer resumes", "[transfer]")
{
    TempFolder tmp;
    TestLog log;
    const RunContext ctx("resume", log);

    const std::string content = makeTestContent(300 * 1000);
    writeFile(tmp / "source.bin", content);
    writeFile(tmp / "target.bin", content.substr(0, 100 * 1000) + "garbage beyond the resume position");

    CHECK(transferSequential(tmp / "source.bin", tmp / "target.bin", content.size(), 100 * 1000, ctx) == 200 * 1000);
    CHECK(readFile(tmp / "target.bin") == content);
}


TEST_CASE("large file is copied in chunks", "[transfer]")
{
    TempFolder tmp;
    TestLog log;
    const RunContext ctx("chunked", log);

    const size_t fileSize = 3 * CHUNK_SIZE + 12345; //last chunk is partial
    const std::string content = makeTestContent(fileSize);
    writeFile(tmp / "big.bin", content);

    CHECK(transferFile(tmp / "big.bin", tmp / "copy.bin", fileSize, 0, ctx) == fileSize);
    CHECK(readFile(tmp / "copy.bin") == content);
}


TEST_CASE("chunked transfer resumes after complete chunks", "[transfer]")
{
    TempFolder tmp;
    TestLog log;
    const RunContext ctx("chunked-resume", log);

    const size_t fileSize = 2 * CHUNK_SIZE + 1000;
    const std::string content = makeTestContent(fileSize);
    writeFile(tmp / "big.bin", content);

    //first chunk complete, second one half written
    const size_t resumeFrom = CHUNK_SIZE + CHUNK_SIZE / 2;
    writeFile(tmp / "copy.bin", content.substr(0, resumeFrom));

    //partial chunk is copied again in full
    CHECK(transferChunked(tmp / "big.bin", tmp / "copy.bin", fileSize, resumeFrom, ctx) == CHUNK_SIZE + 1000);
    CHECK(readFile(tmp / "copy.bin") == content);
}


TEST_CASE("chunked transfer truncates longer target", "[transfer]")
{
    TempFolder tmp;
    TestLog log;
    const RunContext ctx("truncate", log);

    const size_t fileSize = CHUNK_SIZE + 1;
    const std::string content = makeTestContent(fileSize);
    writeFile(tmp / "big.bin", content);
    writeFile(tmp / "copy.bin", makeTestContent(2 * CHUNK_SIZE));

    transferChunked(tmp / "big.bin", tmp / "copy.bin", fileSize, 0, ctx);
    CHECK(readFile(tmp / "copy.bin") == content);
}


TEST_CASE("locked source", "[transfer]")
{
    TempFolder tmp;
    TestLog log;
    const RunContext ctx("locked", log);

    writeFile(tmp / "source.txt", "data");
    FileLockHolder lock(tmp / "source.txt");

    CHECK_THROWS_AS(transferFile(tmp / "source.txt", tmp / "target.txt", 4, 0, ctx), ErrorFileLocked);
}


TEST_CASE("missing source", "[transfer]")
{
    TempFolder tmp;
    TestLog log;
    const RunContext ctx("missing", log);

    CHECK_THROWS_AS(transferFile(tmp / "none.txt", tmp / "target.txt", 0, 0, ctx), FileError);
    CHECK(!itemExists(tmp / "target.txt"));
}
