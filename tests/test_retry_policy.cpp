// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include <catch2/catch.hpp>
#include <rz/thread.h>
#include "base/retry_policy.h"
#include "test_tools.h"

using namespace rz;
using namespace rpl;
using namespace rpl::test;


TEST_CASE("lock held through all attempts", "[retry]")
{
    TempFolder tmp;
    TestLog log;
    const RunContext ctx("retry-exhausted", log);

    writeFile(tmp / "source.txt", "data");
    FileLockHolder lock(tmp / "source.txt");

    const RetrySettings settings{3, std::chrono::milliseconds(10)};
    CHECK(transferWithRetry(tmp / "source.txt", tmp / "target.txt", 4, settings, ctx) == TransferOutcome::failed);

    CHECK(log.count(LogCallback::MsgType::warning) == 2); //before attempt 2 and 3
    CHECK(log.count(LogCallback::MsgType::error)   == 1);
    CHECK(!itemExists(tmp / "target.txt"));
}


TEST_CASE("lock released while waiting", "[retry]")
{
    TempFolder tmp;
    TestLog log;
    const RunContext ctx("retry-released", log);

    const std::string content = makeTestContent(200 * 1000);
    writeFile(tmp / "source.bin", content);

    FileLockHolder lock(tmp / "source.bin");
    InterruptibleThread releaser([&lock]
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        lock.release();
    });

    const RetrySettings settings{50, std::chrono::milliseconds(20)};
    CHECK(transferWithRetry(tmp / "source.bin", tmp / "target.bin", content.size(), settings, ctx) == TransferOutcome::success);
    releaser.join();

    CHECK(readFile(tmp / "target.bin") == content);
    CHECK(log.count(LogCallback::MsgType::warning) >= 1);
    CHECK(log.count(LogCallback::MsgType::error) == 0);
}


TEST_CASE("foreign target content is not resumed", "[retry]")
{
    TempFolder tmp;
    TestLog log;
    const RunContext ctx("retry-first-attempt", log);

    const std::string content = makeTestContent(500 * 1000);
    writeFile(tmp / "source.bin", content);
    writeFile(tmp / "target.bin", std::string(123456, 'X')); //same size as a partial copy, but different bytes

    CHECK(transferWithRetry(tmp / "source.bin", tmp / "target.bin", content.size(), RetrySettings(), ctx) == TransferOutcome::success);
    CHECK(readFile(tmp / "target.bin") == content);
}


TEST_CASE("other errors are not retried", "[retry]")
{
    TempFolder tmp;
    TestLog log;
    const RunContext ctx("retry-other", log);

    const RetrySettings settings{3, std::chrono::seconds(10)}; //a retry would time out the test
    CHECK_THROWS_AS(transferWithRetry(tmp / "missing.txt", tmp / "target.txt", 0, settings, ctx), FileError);
    CHECK(log.count(LogCallback::MsgType::warning) == 0);
}
