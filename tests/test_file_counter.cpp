// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include <catch2/catch.hpp>
#include <unistd.h>
#include "base/file_counter.h"
#include "test_tools.h"

using namespace rz;
using namespace rpl;
using namespace rpl::test;


namespace
{
CopyJob makeJob(const Zstring& sourcePath)
{
    CopyJob job;
    job.sourcePath = sourcePath;
    job.destinationPath = sourcePath + "_copy";
    return job;
}
}


TEST_CASE("files are counted recursively", "[counter]")
{
    TempFolder tmp;
    writeFile(tmp / "src/a.txt",       "");
    writeFile(tmp / "src/b.txt",       "");
    writeFile(tmp / "src/sub/c.txt",   "");
    writeFile(tmp / "src/sub/x/d.txt", "");
    createDirectoryIfMissingRecursion(tmp / "src/empty");

    TestLog log;
    CHECK(countTotalFiles(makeJob(tmp / "src"), FILE_COUNTER_PARALLELISM, RunContext("count", log)) == 4);
}


TEST_CASE("hidden files are counted only if included", "[counter]")
{
    TempFolder tmp;
    writeFile(tmp / "src/visible",              "");
    writeFile(tmp / "src/.hidden",              "");
    writeFile(tmp / "src/.hidden_folder/inner", ""); //hidden folders are always traversed

    TestLog log;
    CopyJob job = makeJob(tmp / "src");
    CHECK(countTotalFiles(job, 1, RunContext("count", log)) == 2);

    job.includeHidden = true;
    CHECK(countTotalFiles(job, 1, RunContext("count", log)) == 3);
}


TEST_CASE("files below max depth are not counted", "[counter]")
{
    TempFolder tmp;
    writeFile(tmp / "src/level0.txt",     "");
    writeFile(tmp / "src/a/level1.txt",   "");
    writeFile(tmp / "src/a/b/level2.txt", "");

    TestLog log;
    CopyJob job = makeJob(tmp / "src");
    job.maxDepth = 1;
    CHECK(countTotalFiles(job, FILE_COUNTER_PARALLELISM, RunContext("count", log)) == 2);

    job.maxDepth = 0;
    CHECK(countTotalFiles(job, FILE_COUNTER_PARALLELISM, RunContext("count", log)) == 1);
}


TEST_CASE("symlinks are counted like the copy treats them", "[counter]")
{
    TempFolder tmp;
    writeFile(tmp / "outside/f1", "");
    writeFile(tmp / "outside/f2", "");
    writeFile(tmp / "src/file",   "");
    createSymlink(tmp / "src/to_file",   tmp / "src/file");
    createSymlink(tmp / "src/to_folder", tmp / "outside");
    createSymlink(tmp / "src/broken",    tmp / "missing");
    createSymlink(tmp / "src/cycle",     "..");

    TestLog log;
    CopyJob job = makeJob(tmp / "src");

    //followed: file + link to file + two files below linked folder
    CHECK(countTotalFiles(job, FILE_COUNTER_PARALLELISM, RunContext("count", log)) == 4);

    job.preserveSymlinks = true; //each link is one item
    CHECK(countTotalFiles(job, FILE_COUNTER_PARALLELISM, RunContext("count", log)) == 5);
}


TEST_CASE("counter: missing source folder", "[counter]")
{
    TempFolder tmp;
    TestLog log;
    CHECK_THROWS_AS(countTotalFiles(makeJob(tmp / "none"), 1, RunContext("count", log)), ErrorSourceNotFound);
}


TEST_CASE("unreadable folder counts as zero", "[counter]")
{
    if (::geteuid() == 0)
        return; //root ignores permissions

    TempFolder tmp;
    writeFile(tmp / "src/ok.txt",         "");
    writeFile(tmp / "src/locked/1.txt",   "");
    writeFile(tmp / "src/locked/2.txt",   "");
    REQUIRE(::chmod((tmp / "src/locked").c_str(), 0) == 0);

    TestLog log;
    CHECK(countTotalFiles(makeJob(tmp / "src"), FILE_COUNTER_PARALLELISM, RunContext("count", log)) == 1);
    CHECK(log.count(LogCallback::MsgType::warning) == 1);

    ::chmod((tmp / "src/locked").c_str(), S_IRWXU);
}
