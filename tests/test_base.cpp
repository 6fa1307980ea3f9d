// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include <catch2/catch.hpp>
#include <rz/file_io.h>
#include <rz/string_tools.h>
#include <rz/thread.h>
#include "test_tools.h"

using namespace rz;
using namespace rpl::test;


TEST_CASE("file path helpers", "[rz]")
{
    CHECK(getFileExtension("file.txt") == "txt");
    CHECK(getFileExtension("/a/b/archive.tar.gz") == "gz");
    CHECK(getFileExtension(".profile").empty());
    CHECK(getFileExtension("/a.b/README").empty());

    CHECK(appendPath("/a", "b") == "/a/b");
    CHECK(appendPath("/a/", "b") == "/a/b");
    CHECK(appendPath("", "b") == "b");

    CHECK(trimTrailingSeparator("/a/b//") == "/a/b");
    CHECK(trimTrailingSeparator("/") == "/");

    CHECK(getParentFolderPath("/a/b") == Zstring("/a"));
    CHECK(getParentFolderPath("/a") == Zstring("/"));
    CHECK(!getParentFolderPath("/"));
    CHECK(!getParentFolderPath("file"));

    CHECK(isSameOrParentPath("/a/b", "/a/b"));
    CHECK(isSameOrParentPath("/a/b", "/a/b/c"));
    CHECK(isSameOrParentPath("/", "/a"));
    CHECK(!isSameOrParentPath("/a/b", "/a/bc"));
    CHECK(!isSameOrParentPath("/a/b/c", "/a/b"));
}


TEST_CASE("errno is mapped to file error types", "[rz]")
{
    CHECK_THROWS_AS(throwFileError("msg", SysError("denied", EACCES)),     ErrorAccessDenied);
    CHECK_THROWS_AS(throwFileError("msg", SysError("perm",   EPERM)),      ErrorAccessDenied);
    CHECK_THROWS_AS(throwFileError("msg", SysError("locked", EWOULDBLOCK)), ErrorFileLocked);
    CHECK_THROWS_AS(throwFileError("msg", SysError("busy",   EBUSY)),      ErrorFileLocked);

    try
    {
        throwFileError("Cannot read file.", SysError("other", ENOSPC));
        FAIL("no exception");
    }
    catch (const ErrorAccessDenied&) { FAIL("wrong type"); }
    catch (const ErrorFileLocked&)   { FAIL("wrong type"); }
    catch (const FileError& e) { CHECK(startsWith(e.toString(), "Cannot read file.")); }
}


TEST_CASE("file content is written and read back", "[rz]")
{
    TempFolder tmp;
    const Zstring filePath = tmp / "data.bin";

    setFileContent(filePath, "first");
    setFileContent(filePath, "second version"); //replace existing
    CHECK(getFileContent(filePath) == "second version");
    CHECK(getFileSize(filePath) == 14);
    CHECK(getItemType(filePath) == ItemType::file);

    CHECK(!getItemTypeIfExists(tmp / "missing"));
    CHECK(!getItemTypeIfExists(tmp / "data.bin/below-a-file")); //ENOTDIR
}


TEST_CASE("exclusive writer excludes readers", "[rz]")
{
    TempFolder tmp;
    const Zstring filePath = tmp / "locked.txt";
    writeFile(filePath, "content");

    FileOutputPlain fileOut(filePath, FileOutputPlain::OpenMode::createOrAppend);
    CHECK_THROWS_AS(FileInputPlain(filePath), ErrorFileLocked);
    CHECK_THROWS_AS(FileOutputPlain(filePath, FileOutputPlain::OpenMode::createNew), ErrorTargetExisting);
    fileOut.close();

    CHECK(fileOut.getHandle() == FileBase::invalidFileHandle);

    FileInputPlain fileIn(filePath);
    std::string buf(16, '\0');
    buf.resize(readAll(fileIn, buf.data(), buf.size()));
    CHECK(buf == "content");
}


TEST_CASE("thread group runs all tasks", "[rz]")
{
    std::atomic<int> done{0};
    {
        ThreadGroup<std::function<void()>> tg(4, "Test");
        for (int i = 0; i < 100; ++i)
            tg.run([&done] { ++done; });

        tg.wait();
        CHECK(tg.waitFor(std::chrono::milliseconds(0)));
    }
    CHECK(done == 100);
}


TEST_CASE("thread group stops blocked tasks on destruction", "[rz]")
{
    std::atomic<bool> stopped{false};
    {
        ThreadGroup<std::function<void()>> tg(1, "Test");
        tg.run([&stopped]
        {
            try
            {
                interruptibleSleep(std::chrono::seconds(60)); //throw ThreadStopRequest
            }
            catch (ThreadStopRequest&) { stopped = true; throw; }
        });
        CHECK(!tg.waitFor(std::chrono::milliseconds(50)));
    }
    CHECK(stopped);
}
