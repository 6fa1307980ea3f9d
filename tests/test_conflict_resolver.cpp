// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include <catch2/catch.hpp>
#include "base/conflict_resolver.h"
#include "test_tools.h"

using namespace rz;
using namespace rpl;
using namespace rpl::test;


TEST_CASE("missing target proceeds unchanged", "[conflict]")
{
    TempFolder tmp;
    const ConflictDecision decision = resolveConflict(tmp / "new.txt", false, false);

    CHECK(decision.action == ConflictDecision::Action::proceed);
    CHECK(decision.targetPath == tmp / "new.txt");
    CHECK(!decision.replaceExisting);
}


TEST_CASE("existing target: overwrite beats rename beats skip", "[conflict]")
{
    TempFolder tmp;
    writeFile(tmp / "file.txt", "old");

    const ConflictDecision replace = resolveConflict(tmp / "file.txt", true, true);
    CHECK(replace.action == ConflictDecision::Action::proceed);
    CHECK(replace.replaceExisting);
    CHECK(replace.targetPath == tmp / "file.txt");

    const ConflictDecision renamed = resolveConflict(tmp / "file.txt", false, true);
    CHECK(renamed.action == ConflictDecision::Action::proceedRenamed);
    CHECK(renamed.targetPath == tmp / "file(1).txt");

    const ConflictDecision skipped = resolveConflict(tmp / "file.txt", false, false);
    CHECK(skipped.action == ConflictDecision::Action::skip);

    CHECK(readFile(tmp / "file.txt") == "old"); //decision only: nothing touched
}


TEST_CASE("unique name picks the lowest free number", "[conflict]")
{
    TempFolder tmp;
    writeFile(tmp / "report.pdf",    "");
    writeFile(tmp / "report(1).pdf", "");
    writeFile(tmp / "report(3).pdf", "");

    CHECK(getUniqueTargetPath(tmp / "report.pdf") == tmp / "report(2).pdf");
}


TEST_CASE("unique name without extension", "[conflict]")
{
    TempFolder tmp;
    writeFile(tmp / "Makefile", "");
    writeFile(tmp / ".bashrc",  "");
    writeFile(tmp / "a.tar.gz", "");

    CHECK(getUniqueTargetPath(tmp / "Makefile") == tmp / "Makefile(1)");
    CHECK(getUniqueTargetPath(tmp / ".bashrc")  == tmp / ".bashrc(1)");
    CHECK(getUniqueTargetPath(tmp / "a.tar.gz") == tmp / "a.tar(1).gz");
}
