// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include <catch2/catch.hpp>
#include "command_line.h"

using namespace rz;
using namespace rpl;


TEST_CASE("defaults", "[command line]")
{
    const CommandLineConfig cfg = parseCommandLine({"--source", "/data/in/", "--destination", "/data/out"});

    CHECK(cfg.job.sourcePath      == "/data/in");
    CHECK(cfg.job.destinationPath == "/data/out");
    CHECK(!cfg.job.overwrite);
    CHECK(!cfg.job.renameOnConflict);
    CHECK(!cfg.job.includeHidden);
    CHECK(!cfg.job.preserveSymlinks);
    CHECK(cfg.job.maxDepth == 50);
    CHECK(cfg.parallel);
    CHECK(cfg.consoleLevel == ConsoleLevel::errorOnly);
    CHECK(cfg.logFolderPath == "logs");
    CHECK(!cfg.showHelp);
}


TEST_CASE("all options", "[command line]")
{
    const CommandLineConfig cfg = parseCommandLine(
    {
        "--source", "src", "--destination", "dst",
        "--overwrite", "true", "--rename-on-conflict", "TRUE", "--include-hidden", "true",
        "--preserve-symlinks", "True", "--max-depth", "7", "--parallel", "false",
        "--LOG", "verbose", "--log-folder", "/var/log/replica",
    });

    CHECK(cfg.job.overwrite);
    CHECK(cfg.job.renameOnConflict);
    CHECK(cfg.job.includeHidden);
    CHECK(cfg.job.preserveSymlinks);
    CHECK(cfg.job.maxDepth == 7);
    CHECK(!cfg.parallel);
    CHECK(cfg.consoleLevel == ConsoleLevel::verbose);
    CHECK(cfg.logFolderPath == "/var/log/replica");
}


TEST_CASE("help", "[command line]")
{
    CHECK(parseCommandLine({"--help"}).showHelp);
    CHECK(parseCommandLine({"-h"}).showHelp);
    CHECK(parseCommandLine({"/?"}).showHelp);
    CHECK(parseCommandLine({"--source", "a", "-?"}).showHelp); //no further validation
    CHECK(!getSyntaxHelp().empty());
}


TEST_CASE("invalid command lines fail before copying", "[command line]")
{
    using Args = std::vector<Zstring>;

    CHECK_THROWS_AS(parseCommandLine(Args{}),                                    FileError); //missing source
    CHECK_THROWS_AS(parseCommandLine(Args{"--source", "a"}),                     FileError); //missing destination
    CHECK_THROWS_AS(parseCommandLine(Args{"--destination", "b"}),                FileError);
    CHECK_THROWS_AS(parseCommandLine(Args{"stray", "--source", "a", "--destination", "b"}), FileError);
    CHECK_THROWS_AS(parseCommandLine(Args{"--source", "a", "--destination"}),    FileError); //missing value
    CHECK_THROWS_AS(parseCommandLine(Args{"--source", "--destination", "b"}),    FileError);
    CHECK_THROWS_AS(parseCommandLine(Args{"--source", "a", "--destination", "b", "--overwrite", "yes"}), FileError);
    CHECK_THROWS_AS(parseCommandLine(Args{"--source", "a", "--destination", "b", "--max-depth", "-1"}),  FileError);
    CHECK_THROWS_AS(parseCommandLine(Args{"--source", "a", "--destination", "b", "--max-depth", "abc"}), FileError);
    CHECK_THROWS_AS(parseCommandLine(Args{"--source", "a", "--destination", "b", "--log", "debug"}),     FileError);
    CHECK_THROWS_AS(parseCommandLine(Args{"--source", "a", "--destination", "b", "--verbose", "true"}),  FileError);
}
