// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include "command_line.h"
#include <algorithm>
#include <rz/file_path.h>

using namespace rz;
using namespace rpl;


namespace
{
const char optionSource          [] = "--source";
const char optionDestination     [] = "--destination";
const char optionOverwrite       [] = "--overwrite";
const char optionRenameOnConflict[] = "--rename-on-conflict";
const char optionIncludeHidden   [] = "--include-hidden";
const char optionPreserveSymlinks[] = "--preserve-symlinks";
const char optionMaxDepth        [] = "--max-depth";
const char optionParallel        [] = "--parallel";
const char optionLog             [] = "--log";
const char optionLogFolder       [] = "--log-folder";


bool isHelpRequest(const Zstring& arg)
{
    auto it = std::find_if(arg.begin(), arg.end(), [](Zchar c) { return c != '/' && c != '-'; });
    if (it == arg.begin()) return false; //require at least one prefix character

    const Zstring argTmp(it, arg.end());
    return equalAsciiNoCase(argTmp, "help") ||
           equalAsciiNoCase(argTmp, "h")    ||
           argTmp == "?";
}


bool isCommandLineOption(const Zstring& arg)
{
    return startsWith(arg, "--") || isHelpRequest(arg);
}


bool parseBool(const Zstring& option, const Zstring& value) //throw FileError
{
    if (equalAsciiNoCase(value, "true"))
        return true;
    if (equalAsciiNoCase(value, "false"))
        return false;
    throw FileError(replaceCpy(replaceCpy("Invalid value %y for option %x: expected \"true\" or \"false\".", "%x", option), "%y", fmtPath(value)));
}
}


CommandLineConfig rpl::parseCommandLine(const std::vector<Zstring>& commandArgs) //throw FileError
{
    CommandLineConfig cfg;

    for (auto it = commandArgs.begin(); it != commandArgs.end(); ++it)
    {
        if (isHelpRequest(*it))
        {
            cfg.showHelp = true;
            return cfg;
        }

        const Zstring option = *it;
        if (!isCommandLineOption(option))
            throw FileError(replaceCpy("Unexpected command line argument %x.", "%x", fmtPath(option)));

        if (++it == commandArgs.end() || isCommandLineOption(*it))
            throw FileError(replaceCpy("A value is expected after %x.", "%x", option));
        const Zstring& value = *it;

        if (equalAsciiNoCase(option, optionSource))
            cfg.job.sourcePath = trimTrailingSeparator(value);
        else if (equalAsciiNoCase(option, optionDestination))
            cfg.job.destinationPath = trimTrailingSeparator(value);
        else if (equalAsciiNoCase(option, optionOverwrite))
            cfg.job.overwrite = parseBool(option, value); //throw FileError
        else if (equalAsciiNoCase(option, optionRenameOnConflict))
            cfg.job.renameOnConflict = parseBool(option, value); //throw FileError
        else if (equalAsciiNoCase(option, optionIncludeHidden))
            cfg.job.includeHidden = parseBool(option, value); //throw FileError
        else if (equalAsciiNoCase(option, optionPreserveSymlinks))
            cfg.job.preserveSymlinks = parseBool(option, value); //throw FileError
        else if (equalAsciiNoCase(option, optionParallel))
            cfg.parallel = parseBool(option, value); //throw FileError
        else if (equalAsciiNoCase(option, optionMaxDepth))
        {
            if (!tryStringTo(value, cfg.job.maxDepth) || cfg.job.maxDepth < 0)
                throw FileError(replaceCpy(replaceCpy("Invalid value %y for option %x: expected a non-negative number.", "%x", option), "%y", fmtPath(value)));
        }
        else if (equalAsciiNoCase(option, optionLog))
        {
            if (equalAsciiNoCase(value, "error-only"))
                cfg.consoleLevel = ConsoleLevel::errorOnly;
            else if (equalAsciiNoCase(value, "warning"))
                cfg.consoleLevel = ConsoleLevel::warning;
            else if (equalAsciiNoCase(value, "verbose"))
                cfg.consoleLevel = ConsoleLevel::verbose;
            else
                throw FileError(replaceCpy(replaceCpy("Invalid value %y for option %x: expected \"error-only\", \"warning\" or \"verbose\".", "%x", option), "%y", fmtPath(value)));
        }
        else if (equalAsciiNoCase(option, optionLogFolder))
            cfg.logFolderPath = value;
        else
            throw FileError(replaceCpy("Unknown command line option %x.", "%x", fmtPath(option)));
    }

    if (cfg.job.sourcePath.empty())
        throw FileError(replaceCpy("Missing required option %x.", "%x", optionSource));
    if (cfg.job.destinationPath.empty())
        throw FileError(replaceCpy("Missing required option %x.", "%x", optionDestination));

    return cfg;
}


std::string rpl::getSyntaxHelp()
{
    return std::string("Syntax:\n\n") +
           "replica --source <folder> --destination <folder> [options]\n\n" +
           "    " + optionOverwrite        + " true|false        Replace existing files (default: false)\n" +
           "    " + optionRenameOnConflict + " true|false  Write \"name(n).ext\" next to existing files (default: false)\n" +
           "    " + optionIncludeHidden    + " true|false   Copy files starting with \".\" (default: false)\n" +
           "    " + optionPreserveSymlinks + " true|false  Recreate symbolic links instead of following them (default: false)\n" +
           "    " + optionMaxDepth         + " <n>              Maximum folder depth (default: 50)\n" +
           "    " + optionParallel         + " true|false         Use one worker per processor (default: true)\n" +
           "    " + optionLog              + " error-only|warning|verbose\n" +
           "                                 Console output level (default: error-only)\n" +
           "    " + optionLogFolder        + " <folder>            Log file location (default: logs)\n";
}
