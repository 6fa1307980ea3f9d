// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef COMMAND_LINE_H_3928475610293847
#define COMMAND_LINE_H_3928475610293847

#include <vector>
#include <rz/file_error.h>
#include "base/structures.h"
#include "log_sink.h"


namespace rpl
{
struct CommandLineConfig
{
    CopyJob job;
    bool parallel = true; //false: single worker thread
    ConsoleLevel consoleLevel = ConsoleLevel::errorOnly;
    Zstring logFolderPath = "logs";
    bool showHelp = false;
};

//fails before any copying: missing source/destination, unknown option, missing or malformed value
CommandLineConfig parseCommandLine(const std::vector<Zstring>& commandArgs); //throw FileError

std::string getSyntaxHelp();
}

#endif //COMMAND_LINE_H_3928475610293847
