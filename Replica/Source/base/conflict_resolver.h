// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef CONFLICT_RESOLVER_H_3847102938475610
#define CONFLICT_RESOLVER_H_3847102938475610

#include <rz/file_error.h>


namespace rpl
{
struct ConflictDecision
{
    enum class Action
    {
        proceed,
        proceedRenamed,
        skip,
    };
    Action action = Action::proceed;
    Zstring targetPath;           //where to write
    bool replaceExisting = false; //proceed: caller must remove the existing item first
};

/*  precedence: overwrite > renameOnConflict > skip
    check-then-act: not atomic against other processes writing the same destination   */
ConflictDecision resolveConflict(const Zstring& targetPath, bool overwrite, bool renameOnConflict); //throw FileError

//"file.txt" -> "file(1).txt", "file(2).txt", ... lowest free number wins
Zstring getUniqueTargetPath(const Zstring& targetPath); //throw FileError
}

#endif //CONFLICT_RESOLVER_H_3847102938475610
