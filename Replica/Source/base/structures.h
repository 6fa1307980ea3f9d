// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef STRUCTURES_H_8301928374651029
#define STRUCTURES_H_8301928374651029

#include <rz/zstring.h>


namespace rpl
{
//immutable description of one copy run; shared read-only by all workers
struct CopyJob
{
    Zstring sourcePath;
    Zstring destinationPath;

    bool overwrite        = false; //conflict: replace existing target
    bool renameOnConflict = false; //conflict: write to "name(n).ext" instead (ignored if overwrite)
    bool includeHidden    = false; //files and symlinks only: hidden folders are always traversed
    bool preserveSymlinks = false; //recreate links instead of following them

    int maxDepth = 50; //root folder has depth 0; folders deeper than maxDepth are not copied
};


struct DirectoryFrame
{
    Zstring sourcePath;
    Zstring targetPath;
    int depth = 0;
};


enum class TransferOutcome
{
    success,
    skipped, //conflict policy
    failed,  //locked file: retries exhausted
};


inline
bool isHiddenItem(const Zstring& itemName) { return rz::startsWith(itemName, '.'); }
}

#endif //STRUCTURES_H_8301928374651029
