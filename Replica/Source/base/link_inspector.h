// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef LINK_INSPECTOR_H_1029384756102938
#define LINK_INSPECTOR_H_1029384756102938

#include <optional>
#include <rz/file_error.h>


namespace rpl
{
//snapshot at the time of the query: never cached
struct LinkInfo
{
    Zstring linkPath;
    Zstring rawTarget;      //stored link content, possibly relative
    Zstring resolvedTarget; //canonical; empty if unresolvable
    bool targetExists   = false;
    bool targetIsFolder = false;
    bool isCyclic       = false;
};

//false if not existing
bool isSymlink(const Zstring& itemPath); //throw FileError

//no value: broken link
std::optional<Zstring> resolveSymlinkTarget(const Zstring& linkPath); //throw FileError, ErrorCyclicLink (link loop: ELOOP)

//cyclic: the resolved target is the link's own (canonical) location or one of its ancestors
bool isCyclicLink(const Zstring& linkPath, const Zstring& resolvedTarget); //throw FileError

LinkInfo inspectLink(const Zstring& linkPath); //throw FileError
}

#endif //LINK_INSPECTOR_H_1029384756102938
