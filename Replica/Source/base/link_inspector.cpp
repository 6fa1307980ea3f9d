// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include "link_inspector.h"
#include <rz/file_access.h>
#include <rz/symlink_target.h>

using namespace rz;
using namespace rpl;


namespace
{
//resolve all links in the parent folder, but not the item itself
Zstring getCanonicalItemLocation(const Zstring& itemPath) //throw FileError
{
    const Zstring itemName = getItemName(trimTrailingSeparator(itemPath));
    const std::optional<Zstring> parentPath = getParentFolderPath(itemPath);

    const Zstring parentPathFmt = parentPath ? *parentPath : Zstring(".");
    try
    {
        return appendPath(impl::getSymlinkResolvedPath(parentPathFmt), itemName); //throw SysError
    }
    catch (const SysError& e) { throwFileError(replaceCpy("Cannot determine final path for %x.", "%x", fmtPath(parentPathFmt)), e); }
}
}


bool rpl::isSymlink(const Zstring& itemPath) //throw FileError
{
    return getItemTypeIfExists(itemPath) == ItemType::symlink; //throw FileError
}


std::optional<Zstring> rpl::resolveSymlinkTarget(const Zstring& linkPath) //throw FileError, ErrorCyclicLink
{
    try
    {
        return impl::getSymlinkResolvedPath(linkPath); //throw SysError
    }
    catch (const SysError& e)
    {
        switch (e.getErrorCode())
        {
            case ENOENT:  //target missing
            case ENOTDIR: //target path runs through a file
                return std::nullopt;
            case ELOOP:
                throw ErrorCyclicLink(replaceCpy("Symbolic link %x is part of a link loop.", "%x", fmtPath(linkPath)), e.toString());
            default:
                throwFileError(replaceCpy("Cannot determine final path for %x.", "%x", fmtPath(linkPath)), e);
        }
    }
}


bool rpl::isCyclicLink(const Zstring& linkPath, const Zstring& resolvedTarget) //throw FileError
{
    return isSameOrParentPath(resolvedTarget, getCanonicalItemLocation(linkPath)); //throw FileError
}


LinkInfo rpl::inspectLink(const Zstring& linkPath) //throw FileError
{
    LinkInfo li;
    li.linkPath  = linkPath;
    li.rawTarget = getSymlinkRawContent(linkPath); //throw FileError

    std::optional<Zstring> resolvedTarget;
    try
    {
        resolvedTarget = resolveSymlinkTarget(linkPath); //throw FileError, ErrorCyclicLink
    }
    catch (ErrorCyclicLink&)
    {
        li.isCyclic = true;
        return li;
    }

    if (resolvedTarget)
    {
        li.resolvedTarget = *resolvedTarget;
        li.targetExists   = true;
        li.targetIsFolder = S_ISDIR(getItemStat(*resolvedTarget, ProcSymlink::follow).st_mode); //throw FileError
        li.isCyclic       = li.targetIsFolder && isCyclicLink(linkPath, *resolvedTarget); //throw FileError
    }
    return li;
}
