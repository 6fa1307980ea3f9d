// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include "conflict_resolver.h"
#include <rz/file_access.h>

using namespace rz;
using namespace rpl;


Zstring rpl::getUniqueTargetPath(const Zstring& targetPath) //throw FileError
{
    const Zstring itemName = getItemName(targetPath);
    const Zstring extension = getFileExtension(itemName);

    const Zstring stem = extension.empty() ? itemName : itemName.substr(0, itemName.size() - extension.size() - 1);
    const Zstring extensionFmt = extension.empty() ? Zstring() : '.' + extension;

    const std::optional<Zstring> parentPath = getParentFolderPath(targetPath);

    for (int n = 1;; ++n)
    {
        const Zstring newName = stem + '(' + numberTo<Zstring>(n) + ')' + extensionFmt;
        const Zstring newPath = parentPath ? appendPath(*parentPath, newName) : newName;

        if (!itemExists(newPath)) //throw FileError
            return newPath;
    }
}


ConflictDecision rpl::resolveConflict(const Zstring& targetPath, bool overwrite, bool renameOnConflict) //throw FileError
{
    if (!itemExists(targetPath)) //throw FileError
        return {ConflictDecision::Action::proceed, targetPath, false};

    if (overwrite)
        return {ConflictDecision::Action::proceed, targetPath, true};

    if (renameOnConflict)
        return {ConflictDecision::Action::proceedRenamed, getUniqueTargetPath(targetPath), false}; //throw FileError

    return {ConflictDecision::Action::skip, targetPath, false};
}
