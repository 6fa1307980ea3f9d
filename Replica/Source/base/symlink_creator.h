// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef SYMLINK_CREATOR_H_6574839201928374
#define SYMLINK_CREATOR_H_6574839201928374

#include <rz/file_error.h>


namespace rpl
{
//platform-specific link creation, selected at runtime
class SymlinkCreator
{
public:
    virtual ~SymlinkCreator() {}

    //linkPath must not exist; "targetIsFolder" is needed by platforms distinguishing file and folder links
    virtual void createSymlink(const Zstring& linkPath, const Zstring& targetPath, bool targetIsFolder) const = 0; //throw ErrorLinkCreation
};


const SymlinkCreator& getNativeSymlinkCreator();
}

#endif //SYMLINK_CREATOR_H_6574839201928374
