// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include "symlink_creator.h"
#include <unistd.h> //symlink

using namespace rz;
using namespace rpl;


namespace
{
//on Linux there is no distinction between file and directory symlinks
class PosixSymlinkCreator : public SymlinkCreator
{
public:
    void createSymlink(const Zstring& linkPath, const Zstring& targetPath, bool targetIsFolder) const override //throw ErrorLinkCreation
    {
        if (::symlink(targetPath.c_str(), linkPath.c_str()) != 0)
        {
            const ErrorCode ec = getLastError();
            throw ErrorLinkCreation(replaceCpy(replaceCpy("Cannot create symbolic link %x pointing to %y.", "%x", fmtPath(linkPath)), "%y", fmtPath(targetPath)),
                                    formatSystemError("symlink", ec));
        }
    }
};
}


const SymlinkCreator& rpl::getNativeSymlinkCreator()
{
    static const PosixSymlinkCreator nativeCreator;
    return nativeCreator;
}
