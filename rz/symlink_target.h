// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef SYMLINK_TARGET_H_5019283746501928
#define SYMLINK_TARGET_H_5019283746501928

#include <vector>
#include <unistd.h>
#include <stdlib.h> //realpath
#include "file_error.h"
#include "file_path.h"


namespace rz
{
//the link's stored content, not resolved: may be relative, may be broken
Zstring getSymlinkRawContent(const Zstring& linkPath); //throw FileError

//canonical absolute path with all links resolved
Zstring getSymlinkResolvedPath(const Zstring& linkPath); //throw FileError

namespace impl
{
Zstring getSymlinkRawContent  (const Zstring& linkPath); //throw SysError
Zstring getSymlinkResolvedPath(const Zstring& linkPath); //throw SysError
}
}









//################################ implementation ################################


namespace rz
{
namespace impl
{
inline
Zstring getSymlinkRawContent(const Zstring& linkPath) //throw SysError
{
    const size_t bufSize = 10000;
    std::vector<char> buf(bufSize);

    const ssize_t bytesWritten = ::readlink(linkPath.c_str(), buf.data(), bufSize);
    if (bytesWritten < 0)
        THROW_LAST_SYS_ERROR("readlink");

    ASSERT_SYSERROR(static_cast<size_t>(bytesWritten) <= bufSize); //better safe than sorry

    if (static_cast<size_t>(bytesWritten) == bufSize) //detect truncation; not an error for readlink!
        throw SysError(formatSystemError("readlink", "", "Buffer truncated."));

    return Zstring(buf.data(), bytesWritten); //readlink does not append 0-termination!
}


inline
Zstring getSymlinkResolvedPath(const Zstring& linkPath) //throw SysError
{
    char* targetPath = ::realpath(linkPath.c_str(), nullptr);
    if (!targetPath)
        THROW_LAST_SYS_ERROR("realpath");
    RZ_ON_SCOPE_EXIT(::free(targetPath));
    return targetPath;
}
}


inline
Zstring getSymlinkRawContent(const Zstring& linkPath) //throw FileError
{
    try
    {
        return impl::getSymlinkRawContent(linkPath); //throw SysError
    }
    catch (const SysError& e) { throwFileError(replaceCpy("Cannot resolve symbolic link %x.", "%x", fmtPath(linkPath)), e); }
}


inline
Zstring getSymlinkResolvedPath(const Zstring& linkPath) //throw FileError
{
    try
    {
        return impl::getSymlinkResolvedPath(linkPath); //throw SysError
    }
    catch (const SysError& e) { throwFileError(replaceCpy("Cannot determine final path for %x.", "%x", fmtPath(linkPath)), e); }
}
}

#endif //SYMLINK_TARGET_H_5019283746501928
