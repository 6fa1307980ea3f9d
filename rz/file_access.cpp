// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include "file_access.h"
#include <algorithm>
#include <cstring>
#include <fcntl.h>  //AT_FDCWD, AT_SYMLINK_NOFOLLOW
#include <unistd.h> //unlink, rmdir
#include <cstdio>   //rename
#ifdef HAVE_SELINUX
    #include <selinux/selinux.h>
#endif

using namespace rz;


namespace
{
ItemType getItemTypeImpl(const Zstring& itemPath) //throw SysError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
        THROW_LAST_SYS_ERROR("lstat");

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}
}


ItemType rz::getItemType(const Zstring& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysError
    }
    catch (const SysError& e) { throwFileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(itemPath)), e); }
}


std::optional<ItemType> rz::getItemTypeIfExists(const Zstring& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysError
    }
    catch (const SysError& e)
    {
        //ENOTDIR: some parent component is not a folder => item can't exist either
        if (e.getErrorCode() == ENOENT || e.getErrorCode() == ENOTDIR)
            return std::nullopt;

        throwFileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(itemPath)), e);
    }
}


struct stat rz::getItemStat(const Zstring& itemPath, ProcSymlink procSl) //throw FileError
{
    struct stat itemInfo = {};
    if ((procSl == ProcSymlink::follow ?
         ::stat (itemPath.c_str(), &itemInfo) :
         ::lstat(itemPath.c_str(), &itemInfo)) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(itemPath)), procSl == ProcSymlink::follow ? "stat" : "lstat");

    return itemInfo;
}


uint64_t rz::getFileSize(const Zstring& filePath) //throw FileError
{
    const struct stat fileInfo = getItemStat(filePath, ProcSymlink::follow); //throw FileError
    return static_cast<uint64_t>(fileInfo.st_size);
}


void rz::removeFilePlain(const Zstring& filePath) //throw FileError
{
    try
    {
        if (::unlink(filePath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throwFileError(replaceCpy("Cannot delete file %x.", "%x", fmtPath(filePath)), e); }
}


void rz::removeSymlinkPlain(const Zstring& linkPath) //throw FileError
{
    try
    {
        if (::unlink(linkPath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throwFileError(replaceCpy("Cannot delete symbolic link %x.", "%x", fmtPath(linkPath)), e); }
}


void rz::removeDirectoryPlain(const Zstring& dirPath) //throw FileError
{
    try
    {
        if (::rmdir(dirPath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("rmdir");
    }
    catch (const SysError& e) { throwFileError(replaceCpy("Cannot delete directory %x.", "%x", fmtPath(dirPath)), e); }
}


void rz::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting) //throw FileError, ErrorTargetExisting
{
    auto getErrorMsg = [&] { return replaceCpy(replaceCpy("Cannot move file %x to %y.", "%x", '\n' + fmtPath(pathFrom)), "%y", '\n' + fmtPath(pathTo)); };

    //rename() replaces silently => check first; not atomic, but good enough for our single-writer use
    if (!replaceExisting)
        if (itemExists(pathTo)) //throw FileError
            throw ErrorTargetExisting(getErrorMsg(), formatSystemError("rename", EEXIST));

    try
    {
        if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
            THROW_LAST_SYS_ERROR("rename");
    }
    catch (const SysError& e) { throwFileError(getErrorMsg(), e); }
}


void rz::setFileTime(const Zstring& itemPath, const timespec& modTime, ProcSymlink procSl) //throw FileError
{
    /*  utimensat() is supposed to obsolete utime/utimes and is also used by "cp" and "touch"
        access time: don't use UTIME_NOW/UTIME_OMIT: buggy on some file systems         */
    const timespec newTimes[2]
    {
        {.tv_sec = ::time(nullptr), .tv_nsec = 0}, //access time
        modTime,
    };

    if (::utimensat(AT_FDCWD, itemPath.c_str(), newTimes, procSl == ProcSymlink::asLink ? AT_SYMLINK_NOFOLLOW : 0) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot write modification time of %x.", "%x", fmtPath(itemPath)), "utimensat");
}


namespace
{
#ifdef HAVE_SELINUX
//copy SELinux security context
void copySecurityContext(const Zstring& source, const Zstring& target, ProcSymlink procSl) //throw FileError
{
    char* contextSource = nullptr;
    const int rv = procSl == ProcSymlink::follow ?
                   ::getfilecon (source.c_str(), &contextSource) :
                   ::lgetfilecon(source.c_str(), &contextSource);
    if (rv < 0)
    {
        if (errno == ENODATA ||  //no security context (allegedly) is not an error condition on SELinux
            errno == EOPNOTSUPP) //extended attributes are not supported by the filesystem
            return;

        THROW_LAST_FILE_ERROR(replaceCpy("Cannot read security context of %x.", "%x", fmtPath(source)), "getfilecon");
    }
    RZ_ON_SCOPE_EXIT(::freecon(contextSource));

    {
        char* contextTarget = nullptr;
        const int rv2 = procSl == ProcSymlink::follow ?
                        ::getfilecon(target.c_str(), &contextTarget) :
                        ::lgetfilecon(target.c_str(), &contextTarget);
        if (rv2 < 0)
        {
            if (errno == EOPNOTSUPP)
                return;
            //else: still try to set security context
        }
        else
        {
            RZ_ON_SCOPE_EXIT(::freecon(contextTarget));

            if (::strcmp(contextSource, contextTarget) == 0) //nothing to do
                return;
        }
    }

    const int rv3 = procSl == ProcSymlink::follow ?
                    ::setfilecon(target.c_str(), contextSource) :
                    ::lsetfilecon(target.c_str(), contextSource);
    if (rv3 < 0)
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot write security context of %x.", "%x", fmtPath(target)), "setfilecon");
}
#endif
}


void rz::copyItemPermissions(const Zstring& sourcePath, const Zstring& targetPath, ProcSymlink procSl) //throw FileError
{
#ifdef HAVE_SELINUX
    copySecurityContext(sourcePath, targetPath, procSl); //throw FileError
#endif

    const struct stat sourceInfo = getItemStat(sourcePath, procSl); //throw FileError

    if (S_ISLNK(sourceInfo.st_mode)) //setting access permissions doesn't make sense for symlinks on Linux: there is no lchmod()
        return;

    const mode_t ownerAccess = S_ISDIR(sourceInfo.st_mode) ? S_IRWXU : (S_IRUSR | S_IWUSR);

    if (::chmod(targetPath.c_str(), (sourceInfo.st_mode & 07777) | ownerAccess) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot write permissions of %x.", "%x", fmtPath(targetPath)), "chmod");
}


void rz::createDirectory(const Zstring& dirPath) //throw FileError, ErrorTargetExisting
{
    try
    {
        //don't allow creating irregular folders!
        const Zstring dirName = getItemName(dirPath);

        if (std::all_of(dirName.begin(), dirName.end(), [](Zchar c) { return c == '.'; }))
            throw SysError(replaceCpy("Invalid folder name %x.", "%x", fmtPath(dirName)));

        const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

        if (::mkdir(dirPath.c_str(), mode) != 0)
        {
            const int ec = errno; //copy before directly or indirectly making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy("Cannot create directory %x.", "%x", fmtPath(dirPath)), formatSystemError("mkdir", ec));
            THROW_LAST_SYS_ERROR("mkdir");
        }
    }
    catch (const SysError& e) { throwFileError(replaceCpy("Cannot create directory %x.", "%x", fmtPath(dirPath)), e); }
}


void rz::createDirectoryIfMissingRecursion(const Zstring& dirPath) //throw FileError
{
    const std::optional<Zstring> parentPath = getParentFolderPath(dirPath);
    if (!parentPath) //device root
        return;

    try //generally we expect that path already exists (see: versioning, base folder, log file path) => check first
    {
        if (getItemType(dirPath) != ItemType::file) //throw FileError
            return; //already existing (or symlink, hopefully to a folder)
    }
    catch (FileError&) {} //not yet existing or access error? let's find out...

    createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    try
    {
        createDirectory(dirPath); //throw FileError, ErrorTargetExisting
    }
    catch (FileError&)
    {
        //race condition: someone else created the folder in the meantime?
        if (getItemTypeIfExists(dirPath) == ItemType::folder) //throw FileError
            return;
        throw;
    }
}
