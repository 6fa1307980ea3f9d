// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef FILE_ACCESS_H_6029384756102938
#define FILE_ACCESS_H_6029384756102938

#include <optional>
#include <sys/stat.h>
#include "file_path.h"
#include "file_error.h"


namespace rz
{

enum class ItemType
{
    file,
    folder,
    symlink,
};
//(hard) symlink-aware: does not follow links
ItemType getItemType(const Zstring& itemPath); //throw FileError
//- not existing: no value
//- parent folder not existing or not a folder: no value, too
std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath); //throw FileError

inline bool itemExists(const Zstring& itemPath) { return static_cast<bool>(getItemTypeIfExists(itemPath)); } //throw FileError

enum class ProcSymlink
{
    asLink,
    follow
};
struct stat getItemStat(const Zstring& itemPath, ProcSymlink procSl); //throw FileError

uint64_t getFileSize(const Zstring& filePath); //throw FileError

void removeFilePlain   (const Zstring& filePath); //throw FileError; ERROR if not existing
void removeSymlinkPlain(const Zstring& linkPath); //throw FileError; ERROR if not existing
void removeDirectoryPlain(const Zstring& dirPath); //throw FileError; ERROR if not existing or not empty

//rename file or empty folder: atomic if within the same file system
void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting); //throw FileError, ErrorTargetExisting

void setFileTime(const Zstring& itemPath, const timespec& modTime, ProcSymlink procSl); //throw FileError

//copy permission bits + SELinux security context; the owner always keeps rwx on folders, rw on files
void copyItemPermissions(const Zstring& sourcePath, const Zstring& targetPath, ProcSymlink procSl); //throw FileError

//fail if already existing or parent directory not existing:
void createDirectory(const Zstring& dirPath); //throw FileError, ErrorTargetExisting

//creates parent directories recursively if not existing
void createDirectoryIfMissingRecursion(const Zstring& dirPath); //throw FileError
}

#endif //FILE_ACCESS_H_6029384756102938
