// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef FILE_TRAVERSER_H_2938475610293847
#define FILE_TRAVERSER_H_2938475610293847

#include <functional>
#include "file_error.h"


namespace rz
{
struct FileInfo
{
    Zstring itemName;
    Zstring fullPath;
    uint64_t fileSize = 0; //[bytes]
    timespec modTime = {};
};

struct FolderInfo
{
    Zstring itemName;
    Zstring fullPath;
};

struct SymlinkInfo
{
    Zstring itemName;
    Zstring fullPath;
};

//- non-recursive
//- "." and ".." are skipped
void traverseFolder(const Zstring& dirPath,
                    const std::function<void(const FileInfo&    fi)>& onFile,  /*optional*/
                    const std::function<void(const FolderInfo&  fi)>& onFolder,/*optional*/
                    const std::function<void(const SymlinkInfo& si)>& onSymlink/*optional*/); //throw FileError, ErrorAccessDenied, X
}

#endif //FILE_TRAVERSER_H_2938475610293847
