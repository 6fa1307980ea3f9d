// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef FILE_PATH_H_0192837465019283
#define FILE_PATH_H_0192837465019283

#include <optional>
#include "zstring.h"


namespace rz
{
const Zchar FILE_NAME_SEPARATOR = '/';

std::optional<Zstring> getParentFolderPath(const Zstring& itemPath); //no value for root or relative single-component path
inline Zstring getItemName(const Zstring& itemPath) { return Zstring(afterLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::all)); }

//"file.txt" -> "txt", ".profile" -> "", "archive.tar.gz" -> "gz"
Zstring getFileExtension(const Zstring& filePath);

Zstring appendPath(const Zstring& basePath, const Zstring& relPath);

//remove trailing separators except for "/"
Zstring trimTrailingSeparator(Zstring path);

//component-wise: "/a/b" is a parent of "/a/b/c", but not of "/a/bc"; equal paths count as well
bool isSameOrParentPath(const Zstring& parentPath, const Zstring& childPath);
}

#endif //FILE_PATH_H_0192837465019283
