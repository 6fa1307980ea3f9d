// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include "file_path.h"

using namespace rz;


std::optional<Zstring> rz::getParentFolderPath(const Zstring& itemPath)
{
    const Zstring path = trimTrailingSeparator(itemPath);

    const size_t pos = path.rfind(FILE_NAME_SEPARATOR);
    if (pos == Zstring::npos || path == "/")
        return std::nullopt;

    if (pos == 0)
        return Zstring(1, FILE_NAME_SEPARATOR);
    return path.substr(0, pos);
}


Zstring rz::getFileExtension(const Zstring& filePath)
{
    const std::string_view fileName = afterLast(filePath, FILE_NAME_SEPARATOR, IfNotFoundReturn::all);

    const size_t pos = fileName.rfind('.');
    if (pos == std::string_view::npos || pos == 0) //leading dot: hidden file, not an extension
        return Zstring();
    return Zstring(fileName.substr(pos + 1));
}


Zstring rz::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    if (relPath.empty())
        return basePath;

    if (basePath.empty()) //basePath might be a relative path, too!
        return relPath;

    if (endsWith(basePath, FILE_NAME_SEPARATOR))
        return basePath + relPath;

    Zstring output = basePath;
    output.reserve(basePath.size() + 1 + relPath.size()); //append all three strings using a single memory allocation
    output += FILE_NAME_SEPARATOR;
    output += relPath;
    return output;
}


Zstring rz::trimTrailingSeparator(Zstring path)
{
    while (path.size() > 1 && endsWith(path, FILE_NAME_SEPARATOR))
        path.pop_back();
    return path;
}


bool rz::isSameOrParentPath(const Zstring& parentPath, const Zstring& childPath)
{
    const Zstring parent = trimTrailingSeparator(parentPath);
    const Zstring child  = trimTrailingSeparator(childPath);

    if (parent == child)
        return true;

    if (parent == "/")
        return startsWith(child, FILE_NAME_SEPARATOR);

    return startsWith(child, parent) && child.size() > parent.size() && child[parent.size()] == FILE_NAME_SEPARATOR;
}
