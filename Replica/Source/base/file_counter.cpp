// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include "file_counter.h"
#include <rz/file_access.h>
#include <rz/file_traverser.h>
#include <rz/thread.h>
#include "link_inspector.h"

using namespace rz;
using namespace rpl;


namespace
{
class FileCounter
{
public:
    FileCounter(const CopyJob& job, size_t parallelism, const RunContext& ctx) :
        job_(job), ctx_(ctx), workers_(parallelism, "File counter") {}

    int run()
    {
        countFolder(job_.sourcePath, 0);
        workers_.wait();
        return fileCount_;
    }

private:
    void countFolder(const Zstring& folderPath, int depth)
    {
        if (depth > job_.maxDepth)
            return;

        workers_.run([this, folderPath, depth]
        {
            try
            {
                traverseFolder(folderPath, [&](const FileInfo& fi) //throw FileError
                {
                    if (job_.includeHidden || !isHiddenItem(fi.itemName))
                        ++fileCount_;
                },
                [&](const FolderInfo& fi) { countFolder(fi.fullPath, depth + 1); },

                [&](const SymlinkInfo& si)
                {
                    if (!job_.includeHidden && isHiddenItem(si.itemName))
                        return;
                    if (job_.preserveSymlinks)
                        ++fileCount_;
                    else
                        try
                        {
                            const LinkInfo li = inspectLink(si.fullPath); //throw FileError
                            if (li.targetExists && !li.isCyclic)
                            {
                                if (li.targetIsFolder)
                                    countFolder(si.fullPath, depth + 1);
                                else
                                    ++fileCount_;
                            }
                        }
                        catch (const FileError& e) { ctx_.logWarning(e.toString()); }
                });
            }
            catch (const FileError& e) //e.g. access denied: count what we can
            {
                ctx_.logWarning(e.toString());
            }
        }, true /*insertFront: depth-first*/);
    }

    const CopyJob& job_;
    const RunContext& ctx_;
    std::atomic<int> fileCount_{0};
    ThreadGroup<std::function<void()>> workers_; //declare last: joined before other members are destroyed
};
}


int rpl::countTotalFiles(const CopyJob& job, size_t parallelism, const RunContext& ctx) //throw FileError, ErrorSourceNotFound
{
    if (getItemTypeIfExists(job.sourcePath) == std::nullopt) //throw FileError
        throw ErrorSourceNotFound(replaceCpy("Source folder %x not found.", "%x", fmtPath(job.sourcePath)));

    return FileCounter(job, parallelism, ctx).run();
}
