// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include "copy_engine.h"
#include <algorithm>
#include <vector>
#include <rz/file_access.h>
#include <rz/file_traverser.h>
#include <rz/thread.h>
#include "conflict_resolver.h"
#include "link_inspector.h"

using namespace rz;
using namespace rpl;


namespace
{
//poll interval of the controlling thread: cancellation and fail-fast latency
constexpr std::chrono::milliseconds ENGINE_POLL_INTERVAL(100);


class TreeCopier
{
public:
    TreeCopier(const CopyJob& job, const EngineSettings& settings, ProgressAggregator& progress, const RunContext& ctx) :
        job_(job),
        retry_(settings.retry),
        symlinkCreator_(settings.symlinkCreator ? *settings.symlinkCreator : getNativeSymlinkCreator()),
        progress_(progress),
        ctx_(ctx),
        workers_(settings.threadCount, "Copy worker") {}

    void run(const AbortFlag& abortFlag) //throw FileError, AbortProcess
    {
        scheduleFolder({job_.sourcePath, job_.destinationPath, 0});

        for (;;)
        {
            const bool allDone = workers_.waitFor(ENGINE_POLL_INTERVAL);

            if (std::exception_ptr ep = firstError_.access([](const std::exception_ptr& ep2) { return ep2; }))
                std::rethrow_exception(ep); //~ThreadGroup() stops remaining workers

            if (abortFlag.isAborted())
                throw AbortProcess();

            if (allDone)
            {
                applyFolderTimes();
                return;
            }
        }
    }

private:
    TreeCopier           (const TreeCopier&) = delete;
    TreeCopier& operator=(const TreeCopier&) = delete;

    void scheduleTask(std::function<void()>&& task, bool insertFront)
    {
        workers_.run([this, task = std::move(task)]
        {
            if (failed_) //fail-fast: don't start new work
                return;
            try
            {
                task(); //throw FileError, ThreadStopRequest
            }
            catch (const FileError&)        { reportFatalError(std::current_exception()); }
            catch (const std::exception&)   { reportFatalError(std::current_exception()); }
            //ThreadStopRequest: end worker thread
        }, insertFront);
    }

    void reportFatalError(const std::exception_ptr& ep)
    {
        firstError_.access([&](std::exception_ptr& ep2) { if (!ep2) ep2 = ep; });
        failed_ = true;
    }

    //subfolders first: depth-first traversal keeps the number of open work items low
    void scheduleFolder(DirectoryFrame&& frame)
    {
        scheduleTask([this, frame = std::move(frame)] { copyFolder(frame); }, true /*insertFront*/);
    }

    void copyFolder(const DirectoryFrame& frame); //throw FileError, ThreadStopRequest
    void copyFile(const Zstring& sourcePath, const Zstring& targetPath, uint64_t fileSize, const timespec& modTime); //throw FileError, ThreadStopRequest
    void copySymlink(const Zstring& linkPath, const Zstring& targetPath, int depth); //throw FileError, ThreadStopRequest

    void prepareTarget(const ConflictDecision& decision); //throw FileError
    void applyFolderTimes();

    struct FolderTime
    {
        Zstring targetPath;
        timespec modTime = {};
        int depth = 0;
    };

    const CopyJob& job_;
    const RetrySettings retry_;
    const SymlinkCreator& symlinkCreator_;
    ProgressAggregator& progress_;
    const RunContext& ctx_;

    Protected<std::vector<FolderTime>> folderTimes_; //applied after all children are written
    Protected<std::exception_ptr> firstError_;
    std::atomic<bool> failed_{false};

    ThreadGroup<std::function<void()>> workers_; //declare last: joined before other members are destroyed
};


void TreeCopier::copyFolder(const DirectoryFrame& frame) //throw FileError, ThreadStopRequest
{
    interruptionPoint(); //throw ThreadStopRequest

    //1. source must exist
    const std::optional<ItemType> sourceType = getItemTypeIfExists(frame.sourcePath); //throw FileError
    if (!sourceType)
        throw ErrorSourceNotFound(replaceCpy("Source folder %x not found.", "%x", fmtPath(frame.sourcePath)));

    //2. folder reached through a link: don't descend into ourselves
    if (*sourceType == ItemType::symlink)
        if (const std::optional<Zstring> resolvedPath = resolveSymlinkTarget(frame.sourcePath)) //throw FileError, ErrorCyclicLink
            if (isCyclicLink(frame.sourcePath, *resolvedPath)) //throw FileError
                throw ErrorCyclicLink(replaceCpy(replaceCpy("Symbolic link %x points to its own parent folder %y.", "%x",
                                                            fmtPath(frame.sourcePath)), "%y", fmtPath(*resolvedPath)));
    //3. depth limit
    if (frame.depth > job_.maxDepth)
    {
        ctx_.logInfo(replaceCpy("Maximum folder depth reached: %x not copied.", "%x", fmtPath(frame.sourcePath)));
        return;
    }

    //4. create target folder (idempotent) + metadata: best effort
    createDirectoryIfMissingRecursion(frame.targetPath); //throw FileError

    try
    {
        copyItemPermissions(frame.sourcePath, frame.targetPath, ProcSymlink::follow); //throw FileError

        const FolderTime ft{frame.targetPath, getItemStat(frame.sourcePath, ProcSymlink::follow).st_mtim, frame.depth}; //throw FileError
        folderTimes_.access([&](std::vector<FolderTime>& folderTimes) { folderTimes.push_back(ft); });
    }
    catch (const FileError& e) { ctx_.logWarning(e.toString()); }

    ctx_.logInfo(replaceCpy("Entering folder %x", "%x", fmtPath(frame.sourcePath)));

    //5. enumerate + 6. schedule children
    traverseFolder(frame.sourcePath, [&](const FileInfo& fi) //throw FileError, ErrorAccessDenied
    {
        if (!job_.includeHidden && isHiddenItem(fi.itemName))
            return;

        scheduleTask([this, fi, targetPath = appendPath(frame.targetPath, fi.itemName)]
        { copyFile(fi.fullPath, targetPath, fi.fileSize, fi.modTime); }, false /*insertFront*/);
    },

    [&](const FolderInfo& fi)
    {
        scheduleFolder({fi.fullPath, appendPath(frame.targetPath, fi.itemName), frame.depth + 1});
    },

    [&](const SymlinkInfo& si)
    {
        if (!job_.includeHidden && isHiddenItem(si.itemName))
            return;

        scheduleTask([this, si, targetPath = appendPath(frame.targetPath, si.itemName), depth = frame.depth]
        { copySymlink(si.fullPath, targetPath, depth); }, false /*insertFront*/);
    });
}


//creating child items updates a folder's modification time => set once all work is done, deepest folders first
void TreeCopier::applyFolderTimes()
{
    std::vector<FolderTime> folderTimes = folderTimes_.access([](std::vector<FolderTime>& ft) { return std::exchange(ft, {}); });

    std::stable_sort(folderTimes.begin(), folderTimes.end(), [](const FolderTime& lhs, const FolderTime& rhs) { return lhs.depth > rhs.depth; });

    for (const FolderTime& ft : folderTimes)
        try
        {
            setFileTime(ft.targetPath, ft.modTime, ProcSymlink::follow); //throw FileError
        }
        catch (const FileError& e) { ctx_.logWarning(e.toString()); }
}


void TreeCopier::prepareTarget(const ConflictDecision& decision) //throw FileError
{
    if (!decision.replaceExisting)
        return;

    switch (getItemType(decision.targetPath)) //throw FileError
    {
        case ItemType::file:
            removeFilePlain(decision.targetPath); //throw FileError
            break;
        case ItemType::symlink:
            removeSymlinkPlain(decision.targetPath); //throw FileError
            break;
        case ItemType::folder: //never delete a folder tree in place of a file
            throw FileError(replaceCpy("The name %x is already used by another item.", "%x", fmtPath(decision.targetPath)));
    }
}


void TreeCopier::copyFile(const Zstring& sourcePath, const Zstring& targetPath, uint64_t fileSize, const timespec& modTime) //throw FileError, ThreadStopRequest
{
    interruptionPoint(); //throw ThreadStopRequest

    const ConflictDecision decision = resolveConflict(targetPath, job_.overwrite, job_.renameOnConflict); //throw FileError
    switch (decision.action)
    {
        case ConflictDecision::Action::skip:
            ctx_.logInfo(replaceCpy("Target %x already exists: skipped.", "%x", fmtPath(targetPath)));
            progress_.fileCopied();
            return;

        case ConflictDecision::Action::proceedRenamed:
            ctx_.logInfo(replaceCpy(replaceCpy("Target %x already exists: writing to %y instead.", "%x", fmtPath(targetPath)), "%y", fmtPath(decision.targetPath)));
            break;

        case ConflictDecision::Action::proceed:
            if (decision.replaceExisting)
                ctx_.logInfo(replaceCpy("Overwriting %x", "%x", fmtPath(targetPath)));
            break;
    }
    prepareTarget(decision); //throw FileError

    const TransferOutcome outcome = transferWithRetry(sourcePath, decision.targetPath, fileSize, retry_, ctx_); //throw FileError, ThreadStopRequest
    if (outcome == TransferOutcome::success)
    {
        try
        {
            setFileTime(decision.targetPath, modTime, ProcSymlink::follow); //throw FileError
        }
        catch (const FileError& e) { ctx_.logWarning(e.toString()); }

        ctx_.logInfo(replaceCpy(replaceCpy("Copied file %x to %y", "%x", fmtPath(sourcePath)), "%y", fmtPath(decision.targetPath)));
    }
    progress_.fileCopied();
}


void TreeCopier::copySymlink(const Zstring& linkPath, const Zstring& targetPath, int depth) //throw FileError, ThreadStopRequest
{
    interruptionPoint(); //throw ThreadStopRequest

    const LinkInfo li = inspectLink(linkPath); //throw FileError
    if (li.isCyclic)
        throw ErrorCyclicLink(replaceCpy("Symbolic link %x points to its own parent folder or is part of a link loop.", "%x", fmtPath(linkPath)));

    if (job_.preserveSymlinks)
    {
        const ConflictDecision decision = resolveConflict(targetPath, job_.overwrite, job_.renameOnConflict); //throw FileError
        if (decision.action == ConflictDecision::Action::skip)
        {
            ctx_.logInfo(replaceCpy("Target %x already exists: skipped.", "%x", fmtPath(targetPath)));
            progress_.fileCopied();
            return;
        }
        prepareTarget(decision); //throw FileError

        symlinkCreator_.createSymlink(decision.targetPath, li.rawTarget, li.targetIsFolder); //throw ErrorLinkCreation
        try
        {
            setFileTime(decision.targetPath, getItemStat(linkPath, ProcSymlink::asLink).st_mtim, ProcSymlink::asLink); //throw FileError
        }
        catch (const FileError& e) { ctx_.logWarning(e.toString()); }

        ctx_.logInfo(replaceCpy(replaceCpy("Created symbolic link %x pointing to %y", "%x", fmtPath(decision.targetPath)), "%y", fmtPath(li.rawTarget)));
        progress_.fileCopied();
        return;
    }

    //follow link:
    if (!li.targetExists)
    {
        ctx_.logWarning(replaceCpy(replaceCpy("Symbolic link %x is broken: target %y not found.", "%x", fmtPath(linkPath)), "%y", fmtPath(li.rawTarget)));
        return;
    }

    if (li.targetIsFolder)
        scheduleFolder({linkPath, targetPath, depth + 1});
    else
    {
        const struct stat targetInfo = getItemStat(linkPath, ProcSymlink::follow); //throw FileError
        copyFile(linkPath, targetPath, static_cast<uint64_t>(targetInfo.st_size), targetInfo.st_mtim); //throw FileError, ThreadStopRequest
    }
}
}


void rpl::copyDirectoryTree(const CopyJob& job, const EngineSettings& settings, //throw FileError, ErrorSourceNotFound, ErrorCyclicLink, ErrorAccessDenied, ErrorLinkCreation, AbortProcess
                            ProgressAggregator& progress, const AbortFlag& abortFlag, const RunContext& ctx)
{
    ctx.logInfo(replaceCpy(replaceCpy("Copying %x to %y", "%x", fmtPath(job.sourcePath)), "%y", fmtPath(job.destinationPath)));

    TreeCopier(job, settings, progress, ctx).run(abortFlag); //throw FileError, AbortProcess
}
