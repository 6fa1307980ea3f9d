// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include "retry_policy.h"
#include <rz/file_access.h>
#include <rz/thread.h>
#include "transfer_strategy.h"

using namespace rz;
using namespace rpl;


namespace
{
uint64_t getResumePosition(const Zstring& targetPath, uint64_t fileSize) //throw FileError
{
    if (getItemTypeIfExists(targetPath) != ItemType::file) //throw FileError
        return 0;

    return std::min(getFileSize(targetPath), fileSize); //throw FileError
}
}


TransferOutcome rpl::transferWithRetry(const Zstring& sourcePath, const Zstring& targetPath, uint64_t fileSize, //throw FileError, ThreadStopRequest
                                       const RetrySettings& settings, const RunContext& ctx)
{
    for (size_t attempt = 1;; ++attempt)
        try
        {
            //first attempt: existing content is not ours => start from scratch
            const uint64_t resumeFrom = attempt > 1 ? getResumePosition(targetPath, fileSize) : 0; //throw FileError

            transferFile(sourcePath, targetPath, fileSize, resumeFrom, ctx); //throw FileError, ErrorFileLocked, ThreadStopRequest
            return TransferOutcome::success;
        }
        catch (const ErrorFileLocked& e)
        {
            if (attempt >= settings.attemptsMax)
            {
                ctx.logError(e.toString() + "\n\n" +
                             replaceCpy("File skipped after %x attempts.", "%x", numberTo<std::string>(attempt)));
                try
                {
                    if (getItemTypeIfExists(targetPath) == ItemType::file) //throw FileError
                        removeFilePlain(targetPath); //throw FileError
                }
                catch (const FileError& e2) { ctx.logWarning(e2.toString()); }

                return TransferOutcome::failed;
            }

            ctx.logWarning(e.toString() + "\n\n" +
                           replaceCpy(replaceCpy("Retrying in %x ms: attempt %y", "%x", numberTo<std::string>(settings.delay.count())),
                                      "%y", numberTo<std::string>(attempt + 1) + '/' + numberTo<std::string>(settings.attemptsMax)));

            interruptibleSleep(settings.delay); //throw ThreadStopRequest
        }
}
