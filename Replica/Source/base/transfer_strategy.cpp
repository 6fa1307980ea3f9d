// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include "transfer_strategy.h"
#include <mutex>
#include <vector>
#include <rz/file_io.h>
#include <rz/thread.h>

using namespace rz;
using namespace rpl;


namespace
{
//analog to "cp" which copies "mode" (considering umask) by default:
mode_t getTargetPermissions(const struct stat& sourceInfo)
{
    return (sourceInfo.st_mode & (S_IRWXU | S_IRWXG | S_IRWXO)) | S_IWUSR; //we need write access to resume!
}


int getPercent(uint64_t bytesDone, uint64_t fileSize)
{
    return fileSize == 0 ? 100 : static_cast<int>(std::min<uint64_t>(bytesDone, fileSize) * 100 / fileSize);
}
}


uint64_t rpl::transferSequential(const Zstring& sourcePath, const Zstring& targetPath, uint64_t fileSize, uint64_t resumeFrom, //throw FileError, ErrorFileLocked, ThreadStopRequest
                                 const RunContext& ctx)
{
    FileInputPlain fileIn(sourcePath); //throw FileError, ErrorFileLocked

    FileOutputPlain fileOut(targetPath, FileOutputPlain::OpenMode::createOrAppend, getTargetPermissions(fileIn.getStatBuffered())); //throw FileError, ErrorFileLocked

    //drop anything beyond the resume position: might be a partially written chunk
    fileOut.truncate(resumeFrom); //throw FileError
    fileOut.seek    (resumeFrom); //
    fileIn .seek    (resumeFrom); //

    std::vector<std::byte> buffer(SEQUENTIAL_BUFFER_SIZE);
    uint64_t bytesCopied = 0;
    int lastPercentLogged = getPercent(resumeFrom, fileSize) / 10 * 10;

    for (;;)
    {
        interruptionPoint(); //throw ThreadStopRequest

        const size_t bytesRead = fileIn.tryRead(buffer.data(), buffer.size()); //throw FileError
        if (bytesRead == 0) //EOF
            break;

        writeAll(fileOut, buffer.data(), bytesRead); //throw FileError
        bytesCopied += bytesRead;

        const int percent = getPercent(resumeFrom + bytesCopied, fileSize);
        if (percent >= lastPercentLogged + 10 && percent < 100)
        {
            lastPercentLogged = percent / 10 * 10;
            ctx.logInfo(replaceCpy(replaceCpy("Copying %x: %y%", "%x", fmtPath(sourcePath)), "%y", numberTo<std::string>(lastPercentLogged)));
        }
    }

    fileOut.close(); //throw FileError
    fileIn .close(); //
    return bytesCopied;
}


uint64_t rpl::transferChunked(const Zstring& sourcePath, const Zstring& targetPath, uint64_t fileSize, uint64_t resumeFrom, //throw FileError, ErrorFileLocked, ThreadStopRequest
                              const RunContext& ctx)
{
    FileInputPlain fileIn(sourcePath); //throw FileError, ErrorFileLocked

    FileOutputPlain fileOut(targetPath, FileOutputPlain::OpenMode::createOrAppend, getTargetPermissions(fileIn.getStatBuffered())); //throw FileError, ErrorFileLocked

    std::mutex lockIn;  //serialize seek + read on the shared source handle
    std::mutex lockOut; //serialize seek + write on the shared target handle
    std::atomic<uint64_t> bytesCopied{0};
    Protected<std::exception_ptr> firstError;
    {
        //worker threads access the stack objects above => must be joined before they go out of scope!
        ThreadGroup<std::function<void()>> chunkWorkers(CHUNK_WORKER_COUNT, "Chunk copy");

        for (uint64_t chunkBegin = 0; chunkBegin < fileSize; chunkBegin += CHUNK_SIZE)
        {
            const size_t chunkLen = static_cast<size_t>(std::min(CHUNK_SIZE, fileSize - chunkBegin));

            if (chunkBegin + chunkLen <= resumeFrom) //already complete
                continue;

            chunkWorkers.run([&, chunkBegin, chunkLen]
            {
                try
                {
                    interruptionPoint(); //throw ThreadStopRequest

                    std::vector<std::byte> buffer(chunkLen);
                    size_t bytesRead = 0;
                    {
                        std::lock_guard dummy(lockIn);
                        fileIn.seek(chunkBegin);                              //throw FileError
                        bytesRead = readAll(fileIn, buffer.data(), chunkLen); //
                    }
                    if (bytesRead != chunkLen)
                        throw FileError(replaceCpy("Cannot read file %x.", "%x", fmtPath(sourcePath)),
                                        replaceCpy(replaceCpy("Unexpected size of data stream.\nExpected: %x bytes\nActual: %y bytes", "%x",
                                                              numberTo<std::string>(chunkLen)), "%y", numberTo<std::string>(bytesRead)));
                    interruptionPoint(); //throw ThreadStopRequest
                    {
                        std::lock_guard dummy(lockOut);
                        fileOut.seek(chunkBegin);                    //throw FileError
                        writeAll(fileOut, buffer.data(), bytesRead); //
                    }
                    bytesCopied += bytesRead;
                }
                catch (const FileError&)
                {
                    firstError.access([](std::exception_ptr& ep) { if (!ep) ep = std::current_exception(); });
                }
            });
        }

        chunkWorkers.wait(); //throw ThreadStopRequest
    }

    if (const std::exception_ptr ep = firstError.access([](const std::exception_ptr& ep2) { return ep2; }))
        std::rethrow_exception(ep);

    fileOut.truncate(fileSize); //throw FileError; in case the target was longer before

    fileOut.close(); //throw FileError
    fileIn .close(); //

    ctx.logInfo(replaceCpy(replaceCpy("Copied %x in chunks: %y bytes", "%x", fmtPath(sourcePath)), "%y", numberTo<std::string>(bytesCopied.load())));
    return bytesCopied;
}


uint64_t rpl::transferFile(const Zstring& sourcePath, const Zstring& targetPath, uint64_t fileSize, uint64_t resumeFrom, //throw FileError, ErrorFileLocked, ThreadStopRequest
                           const RunContext& ctx)
{
    if (fileSize > CHUNKED_SIZE_THRESHOLD)
        return transferChunked(sourcePath, targetPath, fileSize, resumeFrom, ctx); //throw FileError, ErrorFileLocked, ThreadStopRequest
    else
        return transferSequential(sourcePath, targetPath, fileSize, resumeFrom, ctx); //throw FileError, ErrorFileLocked, ThreadStopRequest
}
