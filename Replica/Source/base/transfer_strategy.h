// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef TRANSFER_STRATEGY_H_9283746510293847
#define TRANSFER_STRATEGY_H_9283746510293847

#include <rz/file_error.h>
#include "process_callback.h"


namespace rpl
{
const size_t   SEQUENTIAL_BUFFER_SIZE = 80 * 1024;       //[bytes]
const uint64_t CHUNK_SIZE             = 4 * 1024 * 1024; //[bytes]
const uint64_t CHUNKED_SIZE_THRESHOLD = 4 * 1024 * 1024; //files larger than this use chunked transfer
const size_t   CHUNK_WORKER_COUNT     = 4;               //per file

/*  copy file content of "sourcePath" starting at byte "resumeFrom" to "targetPath":
    - target is created if missing (source permission bits), else content before "resumeFrom" is kept
    - target is left incomplete on error or cancellation: no temp file, no rename
    - returns number of bytes copied by this call                                          */
uint64_t transferFile(const Zstring& sourcePath, const Zstring& targetPath, uint64_t fileSize, uint64_t resumeFrom, //throw FileError, ErrorFileLocked, ThreadStopRequest
                      const RunContext& ctx);

//single stream through an 80 KiB buffer
uint64_t transferSequential(const Zstring& sourcePath, const Zstring& targetPath, uint64_t fileSize, uint64_t resumeFrom, //throw FileError, ErrorFileLocked, ThreadStopRequest
                            const RunContext& ctx);

//4 MiB chunks copied concurrently by 4 workers through shared, mutex-protected handles
uint64_t transferChunked(const Zstring& sourcePath, const Zstring& targetPath, uint64_t fileSize, uint64_t resumeFrom, //throw FileError, ErrorFileLocked, ThreadStopRequest
                         const RunContext& ctx);
}

#endif //TRANSFER_STRATEGY_H_9283746510293847
