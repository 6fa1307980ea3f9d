// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef COPY_ENGINE_H_2019384756102938
#define COPY_ENGINE_H_2019384756102938

#include <thread>
#include <rz/file_error.h>
#include "structures.h"
#include "process_callback.h"
#include "retry_policy.h"
#include "progress_aggregator.h"
#include "symlink_creator.h"


namespace rpl
{
struct EngineSettings
{
    size_t threadCount = std::max(std::thread::hardware_concurrency(), 1U); //run-wide: folders and files share the same workers
    RetrySettings retry;
    const SymlinkCreator* symlinkCreator = nullptr; //optional: native creator if nullptr
};

/*  replicate the folder tree of job.sourcePath below job.destinationPath
    - fail-fast: the first fatal error stops all workers and is rethrown with its original type
    - cancellation: throws AbortProcess once "abortFlag" is set; in-flight work stops at the next interruption point
    - no rollback: whatever was copied so far remains                                                                  */
void copyDirectoryTree(const CopyJob& job, const EngineSettings& settings, //throw FileError, ErrorSourceNotFound, ErrorCyclicLink, ErrorAccessDenied, ErrorLinkCreation, AbortProcess
                       ProgressAggregator& progress, const AbortFlag& abortFlag, const RunContext& ctx);
}

#endif //COPY_ENGINE_H_2019384756102938
