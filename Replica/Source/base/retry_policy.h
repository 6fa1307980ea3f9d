// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef RETRY_POLICY_H_5610293847561029
#define RETRY_POLICY_H_5610293847561029

#include <chrono>
#include <rz/file_error.h>
#include "structures.h"
#include "process_callback.h"


namespace rpl
{
struct RetrySettings
{
    size_t attemptsMax = 3;
    std::chrono::milliseconds delay{2000};
};

/*  retry file transfer on ErrorFileLocked only:
    - first attempt starts at byte 0, later attempts resume from the bytes already present at the target
    - retries exhausted: error is logged, partial target is removed, returns "failed"
    - other errors and cancellation propagate immediately                               */
TransferOutcome transferWithRetry(const Zstring& sourcePath, const Zstring& targetPath, uint64_t fileSize, //throw FileError, ThreadStopRequest
                                  const RetrySettings& settings, const RunContext& ctx);
}

#endif //RETRY_POLICY_H_5610293847561029
