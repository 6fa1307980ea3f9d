// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef FILE_COUNTER_H_0192837465748392
#define FILE_COUNTER_H_0192837465748392

#include <rz/file_error.h>
#include "structures.h"
#include "process_callback.h"


namespace rpl
{
const size_t FILE_COUNTER_PARALLELISM = 5;

/*  number of progress events a copy of "job" is expected to produce:
    same traversal rules as the copy engine (hidden filter, depth limit, symlink handling)
    - unreadable subtrees count as 0 (logged as warning)
    - missing source folder: ErrorSourceNotFound                                           */
int countTotalFiles(const CopyJob& job, size_t parallelism, const RunContext& ctx); //throw FileError, ErrorSourceNotFound
}

#endif //FILE_COUNTER_H_0192837465748392
