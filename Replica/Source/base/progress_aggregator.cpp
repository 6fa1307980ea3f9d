// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include "progress_aggregator.h"
#include <algorithm>
#include <cstdint>

using namespace rpl;


ProgressAggregator::ProgressAggregator(int totalFiles, const std::function<void(int percent)>& onProgress) :
    total_(std::max(totalFiles, 0)),
    onProgress_(onProgress)
{
    if (total_ == 0) //nothing to do = done
    {
        lastReported_ = 100;
        if (onProgress_)
            onProgress_(100);
    }
}


void ProgressAggregator::fileCopied()
{
    const int completed = ++completed_;

    if (total_ == 0) //already reported
        return;

    //pre-count may be too low if the source changed meanwhile => clamp
    const int percent = static_cast<int>(std::min<int64_t>(100, static_cast<int64_t>(completed) * 100 / total_));

    std::lock_guard dummy(lockReport_);
    lastReported_ = std::max(lastReported_, percent);

    if (onProgress_)
        onProgress_(lastReported_);
}
