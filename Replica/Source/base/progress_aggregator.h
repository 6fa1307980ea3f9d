// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef PROGRESS_AGGREGATOR_H_7465839201029384
#define PROGRESS_AGGREGATOR_H_7465839201029384

#include <functional>
#include <mutex>
#include <atomic>


namespace rpl
{
/*  run-wide completion percentage: floor(completed * 100 / total), at most 100
    - reported values never decrease, even if completions race
    - total == 0: 100 is reported once on construction, nothing afterwards      */
class ProgressAggregator
{
public:
    ProgressAggregator(int totalFiles, const std::function<void(int percent)>& onProgress /*noexcept! any thread*/);

    //context of any worker thread: file copied, skipped or failed
    void fileCopied();

    int getTotal    () const { return total_; }
    int getCompleted() const { return completed_; }

private:
    ProgressAggregator           (const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    const int total_;
    std::atomic<int> completed_{0};

    std::mutex lockReport_; //serialize notification
    int lastReported_ = 0;
    const std::function<void(int percent)> onProgress_;
};
}

#endif //PROGRESS_AGGREGATOR_H_7465839201029384
