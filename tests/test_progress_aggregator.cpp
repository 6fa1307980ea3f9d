// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include <catch2/catch.hpp>
#include <algorithm>
#include <mutex>
#include <vector>
#include <rz/thread.h>
#include "base/progress_aggregator.h"

using namespace rz;
using namespace rpl;


namespace
{
struct ProgressRecorder
{
    void operator()(int percent)
    {
        std::lock_guard dummy(lock);
        values.push_back(percent);
    }

    std::mutex lock;
    std::vector<int> values;
};
}


TEST_CASE("percent is rounded down", "[progress]")
{
    ProgressRecorder rec;
    ProgressAggregator progress(3, [&](int percent) { rec(percent); });

    CHECK(rec.values.empty());
    progress.fileCopied();
    progress.fileCopied();
    progress.fileCopied();

    CHECK(rec.values == std::vector<int>{33, 66, 100});
    CHECK(progress.getCompleted() == 3);
    CHECK(progress.getTotal() == 3);
}


TEST_CASE("nothing to copy reports 100 once", "[progress]")
{
    ProgressRecorder rec;
    ProgressAggregator progress(0, [&](int percent) { rec(percent); });

    CHECK(rec.values == std::vector<int>{100});

    progress.fileCopied();
    CHECK(rec.values == std::vector<int>{100});
}


TEST_CASE("more files than counted are clamped", "[progress]")
{
    ProgressRecorder rec;
    ProgressAggregator progress(2, [&](int percent) { rec(percent); });

    for (int i = 0; i < 4; ++i)
        progress.fileCopied();

    CHECK(rec.values == std::vector<int>{50, 100, 100, 100});
}


TEST_CASE("reported values never decrease under concurrency", "[progress]")
{
    const int threadCount    = 8;
    const int filesPerThread = 250;

    ProgressRecorder rec;
    ProgressAggregator progress(threadCount * filesPerThread, [&](int percent) { rec(percent); });
    {
        ThreadGroup<std::function<void()>> tg(threadCount, "Progress test");
        for (int i = 0; i < threadCount; ++i)
            tg.run([&progress]
            {
                for (int j = 0; j < filesPerThread; ++j)
                    progress.fileCopied();
            });
        tg.wait();
    }

    REQUIRE(rec.values.size() == static_cast<size_t>(threadCount * filesPerThread));
    CHECK(std::is_sorted(rec.values.begin(), rec.values.end()));
    CHECK(rec.values.back() == 100);
    CHECK(rec.values.front() >= 0);
}
