// Copyright (C) 2025, Moritz Scheer

#pragma once

#include "../utils/types.hpp"

namespace wtwire
{
namespace networking
{
namespace scheduler
{

//
// Resumes task until it stops suspending. wait() is called on every suspension and blocks until the task's source
// or sink may make progress, a negative return from wait() aborts the run.
//
template <typename task, typename wait_fn> auto run(task &t, wait_fn wait) -> decltype(t.poll())
{
    while (true)
    {
        auto res = t.poll();
        if (res != WTWIRE_ERR_AGAIN)
        {
            return res;
        }

        int err = wait();
        if (err < 0)
        {
            return err;
        }
    }
}

//
// For sources and sinks that make progress on their own between polls.
//
template <typename task> auto run(task &t) -> decltype(t.poll())
{
    return run(t, []() { return 0; });
}

}; // namespace scheduler
}; // namespace networking
}; // namespace wtwire
