#pragma once

#include <chrono>

using Clock = std::chrono::steady_clock;

// When the host should call update() again
struct NextUpdate
{
    enum class Kind
    {
        // redraw and update as soon as possible
        Soonest,
        WaitUntil,
        // nothing scheduled, wait for the next external event
        Latest,
    };

    Kind kind = Kind::Latest;
    Clock::time_point deadline;

    static NextUpdate soonest()
    {
        return NextUpdate{Kind::Soonest, {}};
    }

    static NextUpdate waitUntil(Clock::time_point t)
    {
        return NextUpdate{Kind::WaitUntil, t};
    }

    static NextUpdate latest()
    {
        return NextUpdate{Kind::Latest, {}};
    }

    static NextUpdate earliest(const NextUpdate& a, const NextUpdate& b)
    {
        if(a.kind == Kind::Soonest || b.kind == Kind::Latest)
        {
            return a;
        }
        if(b.kind == Kind::Soonest || a.kind == Kind::Latest)
        {
            return b;
        }
        return a.deadline <= b.deadline ? a : b;
    }
};
