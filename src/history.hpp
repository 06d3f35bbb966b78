#pragma once

#include "view_state.hpp"

#include <cstddef>
#include <deque>

// Bounded log of past view bounds. Overflow evicts the oldest entry.
class HistoryStack {
public:
    static constexpr size_t DEFAULT_CAPACITY = 20;

    explicit HistoryStack(size_t capacity = DEFAULT_CAPACITY)
        : cap(capacity > 0 ? capacity : 1)
    {
    }

    void push(const Bounds& b)
    {
        entries.push_back(b);
        if (entries.size() > cap)
            entries.pop_front();
    }

    // Most recent entry; false when empty.
    bool pop(Bounds& out)
    {
        if (entries.empty()) return false;
        out = entries.back();
        entries.pop_back();
        return true;
    }

    const Bounds& at(size_t i) const { return entries.at(i); }
    size_t size()     const { return entries.size(); }
    size_t capacity() const { return cap; }
    bool   empty()    const { return entries.empty(); }
    void   clear()          { entries.clear(); }

private:
    std::deque<Bounds> entries;
    size_t             cap;
};
