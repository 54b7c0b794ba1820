#ifndef __TETHER_EVENTS_HPP
#define __TETHER_EVENTS_HPP

#include "base.hpp"

namespace tether {

// event flags, with the same values as the TCL_*_EVENTS flags
constexpr int EV_DONT_WAIT = 1 << 1;
constexpr int EV_WINDOW    = 1 << 2;
constexpr int EV_FILE      = 1 << 3;
constexpr int EV_TIMER     = 1 << 4;
constexpr int EV_IDLE      = 1 << 5;
constexpr int EV_ALL       = ~EV_DONT_WAIT;

// upper bound on events handled by one call to do_events()
constexpr u32 DEFAULT_EVENT_BOUND = 10000;

// Process one event of the kinds selected by flags. Returns true if an event
// was processed. Blocks unless EV_DONT_WAIT is given.
bool do_one_event(int flags=EV_ALL | EV_DONT_WAIT);

// Process pending events without waiting until none are left or max_events
// have been handled, and return the number processed. The bound keeps
// handlers that schedule new events from running forever.
u32 do_events(int flags=EV_ALL, u32 max_events=DEFAULT_EVENT_BOUND);

}

#endif
