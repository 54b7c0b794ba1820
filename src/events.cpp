#include "events.hpp"
#include "types.hpp"

#include <tcl.h>

namespace tether {

static_assert(EV_DONT_WAIT == TCL_DONT_WAIT);
static_assert(EV_WINDOW == TCL_WINDOW_EVENTS);
static_assert(EV_FILE == TCL_FILE_EVENTS);
static_assert(EV_TIMER == TCL_TIMER_EVENTS);
static_assert(EV_IDLE == TCL_IDLE_EVENTS);
static_assert(EV_ALL == TCL_ALL_EVENTS);

bool do_one_event(int flags) {
    init_library();
    return Tcl_DoOneEvent(flags) != 0;
}

u32 do_events(int flags, u32 max_events) {
    init_library();
    u32 n = 0;
    while (n < max_events && Tcl_DoOneEvent(flags | EV_DONT_WAIT) != 0) {
        ++n;
    }
    return n;
}

}
