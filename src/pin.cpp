#include "pin.hpp"
#include "log.hpp"
#include "table.hpp"

namespace tether {

struct pin_entry {
    shared_ptr<command_proc> proc;
    u32 count;
};

static table<u64, pin_entry> pins;

u64 pin_callable(const host_callable& fn) {
    auto id = fn.id();
    auto e = pins.get_ptr(id);
    if (e == nullptr) {
        pins.insert(id, pin_entry{fn.proc, 1});
    } else {
        ++e->count;
    }
    return id;
}

bool unpin_callable(u64 id) {
    auto e = pins.get_ptr(id);
    if (e == nullptr) {
        get_logger()->log_warning("pin",
                "release of a callable that is not pinned");
        return false;
    }
    if (--e->count == 0) {
        pins.remove(id);
    }
    return true;
}

shared_ptr<command_proc> find_pinned(u64 id) {
    auto e = pins.get_ptr(id);
    return e == nullptr ? nullptr : e->proc;
}

u32 pinned_count() {
    return pins.get_size();
}

u32 pin_count(u64 id) {
    auto e = pins.get_ptr(id);
    return e == nullptr ? 0 : e->count;
}

}
