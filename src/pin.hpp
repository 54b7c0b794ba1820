#ifndef __TETHER_PIN_HPP
#define __TETHER_PIN_HPP

#include "base.hpp"
#include "value.hpp"

namespace tether {

// Callables registered as foreign commands are kept alive by the pin table,
// which is keyed by callable identity and counts registrations. An entry is
// removed when its count drops to zero, which only happens in response to the
// foreign runtime's command deletion notification.

// pin a callable and return its identity
u64 pin_callable(const host_callable& fn);
// Decrement the pin count for id. Returns false (and logs a warning) if id
// isn't pinned.
bool unpin_callable(u64 id);
// the pinned procedure with identity id, or nullptr
shared_ptr<command_proc> find_pinned(u64 id);

// number of distinct callables currently pinned
u32 pinned_count();
// number of registrations holding the callable with identity id
u32 pin_count(u64 id);

}

#endif
