#ifndef __TETHER_CONSTRUCT_HPP
#define __TETHER_CONSTRUCT_HPP

#include "base.hpp"
#include "handle.hpp"
#include "value.hpp"

namespace tether {

class interpreter;

// Create a foreign object for a host value. Handles are returned unchanged,
// sequences become lists, and callables are registered as commands in interp
// (or the current interpreter when interp is null) and replaced by the
// command name. Throws type_conversion_error for integers wider than the
// foreign wide-int type and unsupported_value_error for byte arrays and empty
// callables.
obj_handle new_object(const host_value& v, interpreter* interp=nullptr);

}

#endif
