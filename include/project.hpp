#ifndef __TETHER_PROJECT_HPP
#define __TETHER_PROJECT_HPP

#include "base.hpp"
#include "handle.hpp"
#include "value.hpp"

namespace tether {

class interpreter;

// Convert a foreign object to a host value according to its current type
// tag. Lists are decomposed recursively and their element type promoted.
// Text, untyped and unrecognized objects become strings, and a null handle
// becomes nothing. Projection never changes an object's representation.
host_value project(const obj_handle& h);
// same as above for a borrowed object pointer
host_value project(Tcl_Obj* obj);

// Typed extraction using the foreign runtime's own conversions, which may
// change the object's internal representation. On failure these throw
// type_conversion_error. If interp is given, its result receives the
// foreign error message as well.
bool get_bool(const obj_handle& h, interpreter* interp=nullptr);
i32 get_int(const obj_handle& h, interpreter* interp=nullptr);
i64 get_wide(const obj_handle& h, interpreter* interp=nullptr);
f64 get_double(const obj_handle& h, interpreter* interp=nullptr);

}

#endif
