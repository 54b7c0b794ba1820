#ifndef __TETHER_TYPES_HPP
#define __TETHER_TYPES_HPP

#include "base.hpp"
#include "handle.hpp"

namespace tether {

// Type tags derived from an object's internal representation. Untyped and
// unrecognized representations are read back as text.
enum type_tag {
    TT_NULL,
    TT_UNTYPED,
    TT_BOOLEAN,
    TT_INT,
    TT_WIDE_INT,
    TT_DOUBLE,
    TT_STRING,
    TT_LIST
};

string type_tag_name(type_tag tag);

// Initialize the foreign library and record the type records of the builtin
// object types. This is idempotent. argv0 is passed to Tcl_FindExecutable on
// the first call only.
void init_library(const char* argv0=nullptr);

// Determine an object's tag by comparing its type record against the recorded
// ones. When the int and wide-int records coincide, TT_INT is reported.
type_tag classify(const Tcl_Obj* obj);
type_tag classify(const obj_handle& h);

// true if the int and wide-int probes yielded the same type record (as on
// platforms where Tcl_WideInt is long)
bool same_int_types();

// version string of the loaded foreign library, e.g. "8.6.13"
string foreign_version();

}

#endif
