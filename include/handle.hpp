#ifndef __TETHER_HANDLE_HPP
#define __TETHER_HANDLE_HPP

#include "base.hpp"

#include <tcl.h>

namespace tether {

// An obj_handle owns exactly one reference to a Tcl_Obj. Copies take another
// reference, moves transfer it, and the destructor gives it back. A handle may
// also be null, in which case it owns nothing.
//
// Tcl objects are copy-on-write: an object with more than one reference must
// not be modified in place. Writers call assert_writable() first and take a
// duplicate() when the object is shared.
class obj_handle {
private:
    Tcl_Obj* obj;

public:
    obj_handle() noexcept
        : obj{nullptr} {
    }
    // takes a new reference to o, which may be null
    explicit obj_handle(Tcl_Obj* o);
    obj_handle(const obj_handle& src);
    obj_handle(obj_handle&& src) noexcept;
    ~obj_handle();

    obj_handle& operator=(const obj_handle& src);
    obj_handle& operator=(obj_handle&& src) noexcept;

    // release the reference early. The handle becomes null.
    void reset();

    // the wrapped object (borrowed). nullptr for a null handle.
    Tcl_Obj* get() const {
        return obj;
    }
    bool is_null() const {
        return obj == nullptr;
    }

    // reference count of the wrapped object, including this handle. A null
    // handle reports 0.
    int refcount() const;
    bool is_shared() const;

    // throw shared_mutation_error unless this handle may be modified in place
    void assert_writable() const;

    // an independent copy with its own reference count of one. The rvalue
    // form reuses the object when this handle is its only owner.
    obj_handle duplicate() const&;
    obj_handle duplicate() &&;

    // string representation of the object (the empty string for null)
    string as_string() const;
    // the foreign runtime's name for the current internal representation. An
    // object with no internal representation reports "", a null handle "null".
    string type_name() const;

    bool operator==(const obj_handle& other) const {
        return obj == other.obj;
    }
    bool operator!=(const obj_handle& other) const {
        return obj != other.obj;
    }
};

// new string object wrapped in a handle
obj_handle make_string_object(const string& s);

}

#endif
