#include "project.hpp"
#include "interpreter.hpp"
#include "types.hpp"

#include <limits>

namespace tether {

static string text_of(Tcl_Obj* obj) {
    int len;
    auto s = Tcl_GetStringFromObj(obj, &len);
    return string(s, len);
}

static host_value project_integer(Tcl_Obj* obj, bool narrow) {
    Tcl_WideInt w;
    if (Tcl_GetWideIntFromObj(nullptr, obj, &w) != TCL_OK) {
        return host_value{text_of(obj)};
    }
    if (narrow && w >= std::numeric_limits<i32>::min()
            && w <= std::numeric_limits<i32>::max()) {
        return host_value{(i32)w};
    }
    return host_value{(i64)w};
}

static host_value project_list(Tcl_Obj* obj) {
    int objc;
    Tcl_Obj** objv;
    if (Tcl_ListObjGetElements(nullptr, obj, &objc, &objv) != TCL_OK) {
        return host_value{text_of(obj)};
    }
    // the elements are borrowed from the list, which outlives this loop
    std::vector<host_value> items;
    items.reserve(objc);
    for (int i = 0; i < objc; ++i) {
        items.push_back(project(objv[i]));
    }
    return host_value{host_sequence{std::move(items)}};
}

host_value project(Tcl_Obj* obj) {
    switch (classify(obj)) {
    case TT_NULL:
        return host_value{};
    case TT_BOOLEAN: {
        int b;
        if (Tcl_GetBooleanFromObj(nullptr, obj, &b) != TCL_OK) {
            break;
        }
        return host_value{b != 0};
    }
    case TT_INT:
        return project_integer(obj, true);
    case TT_WIDE_INT:
        return project_integer(obj, false);
    case TT_DOUBLE: {
        double d;
        if (Tcl_GetDoubleFromObj(nullptr, obj, &d) != TCL_OK) {
            break;
        }
        return host_value{d};
    }
    case TT_LIST:
        return project_list(obj);
    case TT_UNTYPED:
    case TT_STRING:
        break;
    }
    return host_value{text_of(obj)};
}

host_value project(const obj_handle& h) {
    return project(h.get());
}

// throw a conversion error, preferring the interpreter's message if it has one
[[noreturn]] static void conversion_failed(const obj_handle& h,
        interpreter* interp,
        const char* expected) {
    if (interp != nullptr) {
        throw type_conversion_error{interp->get_result()};
    }
    throw type_conversion_error{string{"expected "} + expected + " but got \""
            + h.as_string() + "\""};
}

static Tcl_Interp* raw_of(interpreter* interp) {
    return interp == nullptr ? nullptr : interp->raw();
}

static Tcl_Obj* checked(const obj_handle& h, const char* expected) {
    if (h.is_null()) {
        throw type_conversion_error{string{"expected "} + expected
                + " but got a null object"};
    }
    return h.get();
}

bool get_bool(const obj_handle& h, interpreter* interp) {
    int b;
    if (Tcl_GetBooleanFromObj(raw_of(interp), checked(h, "boolean"), &b)
            != TCL_OK) {
        conversion_failed(h, interp, "boolean");
    }
    return b != 0;
}

i32 get_int(const obj_handle& h, interpreter* interp) {
    int x;
    if (Tcl_GetIntFromObj(raw_of(interp), checked(h, "integer"), &x)
            != TCL_OK) {
        conversion_failed(h, interp, "integer");
    }
    return x;
}

i64 get_wide(const obj_handle& h, interpreter* interp) {
    Tcl_WideInt x;
    if (Tcl_GetWideIntFromObj(raw_of(interp), checked(h, "integer"), &x)
            != TCL_OK) {
        conversion_failed(h, interp, "integer");
    }
    return x;
}

f64 get_double(const obj_handle& h, interpreter* interp) {
    double x;
    if (Tcl_GetDoubleFromObj(raw_of(interp), checked(h, "floating-point number"), &x)
            != TCL_OK) {
        conversion_failed(h, interp, "floating-point number");
    }
    return x;
}

}
