#include "types.hpp"

namespace tether {

// type records of the builtin object types, filled in by probing
struct type_registry {
    bool initialized = false;
    const Tcl_ObjType* boolean_type = nullptr;
    const Tcl_ObjType* int_type = nullptr;
    const Tcl_ObjType* wide_int_type = nullptr;
    const Tcl_ObjType* double_type = nullptr;
    const Tcl_ObjType* string_type = nullptr;
    const Tcl_ObjType* list_type = nullptr;
};

static type_registry registry;

// type of a temporary object after it has been given the desired
// representation
static const Tcl_ObjType* probe_type(const obj_handle& h) {
    return h.get()->typePtr;
}

void init_library(const char* argv0) {
    if (registry.initialized) {
        return;
    }
    Tcl_FindExecutable(argv0);

    // Tcl_NewBooleanObj produces an int, so a boolean literal has to be
    // parsed to get the boolean representation
    obj_handle b = make_string_object("true");
    int flag;
    if (Tcl_GetBooleanFromObj(nullptr, b.get(), &flag) != TCL_OK) {
        throw foreign_runtime_error{ST_ERROR,
                "failed to probe the boolean object type"};
    }
    registry.boolean_type = probe_type(b);

    registry.int_type = probe_type(obj_handle{Tcl_NewIntObj(1)});
    registry.wide_int_type =
        probe_type(obj_handle{Tcl_NewWideIntObj((Tcl_WideInt)1 << 40)});
    registry.double_type = probe_type(obj_handle{Tcl_NewDoubleObj(1.5)});

    obj_handle s = make_string_object("tether");
    Tcl_GetUnicode(s.get());
    registry.string_type = probe_type(s);

    // an empty list has no internal representation until it is used
    Tcl_Obj* elem = Tcl_NewIntObj(0);
    registry.list_type = probe_type(obj_handle{Tcl_NewListObj(1, &elem)});

    registry.initialized = true;
}

type_tag classify(const Tcl_Obj* obj) {
    if (obj == nullptr) {
        return TT_NULL;
    }
    init_library();
    auto t = obj->typePtr;
    if (t == nullptr) {
        return TT_UNTYPED;
    } else if (t == registry.boolean_type) {
        return TT_BOOLEAN;
    } else if (t == registry.int_type) {
        return TT_INT;
    } else if (t == registry.wide_int_type) {
        return TT_WIDE_INT;
    } else if (t == registry.double_type) {
        return TT_DOUBLE;
    } else if (t == registry.list_type) {
        return TT_LIST;
    } else if (t == registry.string_type) {
        return TT_STRING;
    }
    // unrecognized representations are read as text
    return TT_STRING;
}

type_tag classify(const obj_handle& h) {
    return classify(h.get());
}

bool same_int_types() {
    init_library();
    return registry.int_type == registry.wide_int_type;
}

string type_tag_name(type_tag tag) {
    switch (tag) {
    case TT_NULL:
        return "null";
    case TT_UNTYPED:
        return "untyped";
    case TT_BOOLEAN:
        return "boolean";
    case TT_INT:
        return "int";
    case TT_WIDE_INT:
        return "wideInt";
    case TT_DOUBLE:
        return "double";
    case TT_STRING:
        return "string";
    case TT_LIST:
        return "list";
    }
    return "unknown";
}

string foreign_version() {
    int major, minor, patch, kind;
    Tcl_GetVersion(&major, &minor, &patch, &kind);
    return std::to_string(major) + "." + std::to_string(minor) + "."
        + std::to_string(patch);
}

}
