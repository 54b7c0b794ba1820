#include "list.hpp"
#include "interpreter.hpp"
#include "types.hpp"

namespace tether {

obj_handle new_list() {
    init_library();
    // Tcl_NewListObj(0, nullptr) gives an untyped empty object, so build a
    // one element list and empty it, which keeps the list representation
    Tcl_Obj* elem = Tcl_NewObj();
    obj_handle res{Tcl_NewListObj(1, &elem)};
    if (Tcl_ListObjReplace(nullptr, res.get(), 0, 1, 0, nullptr) != TCL_OK) {
        throw foreign_runtime_error{ST_ERROR, "failed to create a list"};
    }
    return res;
}

static Tcl_Interp* raw_of(interpreter* interp) {
    return interp == nullptr ? nullptr : interp->raw();
}

static string append_failure(const obj_handle& list, interpreter* interp) {
    if (interp != nullptr) {
        return interp->get_result();
    }
    return "cannot use \"" + list.as_string() + "\" as a list";
}

void list_append(obj_handle& list,
        const host_value& value,
        interpreter* interp) {
    list.assert_writable();
    auto elem = new_object(value, interp);
    if (Tcl_ListObjAppendElement(raw_of(interp), list.get(), elem.get())
            != TCL_OK) {
        throw list_append_error{append_failure(list, interp)};
    }
}

string option_flag(const string& key) {
    if (!key.empty() && key[0] == '_') {
        return "-" + key.substr(1);
    }
    return "-" + key;
}

void list_append_option(obj_handle& list,
        const string& key,
        const host_value& value,
        interpreter* interp) {
    list_append(list, option_flag(key), interp);
    list_append(list, value, interp);
}

void list_concat(obj_handle& list, const obj_handle& other) {
    list.assert_writable();
    if (other.is_null()) {
        return;
    }
    if (Tcl_ListObjAppendList(nullptr, list.get(), other.get()) != TCL_OK) {
        throw list_append_error{"cannot concatenate \"" + other.as_string()
                + "\" to \"" + list.as_string() + "\""};
    }
}

static Tcl_Obj* as_list(const obj_handle& list) {
    int len;
    if (Tcl_ListObjLength(nullptr, list.get(), &len) != TCL_OK) {
        throw type_conversion_error{"expected a list but got \""
                + list.as_string() + "\""};
    }
    return list.get();
}

u32 list_length(const obj_handle& list) {
    if (list.is_null()) {
        return 0;
    }
    int len;
    Tcl_ListObjLength(nullptr, as_list(list), &len);
    return (u32)len;
}

obj_handle list_index(const obj_handle& list, i64 i) {
    if (list.is_null() || i < 0 || i >= (i64)list_length(list)) {
        return obj_handle{};
    }
    Tcl_Obj* elem;
    Tcl_ListObjIndex(nullptr, list.get(), (int)i, &elem);
    return obj_handle{elem};
}

std::vector<obj_handle> list_elements(const obj_handle& list) {
    std::vector<obj_handle> res;
    if (list.is_null()) {
        return res;
    }
    int objc;
    Tcl_Obj** objv;
    Tcl_ListObjGetElements(nullptr, as_list(list), &objc, &objv);
    res.reserve(objc);
    for (int i = 0; i < objc; ++i) {
        res.emplace_back(objv[i]);
    }
    return res;
}

}
