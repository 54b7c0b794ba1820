#include "handle.hpp"

namespace tether {

obj_handle::obj_handle(Tcl_Obj* o)
    : obj{o} {
    if (obj != nullptr) {
        Tcl_IncrRefCount(obj);
    }
}

obj_handle::obj_handle(const obj_handle& src)
    : obj_handle{src.obj} {
}

obj_handle::obj_handle(obj_handle&& src) noexcept
    : obj{src.obj} {
    src.obj = nullptr;
}

obj_handle::~obj_handle() {
    reset();
}

obj_handle& obj_handle::operator=(const obj_handle& src) {
    // take the new reference first in case src and this share an object
    auto o = src.obj;
    if (o != nullptr) {
        Tcl_IncrRefCount(o);
    }
    reset();
    obj = o;
    return *this;
}

obj_handle& obj_handle::operator=(obj_handle&& src) noexcept {
    if (this != &src) {
        reset();
        obj = src.obj;
        src.obj = nullptr;
    }
    return *this;
}

void obj_handle::reset() {
    if (obj != nullptr) {
        Tcl_DecrRefCount(obj);
        obj = nullptr;
    }
}

int obj_handle::refcount() const {
    return obj == nullptr ? 0 : obj->refCount;
}

bool obj_handle::is_shared() const {
    return obj != nullptr && Tcl_IsShared(obj);
}

void obj_handle::assert_writable() const {
    if (obj == nullptr) {
        throw shared_mutation_error{"cannot modify a null object"};
    } else if (Tcl_IsShared(obj)) {
        throw shared_mutation_error{"cannot modify a shared object (refcount "
                + std::to_string(obj->refCount) + "); duplicate it first"};
    }
}

obj_handle obj_handle::duplicate() const& {
    if (obj == nullptr) {
        return obj_handle{};
    }
    return obj_handle{Tcl_DuplicateObj(obj)};
}

obj_handle obj_handle::duplicate() && {
    if (obj != nullptr && !Tcl_IsShared(obj)) {
        return std::move(*this);
    }
    return static_cast<const obj_handle&>(*this).duplicate();
}

string obj_handle::as_string() const {
    if (obj == nullptr) {
        return "";
    }
    int len;
    auto s = Tcl_GetStringFromObj(obj, &len);
    return string(s, len);
}

string obj_handle::type_name() const {
    if (obj == nullptr) {
        return "null";
    } else if (obj->typePtr == nullptr) {
        return "";
    }
    return obj->typePtr->name;
}

obj_handle make_string_object(const string& s) {
    return obj_handle{Tcl_NewStringObj(s.c_str(), (int)s.size())};
}

}
