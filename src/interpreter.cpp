#include "interpreter.hpp"
#include "project.hpp"
#include "types.hpp"

#include <vector>

namespace tether {

static_assert(ST_OK == TCL_OK);
static_assert(ST_ERROR == TCL_ERROR);
static_assert(ST_RETURN == TCL_RETURN);
static_assert(ST_BREAK == TCL_BREAK);
static_assert(ST_CONTINUE == TCL_CONTINUE);

// variables are always resolved in the global namespace
constexpr int VAR_FLAGS = TCL_GLOBAL_ONLY | TCL_LEAVE_ERR_MSG;

var_name::var_name(const char* name)
    : var_name{string{name}} {
}

var_name::var_name(const string& name)
    : obj{make_string_object(name)}
    , text{name}
    , from_text{true} {
}

var_name::var_name(obj_handle name)
    : obj{std::move(name)}
    , text{}
    , from_text{false} {
    if (obj.is_null()) {
        throw unsupported_value_error{"variable name cannot be a null object"};
    }
}

interpreter::interpreter(logger* log)
    : interpreter{IS_TRANSIENT, log} {
}

interpreter::interpreter(interp_state state, logger* log)
    : interp{nullptr}
    , state{state}
    , log{log == nullptr ? get_logger() : log} {
    init_library();
    interp = Tcl_CreateInterp();
    if (interp == nullptr) {
        throw foreign_runtime_error{ST_ERROR, "failed to create interpreter"};
    }
    if (state == IS_TRANSIENT) {
        Tcl_Preserve(interp);
    }
    // the interpreter is still usable without the script library
    if (Tcl_Init(interp) != TCL_OK) {
        this->log->log_warning("interpreter",
                "Tcl_Init failed: " + get_result());
        Tcl_ResetResult(interp);
    }
}

interpreter::interpreter(Tcl_Interp* raw, logger* log)
    : interp{raw}
    , state{IS_BORROWED}
    , log{log == nullptr ? get_logger() : log} {
}

interpreter interpreter::borrow(Tcl_Interp* raw, logger* log) {
    if (raw == nullptr) {
        throw foreign_runtime_error{ST_ERROR, "cannot borrow a null interpreter"};
    }
    return interpreter{raw, log};
}

interpreter::~interpreter() {
    if (state == IS_TRANSIENT) {
        release();
    }
}

void interpreter::release() {
    if (!Tcl_InterpDeleted(interp)) {
        Tcl_DeleteInterp(interp);
    }
    Tcl_Release(interp);
    state = IS_DELETED;
}

void interpreter::destroy() {
    switch (state) {
    case IS_TRANSIENT:
        release();
        break;
    case IS_DELETED:
        break;
    case IS_PERMANENT:
        throw tether_error{"interpreter",
                "the default interpreter cannot be destroyed"};
    case IS_BORROWED:
        throw tether_error{"interpreter",
                "a borrowed interpreter cannot be destroyed"};
    }
}

bool interpreter::is_deleted() const {
    return state == IS_DELETED || Tcl_InterpDeleted(interp);
}

bool interpreter::is_active() const {
    return !is_deleted() && Tcl_InterpActive(interp);
}

void interpreter::check_alive() const {
    if (is_deleted()) {
        throw foreign_runtime_error{ST_ERROR, "interpreter has been deleted"};
    }
}

void interpreter::raise_status(status_code st) const {
    if (st != ST_OK) {
        throw foreign_runtime_error{st, get_result()};
    }
}

status_code interpreter::eval_list(const obj_handle& cmd) {
    // hold references to the words in case evaluation changes the list
    auto words = list_elements(cmd);
    if (words.empty()) {
        Tcl_ResetResult(interp);
        return ST_OK;
    }
    std::vector<Tcl_Obj*> objv;
    objv.reserve(words.size());
    for (auto& w : words) {
        objv.push_back(w.get());
    }
    return (status_code)Tcl_EvalObjv(interp, (int)objv.size(), objv.data(),
            TCL_EVAL_GLOBAL);
}

status_code interpreter::eval_object(const obj_handle& obj) {
    if (classify(obj) == TT_LIST) {
        return eval_list(obj);
    }
    return (status_code)Tcl_EvalObjEx(interp, obj.get(),
            TCL_EVAL_DIRECT | TCL_EVAL_GLOBAL);
}

string interpreter::get_result() const {
    int len;
    auto s = Tcl_GetStringFromObj(Tcl_GetObjResult(interp), &len);
    return string(s, len);
}

obj_handle interpreter::get_result_handle() const {
    return obj_handle{Tcl_GetObjResult(interp)};
}

host_value interpreter::get_result_value() const {
    return project(get_result_handle());
}

void interpreter::set_result(const host_value& v) {
    check_alive();
    if (v.is_nothing()) {
        Tcl_ResetResult(interp);
        return;
    }
    interp_scope scope{*this};
    auto obj = new_object(v, this);
    Tcl_SetObjResult(interp, obj.get());
}

void interpreter::reset_result() {
    check_alive();
    Tcl_ResetResult(interp);
}

obj_handle interpreter::lookup_var(const var_name& name,
        const var_name* name2) {
    check_alive();
    auto part2 = name2 == nullptr ? nullptr : name2->obj.get();
    auto res = Tcl_ObjGetVar2(interp, name.obj.get(), part2, VAR_FLAGS);
    if (res == nullptr) {
        throw foreign_runtime_error{ST_ERROR, get_result()};
    }
    return obj_handle{res};
}

void interpreter::store_var(const var_name& name,
        const var_name* name2,
        const host_value& v) {
    check_alive();
    interp_scope scope{*this};
    auto obj = new_object(v, this);
    auto part2 = name2 == nullptr ? nullptr : name2->obj.get();
    if (Tcl_ObjSetVar2(interp, name.obj.get(), part2, obj.get(), VAR_FLAGS)
            == nullptr) {
        throw foreign_runtime_error{ST_ERROR, get_result()};
    }
}

static bool has_nul(const string& s) {
    return s.find('\0') != string::npos;
}

void interpreter::remove_var(const var_name& name,
        const var_name* name2,
        unset_flag flag) {
    check_alive();
    bool text = name.from_text && (name2 == nullptr || name2->from_text);
    if (text) {
        if (has_nul(name.text) || (name2 != nullptr && has_nul(name2->text))) {
            throw unsupported_value_error{
                "variable names given as text cannot contain NUL characters"};
        }
        int flags = TCL_GLOBAL_ONLY;
        if (flag == UNSET_COMPLAIN) {
            flags |= TCL_LEAVE_ERR_MSG;
        }
        auto part2 = name2 == nullptr ? nullptr : name2->text.c_str();
        if (Tcl_UnsetVar2(interp, name.text.c_str(), part2, flags) != TCL_OK
                && flag == UNSET_COMPLAIN) {
            throw foreign_runtime_error{ST_ERROR, get_result()};
        }
        return;
    }

    // names held in objects go through the unset command, which accepts the
    // object as is
    auto cmd = make_list("unset");
    if (flag == UNSET_NOCOMPLAIN) {
        append(cmd, "-nocomplain");
    }
    append(cmd, "--");
    if (name2 == nullptr) {
        append(cmd, name.obj);
    } else {
        append(cmd, name.obj.as_string() + "(" + name2->obj.as_string() + ")");
    }
    raise_status(eval_list(cmd));
}

bool interpreter::var_exists(const var_name& name, const var_name* name2) {
    check_alive();
    auto part2 = name2 == nullptr ? nullptr : name2->obj.get();
    return Tcl_ObjGetVar2(interp, name.obj.get(), part2, TCL_GLOBAL_ONLY)
        != nullptr;
}

obj_handle interpreter::get_var_handle(const var_name& name) {
    return lookup_var(name, nullptr);
}

obj_handle interpreter::get_var_handle(const var_name& name,
        const var_name& name2) {
    return lookup_var(name, &name2);
}

host_value interpreter::get_var(const var_name& name) {
    return project(lookup_var(name, nullptr));
}

host_value interpreter::get_var(const var_name& name, const var_name& name2) {
    return project(lookup_var(name, &name2));
}

string interpreter::get_var_string(const var_name& name) {
    return lookup_var(name, nullptr).as_string();
}

string interpreter::get_var_string(const var_name& name,
        const var_name& name2) {
    return lookup_var(name, &name2).as_string();
}

void interpreter::set_var(const var_name& name, const host_value& v) {
    store_var(name, nullptr, v);
}

void interpreter::set_var(const var_name& name,
        const var_name& name2,
        const host_value& v) {
    store_var(name, &name2, v);
}

void interpreter::unset_var(const var_name& name, unset_flag flag) {
    remove_var(name, nullptr, flag);
}

void interpreter::unset_var(const var_name& name,
        const var_name& name2,
        unset_flag flag) {
    remove_var(name, &name2, flag);
}

bool interpreter::exists(const var_name& name) {
    return var_exists(name, nullptr);
}

bool interpreter::exists(const var_name& name, const var_name& name2) {
    return var_exists(name, &name2);
}

static unique_ptr<interpreter> default_interp;
static std::vector<interpreter*> scope_stack;

interpreter& default_interpreter() {
    if (default_interp == nullptr) {
        default_interp.reset(new interpreter{IS_PERMANENT, nullptr});
    }
    return *default_interp;
}

interpreter& current_interpreter() {
    if (scope_stack.empty()) {
        return default_interpreter();
    }
    return *scope_stack.back();
}

interp_scope::interp_scope(interpreter& interp) {
    scope_stack.push_back(&interp);
}

interp_scope::~interp_scope() {
    scope_stack.pop_back();
}

}
