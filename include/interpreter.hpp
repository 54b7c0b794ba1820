#ifndef __TETHER_INTERPRETER_HPP
#define __TETHER_INTERPRETER_HPP

#include "base.hpp"
#include "construct.hpp"
#include "handle.hpp"
#include "list.hpp"
#include "log.hpp"
#include "value.hpp"

#include <type_traits>

namespace tether {

enum interp_state {
    // owned; deleted when the interpreter object is destroyed
    IS_TRANSIENT,
    // the default interpreter, which is never deleted
    IS_PERMANENT,
    // a view of an interpreter owned by someone else (e.g. the caller of a
    // command procedure)
    IS_BORROWED,
    IS_DELETED
};

enum unset_flag {
    UNSET_COMPLAIN,
    UNSET_NOCOMPLAIN
};

// One part of a variable name, given either as text or as an object.
struct var_name {
    obj_handle obj;
    string text;
    bool from_text;

    var_name(const char* name);
    var_name(const string& name);
    var_name(obj_handle name);
};

class interpreter {
    friend interpreter& default_interpreter();

private:
    Tcl_Interp* interp;
    interp_state state;
    logger* log;

    // create a new foreign interpreter in the given state
    interpreter(interp_state state, logger* log);
    // wrap an existing foreign interpreter without owning it
    interpreter(Tcl_Interp* raw, logger* log);

    void release();
    // throw foreign_runtime_error if the interpreter has been deleted
    void check_alive() const;
    // throw foreign_runtime_error carrying the result text unless st is OK
    void raise_status(status_code st) const;

    // evaluate the words of a list as one command, without substitution
    status_code eval_list(const obj_handle& cmd);
    // lists are evaluated with eval_list(), anything else as a script
    status_code eval_object(const obj_handle& obj);

public:
    // Create a new transient interpreter. Messages go to log, or to the
    // process-wide logger when log is null.
    explicit interpreter(logger* log=nullptr);
    ~interpreter();

    interpreter(const interpreter&) = delete;
    interpreter& operator=(const interpreter&) = delete;

    static interpreter borrow(Tcl_Interp* raw, logger* log=nullptr);

    Tcl_Interp* raw() const {
        return interp;
    }
    interp_state get_state() const {
        return state;
    }
    logger* get_log() const {
        return log;
    }

    bool is_deleted() const;
    // true while a script is being evaluated in this interpreter
    bool is_active() const;
    // delete a transient interpreter before its destructor runs. Throws
    // tether_error for permanent and borrowed interpreters.
    void destroy();

    // Evaluate a command. A single argument is converted and, if it is a
    // list, evaluated as a command word by word; otherwise it is evaluated as
    // a script. Several arguments (or any options) are assembled into a list
    // and evaluated as one command. Callables among the arguments are
    // registered in this interpreter.
    //
    // try_eval() returns the completion code. The other forms throw
    // foreign_runtime_error for anything but ST_OK and return the result.
    template<typename... Args> status_code try_eval(const Args&... args);
    template<typename... Args> host_value eval(const Args&... args);
    template<typename... Args> string eval_string(const Args&... args);
    template<typename... Args> obj_handle eval_handle(const Args&... args);

    string get_result() const;
    obj_handle get_result_handle() const;
    host_value get_result_value() const;
    // set the result. Nothing resets it to the empty string.
    void set_result(const host_value& v);
    void reset_result();

    // Global variables. name2 selects an array element. Missing variables
    // raise foreign_runtime_error.
    obj_handle get_var_handle(const var_name& name);
    obj_handle get_var_handle(const var_name& name, const var_name& name2);
    host_value get_var(const var_name& name);
    host_value get_var(const var_name& name, const var_name& name2);
    string get_var_string(const var_name& name);
    string get_var_string(const var_name& name, const var_name& name2);

    void set_var(const var_name& name, const host_value& v);
    void set_var(const var_name& name,
            const var_name& name2,
            const host_value& v);

    // Unset a variable. Unless flag is UNSET_NOCOMPLAIN, unsetting a
    // variable that doesn't exist raises foreign_runtime_error. Names given
    // as text may not contain NUL characters.
    void unset_var(const var_name& name, unset_flag flag=UNSET_COMPLAIN);
    void unset_var(const var_name& name,
            const var_name& name2,
            unset_flag flag=UNSET_COMPLAIN);

    bool exists(const var_name& name);
    bool exists(const var_name& name, const var_name& name2);

private:
    obj_handle lookup_var(const var_name& name, const var_name* name2);
    void store_var(const var_name& name,
            const var_name* name2,
            const host_value& v);
    void remove_var(const var_name& name,
            const var_name* name2,
            unset_flag flag);
    bool var_exists(const var_name& name, const var_name* name2);
};

// The permanent interpreter, created on first use
interpreter& default_interpreter();

// The interpreter in which conversions register callables when none is
// given: the innermost interp_scope's, else the default interpreter.
interpreter& current_interpreter();

// Makes an interpreter current for its lifetime. Scopes nest, and the
// previous interpreter is restored on every exit path.
class interp_scope {
public:
    explicit interp_scope(interpreter& interp);
    ~interp_scope();

    interp_scope(const interp_scope&) = delete;
    interp_scope& operator=(const interp_scope&) = delete;
};


template<typename... Args>
status_code interpreter::try_eval(const Args&... args) {
    check_alive();
    interp_scope scope{*this};
    if constexpr (sizeof...(Args) == 1
            && (!std::is_same_v<Args, option> && ...)) {
        return eval_object(new_object(host_value(args...), this));
    } else {
        auto cmd = new_list();
        append(cmd, args...);
        return eval_list(cmd);
    }
}

template<typename... Args>
host_value interpreter::eval(const Args&... args) {
    raise_status(try_eval(args...));
    return get_result_value();
}

template<typename... Args>
string interpreter::eval_string(const Args&... args) {
    raise_status(try_eval(args...));
    return get_result();
}

template<typename... Args>
obj_handle interpreter::eval_handle(const Args&... args) {
    raise_status(try_eval(args...));
    return get_result_handle();
}

}

#endif
