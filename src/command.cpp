#include "command.hpp"
#include "pin.hpp"
#include "table.hpp"

#include <vector>

namespace tether {

constexpr const char* CALLBACK_ERROR_PREFIX = "(callback error) ";

static table<string, u64> autoname_counters;

string autoname(const string& prefix) {
    auto n = autoname_counters.get(prefix).value_or(0) + 1;
    autoname_counters.insert(prefix, n);
    return prefix + std::to_string(n);
}

static void set_error_result(Tcl_Interp* raw, const string& message) {
    auto msg = CALLBACK_ERROR_PREFIX + message;
    Tcl_SetObjResult(raw, Tcl_NewStringObj(msg.c_str(), (int)msg.size()));
}

// Tcl_CmdProc for registered callables. The client data is the callable's
// identity in the pin table.
static int invoke_callable(ClientData data,
        Tcl_Interp* raw,
        int argc,
        const char* argv[]) {
    auto proc = find_pinned((u64)(uintptr_t)data);
    if (proc == nullptr) {
        set_error_result(raw, "command is no longer registered");
        return TCL_ERROR;
    }

    try {
        auto view = interpreter::borrow(raw);
        interp_scope scope{view};
        std::vector<string> args(argv, argv + argc);
        auto res = (*proc)(args);
        view.set_result(res.value);
        return res.status;
    } catch (const tether_error& e) {
        set_error_result(raw, e.message);
    } catch (const std::exception& e) {
        set_error_result(raw, e.what());
    } catch (...) {
        set_error_result(raw, "unknown exception");
    }
    return TCL_ERROR;
}

// Tcl_CmdDeleteProc for registered callables
static void release_callable(ClientData data) {
    unpin_callable((u64)(uintptr_t)data);
}

string register_command(interpreter& interp,
        const string& name,
        const host_callable& fn) {
    if (fn.empty()) {
        throw unsupported_value_error{"cannot register an empty callable"};
    }
    if (interp.is_deleted()) {
        throw foreign_runtime_error{ST_ERROR, "interpreter has been deleted"};
    }
    auto id = pin_callable(fn);
    auto token = Tcl_CreateCommand(interp.raw(), name.c_str(),
            invoke_callable, (ClientData)(uintptr_t)id, release_callable);
    if (token == nullptr) {
        unpin_callable(id);
        throw foreign_runtime_error{ST_ERROR,
                "failed to create command \"" + name + "\""};
    }
    return name;
}

string register_command(interpreter& interp, const host_callable& fn) {
    return register_command(interp, autoname(), fn);
}

string register_command(interpreter& interp,
        const string& name,
        command_proc fn) {
    return register_command(interp, name, host_callable{std::move(fn)});
}

string register_command(interpreter& interp, command_proc fn) {
    return register_command(interp, autoname(), host_callable{std::move(fn)});
}

bool delete_command(interpreter& interp, const string& name) {
    if (interp.is_deleted()) {
        return false;
    }
    return Tcl_DeleteCommand(interp.raw(), name.c_str()) == 0;
}

bool command_exists(interpreter& interp, const string& name) {
    if (interp.is_deleted()) {
        return false;
    }
    Tcl_CmdInfo info;
    return Tcl_GetCommandInfo(interp.raw(), name.c_str(), &info) != 0;
}

}
