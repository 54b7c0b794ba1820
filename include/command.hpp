#ifndef __TETHER_COMMAND_HPP
#define __TETHER_COMMAND_HPP

#include "base.hpp"
#include "interpreter.hpp"
#include "value.hpp"

namespace tether {

constexpr const char* DEFAULT_COMMAND_PREFIX = "tether_callback";

// Generate a command name: prefix followed by a counter kept per prefix,
// starting at 1.
string autoname(const string& prefix=DEFAULT_COMMAND_PREFIX);

// Register a callable as a command and return the command name. When no name
// is given one is generated with autoname(). The callable stays alive until
// the foreign runtime deletes the command (through delete_command(), by
// redefining it, or by deleting the interpreter).
//
// When the command runs, its words (command name first) are passed to the
// callable as text and the callable's command_result becomes the command's
// status and result. An exception thrown by the callable becomes ST_ERROR
// with the message prefixed by "(callback error) ".
string register_command(interpreter& interp,
        const string& name,
        const host_callable& fn);
string register_command(interpreter& interp, const host_callable& fn);
string register_command(interpreter& interp,
        const string& name,
        command_proc fn);
string register_command(interpreter& interp, command_proc fn);

// delete a command. Returns false if there was no such command.
bool delete_command(interpreter& interp, const string& name);

bool command_exists(interpreter& interp, const string& name);

}

#endif
