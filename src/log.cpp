#include "log.hpp"

#include <iostream>

namespace tether {

logger::logger(std::ostream* err_out, std::ostream* info_out)
    : err_out{err_out}
    , info_out{info_out} {
}

static void emit(std::ostream* out,
        const char* level,
        const string& subsystem,
        const string& message) {
    if (out == nullptr) {
        return;
    }
    (*out) << "[" << level << "] " << subsystem << ":\n\t"
           << message << '\n';
}

void logger::log_error(const string& subsystem, const string& message) {
    emit(err_out, "ERROR", subsystem, message);
}

void logger::log_warning(const string& subsystem, const string& message) {
    emit(err_out, "WARNING", subsystem, message);
}

void logger::log_info(const string& subsystem, const string& message) {
    emit(info_out, "INFO", subsystem, message);
}

static logger default_log{&std::cerr, nullptr};
static logger* active_log = &default_log;

logger* get_logger() {
    return active_log;
}

void set_logger(logger* log) {
    active_log = log == nullptr ? &default_log : log;
}

}
