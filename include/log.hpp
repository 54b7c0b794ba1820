#ifndef __TETHER_LOG_HPP
#define __TETHER_LOG_HPP

#include "base.hpp"

#include <ostream>

namespace tether {

class logger {
private:
    std::ostream* err_out;
    std::ostream* info_out;

public:
    // info_out and err_out must be externally managed and ensured to outlive
    // the logger. They may be null, in which case messages are simply ignored.
    logger(std::ostream* err_out, std::ostream* info_out);

    // an error goes to err_out and indicates a stoppage of control flow
    void log_error(const string& subsystem, const string& message);

    // a warning goes to err_out but is not considered fatal
    void log_warning(const string& subsystem, const string& message);

    // info messages are logged to info_out
    void log_info(const string& subsystem, const string& message);
};

// The process-wide logger used when no other logger is supplied. Initially
// this sends errors and warnings to std::cerr and drops info messages.
logger* get_logger();
// replace the process-wide logger. Passing nullptr restores the initial one.
// The caller keeps ownership of log.
void set_logger(logger* log);

}


#endif
