#include "config.h"

#include "base.hpp"
#include "events.hpp"
#include "interpreter.hpp"
#include "log.hpp"
#include "types.hpp"

#include <iostream>
#include <sstream>
#include <vector>

using namespace tether;

void show_usage() {
    std::cout <<
        "Usage: tether [options] [FILE | -]\n"
        "Description:\n"
        "  Evaluate Tcl scripts through the tether bindings.\n"
        "Options/Arguments:\n"
        "  -h            Show this help message and exit.\n"
        "  -v            Show version information and exit.\n"
        "  -i            Start the REPL after finishing evaluation.\n"
        "  -q            Don't print results.\n"
        "  -e script     Evaluate script. Can occur multiple times.\n"
        "  -D name=value Set a global variable before evaluation. Can occur\n"
        "                multiple times.\n"
        "  -             Read the script from STDIN.\n"
        "  FILE          Script file to source. Omitting this (and -e) starts\n"
        "                a REPL.\n"
        "Pending events are processed after each evaluation.\n"
        ;
}

struct driver_options {
    // script file to source. An empty filename with stdin_flag set means
    // stdin.
    string src = "";
    bool stdin_flag = false;
    // scripts given with -e, in order
    std::vector<string> scripts;
    // global variables given with -D
    std::vector<std::pair<string,string>> defines;
    // if true, show help/version and exit
    bool help = false;
    bool version = false;
    // whether to start a REPL after the other inputs are evaluated
    bool repl = false;
    // suppress result printing
    bool quiet = false;

    // if true, the argument list was malformed and the other fields are not
    // guaranteed to be properly initialized
    bool err = false;
    string message = "";
};

// fetch the argument of option s, which is either attached (-Dx=1) or the
// next word (-D x=1). Returns false if it is missing.
static bool option_arg(int argc, char** argv, int* i, const string& s,
        string* out) {
    if (s.size() > 2) {
        *out = s.substr(2);
        return true;
    } else if (*i == argc - 1) {
        return false;
    }
    *out = argv[++(*i)];
    return true;
}

// fill in a driver_options object from the command line. Malformed command
// lines set opt->err.
void process_args(int argc, char** argv, driver_options* opt) {
    int i;
    for (i = 1; i < argc; ++i) {
        string s{argv[i]};
        if (s[0] == '-') {
            string arg;
            switch(s[1]) {
            case 'h':
                opt->help = true;
                // no sense doing further processing at this point
                return;
            case 'v':
                opt->version = true;
                return;
            case 'i':
            case 'q':
                if (s[2] != '\0') {
                    opt->err = true;
                    opt->message = "Unrecognized option: " + s;
                    return;
                }
                if (s[1] == 'i') {
                    opt->repl = true;
                } else {
                    opt->quiet = true;
                }
                break;
            case 'e':
                if (!option_arg(argc, argv, &i, s, &arg)) {
                    opt->err = true;
                    opt->message = "Option -e requires an argument.";
                    return;
                }
                opt->scripts.push_back(arg);
                break;
            case 'D': {
                if (!option_arg(argc, argv, &i, s, &arg)) {
                    opt->err = true;
                    opt->message = "Option -D requires an argument.";
                    return;
                }
                auto eq = arg.find('=');
                if (eq == string::npos || eq == 0) {
                    opt->err = true;
                    opt->message = "Option -D expects name=value, got: " + arg;
                    return;
                }
                opt->defines.emplace_back(arg.substr(0, eq), arg.substr(eq+1));
                break;
            }
            case '\0':
                if (opt->stdin_flag || opt->src != "") {
                    opt->err = true;
                    opt->message = "Multiple input sources provided.";
                    return;
                }
                opt->stdin_flag = true;
                break;
            default:
                opt->err = true;
                opt->message = "Unrecognized option: " + s;
                return;
            }
        } else {
            // filename
            if (opt->stdin_flag || opt->src != "") {
                opt->err = true;
                opt->message = "Multiple input sources provided.";
                return;
            }
            opt->src = s;
        }
    }
    // enable repl if there is nothing else to evaluate
    if (opt->src == "" && !opt->stdin_flag && opt->scripts.empty()) {
        opt->repl = true;
    }
}

// Evaluate a script or source command, print its result, and run pending
// events. Returns false on error.
template<typename... Args>
static bool run(interpreter& inter, const driver_options& opt,
        const Args&... args) {
    auto st = inter.try_eval(args...);
    if (st != ST_OK) {
        inter.get_log()->log_error("tether",
                status_name(st) + ": " + inter.get_result());
    } else if (!opt.quiet) {
        auto res = inter.get_result();
        if (res != "") {
            std::cout << res << '\n';
        }
    }
    do_events();
    return st == ST_OK;
}

static void repl(interpreter& inter, const driver_options& opt) {
    string buf;
    string line;
    std::cout << "% " << std::flush;
    while (std::getline(std::cin, line)) {
        buf += line;
        buf += '\n';
        if (!Tcl_CommandComplete(buf.c_str())) {
            std::cout << "> " << std::flush;
            continue;
        }
        run(inter, opt, buf);
        buf.clear();
        std::cout << "% " << std::flush;
    }
    std::cout << '\n';
}

int main(int argc, char** argv) {
    driver_options opt;
    process_args(argc, argv, &opt);
    if (opt.help) {
        show_usage();
        return 0;
    } else if (opt.version) {
        init_library(argv[0]);
        std::cout << "tether " << TETHER_VERSION << " (Tcl "
                  << foreign_version() << ")\n";
        return 0;
    } else if (opt.err) {
        std::cout << "Error processing command line arguments:\n  "
                  << opt.message << '\n';
        return -1;
    }

    init_library(argv[0]);
    logger log{&std::cerr, nullptr};
    set_logger(&log);
    bool ok = true;
    {
        interpreter inter{&log};
        for (auto& d : opt.defines) {
            inter.set_var(d.first, d.second);
        }
        for (auto& s : opt.scripts) {
            ok = ok && run(inter, opt, s);
        }
        if (ok && opt.src != "") {
            ok = run(inter, opt, "source", opt.src);
        } else if (ok && opt.stdin_flag) {
            std::ostringstream ss;
            ss << std::cin.rdbuf();
            ok = run(inter, opt, ss.str());
        }
        if (opt.repl) {
            repl(inter, opt);
        }
    }
    set_logger(nullptr);

    return ok ? 0 : 1;
}
