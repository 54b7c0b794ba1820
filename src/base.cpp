#include "base.hpp"

namespace tether {

// Hashes for std::string and integers use FNV-1a
template<> u64 hash<string>(const string& s) {
    static const u64 prime = 0x100000001b3;
    u64 res = 0xcbf29ce484222325;
    for (u32 i=0; i<s.length(); ++i) {
        res ^= (u8)s[i];
        res *= prime;
    }
    return res;
}

template<> u64 hash<u64>(const u64& u) {
    static const u64 prime = 0x100000001b3;
    u64 res = 0xcbf29ce484222325;
    auto bytes = u;
    for (int i = 0; i < 8; ++i) {
        res ^= (bytes & 0xff);
        res *= prime;
        bytes = bytes >> 8;
    }
    return res;
}

string status_name(int code) {
    switch (code) {
    case ST_OK:
        return "TCL_OK";
    case ST_ERROR:
        return "TCL_ERROR";
    case ST_RETURN:
        return "TCL_RETURN";
    case ST_BREAK:
        return "TCL_BREAK";
    case ST_CONTINUE:
        return "TCL_CONTINUE";
    default:
        return "TCL_" + std::to_string(code);
    }
}

tether_error::tether_error(const string& subsystem, const string& message)
    : formatted{"[" + subsystem + "] " + message}
    , subsystem{subsystem}
    , message{message} {
}

foreign_runtime_error::foreign_runtime_error(int status, const string& result)
    : tether_error{"tcl", result}
    , status{status}
    , result{result} {
}

}
