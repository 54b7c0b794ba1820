// base.hpp -- common types and error handling code for tether

#ifndef __TETHER_BASE_HPP
#define __TETHER_BASE_HPP

#include <cstdint>
#include <forward_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace tether {

/// aliases imported from std
template<class T> using forward_list = std::forward_list<T>;
template<class T> using optional = std::optional<T>;
using string = std::string;

template<class T> using shared_ptr = std::shared_ptr<T>;
template<class T> using unique_ptr = std::unique_ptr<T>;

/// integer/float typedefs by bitwidth
typedef uint8_t u8;
typedef uint16_t u16;
typedef uint32_t u32;
typedef uint64_t u64;

typedef int8_t i8;
typedef int16_t i16;
typedef int32_t i32;
typedef int64_t i64;

static_assert(sizeof(double) == 8);
typedef double f64;

// implemented for std::string and u64 (FNV-1a, see base.cpp)
template<typename T> u64 hash(const T& v);
template<> u64 hash<string>(const string& s);
template<> u64 hash<u64>(const u64& u);

// Completion codes shared with the foreign runtime. These have the same
// numeric values as TCL_OK .. TCL_CONTINUE (checked in interpreter.cpp).
enum status_code : int {
    ST_OK       = 0,
    ST_ERROR    = 1,
    ST_RETURN   = 2,
    ST_BREAK    = 3,
    ST_CONTINUE = 4
};

// name of a status code, e.g. "TCL_ERROR". Unknown codes give "TCL_<n>".
string status_name(int code);

// Base class for all exceptions raised by tether. The formatted message is
// "[subsystem] message".
class tether_error : public std::exception {
    string formatted;

public:
    const string subsystem;
    const string message;

    tether_error(const string& subsystem, const string& message);

    const char* what() const noexcept override {
        return formatted.c_str();
    }
};

// The foreign runtime reported a non-OK status. Both message and result hold
// the interpreter's result text verbatim. The status is kept separately.
class foreign_runtime_error : public tether_error {
public:
    const int status;
    const string result;

    foreign_runtime_error(int status, const string& result);
};

// a scalar extraction or numeric conversion failed
class type_conversion_error : public tether_error {
public:
    explicit type_conversion_error(const string& message)
        : tether_error{"conversion", message} {
    }
};

// attempted to write through a handle whose object is shared
class shared_mutation_error : public tether_error {
public:
    explicit shared_mutation_error(const string& message)
        : tether_error{"handle", message} {
    }
};

// a host value has no representation in the foreign runtime
class unsupported_value_error : public tether_error {
public:
    explicit unsupported_value_error(const string& message)
        : tether_error{"conversion", message} {
    }
};

// the target of an append could not be grown as a list
class list_append_error : public tether_error {
public:
    const string result;
    explicit list_append_error(const string& result)
        : tether_error{"list", "append failed: " + result}
        , result{result} {
    }
};

// Raised by host callables to report a failure with a specific message. Any
// exception escaping a callable is turned into an error status at the
// command boundary, so this never crosses into the foreign runtime.
class callback_failure_error : public tether_error {
public:
    explicit callback_failure_error(const string& message)
        : tether_error{"callback", message} {
    }
};

}

#endif
