#ifndef __TETHER_VALUE_HPP
#define __TETHER_VALUE_HPP

#include "base.hpp"
#include "handle.hpp"

#include <functional>
#include <limits>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tether {

// kinds of host values. These line up with the alternatives of
// host_value::variant_type.
enum value_kind {
    VK_NOTHING,
    VK_BOOL,
    VK_I32,
    VK_I64,
    VK_U64,
    VK_F64,
    VK_STRING,
    VK_SYMBOL,
    VK_SEQUENCE,
    VK_HANDLE,
    VK_CALLABLE,
    VK_BYTES,
    // only used as a sequence element type, for heterogeneous sequences
    VK_ANY
};

string kind_name(value_kind k);

// symbols are converted to their names
struct symbol {
    string name;

    bool operator==(const symbol& other) const {
        return name == other.name;
    }
};

// raw bytes. These have no mapping and are rejected by new_object().
struct byte_array {
    std::vector<u8> bytes;

    bool operator==(const byte_array& other) const {
        return bytes == other.bytes;
    }
};

struct command_result;
// Host procedures callable from the foreign runtime. The arguments are the
// words of the command, starting with the command name.
using command_proc = std::function<command_result(const std::vector<string>&)>;

// A shared reference to a command_proc. Copies refer to the same procedure,
// so the pointer doubles as the callable's identity.
struct host_callable {
    shared_ptr<command_proc> proc;

    host_callable() = default;
    explicit host_callable(command_proc fn);

    u64 id() const {
        return (u64)(uintptr_t)proc.get();
    }
    bool empty() const;

    bool operator==(const host_callable& other) const {
        return proc == other.proc;
    }
};

template<typename F> host_callable callback(F&& fn) {
    return host_callable{command_proc{std::forward<F>(fn)}};
}

// Element type of a sequence. VK_ANY means heterogeneous. For sequences of
// sequences, inner holds the element kind of the nested sequences.
struct elem_type {
    value_kind kind = VK_ANY;
    value_kind inner = VK_ANY;

    bool operator==(const elem_type& other) const {
        return kind == other.kind && inner == other.inner;
    }
    bool operator!=(const elem_type& other) const {
        return !(*this == other);
    }
};

class host_value;

struct host_sequence {
    elem_type elem;
    std::vector<host_value> items;

    host_sequence();
    // the element type is computed from items
    explicit host_sequence(std::vector<host_value> items);

    u32 size() const;
    bool empty() const;
    const host_value& operator[](u32 i) const;

    bool is_uniform() const {
        return elem.kind != VK_ANY;
    }

    // convert every item with host_value::as<T>()
    template<typename T> std::vector<T> as_vector() const;

    bool operator==(const host_sequence& other) const;
};

template<typename T> struct dependent_false : std::false_type { };

class host_value {
public:
    using variant_type = std::variant<std::monostate,
          bool,
          i32,
          i64,
          u64,
          f64,
          string,
          symbol,
          host_sequence,
          obj_handle,
          host_callable,
          byte_array>;

private:
    variant_type data;

    template<typename T> void set_integer(T x) {
        if constexpr (std::is_signed_v<T>) {
            if constexpr (sizeof(T) <= 4) {
                data.template emplace<i32>((i32)x);
            } else {
                data.template emplace<i64>((i64)x);
            }
        } else if constexpr (sizeof(T) < 4) {
            data.template emplace<i32>((i32)x);
        } else if constexpr (sizeof(T) == 4) {
            data.template emplace<i64>((i64)x);
        } else if ((u64)x > (u64)std::numeric_limits<i64>::max()) {
            data.template emplace<u64>((u64)x);
        } else {
            data.template emplace<i64>((i64)x);
        }
    }

public:
    host_value() = default;
    host_value(bool b)
        : data{std::in_place_type<bool>, b} {
    }
    template<typename T,
        std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T,bool>,
            int> = 0>
    host_value(T x) {
        set_integer(x);
    }
    template<typename T,
        std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
    host_value(T x)
        : data{std::in_place_type<f64>, (f64)x} {
    }
    host_value(const char* s);
    host_value(const string& s);
    host_value(string&& s);
    host_value(symbol s);
    host_value(host_sequence s);
    host_value(obj_handle h);
    host_value(host_callable c);
    host_value(byte_array b);

    // items are taken as they are
    host_value(std::vector<host_value> items);
    template<typename T,
        std::enable_if_t<!std::is_same_v<T, host_value>, int> = 0>
    host_value(const std::vector<T>& v) {
        std::vector<host_value> items;
        items.reserve(v.size());
        for (const auto& x : v) {
            items.push_back(host_value(x));
        }
        data.template emplace<host_sequence>(std::move(items));
    }
    template<typename... Ts> host_value(const std::tuple<Ts...>& t) {
        std::vector<host_value> items;
        items.reserve(sizeof...(Ts));
        std::apply([&items](const auto&... xs) {
            (items.push_back(host_value(xs)), ...);
        }, t);
        data.template emplace<host_sequence>(std::move(items));
    }

    value_kind kind() const {
        return (value_kind)data.index();
    }
    const variant_type& get_data() const {
        return data;
    }

    bool is_nothing() const {
        return kind() == VK_NOTHING;
    }
    bool is_integer() const {
        auto k = kind();
        return k == VK_I32 || k == VK_I64 || k == VK_U64;
    }
    bool is_string() const {
        return kind() == VK_STRING;
    }
    bool is_sequence() const {
        return kind() == VK_SEQUENCE;
    }

    // These throw type_conversion_error when the kind doesn't match. Numeric
    // accessors accept any integer kind, and as_bool() accepts integers as
    // well since the foreign runtime stores booleans as integers.
    bool as_bool() const;
    i64 as_integer() const;
    f64 as_double() const;
    // strings and symbol names
    const string& as_string() const;
    const host_sequence& as_sequence() const;
    const obj_handle& as_handle() const;
    const host_callable& as_callable() const;
    const byte_array& as_bytes() const;

    template<typename T> T as() const;

    bool operator==(const host_value& other) const {
        return data == other.data;
    }
    bool operator!=(const host_value& other) const {
        return !(data == other.data);
    }
};

// build a sequence from the arguments
template<typename... Args> host_value seq(Args&&... args) {
    return host_value{host_sequence{
        std::vector<host_value>{host_value(std::forward<Args>(args))...}}};
}

// Element type promotion. Integers (bool < i32 < i64) promote to the widest,
// doubles and strings only combine with themselves, and sequences combine
// when their inner kinds do. Everything else is heterogeneous.
elem_type elem_type_of(const host_value& v);
elem_type promote_elem(const elem_type& a, const elem_type& b);
// element type of a sequence with the given items. Empty sequences are
// heterogeneous.
elem_type infer_elem_type(const std::vector<host_value>& items);

// a named argument. Appended to lists as "-key" followed by value.
struct option {
    string key;
    host_value value;

    option(const string& key, host_value value)
        : key{key}
        , value{std::move(value)} {
    }
};

// Result of a host command. Callables may return a status, a value, or
// both. A default result is OK with an empty result.
struct command_result {
    status_code status;
    host_value value;

    command_result()
        : status{ST_OK} {
    }
    command_result(status_code status)
        : status{status} {
    }
    command_result(status_code status, host_value value)
        : status{status}
        , value{std::move(value)} {
    }
    template<typename T,
        std::enable_if_t<std::is_constructible_v<host_value, T>
            && !std::is_same_v<std::decay_t<T>, status_code>
            && !std::is_same_v<std::decay_t<T>, command_result>, int> = 0>
    command_result(T&& v)
        : status{ST_OK}
        , value(std::forward<T>(v)) {
    }
};


// inline and template members that need a complete host_value

inline u32 host_sequence::size() const {
    return (u32)items.size();
}

inline bool host_sequence::empty() const {
    return items.empty();
}

inline const host_value& host_sequence::operator[](u32 i) const {
    return items[i];
}

template<typename T> std::vector<T> host_sequence::as_vector() const {
    std::vector<T> res;
    res.reserve(items.size());
    for (const auto& x : items) {
        res.push_back(x.template as<T>());
    }
    return res;
}

template<typename T> T host_value::as() const {
    if constexpr (std::is_same_v<T, bool>) {
        return as_bool();
    } else if constexpr (std::is_integral_v<T>) {
        if constexpr (std::is_unsigned_v<T> && sizeof(T) == 8) {
            if (kind() == VK_U64) {
                return (T)std::get<u64>(data);
            }
        }
        auto x = as_integer();
        bool in_range;
        if constexpr (std::is_unsigned_v<T>) {
            in_range = x >= 0 && (u64)x <= (u64)std::numeric_limits<T>::max();
        } else {
            in_range = x >= (i64)std::numeric_limits<T>::min()
                && x <= (i64)std::numeric_limits<T>::max();
        }
        if (!in_range) {
            throw type_conversion_error{"integer " + std::to_string(x)
                    + " is out of range for the requested type"};
        }
        return (T)x;
    } else if constexpr (std::is_floating_point_v<T>) {
        return (T)as_double();
    } else if constexpr (std::is_same_v<T, string>) {
        return as_string();
    } else if constexpr (std::is_same_v<T, host_sequence>) {
        return as_sequence();
    } else if constexpr (std::is_same_v<T, obj_handle>) {
        return as_handle();
    } else if constexpr (std::is_same_v<T, host_value>) {
        return *this;
    } else {
        static_assert(dependent_false<T>::value,
                "no conversion from host_value to this type");
    }
}

}

#endif
