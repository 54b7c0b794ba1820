#ifndef __TETHER_LIST_HPP
#define __TETHER_LIST_HPP

#include "base.hpp"
#include "construct.hpp"
#include "handle.hpp"
#include "value.hpp"

#include <type_traits>
#include <vector>

namespace tether {

class interpreter;

// new empty list. Its internal representation is already a list.
obj_handle new_list();

// Append a converted value to a list. Throws shared_mutation_error if the
// list is shared and list_append_error if it cannot be grown as a list. The
// interpreter is used to register callables and receives error messages.
void list_append(obj_handle& list,
        const host_value& value,
        interpreter* interp=nullptr);

// option flag for a key: "-" + key, without one leading underscore
string option_flag(const string& key);

// append option_flag(key) followed by value
void list_append_option(obj_handle& list,
        const string& key,
        const host_value& value,
        interpreter* interp=nullptr);

// append the elements of other to list
void list_concat(obj_handle& list, const obj_handle& other);

// number of elements. Objects that are not lists are converted first, and a
// failed conversion throws type_conversion_error.
u32 list_length(const obj_handle& list);
// element at 0-based index i, or a null handle when i is out of range
obj_handle list_index(const obj_handle& list, i64 i);
std::vector<obj_handle> list_elements(const obj_handle& list);

namespace detail {

template<typename T> void append_positional(obj_handle& list, const T& v) {
    if constexpr (!std::is_same_v<T, option>) {
        list_append(list, host_value(v));
    }
}

template<typename T> void append_named(obj_handle& list, const T& v) {
    if constexpr (std::is_same_v<T, option>) {
        list_append_option(list, v.key, v.value);
    }
}

}

// Append positional arguments in order, then options in the order given.
// Callables among the arguments are registered in the current interpreter.
template<typename... Args> obj_handle& append(obj_handle& list,
        const Args&... args) {
    list.assert_writable();
    (detail::append_positional(list, args), ...);
    (detail::append_named(list, args), ...);
    return list;
}

// new list holding the arguments, as with append()
template<typename... Args> obj_handle make_list(const Args&... args) {
    auto res = new_list();
    append(res, args...);
    return res;
}

// new list formed by concatenating the arguments. Each argument is converted
// and then treated as a list, so nested lists are flattened one level.
template<typename... Args> obj_handle concat(const Args&... args) {
    static_assert((!std::is_same_v<Args, option> && ...),
            "concat() does not take options");
    auto res = new_list();
    (list_concat(res, new_object(host_value(args))), ...);
    return res;
}

}

#endif
