#include "construct.hpp"
#include "command.hpp"
#include "interpreter.hpp"
#include "list.hpp"
#include "types.hpp"

#include <limits>

namespace tether {

static obj_handle new_integer(i64 x) {
    if (x >= std::numeric_limits<int>::min()
            && x <= std::numeric_limits<int>::max()) {
        return obj_handle{Tcl_NewIntObj((int)x)};
    }
    return obj_handle{Tcl_NewWideIntObj((Tcl_WideInt)x)};
}

obj_handle new_object(const host_value& v, interpreter* interp) {
    init_library();
    switch (v.kind()) {
    case VK_NOTHING:
        return obj_handle{Tcl_NewObj()};
    case VK_BOOL:
        return obj_handle{Tcl_NewBooleanObj(v.as_bool() ? 1 : 0)};
    case VK_I32:
    case VK_I64:
        return new_integer(v.as_integer());
    case VK_U64: {
        auto x = v.as<u64>();
        if (x > (u64)std::numeric_limits<Tcl_WideInt>::max()) {
            throw type_conversion_error{"integer " + std::to_string(x)
                    + " does not fit in a wide integer"};
        }
        return new_integer((i64)x);
    }
    case VK_F64:
        return obj_handle{Tcl_NewDoubleObj(v.as_double())};
    case VK_STRING:
    case VK_SYMBOL:
        return make_string_object(v.as_string());
    case VK_SEQUENCE: {
        auto res = new_list();
        for (const auto& x : v.as_sequence().items) {
            list_append(res, x, interp);
        }
        return res;
    }
    case VK_HANDLE:
        if (v.as_handle().is_null()) {
            return obj_handle{Tcl_NewObj()};
        }
        return v.as_handle();
    case VK_CALLABLE: {
        auto& target = interp == nullptr ? current_interpreter() : *interp;
        return make_string_object(register_command(target, v.as_callable()));
    }
    case VK_BYTES:
        throw unsupported_value_error{"byte arrays cannot be converted"};
    case VK_ANY:
        break;
    }
    throw unsupported_value_error{"no conversion for values of kind "
            + kind_name(v.kind())};
}

}
