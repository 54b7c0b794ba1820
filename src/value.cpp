#include "value.hpp"

namespace tether {

string kind_name(value_kind k) {
    switch (k) {
    case VK_NOTHING:
        return "nothing";
    case VK_BOOL:
        return "bool";
    case VK_I32:
        return "i32";
    case VK_I64:
        return "i64";
    case VK_U64:
        return "u64";
    case VK_F64:
        return "f64";
    case VK_STRING:
        return "string";
    case VK_SYMBOL:
        return "symbol";
    case VK_SEQUENCE:
        return "sequence";
    case VK_HANDLE:
        return "handle";
    case VK_CALLABLE:
        return "callable";
    case VK_BYTES:
        return "bytes";
    case VK_ANY:
        return "any";
    }
    return "unknown";
}

host_callable::host_callable(command_proc fn)
    : proc{std::make_shared<command_proc>(std::move(fn))} {
}

bool host_callable::empty() const {
    return proc == nullptr || !(*proc);
}

host_sequence::host_sequence() {
}

host_sequence::host_sequence(std::vector<host_value> items)
    : elem{infer_elem_type(items)}
    , items(std::move(items)) {
}

bool host_sequence::operator==(const host_sequence& other) const {
    return elem == other.elem && items == other.items;
}

host_value::host_value(const char* s)
    : data{std::in_place_type<string>, s} {
}

host_value::host_value(const string& s)
    : data{std::in_place_type<string>, s} {
}

host_value::host_value(string&& s)
    : data{std::in_place_type<string>, std::move(s)} {
}

host_value::host_value(symbol s)
    : data{std::in_place_type<symbol>, std::move(s)} {
}

host_value::host_value(std::vector<host_value> items)
    : data{std::in_place_type<host_sequence>, std::move(items)} {
}

host_value::host_value(host_sequence s)
    : data{std::in_place_type<host_sequence>, std::move(s)} {
}

host_value::host_value(obj_handle h)
    : data{std::in_place_type<obj_handle>, std::move(h)} {
}

host_value::host_value(host_callable c)
    : data{std::in_place_type<host_callable>, std::move(c)} {
}

host_value::host_value(byte_array b)
    : data{std::in_place_type<byte_array>, std::move(b)} {
}

static type_conversion_error kind_mismatch(const char* expected,
        value_kind actual) {
    return type_conversion_error{string{"expected "} + expected
            + " but got " + kind_name(actual)};
}

bool host_value::as_bool() const {
    switch (kind()) {
    case VK_BOOL:
        return std::get<bool>(data);
    case VK_I32:
        return std::get<i32>(data) != 0;
    case VK_I64:
        return std::get<i64>(data) != 0;
    case VK_U64:
        return std::get<u64>(data) != 0;
    default:
        throw kind_mismatch("a boolean", kind());
    }
}

i64 host_value::as_integer() const {
    switch (kind()) {
    case VK_BOOL:
        return std::get<bool>(data) ? 1 : 0;
    case VK_I32:
        return std::get<i32>(data);
    case VK_I64:
        return std::get<i64>(data);
    case VK_U64:
        throw type_conversion_error{"integer "
                + std::to_string(std::get<u64>(data))
                + " does not fit in 64 signed bits"};
    default:
        throw kind_mismatch("an integer", kind());
    }
}

f64 host_value::as_double() const {
    switch (kind()) {
    case VK_F64:
        return std::get<f64>(data);
    case VK_U64:
        return (f64)std::get<u64>(data);
    case VK_BOOL:
    case VK_I32:
    case VK_I64:
        return (f64)as_integer();
    default:
        throw kind_mismatch("a number", kind());
    }
}

const string& host_value::as_string() const {
    if (kind() == VK_STRING) {
        return std::get<string>(data);
    } else if (kind() == VK_SYMBOL) {
        return std::get<symbol>(data).name;
    }
    throw kind_mismatch("a string", kind());
}

const host_sequence& host_value::as_sequence() const {
    if (kind() != VK_SEQUENCE) {
        throw kind_mismatch("a sequence", kind());
    }
    return std::get<host_sequence>(data);
}

const obj_handle& host_value::as_handle() const {
    if (kind() != VK_HANDLE) {
        throw kind_mismatch("an object handle", kind());
    }
    return std::get<obj_handle>(data);
}

const host_callable& host_value::as_callable() const {
    if (kind() != VK_CALLABLE) {
        throw kind_mismatch("a callable", kind());
    }
    return std::get<host_callable>(data);
}

const byte_array& host_value::as_bytes() const {
    if (kind() != VK_BYTES) {
        throw kind_mismatch("a byte array", kind());
    }
    return std::get<byte_array>(data);
}

// position in the integer family, or 0 for other kinds
static int integer_rank(value_kind k) {
    switch (k) {
    case VK_BOOL:
        return 1;
    case VK_I32:
        return 2;
    case VK_I64:
        return 3;
    default:
        return 0;
    }
}

static value_kind promote_kind(value_kind a, value_kind b) {
    auto ra = integer_rank(a);
    auto rb = integer_rank(b);
    if (ra != 0 && rb != 0) {
        return ra >= rb ? a : b;
    } else if (a == b && (a == VK_U64 || a == VK_F64 || a == VK_STRING)) {
        return a;
    }
    return VK_ANY;
}

elem_type elem_type_of(const host_value& v) {
    if (v.kind() == VK_SEQUENCE) {
        return elem_type{VK_SEQUENCE, v.as_sequence().elem.kind};
    }
    return elem_type{v.kind(), VK_ANY};
}

elem_type promote_elem(const elem_type& a, const elem_type& b) {
    if (a.kind == VK_SEQUENCE && b.kind == VK_SEQUENCE) {
        auto inner = promote_kind(a.inner, b.inner);
        if (inner == VK_ANY) {
            return elem_type{};
        }
        return elem_type{VK_SEQUENCE, inner};
    }
    return elem_type{promote_kind(a.kind, b.kind), VK_ANY};
}

elem_type infer_elem_type(const std::vector<host_value>& items) {
    if (items.empty()) {
        return elem_type{};
    }
    auto res = elem_type_of(items[0]);
    for (u32 i = 1; i < items.size(); ++i) {
        res = promote_elem(res, elem_type_of(items[i]));
        if (res.kind == VK_ANY) {
            break;
        }
    }
    return res;
}

}
