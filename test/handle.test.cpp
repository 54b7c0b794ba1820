#define BOOST_TEST_MODULE Handle Test Module
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "base.hpp"
#include "handle.hpp"
#include "list.hpp"
#include "types.hpp"

using namespace tether;

BOOST_AUTO_TEST_CASE( handle_refcount_test ) {
    init_library();
    obj_handle h{Tcl_NewStringObj("hello", -1)};
    BOOST_TEST(h.refcount() == 1);
    BOOST_TEST(!h.is_shared());
    BOOST_TEST(h.as_string() == "hello");
    h.assert_writable();

    {
        obj_handle copy = h;
        BOOST_TEST(copy.get() == h.get());
        BOOST_TEST(h.refcount() == 2);
        BOOST_TEST(h.is_shared());
        BOOST_CHECK_THROW(h.assert_writable(), shared_mutation_error);
    }
    BOOST_TEST(h.refcount() == 1);

    obj_handle other{Tcl_NewIntObj(3)};
    other = h;
    BOOST_TEST(h.refcount() == 2);
    other.reset();
    BOOST_TEST(other.is_null());
    BOOST_TEST(h.refcount() == 1);

    // self assignment keeps the reference
    auto& alias = h;
    h = alias;
    BOOST_TEST(h.refcount() == 1);
}

BOOST_AUTO_TEST_CASE( handle_move_test ) {
    init_library();
    obj_handle h{Tcl_NewStringObj("moved", -1)};
    auto p = h.get();
    obj_handle m{std::move(h)};
    BOOST_TEST(h.is_null());
    BOOST_TEST(m.get() == p);
    BOOST_TEST(m.refcount() == 1);

    obj_handle n;
    n = std::move(m);
    BOOST_TEST(m.is_null());
    BOOST_TEST(n.refcount() == 1);
}

BOOST_AUTO_TEST_CASE( handle_duplicate_test ) {
    init_library();
    obj_handle h{Tcl_NewStringObj("dup", -1)};
    obj_handle shared = h;

    auto d = h.duplicate();
    BOOST_TEST(d.get() != h.get());
    BOOST_TEST(!d.is_shared());
    BOOST_TEST(d.refcount() == 1);
    BOOST_TEST(d.as_string() == "dup");

    // a shared rvalue still gets copied
    auto d2 = obj_handle{h}.duplicate();
    BOOST_TEST(d2.get() != h.get());
    BOOST_TEST(!d2.is_shared());

    // an unshared rvalue is reused
    auto p = d.get();
    auto d3 = std::move(d).duplicate();
    BOOST_TEST(d3.get() == p);
    BOOST_TEST(!d3.is_shared());

    BOOST_TEST(obj_handle{}.duplicate().is_null());
}

BOOST_AUTO_TEST_CASE( handle_null_test ) {
    obj_handle h;
    BOOST_TEST(h.is_null());
    BOOST_TEST(h.refcount() == 0);
    BOOST_TEST(!h.is_shared());
    BOOST_TEST(h.as_string() == "");
    BOOST_TEST(h.type_name() == "null");
    BOOST_CHECK_THROW(h.assert_writable(), shared_mutation_error);
    BOOST_TEST(obj_handle{nullptr}.is_null());
}

BOOST_AUTO_TEST_CASE( classify_test ) {
    init_library();
    init_library();

    BOOST_TEST(classify(nullptr) == TT_NULL);
    BOOST_TEST(classify(obj_handle{}) == TT_NULL);

    obj_handle s{Tcl_NewStringObj("text", -1)};
    BOOST_TEST(classify(s) == TT_UNTYPED);
    Tcl_GetUnicode(s.get());
    BOOST_TEST(classify(s) == TT_STRING);

    BOOST_TEST(classify(obj_handle{Tcl_NewIntObj(5)}) == TT_INT);
    BOOST_TEST(classify(obj_handle{Tcl_NewDoubleObj(0.5)}) == TT_DOUBLE);

    obj_handle w{Tcl_NewWideIntObj((Tcl_WideInt)1 << 40)};
    if (same_int_types()) {
        BOOST_TEST(classify(w) == TT_INT);
    } else {
        BOOST_TEST(classify(w) == TT_WIDE_INT);
    }

    obj_handle b{Tcl_NewStringObj("yes", -1)};
    int flag;
    BOOST_TEST(Tcl_GetBooleanFromObj(nullptr, b.get(), &flag) == TCL_OK);
    BOOST_TEST(classify(b) == TT_BOOLEAN);

    // booleans made by the library itself are integers
    BOOST_TEST(classify(obj_handle{Tcl_NewBooleanObj(1)}) == TT_INT);

    BOOST_TEST(classify(new_list()) == TT_LIST);
    BOOST_TEST(type_tag_name(TT_LIST) == "list");
}

BOOST_AUTO_TEST_CASE( type_name_test ) {
    init_library();
    BOOST_TEST(obj_handle{Tcl_NewStringObj("x", -1)}.type_name() == "");
    BOOST_TEST(obj_handle{Tcl_NewDoubleObj(1.0)}.type_name() == "double");
    BOOST_TEST(new_list().type_name() == "list");
    BOOST_TEST(foreign_version().substr(0, 2) == "8.");
}
