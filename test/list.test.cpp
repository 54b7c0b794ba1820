#define BOOST_TEST_MODULE List Test Module
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "base.hpp"
#include "handle.hpp"
#include "list.hpp"
#include "project.hpp"
#include "types.hpp"

using namespace tether;

BOOST_AUTO_TEST_CASE( new_list_test ) {
    auto l = new_list();
    BOOST_TEST(classify(l) == TT_LIST);
    BOOST_TEST(list_length(l) == 0);
    BOOST_TEST(!l.is_shared());
    BOOST_TEST(l.type_name() == "list");

    // an empty sequence comes back as an empty sequence, not as text
    auto empty = project(new_object(host_value{host_sequence{}}));
    BOOST_TEST(empty.kind() == VK_SEQUENCE);
    BOOST_TEST(empty.as_sequence().empty());
}

BOOST_AUTO_TEST_CASE( append_order_test ) {
    auto l = new_list();
    append(l, 1, "hello", std::vector<int>{2, 3, 4},
            option("_in", "container"));
    BOOST_TEST(list_length(l) == 5);
    auto expected = seq(1, "hello", std::vector<int>{2, 3, 4}, "-in",
            "container");
    BOOST_TEST((project(l) == expected));
    BOOST_TEST(l.as_string() == "1 hello {2 3 4} -in container");

    // options always follow the positional arguments
    auto m = make_list(option("x", 1), "a", option("y", 2.5), "b");
    BOOST_TEST(m.as_string() == "a b -x 1 -y 2.5");
}

BOOST_AUTO_TEST_CASE( option_flag_test ) {
    BOOST_TEST(option_flag("in") == "-in");
    BOOST_TEST(option_flag("_in") == "-in");
    BOOST_TEST(option_flag("__in") == "-_in");
    BOOST_TEST(option_flag("in_") == "-in_");
    BOOST_TEST(option_flag("") == "-");

    auto l = new_list();
    list_append_option(l, "_text", "Quit");
    BOOST_TEST((project(l) == seq("-text", "Quit")));
}

BOOST_AUTO_TEST_CASE( append_shared_test ) {
    auto l = make_list(1, 2);
    obj_handle other = l;
    BOOST_CHECK_THROW(list_append(l, 3), shared_mutation_error);
    BOOST_CHECK_THROW(append(l, 3), shared_mutation_error);
    BOOST_TEST(list_length(l) == 2);

    // the caller makes a private copy to modify
    auto copy = l.duplicate();
    list_append(copy, 3);
    BOOST_TEST(list_length(copy) == 3);
    BOOST_TEST(list_length(other) == 2);
}

BOOST_AUTO_TEST_CASE( append_non_list_test ) {
    init_library();
    obj_handle bad{Tcl_NewStringObj("a {b", -1)};
    BOOST_CHECK_THROW(list_append(bad, 1), list_append_error);

    // text that parses as a list can be grown
    obj_handle good{Tcl_NewStringObj("a b", -1)};
    list_append(good, "c");
    BOOST_TEST(list_length(good) == 3);
    BOOST_TEST(classify(good) == TT_LIST);
}

BOOST_AUTO_TEST_CASE( list_access_test ) {
    auto l = make_list("a", 2, 3.5);
    BOOST_TEST(list_index(l, 0).as_string() == "a");
    BOOST_TEST((project(list_index(l, 1)) == host_value{2}));
    BOOST_TEST(list_index(l, 3).is_null());
    BOOST_TEST(list_index(l, -1).is_null());

    auto elems = list_elements(l);
    BOOST_TEST(elems.size() == 3);
    BOOST_TEST(elems[2].as_string() == "3.5");
    // the elements are shared with the list
    BOOST_TEST(elems[0].is_shared());

    BOOST_TEST(list_length(obj_handle{}) == 0);
    BOOST_TEST(list_elements(obj_handle{}).empty());
    BOOST_CHECK_THROW(list_length(obj_handle{Tcl_NewStringObj("{", -1)}),
            type_conversion_error);
}

BOOST_AUTO_TEST_CASE( concat_test ) {
    auto l = make_list(1, 2);
    list_concat(l, make_list(3, 4));
    BOOST_TEST((project(l) == seq(1, 2, 3, 4)));

    auto c = concat(std::vector<int>{1, 2}, 3, "a b");
    BOOST_TEST(list_length(c) == 5);
    BOOST_TEST(c.as_string() == "1 2 3 a b");

    obj_handle shared = l;
    BOOST_CHECK_THROW(list_concat(l, make_list(5)), shared_mutation_error);
}
