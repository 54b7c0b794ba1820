#define BOOST_TEST_MODULE Host Value Test Module
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>
#include <sstream>

#include "base.hpp"
#include "log.hpp"
#include "value.hpp"

using namespace tether;

BOOST_AUTO_TEST_CASE( value_kind_test ) {
    BOOST_TEST(host_value{}.kind() == VK_NOTHING);
    BOOST_TEST(host_value{true}.kind() == VK_BOOL);
    BOOST_TEST(host_value{(i16)5}.kind() == VK_I32);
    BOOST_TEST(host_value{5}.kind() == VK_I32);
    BOOST_TEST(host_value{5u}.kind() == VK_I64);
    BOOST_TEST(host_value{(i64)5}.kind() == VK_I64);
    BOOST_TEST(host_value{(u64)5}.kind() == VK_I64);
    BOOST_TEST(host_value{(u64)1 << 63}.kind() == VK_U64);
    BOOST_TEST(host_value{2.5f}.kind() == VK_F64);
    BOOST_TEST(host_value{"abc"}.kind() == VK_STRING);
    BOOST_TEST(host_value{string{"abc"}}.kind() == VK_STRING);
    BOOST_TEST(host_value{symbol{"abc"}}.kind() == VK_SYMBOL);
    BOOST_TEST((host_value{std::vector<int>{1, 2}}.kind() == VK_SEQUENCE));
    BOOST_TEST(host_value{std::make_tuple(1, "a")}.kind() == VK_SEQUENCE);
    BOOST_TEST((host_value{byte_array{{1, 2}}}.kind() == VK_BYTES));
}

BOOST_AUTO_TEST_CASE( value_sequence_construction_test ) {
    host_value v{std::vector<int>{1, 2}};
    BOOST_TEST(v.as_sequence().size() == 2);
    BOOST_TEST(v.as_sequence()[1].as_integer() == 2);

    // a vector of host values becomes a sequence of those values
    std::vector<host_value> items;
    items.push_back(host_value{1});
    items.push_back(host_value{"a"});
    host_value w{items};
    BOOST_TEST(w.as_sequence().size() == 2);
    BOOST_TEST((w.as_sequence().elem == elem_type{}));
    BOOST_TEST(host_sequence{items}.size() == 2);
    BOOST_TEST(host_sequence{std::vector<host_value>{}}.empty());

    // nested vectors keep one level per vector
    host_value n{std::vector<std::vector<int>>{{1, 2}, {3}}};
    BOOST_TEST(n.as_sequence().size() == 2);
    BOOST_TEST(n.as_sequence()[0].as_sequence().size() == 2);
    BOOST_TEST((n.as_sequence().elem == elem_type{VK_SEQUENCE, VK_I32}));
}

BOOST_AUTO_TEST_CASE( value_accessor_test ) {
    BOOST_TEST(host_value{7}.as_integer() == 7);
    BOOST_TEST(host_value{true}.as_integer() == 1);
    BOOST_TEST(host_value{1}.as_bool());
    BOOST_TEST(!host_value{0}.as_bool());
    BOOST_TEST(host_value{3}.as_double() == 3.0);
    BOOST_TEST(host_value{symbol{"sym"}}.as_string() == "sym");

    BOOST_CHECK_THROW(host_value{"7"}.as_integer(), type_conversion_error);
    BOOST_CHECK_THROW(host_value{7}.as_string(), type_conversion_error);
    BOOST_CHECK_THROW(host_value{2.5}.as_bool(), type_conversion_error);
    BOOST_CHECK_THROW(host_value{(u64)1 << 63}.as_integer(),
            type_conversion_error);
    BOOST_CHECK_THROW(host_value{"x"}.as_sequence(), type_conversion_error);

    BOOST_TEST(host_value{(i64)1 << 40}.as<i64>() == ((i64)1 << 40));
    BOOST_CHECK_THROW(host_value{(i64)1 << 40}.as<i32>(),
            type_conversion_error);
    BOOST_CHECK_THROW(host_value{-1}.as<u32>(), type_conversion_error);
    BOOST_TEST(host_value{(u64)1 << 63}.as<u64>() == ((u64)1 << 63));
}

BOOST_AUTO_TEST_CASE( value_promotion_test ) {
    BOOST_TEST((seq(1, 2, 3).as_sequence().elem == elem_type{VK_I32}));
    BOOST_TEST((seq(1, (i64)2).as_sequence().elem == elem_type{VK_I64}));
    BOOST_TEST((seq(true, 1).as_sequence().elem == elem_type{VK_I32}));
    BOOST_TEST((seq(1.5, 2.5).as_sequence().elem == elem_type{VK_F64}));
    BOOST_TEST((seq("a", "b").as_sequence().elem == elem_type{VK_STRING}));

    // mixing families doesn't promote
    BOOST_TEST((seq(1, 2.5).as_sequence().elem == elem_type{}));
    BOOST_TEST((seq(1, "a").as_sequence().elem == elem_type{}));
    BOOST_TEST(!seq(1, "a").as_sequence().is_uniform());
    BOOST_TEST((seq().as_sequence().elem == elem_type{}));
    BOOST_TEST((seq(symbol{"a"}, symbol{"b"}).as_sequence().elem
            == elem_type{}));

    // a single element fixes the type
    BOOST_TEST((seq(host_value{}).as_sequence().elem
            == elem_type{VK_NOTHING}));

    // nested sequences promote one level
    auto nested = seq(std::vector<int>{1, 2}, std::vector<i64>{3});
    BOOST_TEST((nested.as_sequence().elem == elem_type{VK_SEQUENCE, VK_I64}));
    auto mixed = seq(std::vector<int>{1}, std::vector<string>{"a"});
    BOOST_TEST((mixed.as_sequence().elem == elem_type{}));
    auto deep = seq(seq(seq(1)), seq(seq(2)));
    BOOST_TEST((deep.as_sequence().elem == elem_type{}));
}

BOOST_AUTO_TEST_CASE( value_as_vector_test ) {
    auto v = seq(1, (i64)2, true).as_sequence().as_vector<i64>();
    BOOST_TEST((v == std::vector<i64>{1, 2, 1}));

    auto s = host_value{std::vector<string>{"x", "y"}};
    BOOST_TEST((s.as_sequence().as_vector<string>()
            == std::vector<string>{"x", "y"}));
    BOOST_CHECK_THROW(s.as_sequence().as_vector<int>(),
            type_conversion_error);
}

BOOST_AUTO_TEST_CASE( value_equality_test ) {
    BOOST_TEST((host_value{1} == host_value{1}));
    BOOST_TEST((host_value{1} != host_value{(i64)1}));
    BOOST_TEST((host_value{"a"} != host_value{symbol{"a"}}));
    BOOST_TEST((seq(1, "a") == host_value{std::make_tuple(1, "a")}));
    BOOST_TEST((seq(1, 2) == host_value{std::vector<int>{1, 2}}));
}

BOOST_AUTO_TEST_CASE( command_result_test ) {
    command_result r1 = "3";
    BOOST_TEST(r1.status == ST_OK);
    BOOST_TEST((r1.value == host_value{"3"}));

    command_result r2 = ST_BREAK;
    BOOST_TEST(r2.status == ST_BREAK);
    BOOST_TEST(r2.value.is_nothing());

    command_result r3{ST_ERROR, "bad"};
    BOOST_TEST(r3.status == ST_ERROR);
    BOOST_TEST((r3.value == host_value{"bad"}));

    command_result r4;
    BOOST_TEST(r4.status == ST_OK);
    BOOST_TEST(r4.value.is_nothing());

    auto cb = callback([](const std::vector<string>& args) -> command_result {
        return (i64)args.size();
    });
    BOOST_TEST(!cb.empty());
    auto res = (*cb.proc)({"a", "b"});
    BOOST_TEST((res.value == host_value{(i64)2}));
    BOOST_TEST(host_callable{}.empty());
    BOOST_TEST(cb.id() != 0);
}

BOOST_AUTO_TEST_CASE( logger_test ) {
    std::ostringstream err, info;
    logger log{&err, &info};
    log.log_warning("sub", "watch out");
    log.log_error("sub", "failed");
    log.log_info("sub", "fyi");
    BOOST_TEST(err.str() == "[WARNING] sub:\n\twatch out\n[ERROR] sub:\n\tfailed\n");
    BOOST_TEST(info.str() == "[INFO] sub:\n\tfyi\n");

    // null streams drop messages
    logger quiet{nullptr, nullptr};
    quiet.log_error("sub", "nobody hears this");

    set_logger(&log);
    BOOST_TEST(get_logger() == &log);
    set_logger(nullptr);
    BOOST_TEST(get_logger() != &log);
}

BOOST_AUTO_TEST_CASE( error_format_test ) {
    foreign_runtime_error e{ST_ERROR, "oops"};
    BOOST_TEST(e.status == ST_ERROR);
    BOOST_TEST(e.result == "oops");
    // the message is the foreign result text as is
    BOOST_TEST(e.message == "oops");
    BOOST_TEST(string{e.what()} == "[tcl] oops");
    BOOST_TEST(status_name(ST_CONTINUE) == "TCL_CONTINUE");
    BOOST_TEST(status_name(17) == "TCL_17");
}
