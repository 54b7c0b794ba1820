#define BOOST_TEST_MODULE Events Test Module
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "base.hpp"
#include "events.hpp"
#include "interpreter.hpp"
#include "log.hpp"

using namespace tether;

BOOST_AUTO_TEST_CASE( do_events_test ) {
    logger log{nullptr, nullptr};
    interpreter inter{&log};

    do_events();
    BOOST_TEST(do_events() == 0);

    inter.eval("after idle {set ::fired 1}");
    BOOST_TEST(!inter.exists("fired"));
    BOOST_TEST(do_events() >= 1);
    BOOST_TEST(inter.get_var_string("fired") == "1");
}

BOOST_AUTO_TEST_CASE( do_events_bound_test ) {
    logger log{nullptr, nullptr};
    interpreter inter{&log};

    // this handler reschedules itself forever
    inter.eval("set ::n 0; proc again {} { incr ::n; after idle again }");
    inter.eval("after idle again");
    BOOST_TEST(do_events(EV_ALL, 5) == 5);
    BOOST_TEST(inter.get_var_string("n") == "5");
    inter.eval("after cancel again");
}

BOOST_AUTO_TEST_CASE( do_one_event_test ) {
    logger log{nullptr, nullptr};
    interpreter inter{&log};

    do_events();
    BOOST_TEST(!do_one_event());
    inter.eval("after idle {set ::one 1}");
    BOOST_TEST(do_one_event(EV_IDLE | EV_DONT_WAIT));
    BOOST_TEST(inter.exists("one"));
}
