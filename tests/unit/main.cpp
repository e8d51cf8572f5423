#define BOOST_TEST_MODULE rcmeter unit tests
#include <boost/test/unit_test.hpp>

#include <fc/log/logger.hpp>

#include <cstdlib>

struct rcmeter_test_logging
{
  rcmeter_test_logging()
  {
    // pool dynamics log every step at debug level, keep the test output readable
    if( std::getenv( "RCMETER_TESTS_VERBOSE" ) == nullptr )
      fc::logger::get( DEFAULT_LOGGER ).set_log_level( fc::log_level::warn );
  }
};

BOOST_TEST_GLOBAL_FIXTURE( rcmeter_test_logging );
