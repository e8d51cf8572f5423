#include <boost/test/unit_test.hpp>

#include <rcmeter/chain/rc/rc_curve.hpp>
#include <rcmeter/chain/rc/rc_exceptions.hpp>

#include "../rc_fixture/rc_fixture.hpp"

using namespace rcmeter::chain;
using rcmeter::protocol::wide_int;

namespace {

rc_price_curve_params make_curve( const wide_int& a, const wide_int& b, uint8_t shift )
{
  rc_price_curve_params curve;
  curve.coeff_a = a;
  curve.coeff_b = b;
  curve.shift = shift;
  return curve;
}

}

BOOST_AUTO_TEST_SUITE( rc_curve_tests )

BOOST_AUTO_TEST_CASE( compute_cost_basic )
{
  try
  {
    // ((100 * 2^20) >> 10) + 1 = 102401 per unit of resource
    const auto curve = make_curve( wide_int( 1 ) << 20, 1000, 10 );

    BOOST_REQUIRE_EQUAL( resource_credits::compute_cost( curve, 9000, 10, 100 ), wide_int( 103 ) );
    BOOST_REQUIRE_EQUAL( resource_credits::compute_cost( curve, 0, 10, 100 ), wide_int( 1025 ) );
    BOOST_REQUIRE_EQUAL( resource_credits::compute_cost( curve, 0, 1, 100 ), wide_int( 103 ) );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( compute_cost_zero_and_negative_count )
{
  try
  {
    const auto curve = make_curve( wide_int( "12981647055416481792" ), wide_int( "1127105802103" ), 49 );
    const wide_int pool( "132161364601521" );
    const wide_int regen( "2757738113130" );

    BOOST_REQUIRE_EQUAL( resource_credits::compute_cost( curve, pool, 0, regen ), wide_int( 0 ) );

    for( const wide_int& usage : { wide_int( 1 ), wide_int( 499232 ), wide_int( "1000000000000" ) } )
    {
      const wide_int cost = resource_credits::compute_cost( curve, pool, usage, regen );
      BOOST_REQUIRE( cost > 0 );
      BOOST_REQUIRE_EQUAL( resource_credits::compute_cost( curve, pool, -usage, regen ), wide_int( -cost ) );
    }

    // demo vote state usage against the demo pool
    BOOST_REQUIRE_EQUAL( resource_credits::compute_cost( curve, pool, 499232, regen ), wide_int( 238189637 ) );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( compute_cost_non_increasing_in_pool )
{
  try
  {
    const auto curve = make_curve( wide_int( "12981647055416481792" ), 1690658703, 49 );
    const wide_int regen( "2757738113130" );
    const wide_int usage = 9303;

    wide_int previous = resource_credits::compute_cost( curve, -1000000, usage, regen );
    // any negative pool is priced like an empty one
    BOOST_REQUIRE_EQUAL( previous, resource_credits::compute_cost( curve, 0, usage, regen ) );

    for( wide_int pool = 1; pool < wide_int( "1000000000000000" ); pool *= 7 )
    {
      wide_int cost = resource_credits::compute_cost( curve, pool, usage, regen );
      BOOST_REQUIRE( cost <= previous );
      BOOST_REQUIRE( cost >= 1 );
      previous = cost;
    }
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( compute_cost_degenerate_denominator )
{
  try
  {
    RCMETER_REQUIRE_THROW( resource_credits::compute_cost( make_curve( 1000, 0, 0 ), 0, 5, 100 ), degenerate_curve_exception );
    RCMETER_REQUIRE_THROW( resource_credits::compute_cost( make_curve( 1000, -10, 0 ), 5, 5, 100 ), degenerate_curve_exception );
    RCMETER_REQUIRE_THROW( resource_credits::compute_cost( make_curve( 1000, 0, 0 ), -50, 5, 100 ), degenerate_curve_exception );

    // zero usage is never priced, even on a degenerate curve
    BOOST_REQUIRE_EQUAL( resource_credits::compute_cost( make_curve( 1000, 0, 0 ), 0, 0, 100 ), wide_int( 0 ) );

    // a positive pool makes up for a zero coeff_b
    BOOST_REQUIRE_EQUAL( resource_credits::compute_cost( make_curve( 1000, 0, 0 ), 100001, 1, 100 ), wide_int( 2 ) );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( compute_cost_zero_regen )
{
  try
  {
    const auto curve = make_curve( 1000, 10, 0 );

    // numerator collapses to the usage itself, positive usage still costs at least 1
    BOOST_REQUIRE_EQUAL( resource_credits::compute_cost( curve, 0, 5, 0 ), wide_int( 1 ) );
    BOOST_REQUIRE_EQUAL( resource_credits::compute_cost( curve, 0, 25, 0 ), wide_int( 3 ) );
    BOOST_REQUIRE_EQUAL( resource_credits::compute_cost( curve, 40, 25, 0 ), wide_int( 1 ) );
    BOOST_REQUIRE_EQUAL( resource_credits::compute_cost( curve, 0, -25, 0 ), wide_int( -3 ) );
    BOOST_REQUIRE_EQUAL( resource_credits::compute_cost( curve, 0, 0, 0 ), wide_int( 0 ) );

    RCMETER_REQUIRE_THROW( resource_credits::compute_cost( curve, 0, 5, -1 ), fc::assert_exception );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
