#include <boost/test/unit_test.hpp>

#include <rcmeter/chain/rc/rc_exceptions.hpp>
#include <rcmeter/chain/rc/rc_model.hpp>

#include <rcmeter/protocol/exceptions.hpp>
#include <rcmeter/protocol/operation_decoder.hpp>

#include <fc/io/json.hpp>
#include <fc/variant_object.hpp>

#include "../rc_fixture/rc_fixture.hpp"

using namespace rcmeter::chain;
using namespace rcmeter::protocol;

namespace {

struct expected_cost
{
  const char*                 name;
  std::array< int64_t, 5 >    usage;
  std::array< const char*, 5 > cost;
  const char*                 total;
};

// resources in order: history, new accounts, market, state, execution time
const expected_cost demo_costs[] = {
  { "vote",       { { 133,  0, 0,   499232,  26500 } },  { { "42083274",   "0", "0",         "238189637",  "0" } },  "280272911" },
  { "transfer",   { { 282,  0, 282, 55158,   9600 } },   { { "89229198",   "0", "495184050", "26316551",   "0" } },  "610729799" },
  { "long_post",  { { 9303, 0, 0,   4434812, 127300 } }, { { "2943614268", "0", "0",         "2115902546", "0" } }, "5059516814" },
  { "short_post", { { 952,  0, 0,   2961738, 127300 } }, { { "301227646",  "0", "0",         "1413081090", "0" } }, "1714308736" }
};

void require_pool( const resource_pool_type& pool, const std::array< const char*, 5 >& expected )
{
  for( size_t i = 0; i < RCMETER_RC_NUM_RESOURCE_TYPES; ++i )
  {
    BOOST_TEST_MESSAGE( "--- Checking pool: " << get_resource_name( i ) );
    BOOST_REQUIRE_EQUAL( pool[i], wide_int( expected[i] ) );
  }
}

}

BOOST_FIXTURE_TEST_SUITE( rc_model_tests, rc_fixture )

BOOST_AUTO_TEST_CASE( rc_regen_from_vesting_shares )
{
  try
  {
    BOOST_REQUIRE_EQUAL( rc_regen, wide_int( "2757738113130" ) );
    BOOST_REQUIRE_EQUAL( compute_rc_regen( 0 ), wide_int( 0 ) );
    BOOST_REQUIRE_EQUAL( compute_rc_regen( 144000 * 3 + 17 ), wide_int( 3 ) );
    RCMETER_REQUIRE_THROW( compute_rc_regen( -1 ), fc::assert_exception );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( demo_transaction_costs )
{
  try
  {
    const rc_model model = make_model();

    for( const expected_cost& expected : demo_costs )
    {
      BOOST_TEST_MESSAGE( "--- Testing: " << expected.name );

      const example_transaction& example = get_example( expected.name );
      rc_transaction_cost result = model.get_transaction_rc_cost( example.tx, example.tx_size );

      for( size_t i = 0; i < RCMETER_RC_NUM_RESOURCE_TYPES; ++i )
      {
        BOOST_REQUIRE_EQUAL( result.usage[i], expected.usage[i] );
        BOOST_REQUIRE_EQUAL( result.cost[i], wide_int( expected.cost[i] ) );
      }
      BOOST_REQUIRE_EQUAL( result.total_cost(), wide_int( expected.total ) );
    }

    // pricing does not touch the pools
    for( size_t i = 0; i < RCMETER_RC_NUM_RESOURCE_TYPES; ++i )
      BOOST_REQUIRE_EQUAL( model.get_pool()[i], pool[i] );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( longer_transaction_costs_more )
{
  try
  {
    const rc_model model = make_model();
    const example_transaction& long_post = get_example( "long_post" );
    const example_transaction& short_post = get_example( "short_post" );

    wide_int long_cost = model.get_transaction_rc_cost( long_post.tx, long_post.tx_size ).total_cost();
    wide_int short_cost = model.get_transaction_rc_cost( short_post.tx, short_post.tx_size ).total_cost();
    BOOST_REQUIRE( long_cost > short_cost );

    // same transaction, claimed bigger
    wide_int padded_cost = model.get_transaction_rc_cost( short_post.tx, short_post.tx_size + 1000 ).total_cost();
    BOOST_REQUIRE( padded_cost > short_cost );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( execution_time_is_not_charged )
{
  try
  {
    const rc_model model = make_model();

    for( const expected_cost& expected : demo_costs )
    {
      const example_transaction& example = get_example( expected.name );
      rc_transaction_cost result = model.get_transaction_rc_cost( example.tx, example.tx_size );

      BOOST_REQUIRE( result.usage[ resource_execution_time ] > 0 );
      BOOST_REQUIRE_EQUAL( result.cost[ resource_execution_time ], wide_int( 0 ) );
    }
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( zero_regen_still_charges )
{
  try
  {
    const rc_model model( params, pool, 0 );
    const example_transaction& vote = get_example( "vote" );

    rc_transaction_cost result = model.get_transaction_rc_cost( vote.tx, vote.tx_size );
    BOOST_REQUIRE_EQUAL( result.usage[ resource_state_bytes ], 499232 );

    BOOST_REQUIRE_EQUAL( result.cost[ resource_history_bytes ], wide_int( 1 ) );
    BOOST_REQUIRE_EQUAL( result.cost[ resource_new_accounts ], wide_int( 0 ) );
    BOOST_REQUIRE_EQUAL( result.cost[ resource_market_bytes ], wide_int( 0 ) );
    BOOST_REQUIRE_EQUAL( result.cost[ resource_state_bytes ], wide_int( 1 ) );
    BOOST_REQUIRE_EQUAL( result.cost[ resource_execution_time ], wide_int( 0 ) );
    BOOST_REQUIRE_EQUAL( result.total_cost(), wide_int( 2 ) );

    const example_transaction& transfer = get_example( "transfer" );
    BOOST_REQUIRE_EQUAL( model.get_transaction_rc_cost( transfer.tx, transfer.tx_size ).total_cost(), wide_int( 3 ) );

    RCMETER_REQUIRE_THROW( rc_model( params, pool, -1 ), invalid_rc_config_exception );
    RCMETER_REQUIRE_THROW( rc_model( nullptr, pool, rc_regen ), invalid_rc_config_exception );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( unknown_operation_leaves_pool )
{
  try
  {
    rc_model model = make_model();

    fc::variant doc = fc::json::from_string(
      R"({"ref_block_num":1,"ref_block_prefix":2,"expiration":"2018-09-28T01:02:03",)"
      R"("operations":[{"type":"smt_setup_operation","value":{"control_account":"alice"}}],)"
      R"("extensions":[],"signatures":[]})" );

    signed_transaction tx;
    RCMETER_REQUIRE_THROW( decode_transaction( doc, tx ), unknown_operation_exception );
    BOOST_REQUIRE( tx.operations.empty() );

    for( size_t i = 0; i < RCMETER_RC_NUM_RESOURCE_TYPES; ++i )
      BOOST_REQUIRE_EQUAL( model.get_pool()[i], pool[i] );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( degenerate_curve_leaves_pool )
{
  try
  {
    auto broken = std::make_shared< rc_resource_param_set >( *params );
    broken->resource_params[ resource_state_bytes ].price_curve_params.coeff_b = 0;

    resource_pool_type empty_pool = pool;
    empty_pool[ resource_state_bytes ] = 0;

    rc_model model( broken, empty_pool, rc_regen );
    const example_transaction& vote = get_example( "vote" );

    RCMETER_REQUIRE_THROW( model.get_transaction_rc_cost( vote.tx, vote.tx_size ), degenerate_curve_exception );
    BOOST_REQUIRE_EQUAL( model.get_pool()[ resource_state_bytes ], wide_int( 0 ) );
    BOOST_REQUIRE_EQUAL( model.get_pool()[ resource_history_bytes ], pool[ resource_history_bytes ] );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( block_pool_dynamics )
{
  try
  {
    rc_model model = make_model();

    rc_pending_block block;
    for( const expected_cost& expected : demo_costs )
    {
      const example_transaction& example = get_example( expected.name );
      block.add( model.get_transaction_rc_cost( example.tx, example.tx_size ) );
    }

    BOOST_REQUIRE_EQUAL( block.tx_count, 4u );
    BOOST_REQUIRE_EQUAL( block.usage[ resource_history_bytes ], 133 + 282 + 9303 + 952 );
    BOOST_REQUIRE_EQUAL( block.usage[ resource_market_bytes ], 282 );
    BOOST_REQUIRE_EQUAL( block.usage[ resource_state_bytes ], 7950940 );
    BOOST_REQUIRE_EQUAL( block.usage[ resource_execution_time ], 290700 );
    BOOST_REQUIRE_EQUAL( block.cost[ resource_state_bytes ], wide_int( 238189637 + 26316551 + 2115902546LL + 1413081090 ) );

    rc_pool_dynamics_info info = model.apply_rc_pool_dynamics( block );

    require_pool( info.pool, { { "199290410749", "24573481", "15970580402", "132161364601521", "47263115029450" } } );
    require_pool( info.budget, { { "347222", "797", "578704", "231481481", "82191781" } } );
    // execution time is accumulated in the block but does not drain its pool
    require_pool( info.usage, { { "10670", "0", "2820", "7950940", "0" } } );
    require_pool( info.decay, { { "319762", "124", "576550", "212053699", "75833955" } } );
    require_pool( info.new_pool, { { "199290427539", "24574154", "15970579736", "132161376078363", "47263121387276" } } );
    BOOST_REQUIRE( info.adjustment.empty() );
    for( uint32_t dt : info.dt )
      BOOST_REQUIRE_EQUAL( dt, 1u );

    for( size_t i = 0; i < RCMETER_RC_NUM_RESOURCE_TYPES; ++i )
    {
      BOOST_REQUIRE_EQUAL( info.new_pool[i], wide_int( info.pool[i] - info.decay[i] + info.budget[i] - info.usage[i] ) );
      BOOST_REQUIRE_EQUAL( model.get_pool()[i], info.new_pool[i] );
    }
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( empty_block_dynamics )
{
  try
  {
    rc_model model = make_model();

    rc_pool_dynamics_info info = model.apply_rc_pool_dynamics( rc_pending_block() );
    require_pool( info.new_pool, { { "199290438209", "24574154", "15970582556", "132161384029290", "47263121387276" } } );

    // next step starts from the pool of the previous one
    rc_pool_dynamics_info next = model.apply_rc_pool_dynamics( resource_count_type(), 2 );
    for( size_t i = 0; i < RCMETER_RC_NUM_RESOURCE_TYPES; ++i )
    {
      BOOST_REQUIRE_EQUAL( next.pool[i], info.new_pool[i] );
      BOOST_REQUIRE_EQUAL( next.dt[i], 2u );
      BOOST_REQUIRE_EQUAL( next.budget[i], wide_int( info.budget[i] * 2 ) );
    }
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( pool_fill_level )
{
  try
  {
    const rc_model model = make_model();

    BOOST_REQUIRE_EQUAL( model.get_pool_fill_level( resource_history_bytes ), 9209 );
    BOOST_REQUIRE_EQUAL( model.get_pool_fill_level( resource_new_accounts ), 1558 );
    BOOST_REQUIRE_EQUAL( model.get_pool_fill_level( resource_market_bytes ), 9962 );
    BOOST_REQUIRE_EQUAL( model.get_pool_fill_level( resource_state_bytes ), 9160 );
    BOOST_REQUIRE_EQUAL( model.get_pool_fill_level( resource_execution_time ), 9226 );

    auto no_eq = std::make_shared< rc_resource_param_set >( *params );
    no_eq->resource_params[ resource_new_accounts ].resource_dynamics_params.pool_eq = 0;
    BOOST_REQUIRE_EQUAL( rc_model( no_eq, pool, rc_regen ).get_pool_fill_level( resource_new_accounts ), 0 );

    auto tiny_eq = std::make_shared< rc_resource_param_set >( *params );
    tiny_eq->resource_params[ resource_state_bytes ].resource_dynamics_params.pool_eq = 1;
    BOOST_REQUIRE_EQUAL( rc_model( tiny_eq, pool, rc_regen ).get_pool_fill_level( resource_state_bytes ),
      int64_t( 1321613646015210000LL ) );

    resource_pool_type overfull = pool;
    overfull[ resource_state_bytes ] = wide_int( "1000000000000000000000" );
    RCMETER_REQUIRE_THROW( rc_model( tiny_eq, overfull, rc_regen ).get_pool_fill_level( resource_state_bytes ), fc::assert_exception );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( cost_json_output )
{
  try
  {
    const rc_model model = make_model();
    const example_transaction& transfer = get_example( "transfer" );

    fc::variant v;
    fc::to_variant( model.get_transaction_rc_cost( transfer.tx, transfer.tx_size ), v );

    BOOST_REQUIRE_EQUAL( v[ "usage" ][ "resource_market_bytes" ].as_int64(), 282 );
    BOOST_REQUIRE_EQUAL( v[ "usage" ][ "resource_new_accounts" ].as_int64(), 0 );
    BOOST_REQUIRE_EQUAL( v[ "cost" ][ "resource_market_bytes" ].as_string(), "495184050" );
    BOOST_REQUIRE_EQUAL( v[ "cost" ].get_object().size(), RCMETER_RC_NUM_RESOURCE_TYPES );

    rc_model mutable_model = make_model();
    fc::variant dynamics;
    fc::to_variant( mutable_model.apply_rc_pool_dynamics( rc_pending_block() ), dynamics );

    BOOST_REQUIRE_EQUAL( dynamics[ "dt" ][ "resource_state_bytes" ].as_uint64(), 1u );
    BOOST_REQUIRE_EQUAL( dynamics[ "new_pool" ][ "resource_state_bytes" ].as_string(), "132161384029290" );
    BOOST_REQUIRE( dynamics[ "adjustment" ].get_object().size() == 0 );
    BOOST_REQUIRE( dynamics.get_object().contains( "decay" ) );
    BOOST_REQUIRE( dynamics.get_object().contains( "budget" ) );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
