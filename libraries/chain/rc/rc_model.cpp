#include <rcmeter/chain/rc/rc_model.hpp>
#include <rcmeter/chain/rc/rc_exceptions.hpp>
#include <rcmeter/chain/util/rd_dynamics.hpp>

#include <rcmeter/protocol/config.hpp>

#include <fc/log/logger.hpp>
#include <fc/variant_object.hpp>

#include <limits>

namespace rcmeter { namespace chain {

namespace {

// execution time is counted but carries no weight in pricing or pool usage yet
bool is_charged_resource( size_t resource )
{
  return resource != size_t( resource_execution_time );
}

} // anonymous

wide_int rc_transaction_cost::total_cost()const
{
  wide_int total = 0;
  for( const auto& c : cost )
    total += c;
  return total;
}

void rc_pending_block::add( const rc_transaction_cost& tx_cost )
{
  for( size_t i = 0; i < RCMETER_RC_NUM_RESOURCE_TYPES; ++i )
  {
    usage[i] = ( protocol::share_type( usage[i] ) + tx_cost.usage[i] ).value;
    cost[i] += tx_cost.cost[i];
  }
  ++tx_count;
}

wide_int compute_rc_regen( const wide_int& total_vesting_shares )
{
  FC_ASSERT( total_vesting_shares >= 0, "Vesting shares cannot be negative", ("v", total_vesting_shares.str()) );
  return total_vesting_shares / RCMETER_RC_BLOCKS_PER_REGEN;
}

rc_model::rc_model( std::shared_ptr< const rc_resource_param_set > params, const resource_pool_type& pool, const wide_int& rc_regen )
  : _params( std::move( params ) ), _pool( pool ), _rc_regen( rc_regen )
{
  RCMETER_ASSERT( _params != nullptr, invalid_rc_config_exception, "Resource parameters are required", ("rc_regen", _rc_regen.str()) );
  RCMETER_ASSERT( _rc_regen >= 0, invalid_rc_config_exception, "Regeneration rate cannot be negative", ("rc_regen", _rc_regen.str()) );

  if( _rc_regen == 0 )
    wlog( "Regeneration rate is 0, transactions will be priced at the curve minimum" );
}

rc_transaction_cost rc_model::get_transaction_rc_cost( const signed_transaction& tx, size_t tx_size )const
{ try {
  rc_transaction_cost result;
  count_resources( tx, tx_size, result.usage, _params->size_info );

  for( size_t i = 0; i < RCMETER_RC_NUM_RESOURCE_TYPES; ++i )
  {
    if( !is_charged_resource( i ) )
      continue;

    const rc_resource_params& params = _params->resource_params[i];
    wide_int scaled_usage = wide_int( result.usage[i] ) * params.resource_dynamics_params.resource_unit;
    result.cost[i] = resource_credits::compute_cost( params.price_curve_params, _pool[i], scaled_usage, _rc_regen );
  }

  return result;
} FC_CAPTURE_AND_RETHROW( (tx_size) ) }

rc_pool_dynamics_info rc_model::apply_rc_pool_dynamics( const resource_count_type& block_usage, uint32_t dt )
{ try {
  rc_pool_dynamics_info info;

  for( size_t i = 0; i < RCMETER_RC_NUM_RESOURCE_TYPES; ++i )
  {
    const util::rd_dynamics_params& params = _params->resource_params[i].resource_dynamics_params;
    const wide_int& pool = _pool[i];

    info.pool[i] = pool;
    info.dt[i] = dt;
    info.budget[i] = params.budget_per_time_unit * dt;
    if( is_charged_resource( i ) )
      info.usage[i] = wide_int( block_usage[i] ) * params.resource_unit;
    info.decay[i] = util::rd_compute_pool_decay( params.decay_params, pool - info.usage[i], dt );

    info.new_pool[i] = pool - info.decay[i] + info.budget[i] - info.usage[i];
  }

  _pool = info.new_pool;

  dlog( "Pool dynamics applied, state bytes pool ${p} -> ${n}",
    ("p", info.pool[ resource_state_bytes ].str())("n", info.new_pool[ resource_state_bytes ].str()) );
  return info;
} FC_CAPTURE_AND_RETHROW( (dt) ) }

rc_pool_dynamics_info rc_model::apply_rc_pool_dynamics( const rc_pending_block& block )
{
  return apply_rc_pool_dynamics( block.usage );
}

int64_t rc_model::get_pool_fill_level( rc_resource_types resource )const
{
  FC_ASSERT( size_t( resource ) < RCMETER_RC_NUM_RESOURCE_TYPES, "Unknown resource ${r}", ("r", int64_t( resource )) );

  const wide_int& pool_eq = _params->resource_params[ resource ].resource_dynamics_params.pool_eq;
  if( pool_eq == 0 )
    return 0;

  wide_int level = _pool[ resource ] * RCMETER_100_PERCENT / pool_eq;
  FC_ASSERT( level >= std::numeric_limits< int64_t >::min() && level <= std::numeric_limits< int64_t >::max(),
    "Fill level of ${r} out of range", ("r", get_resource_name( resource ))("level", level.str()) );
  return level.convert_to< int64_t >();
}

} } // rcmeter::chain

namespace fc {

namespace {

template< typename Array >
fc::variant resource_map_to_variant( const Array& values )
{
  fc::mutable_variant_object result;
  for( size_t i = 0; i < rcmeter::chain::RCMETER_RC_NUM_RESOURCE_TYPES; ++i )
    result( rcmeter::chain::get_resource_name( i ), values[i] );
  return fc::variant( result );
}

fc::variant wide_map_to_variant( const rcmeter::chain::resource_pool_type& values )
{
  fc::mutable_variant_object result;
  for( size_t i = 0; i < rcmeter::chain::RCMETER_RC_NUM_RESOURCE_TYPES; ++i )
  {
    fc::variant v;
    fc::to_variant( values[i], v );
    result( rcmeter::chain::get_resource_name( i ), v );
  }
  return fc::variant( result );
}

} // anonymous

void to_variant( const rcmeter::chain::rc_transaction_cost& cost, fc::variant& v )
{
  fc::mutable_variant_object result;
  result( "usage", resource_map_to_variant( cost.usage ) );
  result( "cost", wide_map_to_variant( cost.cost ) );
  v = fc::variant( result );
}

void to_variant( const rcmeter::chain::rc_pending_block& block, fc::variant& v )
{
  fc::mutable_variant_object result;
  result( "usage", resource_map_to_variant( block.usage ) );
  result( "cost", wide_map_to_variant( block.cost ) );
  result( "tx_count", block.tx_count );
  v = fc::variant( result );
}

void to_variant( const rcmeter::chain::rc_pool_dynamics_info& info, fc::variant& v )
{
  fc::mutable_variant_object adjustment;
  for( const auto& a : info.adjustment )
  {
    fc::variant value;
    fc::to_variant( a.second, value );
    adjustment( rcmeter::chain::get_resource_name( a.first ), value );
  }

  fc::mutable_variant_object result;
  result( "dt", resource_map_to_variant( info.dt ) );
  result( "decay", wide_map_to_variant( info.decay ) );
  result( "budget", wide_map_to_variant( info.budget ) );
  result( "usage", wide_map_to_variant( info.usage ) );
  result( "adjustment", adjustment );
  result( "pool", wide_map_to_variant( info.pool ) );
  result( "new_pool", wide_map_to_variant( info.new_pool ) );
  v = fc::variant( result );
}

} // fc
