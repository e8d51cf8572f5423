#include <rcmeter/chain/rc/rc_params.hpp>
#include <rcmeter/chain/rc/rc_exceptions.hpp>

#include <rcmeter/protocol/variant_decoder.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/variant_object.hpp>

#include <string>
#include <vector>

namespace rcmeter { namespace chain {

using rcmeter::protocol::decode_variant;

namespace detail {

struct rc_pool_entry
{
  wide_int pool;
};

} // detail

namespace {

const fc::variant_object& get_section( const fc::variant_object& doc, const std::string& name, const std::string& path )
{
  auto itr = doc.find( name );
  RCMETER_ASSERT( itr != doc.end(), invalid_rc_config_exception, "Missing ${path}", ("path", path) );
  RCMETER_ASSERT( itr->value().is_object(), invalid_rc_config_exception, "${path} has to be an object", ("path", path) );
  return itr->value().get_object();
}

fc::variant load_json_file( const fc::path& file )
{
  RCMETER_ASSERT( fc::exists( file ), invalid_rc_config_exception, "Configuration file ${f} does not exist", ("f", file.string()) );
  try
  {
    return fc::json::from_file( file );
  }
  RCMETER_RECODE_EXC( fc::exception, invalid_rc_config_exception )
}

} // anonymous

} } // rcmeter::chain

FC_REFLECT( rcmeter::chain::detail::rc_pool_entry, (pool) )

namespace rcmeter { namespace chain {

void rc_resource_param_set::validate()const
{
  for( size_t i = 0; i < RCMETER_RC_NUM_RESOURCE_TYPES; ++i )
  {
    const char* name = get_resource_name( i );
    const util::rd_dynamics_params& dp = resource_params[i].resource_dynamics_params;
    const rc_price_curve_params& cp = resource_params[i].price_curve_params;

    RCMETER_ASSERT( dp.resource_unit > 0, invalid_rc_config_exception,
      "${r}: resource_unit has to be positive", ("r", name) );
    RCMETER_ASSERT( dp.budget_per_time_unit >= 0, invalid_rc_config_exception,
      "${r}: budget_per_time_unit cannot be negative", ("r", name)("v", dp.budget_per_time_unit.str()) );
    RCMETER_ASSERT( dp.decay_params.decay_per_time_unit >= 0, invalid_rc_config_exception,
      "${r}: decay_per_time_unit cannot be negative", ("r", name)("v", dp.decay_params.decay_per_time_unit.str()) );
    RCMETER_ASSERT( dp.pool_eq >= 0 && dp.max_pool_size >= 0 && dp.min_decay >= 0, invalid_rc_config_exception,
      "${r}: pool_eq, max_pool_size and min_decay cannot be negative", ("r", name) );
    RCMETER_ASSERT( cp.coeff_a >= 0, invalid_rc_config_exception,
      "${r}: coeff_a cannot be negative", ("r", name)("v", cp.coeff_a.str()) );
    RCMETER_ASSERT( cp.coeff_b > 0, invalid_rc_config_exception,
      "${r}: coeff_b has to be positive", ("r", name)("v", cp.coeff_b.str()) );
  }
  size_info.validate();
}

rc_resource_param_set load_resource_params( const fc::variant& doc )
{
  rc_resource_param_set result;

  try
  {
    RCMETER_ASSERT( doc.is_object(), invalid_rc_config_exception, "Resource parameters have to be an object", ("doc", doc) );
    const fc::variant_object& obj = doc.get_object();

    auto names_itr = obj.find( "resource_names" );
    RCMETER_ASSERT( names_itr != obj.end(), invalid_rc_config_exception, "Missing resource_names", ("keys", obj.size()) );
    std::vector< std::string > resource_names;
    decode_variant( names_itr->value(), resource_names, "resource_names" );

    RCMETER_ASSERT( resource_names.size() == RCMETER_RC_NUM_RESOURCE_TYPES, invalid_rc_config_exception,
      "Expected ${n} resources, got ${m}", ("n", RCMETER_RC_NUM_RESOURCE_TYPES)("m", resource_names.size()) );
    for( size_t i = 0; i < RCMETER_RC_NUM_RESOURCE_TYPES; ++i )
      RCMETER_ASSERT( resource_names[i] == get_resource_name( i ), invalid_rc_config_exception,
        "Resource ${i} has to be ${expected}, got ${name}", ("i", i)("expected", get_resource_name( i ))("name", resource_names[i]) );

    const fc::variant_object& params = get_section( obj, "resource_params", "resource_params" );
    for( size_t i = 0; i < RCMETER_RC_NUM_RESOURCE_TYPES; ++i )
    {
      const std::string name = get_resource_name( i );
      auto itr = params.find( name );
      RCMETER_ASSERT( itr != params.end(), invalid_rc_config_exception, "Missing resource_params.${r}", ("r", name) );
      decode_variant( itr->value(), result.resource_params[i], "resource_params." + name );
    }

    auto size_itr = obj.find( "size_info" );
    RCMETER_ASSERT( size_itr != obj.end(), invalid_rc_config_exception, "Missing size_info", ("keys", obj.size()) );
    decode_variant( size_itr->value(), result.size_info, "size_info" );

    result.validate();
  }
  catch( const invalid_rc_config_exception& )
  {
    throw;
  }
  RCMETER_RECODE_EXC( fc::exception, invalid_rc_config_exception )

  ilog( "Loaded resource parameters for ${n} resources", ("n", RCMETER_RC_NUM_RESOURCE_TYPES) );
  return result;
}

rc_resource_param_set load_resource_params( const fc::path& file )
{
  ilog( "Loading resource parameters from ${f}", ("f", file.string()) );
  return load_resource_params( load_json_file( file ) );
}

resource_pool_type load_resource_pool( const fc::variant& doc )
{
  resource_pool_type result;

  try
  {
    RCMETER_ASSERT( doc.is_object(), invalid_rc_config_exception, "Resource pool has to be an object", ("doc", doc) );
    const fc::variant_object& obj = doc.get_object();

    for( size_t i = 0; i < RCMETER_RC_NUM_RESOURCE_TYPES; ++i )
    {
      const std::string name = get_resource_name( i );
      auto itr = obj.find( name );
      RCMETER_ASSERT( itr != obj.end(), invalid_rc_config_exception, "Missing pool of ${r}", ("r", name) );

      detail::rc_pool_entry entry;
      decode_variant( itr->value(), entry, name );
      result[i] = entry.pool;
    }
  }
  catch( const invalid_rc_config_exception& )
  {
    throw;
  }
  RCMETER_RECODE_EXC( fc::exception, invalid_rc_config_exception )

  ilog( "Loaded resource pool, state bytes pool: ${p}", ("p", result[ resource_state_bytes ].str()) );
  return result;
}

resource_pool_type load_resource_pool( const fc::path& file )
{
  ilog( "Loading resource pool from ${f}", ("f", file.string()) );
  return load_resource_pool( load_json_file( file ) );
}

} } // rcmeter::chain
