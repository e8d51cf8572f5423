#pragma once

#include <rcmeter/chain/rc/rc_curve.hpp>
#include <rcmeter/chain/rc/resource_count.hpp>
#include <rcmeter/chain/rc/resource_sizes.hpp>

#include <fc/filesystem.hpp>
#include <fc/variant.hpp>

#include <array>

namespace rcmeter { namespace chain {

/**
  * Everything the engine needs to price transactions, loaded once and never modified afterwards.
  * Resource parameters are indexed by rc_resource_types.
  */
struct rc_resource_param_set
{
  std::array< rc_resource_params, RCMETER_RC_NUM_RESOURCE_TYPES > resource_params;
  rc_size_info                                                    size_info;

  void validate()const;
};

/**
  * Loads a `get_resource_params` document:
  * `{ resource_names, resource_params: { <name>: { resource_dynamics_params, price_curve_params } }, size_info }`.
  *
  * @throws invalid_rc_config_exception when the document is incomplete or fails validation
  */
rc_resource_param_set load_resource_params( const fc::variant& doc );
rc_resource_param_set load_resource_params( const fc::path& file );

/**
  * Loads a `get_resource_pool` document: `{ <name>: { pool } }`.
  *
  * @throws invalid_rc_config_exception when a resource is missing or a pool is not an integer
  */
resource_pool_type load_resource_pool( const fc::variant& doc );
resource_pool_type load_resource_pool( const fc::path& file );

} } // rcmeter::chain
