#pragma once

#include <rcmeter/chain/rc/rc_params.hpp>
#include <rcmeter/chain/rc/resource_count.hpp>

#include <rcmeter/protocol/transaction.hpp>

#include <fc/variant.hpp>

#include <array>
#include <memory>

namespace rcmeter { namespace chain {

using rcmeter::protocol::account_name_type;
using rcmeter::protocol::flat_map;
using rcmeter::protocol::signed_transaction;

struct rc_transaction_cost
{
  resource_count_type       usage; //not scaled by resource_unit
  resource_cost_type        cost;

  wide_int total_cost()const;
};

struct rc_pending_block
{
  resource_count_type       usage;
  resource_cost_type        cost;
  uint32_t                  tx_count = 0; //number of transactions that accumulated usage/cost (grows as block is processed)

  void add( const rc_transaction_cost& tx_cost );
};

/**
  * Per resource record of a single pool dynamics step.
  * `adjustment` is reserved and currently never filled.
  */
struct rc_pool_dynamics_info
{
  std::array< uint32_t, RCMETER_RC_NUM_RESOURCE_TYPES > dt;
  resource_pool_type        decay;
  resource_pool_type        budget;
  resource_pool_type        usage;
  flat_map< rc_resource_types, wide_int > adjustment;
  resource_pool_type        pool;
  resource_pool_type        new_pool;
};

// regeneration rate of the whole network given all vested shares
wide_int compute_rc_regen( const wide_int& total_vesting_shares );

/**
  * Prices transactions against a snapshot of the resource pools and advances the pools once per block.
  *
  * Cost queries do not modify the model and can run concurrently. apply_rc_pool_dynamics is the only
  * call that changes the pools, it has to be called once per block after the block's transactions were priced.
  */
class rc_model
{
  public:
    rc_model( std::shared_ptr< const rc_resource_param_set > params, const resource_pool_type& pool, const wide_int& rc_regen );

    // counts resources used by the transaction and prices them, size is the serialized size of the transaction
    rc_transaction_cost get_transaction_rc_cost( const signed_transaction& tx, size_t tx_size )const;

    rc_pool_dynamics_info apply_rc_pool_dynamics( const resource_count_type& block_usage, uint32_t dt = 1 );
    rc_pool_dynamics_info apply_rc_pool_dynamics( const rc_pending_block& block );

    // fill level of the pool relative to its equilibrium in basis points
    int64_t get_pool_fill_level( rc_resource_types resource )const;

    const rc_resource_param_set& get_params()const { return *_params; }
    const resource_pool_type& get_pool()const { return _pool; }
    const wide_int& get_rc_regen()const { return _rc_regen; }

  private:
    std::shared_ptr< const rc_resource_param_set > _params;
    resource_pool_type                             _pool;
    wide_int                                       _rc_regen;
};

} } // rcmeter::chain

namespace fc {

  void to_variant( const rcmeter::chain::rc_transaction_cost& cost, fc::variant& v );
  void to_variant( const rcmeter::chain::rc_pending_block& block, fc::variant& v );
  void to_variant( const rcmeter::chain::rc_pool_dynamics_info& info, fc::variant& v );

} // fc
