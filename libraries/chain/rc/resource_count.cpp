#include <rcmeter/chain/rc/resource_count.hpp>
#include <rcmeter/chain/rc/resource_sizes.hpp>

#include <rcmeter/protocol/operations.hpp>
#include <rcmeter/protocol/transaction.hpp>

#include <algorithm>

namespace rcmeter { namespace chain {

using namespace rcmeter::protocol;

const char* get_resource_name( size_t resource )
{
  FC_ASSERT( resource < RCMETER_RC_NUM_RESOURCE_TYPES, "Unknown resource ${r}", ("r", resource) );
  return fc::reflector< rc_resource_types >::to_string( static_cast< rc_resource_types >( resource ) );
}

struct count_operation_visitor
{
  typedef void result_type;

  mutable int32_t     market_op_count = 0;
  mutable int32_t     new_account_op_count = 0;
  mutable share_type  state_bytes_count = 0;
  mutable share_type  execution_time_count = 0;

  const state_object_size_info& _w;
  const operation_exec_info& _e;

  count_operation_visitor( const state_object_size_info& w, const operation_exec_info& e )
    : _w(w), _e(e) {}

  share_type get_authority_byte_count( const authority& auth )const
  {
    return share_type( _w.authority_base_size )
      + share_type( _w.authority_account_member_size ) * int64_t( auth.account_auths.size() )
      + share_type( _w.authority_key_member_size ) * int64_t( auth.key_auths.size() );
  }

  share_type get_new_account_byte_count( const authority& owner, const authority& active, const authority& posting )const
  {
    return share_type( _w.account_object_base_size )
      + _w.account_authority_object_base_size
      + get_authority_byte_count( owner )
      + get_authority_byte_count( active )
      + get_authority_byte_count( posting );
  }

  void operator()( const account_create_operation& op )const
  {
    state_bytes_count += get_new_account_byte_count( op.owner, op.active, op.posting );
    execution_time_count += _e.account_create_operation_exec_time;
  }

  void operator()( const account_create_with_delegation_operation& op )const
  {
    state_bytes_count += get_new_account_byte_count( op.owner, op.active, op.posting );
    //compare with account_create_operation and delegate_vesting_shares_operation
    state_bytes_count += _w.vesting_delegation_object_base_size;
    execution_time_count += _e.account_create_with_delegation_operation_exec_time;
  }

  void operator()( const account_witness_vote_operation& )const
  {
    state_bytes_count += _w.witness_vote_object_base_size;
    execution_time_count += _e.account_witness_vote_operation_exec_time;
  }

  void operator()( const comment_operation& op )const
  {
    state_bytes_count +=
        share_type( _w.comment_object_base_size )
      + share_type( _w.comment_object_permlink_char_size ) * int64_t( op.permlink.size() )
      + share_type( _w.comment_object_parent_permlink_char_size ) * int64_t( op.parent_permlink.size() );
    execution_time_count += _e.comment_operation_exec_time;
  }

  void operator()( const comment_payout_beneficiaries& bens )const
  {
    state_bytes_count += share_type( _w.comment_object_beneficiaries_member_size ) * int64_t( bens.beneficiaries.size() );
  }

  // stored with the comment, no extra state
  void operator()( const allowed_vote_assets& )const {}

  void operator()( const comment_options_operation& op )const
  {
    for( const comment_options_extension& e : op.extensions )
    {
      e.visit( *this );
    }
    execution_time_count += _e.comment_options_operation_exec_time;
  }

  void operator()( const convert_operation& ) const
  {
    state_bytes_count += _w.convert_request_object_base_size;
    execution_time_count += _e.convert_operation_exec_time;
  }

  void operator()( const create_claimed_account_operation& op )const
  {
    //basically the same as account_create_operation
    state_bytes_count += get_new_account_byte_count( op.owner, op.active, op.posting );
    execution_time_count += _e.create_claimed_account_operation_exec_time;
  }

  void operator()( const decline_voting_rights_operation& )const
  {
    state_bytes_count += _w.decline_voting_rights_request_object_base_size;
    execution_time_count += _e.decline_voting_rights_operation_exec_time;
  }

  void operator()( const delegate_vesting_shares_operation& )const
  {
    // either a delegation is created or an expiration for the returned shares
    state_bytes_count += std::max(
      _w.vesting_delegation_object_base_size,
      _w.vesting_delegation_expiration_object_base_size );
    execution_time_count += _e.delegate_vesting_shares_operation_exec_time;
  }

  void operator()( const escrow_transfer_operation& )const
  {
    state_bytes_count += _w.escrow_object_base_size;
    execution_time_count += _e.escrow_transfer_operation_exec_time;
  }

  void operator()( const limit_order_create_operation& op )const
  {
    if( !op.fill_or_kill )
      state_bytes_count += _w.limit_order_object_base_size;
    execution_time_count += _e.limit_order_create_operation_exec_time;
    market_op_count++;
  }

  void operator()( const limit_order_create2_operation& op )const
  {
    if( !op.fill_or_kill )
      state_bytes_count += _w.limit_order_object_base_size;
    execution_time_count += _e.limit_order_create2_operation_exec_time;
    market_op_count++;
  }

  void operator()( const request_account_recovery_operation& )const
  {
    state_bytes_count += _w.account_recovery_request_object_base_size;
    execution_time_count += _e.request_account_recovery_operation_exec_time;
  }

  void operator()( const set_withdraw_vesting_route_operation& )const
  {
    state_bytes_count += _w.withdraw_vesting_route_object_base_size;
    execution_time_count += _e.set_withdraw_vesting_route_operation_exec_time;
  }

  void operator()( const vote_operation& )const
  {
    state_bytes_count += _w.comment_vote_object_base_size;
    execution_time_count += _e.vote_operation_exec_time;
  }

  void operator()( const witness_update_operation& op )const
  {
    state_bytes_count +=
        share_type( _w.witness_object_base_size )
      + share_type( _w.witness_object_url_char_size ) * int64_t( op.url.size() );
    execution_time_count += _e.witness_update_operation_exec_time;
  }

  void operator()( const transfer_operation& )const
  {
    execution_time_count += _e.transfer_operation_exec_time;
    market_op_count++;
  }

  void operator()( const transfer_to_vesting_operation& )const
  {
    execution_time_count += _e.transfer_to_vesting_operation_exec_time;
    market_op_count++;
  }

  void operator()( const transfer_to_savings_operation& )const
  {
    execution_time_count += _e.transfer_to_savings_operation_exec_time;
  }

  void operator()( const transfer_from_savings_operation& )const
  {
    state_bytes_count += _w.savings_withdraw_object_byte_size;
    execution_time_count += _e.transfer_from_savings_operation_exec_time;
  }

  void operator()( const claim_reward_balance_operation& )const
  {
    execution_time_count += _e.claim_reward_balance_operation_exec_time;
  }

  void operator()( const withdraw_vesting_operation& )const
  {
    execution_time_count += _e.withdraw_vesting_operation_exec_time;
  }

  void operator()( const account_update_operation& )const
  {
    execution_time_count += _e.account_update_operation_exec_time;
  }

  void operator()( const account_witness_proxy_operation& )const
  {
    execution_time_count += _e.account_witness_proxy_operation_exec_time;
  }

  void operator()( const cancel_transfer_from_savings_operation& )const
  {
    execution_time_count += _e.cancel_transfer_from_savings_operation_exec_time;
  }

  void operator()( const change_recovery_account_operation& )const
  {
    execution_time_count += _e.change_recovery_account_operation_exec_time;
  }

  void operator()( const claim_account_operation& o )const
  {
    execution_time_count += _e.claim_account_operation_exec_time;
    // only the free claim consumes the subsidized account pool
    if( o.fee.amount == 0 )
      new_account_op_count++;
  }

  void operator()( const custom_operation& )const
  {
    execution_time_count += _e.custom_operation_exec_time;
  }

  void operator()( const custom_json_operation& )const
  {
    execution_time_count += _e.custom_json_operation_exec_time;
  }

  void operator()( const custom_binary_operation& )const
  {
    execution_time_count += _e.custom_binary_operation_exec_time;
  }

  void operator()( const delete_comment_operation& )const
  {
    execution_time_count += _e.delete_comment_operation_exec_time;
  }

  void operator()( const escrow_approve_operation& )const
  {
    execution_time_count += _e.escrow_approve_operation_exec_time;
  }

  void operator()( const escrow_dispute_operation& )const
  {
    execution_time_count += _e.escrow_dispute_operation_exec_time;
  }

  void operator()( const escrow_release_operation& )const
  {
    execution_time_count += _e.escrow_release_operation_exec_time;
  }

  void operator()( const feed_publish_operation& )const
  {
    execution_time_count += _e.feed_publish_operation_exec_time;
  }

  void operator()( const limit_order_cancel_operation& )const
  {
    execution_time_count += _e.limit_order_cancel_operation_exec_time;
  }

  void operator()( const witness_set_properties_operation& )const
  {
    execution_time_count += _e.witness_set_properties_operation_exec_time;
  }

  // Time critical or simply operations that were outdated when RC was started - no extra cost
  void operator()( const recover_account_operation& ) const {}
  void operator()( const pow_operation& ) const {}
  void operator()( const pow2_operation& ) const {}
  void operator()( const report_over_production_operation& ) const {}
  void operator()( const reset_account_operation& ) const {}
  void operator()( const set_reset_account_operation& ) const {}

  // Virtual Ops (their costs should be added to operations that spawn them)
  void operator()( const virtual_operation& ) const {}
};

void count_resources(
  const signed_transaction& tx,
  const size_t size,
  count_resources_result& result,
  const rc_size_info& size_info
  )
{
  const state_object_size_info& w = size_info.resource_state_bytes;
  const int64_t tx_size = int64_t( size );
  count_operation_visitor vtor( w, size_info.resource_execution_time );

  for( const operation& op : tx.operations )
  {
    op.visit( vtor );
  }

  auto add_usage = [&]( rc_resource_types resource, const share_type& usage )
  {
    result[ resource ] = ( share_type( result[ resource ] ) + usage ).value;
  };

  add_usage( resource_history_bytes, tx_size );

  add_usage( resource_new_accounts, vtor.new_account_op_count );

  if( vtor.market_op_count > 0 )
    add_usage( resource_market_bytes, tx_size );

  add_usage( resource_state_bytes,
      share_type( w.transaction_object_base_size )
    + share_type( w.transaction_object_byte_size ) * tx_size
    + vtor.state_bytes_count );

  add_usage( resource_execution_time, vtor.execution_time_count );
}

} } // rcmeter::chain
