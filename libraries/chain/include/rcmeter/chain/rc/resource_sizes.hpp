#pragma once

#include <fc/reflect/reflect.hpp>

#include <cstdint>

// Sizes and execution times are loaded from the size_info section of the resource parameters
// document, member names are the keys used there.

namespace rcmeter { namespace chain {

struct state_object_size_info
{
  // authorities
  int64_t authority_base_size = 0;
  int64_t authority_account_member_size = 0;
  int64_t authority_key_member_size = 0;

  // account create (all versions)
  int64_t account_object_base_size = 0;
  int64_t account_authority_object_base_size = 0;

  // request account recovery
  int64_t account_recovery_request_object_base_size = 0;

  // comment
  int64_t comment_object_base_size = 0;
  int64_t comment_object_permlink_char_size = 0;
  int64_t comment_object_parent_permlink_char_size = 0;
  int64_t comment_object_beneficiaries_member_size = 0;

  // vote
  int64_t comment_vote_object_base_size = 0;

  // convert
  int64_t convert_request_object_base_size = 0;

  // decline voting rights
  int64_t decline_voting_rights_request_object_base_size = 0;

  // escrow transfer
  int64_t escrow_object_base_size = 0;

  // limit order create (both versions)
  int64_t limit_order_object_base_size = 0;

  // transfer from savings
  int64_t savings_withdraw_object_byte_size = 0;

  // transaction
  int64_t transaction_object_base_size = 0;
  int64_t transaction_object_byte_size = 0;

  // delegate vesting shares
  int64_t vesting_delegation_object_base_size = 0;
  int64_t vesting_delegation_expiration_object_base_size = 0;

  // set withdraw vesting route
  int64_t withdraw_vesting_route_object_base_size = 0;

  // witness update
  int64_t witness_object_base_size = 0;
  int64_t witness_object_url_char_size = 0;

  // account witness vote
  int64_t witness_vote_object_base_size = 0;

  // fixed point scale of the sizes above, reported only
  int64_t STATE_BYTES_SCALE = 0;
};

struct operation_exec_info
{
  int64_t account_create_operation_exec_time = 0;
  int64_t account_create_with_delegation_operation_exec_time = 0;
  int64_t account_update_operation_exec_time = 0;
  int64_t account_witness_proxy_operation_exec_time = 0;
  int64_t account_witness_vote_operation_exec_time = 0;
  int64_t cancel_transfer_from_savings_operation_exec_time = 0;
  int64_t change_recovery_account_operation_exec_time = 0;
  int64_t claim_account_operation_exec_time = 0;
  int64_t claim_reward_balance_operation_exec_time = 0;
  int64_t comment_operation_exec_time = 0;
  int64_t comment_options_operation_exec_time = 0;
  int64_t convert_operation_exec_time = 0;
  int64_t create_claimed_account_operation_exec_time = 0;
  int64_t custom_operation_exec_time = 0;
  int64_t custom_json_operation_exec_time = 0;
  int64_t custom_binary_operation_exec_time = 0;
  int64_t decline_voting_rights_operation_exec_time = 0;
  int64_t delegate_vesting_shares_operation_exec_time = 0;
  int64_t delete_comment_operation_exec_time = 0;
  int64_t escrow_approve_operation_exec_time = 0;
  int64_t escrow_dispute_operation_exec_time = 0;
  int64_t escrow_release_operation_exec_time = 0;
  int64_t escrow_transfer_operation_exec_time = 0;
  int64_t feed_publish_operation_exec_time = 0;
  int64_t limit_order_cancel_operation_exec_time = 0;
  int64_t limit_order_create_operation_exec_time = 0;
  int64_t limit_order_create2_operation_exec_time = 0;
  int64_t request_account_recovery_operation_exec_time = 0;
  int64_t set_withdraw_vesting_route_operation_exec_time = 0;
  int64_t transfer_from_savings_operation_exec_time = 0;
  int64_t transfer_operation_exec_time = 0;
  int64_t transfer_to_savings_operation_exec_time = 0;
  int64_t transfer_to_vesting_operation_exec_time = 0;
  int64_t vote_operation_exec_time = 0;
  int64_t withdraw_vesting_operation_exec_time = 0;
  int64_t witness_set_properties_operation_exec_time = 0;
  int64_t witness_update_operation_exec_time = 0;
};

struct rc_size_info
{
  state_object_size_info resource_state_bytes;
  operation_exec_info    resource_execution_time;

  // every size and execution time has to be non-negative
  void validate()const;
};

} } // rcmeter::chain

FC_REFLECT( rcmeter::chain::state_object_size_info,
  ( authority_base_size )
  ( authority_account_member_size )
  ( authority_key_member_size )
  ( account_object_base_size )
  ( account_authority_object_base_size )
  ( account_recovery_request_object_base_size )
  ( comment_object_base_size )
  ( comment_object_permlink_char_size )
  ( comment_object_parent_permlink_char_size )
  ( comment_object_beneficiaries_member_size )
  ( comment_vote_object_base_size )
  ( convert_request_object_base_size )
  ( decline_voting_rights_request_object_base_size )
  ( escrow_object_base_size )
  ( limit_order_object_base_size )
  ( savings_withdraw_object_byte_size )
  ( transaction_object_base_size )
  ( transaction_object_byte_size )
  ( vesting_delegation_object_base_size )
  ( vesting_delegation_expiration_object_base_size )
  ( withdraw_vesting_route_object_base_size )
  ( witness_object_base_size )
  ( witness_object_url_char_size )
  ( witness_vote_object_base_size )
  ( STATE_BYTES_SCALE )
  )

FC_REFLECT( rcmeter::chain::operation_exec_info,
  ( account_create_operation_exec_time )
  ( account_create_with_delegation_operation_exec_time )
  ( account_update_operation_exec_time )
  ( account_witness_proxy_operation_exec_time )
  ( account_witness_vote_operation_exec_time )
  ( cancel_transfer_from_savings_operation_exec_time )
  ( change_recovery_account_operation_exec_time )
  ( claim_account_operation_exec_time )
  ( claim_reward_balance_operation_exec_time )
  ( comment_operation_exec_time )
  ( comment_options_operation_exec_time )
  ( convert_operation_exec_time )
  ( create_claimed_account_operation_exec_time )
  ( custom_operation_exec_time )
  ( custom_json_operation_exec_time )
  ( custom_binary_operation_exec_time )
  ( decline_voting_rights_operation_exec_time )
  ( delegate_vesting_shares_operation_exec_time )
  ( delete_comment_operation_exec_time )
  ( escrow_approve_operation_exec_time )
  ( escrow_dispute_operation_exec_time )
  ( escrow_release_operation_exec_time )
  ( escrow_transfer_operation_exec_time )
  ( feed_publish_operation_exec_time )
  ( limit_order_cancel_operation_exec_time )
  ( limit_order_create_operation_exec_time )
  ( limit_order_create2_operation_exec_time )
  ( request_account_recovery_operation_exec_time )
  ( set_withdraw_vesting_route_operation_exec_time )
  ( transfer_from_savings_operation_exec_time )
  ( transfer_operation_exec_time )
  ( transfer_to_savings_operation_exec_time )
  ( transfer_to_vesting_operation_exec_time )
  ( vote_operation_exec_time )
  ( withdraw_vesting_operation_exec_time )
  ( witness_set_properties_operation_exec_time )
  ( witness_update_operation_exec_time )
  )

FC_REFLECT( rcmeter::chain::rc_size_info,
  (resource_state_bytes)
  (resource_execution_time)
  )
