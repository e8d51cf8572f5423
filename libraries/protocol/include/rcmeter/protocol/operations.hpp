#pragma once

#include <rcmeter/protocol/types.hpp>

#include <rcmeter/protocol/operation_util.hpp>
#include <rcmeter/protocol/rcmeter_operations.hpp>
#include <rcmeter/protocol/rcmeter_virtual_operations.hpp>

namespace rcmeter { namespace protocol {

  /** NOTE: do not change the order of any operations prior to the virtual operations,
    * the tag of every operation is part of its wire form.
    */
  typedef fc::static_variant<
        vote_operation, // 0
        comment_operation, // 1

        transfer_operation, // 2
        transfer_to_vesting_operation, // 3
        withdraw_vesting_operation, // 4

        limit_order_create_operation, // 5
        limit_order_cancel_operation, // 6

        feed_publish_operation, // 7
        convert_operation, // 8

        account_create_operation, // 9
        account_update_operation, // 10

        witness_update_operation, // 11
        account_witness_vote_operation, // 12
        account_witness_proxy_operation, // 13

        pow_operation, // 14

        custom_operation, // 15

        report_over_production_operation, // 16

        delete_comment_operation, // 17
        custom_json_operation, // 18
        comment_options_operation, // 19
        set_withdraw_vesting_route_operation, // 20
        limit_order_create2_operation, // 21
        claim_account_operation, // 22
        create_claimed_account_operation, // 23
        request_account_recovery_operation, // 24
        recover_account_operation, // 25
        change_recovery_account_operation, // 26
        escrow_transfer_operation, // 27
        escrow_dispute_operation, // 28
        escrow_release_operation, // 29
        pow2_operation, // 30
        escrow_approve_operation, // 31
        transfer_to_savings_operation, // 32
        transfer_from_savings_operation, // 33
        cancel_transfer_from_savings_operation, // 34
        custom_binary_operation, // 35
        decline_voting_rights_operation, // 36
        reset_account_operation, // 37
        set_reset_account_operation, // 38
        claim_reward_balance_operation, // 39
        delegate_vesting_shares_operation, // 40
        account_create_with_delegation_operation, // 41
        witness_set_properties_operation, // 42

        /// virtual operations below this point
        fill_convert_request_operation, // last_regular + 1
        author_reward_operation, // last_regular + 2
        curation_reward_operation, // last_regular + 3
        comment_reward_operation, // last_regular + 4
        liquidity_reward_operation, // last_regular + 5
        interest_operation, // last_regular + 6
        fill_vesting_withdraw_operation, // last_regular + 7
        fill_order_operation, // last_regular + 8
        shutdown_witness_operation, // last_regular + 9
        fill_transfer_from_savings_operation, // last_regular + 10
        hardfork_operation, // last_regular + 11
        comment_payout_update_operation, // last_regular + 12
        return_vesting_delegation_operation, // last_regular + 13
        comment_benefactor_reward_operation, // last_regular + 14
        producer_reward_operation, // last_regular + 15
        clear_null_account_balance_operation // last_regular + 16
      > operation;

  bool is_virtual_operation( const operation& op );

  /// Name of the operation as used in the `type` field of its JSON form, e.g. `vote_operation`.
  string get_operation_name( const operation& op );

} } // rcmeter::protocol

RCMETER_DECLARE_OPERATION_TYPE( rcmeter::protocol::operation )
FC_REFLECT_TYPENAME( rcmeter::protocol::operation )
