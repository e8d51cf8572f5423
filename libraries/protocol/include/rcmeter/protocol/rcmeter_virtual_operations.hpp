#pragma once
#include <rcmeter/protocol/base.hpp>
#include <rcmeter/protocol/asset.hpp>

namespace rcmeter { namespace protocol {

  struct fill_convert_request_operation : public virtual_operation
  {
    account_name_type owner;
    uint32_t          requestid = 0;
    asset             amount_in;
    asset             amount_out;
  };


  struct author_reward_operation : public virtual_operation
  {
    account_name_type author;
    string            permlink;
    asset             sbd_payout;
    asset             steem_payout;
    asset             vesting_payout;
  };


  struct curation_reward_operation : public virtual_operation
  {
    account_name_type curator;
    asset             reward;
    account_name_type comment_author;
    string            comment_permlink;
  };


  struct comment_reward_operation : public virtual_operation
  {
    account_name_type author;
    string            permlink;
    asset             payout;
  };


  struct liquidity_reward_operation : public virtual_operation
  {
    account_name_type owner;
    asset             payout;
  };


  struct interest_operation : public virtual_operation
  {
    account_name_type owner;
    asset             interest;
  };


  struct fill_vesting_withdraw_operation : public virtual_operation
  {
    account_name_type from_account;
    account_name_type to_account;
    asset             withdrawn;
    asset             deposited;
  };


  struct fill_order_operation : public virtual_operation
  {
    account_name_type current_owner;
    uint32_t          current_orderid = 0;
    asset             current_pays;
    account_name_type open_owner;
    uint32_t          open_orderid = 0;
    asset             open_pays;
  };


  struct shutdown_witness_operation : public virtual_operation
  {
    account_name_type owner;
  };


  struct fill_transfer_from_savings_operation : public virtual_operation
  {
    account_name_type from;
    account_name_type to;
    asset             amount;
    uint32_t          request_id = 0;
    string            memo;
  };


  struct hardfork_operation : public virtual_operation
  {
    uint32_t          hardfork_id = 0;
  };


  struct comment_payout_update_operation : public virtual_operation
  {
    account_name_type author;
    string            permlink;
  };


  struct return_vesting_delegation_operation : public virtual_operation
  {
    account_name_type account;
    asset             vesting_shares;
  };


  struct comment_benefactor_reward_operation : public virtual_operation
  {
    account_name_type benefactor;
    account_name_type author;
    string            permlink;
    asset             reward;
  };


  struct producer_reward_operation : public virtual_operation
  {
    account_name_type producer;
    asset             vesting_shares;
  };


  struct clear_null_account_balance_operation : public virtual_operation
  {
    vector< asset >   total_cleared;
  };

} } //rcmeter::protocol

FC_REFLECT( rcmeter::protocol::fill_convert_request_operation, (owner)(requestid)(amount_in)(amount_out) )
FC_REFLECT( rcmeter::protocol::author_reward_operation, (author)(permlink)(sbd_payout)(steem_payout)(vesting_payout) )
FC_REFLECT( rcmeter::protocol::curation_reward_operation, (curator)(reward)(comment_author)(comment_permlink) )
FC_REFLECT( rcmeter::protocol::comment_reward_operation, (author)(permlink)(payout) )
FC_REFLECT( rcmeter::protocol::fill_vesting_withdraw_operation, (from_account)(to_account)(withdrawn)(deposited) )
FC_REFLECT( rcmeter::protocol::liquidity_reward_operation, (owner)(payout) )
FC_REFLECT( rcmeter::protocol::interest_operation, (owner)(interest) )
FC_REFLECT( rcmeter::protocol::fill_order_operation, (current_owner)(current_orderid)(current_pays)(open_owner)(open_orderid)(open_pays) )
FC_REFLECT( rcmeter::protocol::shutdown_witness_operation, (owner) )
FC_REFLECT( rcmeter::protocol::fill_transfer_from_savings_operation, (from)(to)(amount)(request_id)(memo) )
FC_REFLECT( rcmeter::protocol::hardfork_operation, (hardfork_id) )
FC_REFLECT( rcmeter::protocol::comment_payout_update_operation, (author)(permlink) )
FC_REFLECT( rcmeter::protocol::return_vesting_delegation_operation, (account)(vesting_shares) )
FC_REFLECT( rcmeter::protocol::comment_benefactor_reward_operation, (benefactor)(author)(permlink)(reward) )
FC_REFLECT( rcmeter::protocol::producer_reward_operation, (producer)(vesting_shares) )
FC_REFLECT( rcmeter::protocol::clear_null_account_balance_operation, (total_cleared) )
