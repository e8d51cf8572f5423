#include <boost/test/unit_test.hpp>

#include <rcmeter/chain/rc/resource_count.hpp>
#include <rcmeter/chain/rc/resource_sizes.hpp>

#include <rcmeter/protocol/operations.hpp>
#include <rcmeter/protocol/transaction.hpp>

#include <algorithm>

#include "../rc_fixture/rc_fixture.hpp"

using namespace rcmeter::chain;
using namespace rcmeter::protocol;

namespace {

authority single_key_authority()
{
  authority auth;
  auth.weight_threshold = 1;
  auth.add_authority( public_key_type( "STM6LLegbAgLAy28EHrffBVuANFWcFgmqRMW13wBmTExqFE9SCkg4" ), 1 );
  return auth;
}

}

BOOST_FIXTURE_TEST_SUITE( resource_count_tests, rc_fixture )

BOOST_AUTO_TEST_CASE( resource_names )
{
  try
  {
    BOOST_REQUIRE_EQUAL( std::string( get_resource_name( resource_history_bytes ) ), "resource_history_bytes" );
    BOOST_REQUIRE_EQUAL( std::string( get_resource_name( resource_new_accounts ) ), "resource_new_accounts" );
    BOOST_REQUIRE_EQUAL( std::string( get_resource_name( resource_market_bytes ) ), "resource_market_bytes" );
    BOOST_REQUIRE_EQUAL( std::string( get_resource_name( resource_state_bytes ) ), "resource_state_bytes" );
    BOOST_REQUIRE_EQUAL( std::string( get_resource_name( resource_execution_time ) ), "resource_execution_time" );
    RCMETER_REQUIRE_THROW( get_resource_name( RCMETER_RC_NUM_RESOURCE_TYPES ), fc::assert_exception );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( vote_usage )
{
  try
  {
    const example_transaction& vote = get_example( "vote" );
    BOOST_REQUIRE_EQUAL( vote.tx_size, 133u );

    count_resources_result usage;
    count_resources( vote.tx, vote.tx_size, usage, params->size_info );

    BOOST_REQUIRE_EQUAL( usage[ resource_history_bytes ], 133 );
    BOOST_REQUIRE_EQUAL( usage[ resource_new_accounts ], 0 );
    BOOST_REQUIRE_EQUAL( usage[ resource_market_bytes ], 0 );
    BOOST_REQUIRE_EQUAL( usage[ resource_state_bytes ], 6090 + 174 * 133 + 470000 );
    BOOST_REQUIRE_EQUAL( usage[ resource_state_bytes ], 499232 );
    BOOST_REQUIRE_EQUAL( usage[ resource_execution_time ], 26500 );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( transfer_usage )
{
  try
  {
    const example_transaction& transfer = get_example( "transfer" );

    count_resources_result usage;
    count_resources( transfer.tx, transfer.tx_size, usage, params->size_info );

    BOOST_REQUIRE_EQUAL( usage[ resource_history_bytes ], 282 );
    BOOST_REQUIRE_EQUAL( usage[ resource_market_bytes ], 282 );
    BOOST_REQUIRE_EQUAL( usage[ resource_new_accounts ], 0 );
    // nothing beyond the transaction object itself
    BOOST_REQUIRE_EQUAL( usage[ resource_state_bytes ], 6090 + 174 * 282 );
    BOOST_REQUIRE_EQUAL( usage[ resource_execution_time ], 9600 );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( post_usage )
{
  try
  {
    count_resources_result long_post;
    count_resources( get_example( "long_post" ).tx, get_example( "long_post" ).tx_size, long_post, params->size_info );

    // comment base + 40 permlink chars + 11 parent permlink chars + one beneficiary
    const int64_t post_state = 2010000 + 10000 * 40 + 20000 * 11 + 180000;

    BOOST_REQUIRE_EQUAL( long_post[ resource_history_bytes ], 9303 );
    BOOST_REQUIRE_EQUAL( long_post[ resource_market_bytes ], 0 );
    BOOST_REQUIRE_EQUAL( long_post[ resource_state_bytes ], 6090 + 174 * 9303 + post_state );
    BOOST_REQUIRE_EQUAL( long_post[ resource_execution_time ], 114100 + 13200 );

    count_resources_result short_post;
    count_resources( get_example( "short_post" ).tx, get_example( "short_post" ).tx_size, short_post, params->size_info );

    BOOST_REQUIRE_EQUAL( short_post[ resource_history_bytes ], 952 );
    BOOST_REQUIRE_EQUAL( short_post[ resource_state_bytes ], 6090 + 174 * 952 + post_state );
    BOOST_REQUIRE_EQUAL( short_post[ resource_execution_time ], long_post[ resource_execution_time ] );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( multibyte_text_counts_bytes )
{
  try
  {
    const state_object_size_info& w = params->size_info.resource_state_bytes;

    comment_operation comment;
    comment.author = "alice";
    comment.parent_permlink = "\xc3\xa9" "t" "\xc3\xa9";    // 3 characters, 6 bytes
    comment.permlink = "r\xc3\xa9" "sum\xc3\xa9";           // 6 characters, 8 bytes
    BOOST_REQUIRE_EQUAL( comment.parent_permlink.size(), 6u );
    BOOST_REQUIRE_EQUAL( comment.permlink.size(), 8u );

    signed_transaction tx;
    tx.operations.push_back( comment );

    count_resources_result usage;
    count_resources( tx, 0, usage, params->size_info );
    BOOST_REQUIRE_EQUAL( usage[ resource_state_bytes ],
      w.transaction_object_base_size + w.comment_object_base_size
      + w.comment_object_permlink_char_size * 8 + w.comment_object_parent_permlink_char_size * 6 );

    witness_update_operation witness;
    witness.url = "https://\xe2\x82\xac.example";            // 17 characters, 19 bytes

    tx.clear();
    tx.operations.push_back( witness );

    count_resources_result witness_usage;
    count_resources( tx, 0, witness_usage, params->size_info );
    BOOST_REQUIRE_EQUAL( witness_usage[ resource_state_bytes ],
      w.transaction_object_base_size + w.witness_object_base_size + w.witness_object_url_char_size * 19 );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( comment_options_vote_assets_are_free )
{
  try
  {
    allowed_vote_assets assets;
    assets.votable_assets[ asset_symbol_type::from_nai_string( "@@631672482", 3 ) ] = votable_asset_info_v1( 1000, true );

    comment_options_operation options;
    options.author = "alice";
    options.permlink = "p";
    options.extensions.push_back( assets );

    signed_transaction tx;
    tx.operations.push_back( options );

    count_resources_result usage;
    count_resources( tx, 0, usage, params->size_info );
    BOOST_REQUIRE_EQUAL( usage[ resource_state_bytes ], params->size_info.resource_state_bytes.transaction_object_base_size );
    BOOST_REQUIRE_EQUAL( usage[ resource_execution_time ], params->size_info.resource_execution_time.comment_options_operation_exec_time );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( operations_without_state )
{
  try
  {
    const operation_exec_info& exec = params->size_info.resource_execution_time;

    std::vector< std::pair< operation, int64_t > > ops;
    ops.emplace_back( claim_reward_balance_operation(), exec.claim_reward_balance_operation_exec_time );
    ops.emplace_back( withdraw_vesting_operation(), exec.withdraw_vesting_operation_exec_time );
    ops.emplace_back( account_update_operation(), exec.account_update_operation_exec_time );
    ops.emplace_back( account_witness_proxy_operation(), exec.account_witness_proxy_operation_exec_time );
    ops.emplace_back( custom_json_operation(), exec.custom_json_operation_exec_time );
    ops.emplace_back( custom_binary_operation(), exec.custom_binary_operation_exec_time );
    ops.emplace_back( feed_publish_operation(), exec.feed_publish_operation_exec_time );
    ops.emplace_back( limit_order_cancel_operation(), exec.limit_order_cancel_operation_exec_time );
    ops.emplace_back( transfer_to_savings_operation(), exec.transfer_to_savings_operation_exec_time );
    ops.emplace_back( delete_comment_operation(), exec.delete_comment_operation_exec_time );
    ops.emplace_back( escrow_release_operation(), exec.escrow_release_operation_exec_time );
    ops.emplace_back( witness_set_properties_operation(), exec.witness_set_properties_operation_exec_time );

    for( const auto& item : ops )
    {
      BOOST_TEST_MESSAGE( "--- Testing: " << get_operation_name( item.first ) );

      signed_transaction tx;
      tx.operations.push_back( item.first );

      count_resources_result usage;
      count_resources( tx, 0, usage, params->size_info );

      BOOST_REQUIRE_EQUAL( usage[ resource_state_bytes ], params->size_info.resource_state_bytes.transaction_object_base_size );
      BOOST_REQUIRE_EQUAL( usage[ resource_execution_time ], item.second );
      BOOST_REQUIRE_EQUAL( usage[ resource_market_bytes ], 0 );
      BOOST_REQUIRE_EQUAL( usage[ resource_new_accounts ], 0 );
    }
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( ignored_operations )
{
  try
  {
    std::vector< operation > ops;
    ops.push_back( recover_account_operation() );
    ops.push_back( pow_operation() );
    ops.push_back( pow2_operation() );
    ops.push_back( report_over_production_operation() );
    ops.push_back( reset_account_operation() );
    ops.push_back( set_reset_account_operation() );
    ops.push_back( fill_order_operation() );
    ops.push_back( author_reward_operation() );

    signed_transaction tx;
    tx.operations = ops;

    count_resources_result usage;
    count_resources( tx, 100, usage, params->size_info );

    BOOST_REQUIRE_EQUAL( usage[ resource_history_bytes ], 100 );
    BOOST_REQUIRE_EQUAL( usage[ resource_new_accounts ], 0 );
    BOOST_REQUIRE_EQUAL( usage[ resource_market_bytes ], 0 );
    BOOST_REQUIRE_EQUAL( usage[ resource_state_bytes ], 6090 + 174 * 100 );
    BOOST_REQUIRE_EQUAL( usage[ resource_execution_time ], 0 );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( account_creation_usage )
{
  try
  {
    account_create_operation create;
    create.owner = single_key_authority();
    create.active = single_key_authority();
    create.active.add_authority( account_name_type( "alice" ), 1, true );
    create.posting = single_key_authority();

    signed_transaction tx;
    tx.operations.push_back( create );

    count_resources_result usage;
    count_resources( tx, 200, usage, params->size_info );

    // account + account authority + three authorities with one key each + one account member
    const int64_t account_state = 4800000 + 400000 + 3 * ( 40000 + 350000 ) + 180000;
    BOOST_REQUIRE_EQUAL( usage[ resource_state_bytes ], 6090 + 174 * 200 + account_state );
    BOOST_REQUIRE_EQUAL( usage[ resource_execution_time ], 57700 );
    BOOST_REQUIRE_EQUAL( usage[ resource_new_accounts ], 0 );

    account_create_with_delegation_operation create_with_delegation;
    create_with_delegation.owner = create.owner;
    create_with_delegation.active = create.active;
    create_with_delegation.posting = create.posting;

    tx.clear();
    tx.operations.push_back( create_with_delegation );

    count_resources_result delegated;
    count_resources( tx, 200, delegated, params->size_info );
    BOOST_REQUIRE_EQUAL( delegated[ resource_state_bytes ], 6090 + 174 * 200 + account_state + 600000 );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( claim_account_new_accounts )
{
  try
  {
    claim_account_operation free_claim;
    free_claim.fee = asset( 0, STEEM_SYMBOL );

    claim_account_operation paid_claim;
    paid_claim.fee = asset( 3000, STEEM_SYMBOL );

    signed_transaction tx;
    tx.operations.push_back( free_claim );
    tx.operations.push_back( paid_claim );
    tx.operations.push_back( free_claim );

    count_resources_result usage;
    count_resources( tx, 150, usage, params->size_info );

    BOOST_REQUIRE_EQUAL( usage[ resource_new_accounts ], 2 );
    BOOST_REQUIRE_EQUAL( usage[ resource_execution_time ], 3 * 10000 );
    BOOST_REQUIRE_EQUAL( usage[ resource_state_bytes ], 6090 + 174 * 150 );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( market_operations )
{
  try
  {
    limit_order_create_operation order;
    order.amount_to_sell = asset( 1000, STEEM_SYMBOL );
    order.min_to_receive = asset( 1000, SBD_SYMBOL );

    signed_transaction tx;
    tx.operations.push_back( order );
    tx.operations.push_back( transfer_operation() );

    count_resources_result usage;
    count_resources( tx, 300, usage, params->size_info );

    // market bytes are charged once per transaction, not per market operation
    BOOST_REQUIRE_EQUAL( usage[ resource_market_bytes ], 300 );
    BOOST_REQUIRE_EQUAL( usage[ resource_state_bytes ], 6090 + 174 * 300 + 147440 );
    BOOST_REQUIRE_EQUAL( usage[ resource_execution_time ], 31700 + 9600 );

    order.fill_or_kill = true;
    tx.clear();
    tx.operations.push_back( order );

    count_resources_result fill_or_kill;
    count_resources( tx, 300, fill_or_kill, params->size_info );
    BOOST_REQUIRE_EQUAL( fill_or_kill[ resource_market_bytes ], 300 );
    BOOST_REQUIRE_EQUAL( fill_or_kill[ resource_state_bytes ], 6090 + 174 * 300 );

    tx.clear();
    tx.operations.push_back( transfer_to_savings_operation() );

    count_resources_result savings;
    count_resources( tx, 300, savings, params->size_info );
    BOOST_REQUIRE_EQUAL( savings[ resource_market_bytes ], 0 );

    // cancelling an order does not touch the market
    tx.clear();
    tx.operations.push_back( limit_order_cancel_operation() );

    count_resources_result cancel;
    count_resources( tx, 300, cancel, params->size_info );
    BOOST_REQUIRE_EQUAL( cancel[ resource_market_bytes ], 0 );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( state_object_operations )
{
  try
  {
    const state_object_size_info& w = params->size_info.resource_state_bytes;

    witness_update_operation witness;
    witness.url = "https://example.com";

    std::vector< std::pair< operation, int64_t > > ops;
    ops.emplace_back( delegate_vesting_shares_operation(), std::max( w.vesting_delegation_object_base_size, w.vesting_delegation_expiration_object_base_size ) );
    ops.emplace_back( account_witness_vote_operation(), w.witness_vote_object_base_size );
    ops.emplace_back( convert_operation(), w.convert_request_object_base_size );
    ops.emplace_back( decline_voting_rights_operation(), w.decline_voting_rights_request_object_base_size );
    ops.emplace_back( escrow_transfer_operation(), w.escrow_object_base_size );
    ops.emplace_back( request_account_recovery_operation(), w.account_recovery_request_object_base_size );
    ops.emplace_back( set_withdraw_vesting_route_operation(), w.withdraw_vesting_route_object_base_size );
    ops.emplace_back( transfer_from_savings_operation(), w.savings_withdraw_object_byte_size );
    ops.emplace_back( witness, w.witness_object_base_size + w.witness_object_url_char_size * 19 );

    for( const auto& item : ops )
    {
      BOOST_TEST_MESSAGE( "--- Testing: " << get_operation_name( item.first ) );

      signed_transaction tx;
      tx.operations.push_back( item.first );

      count_resources_result usage;
      count_resources( tx, 0, usage, params->size_info );
      BOOST_REQUIRE_EQUAL( usage[ resource_state_bytes ], w.transaction_object_base_size + item.second );
    }
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( usage_accumulates )
{
  try
  {
    const example_transaction& vote = get_example( "vote" );

    count_resources_result usage;
    count_resources( vote.tx, vote.tx_size, usage, params->size_info );
    count_resources( vote.tx, vote.tx_size, usage, params->size_info );

    BOOST_REQUIRE_EQUAL( usage[ resource_history_bytes ], 2 * 133 );
    BOOST_REQUIRE_EQUAL( usage[ resource_state_bytes ], 2 * 499232 );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
