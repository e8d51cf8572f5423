#include <rcmeter/protocol/rcmeter_operations.hpp>
#include <rcmeter/protocol/validation.hpp>

#include <fc/io/json.hpp>
#include <fc/io/raw.hpp>

#include <cstdlib>

namespace rcmeter { namespace protocol {

  void validate_auth_size( const authority& a )
  {
    size_t size = a.account_auths.size() + a.key_auths.size();
    RCMETER_ASSERT( size <= RCMETER_MAX_AUTHORITY_MEMBERSHIP, malformed_operation_exception,
      "Authority membership exceeded. Max: ${max} Current: ${n}", ("max", RCMETER_MAX_AUTHORITY_MEMBERSHIP)("n", size) );
  }

  void account_create_operation::validate() const
  {
    validate_account_name( new_account_name );
    validate_account_name( creator );
    validate_asset_type( fee, STEEM_SYMBOL, "Account creation fee must be STEEM" );
    validate_authority( owner );
    validate_authority( active );
    validate_authority( posting );
    validate_is_string_in_utf8( json_metadata, "JSON Metadata not formatted in UTF8" );
    validate_asset_not_negative( fee, "Account creation fee cannot be negative" );
  }

  void account_create_with_delegation_operation::validate() const
  {
    validate_account_name( new_account_name );
    validate_account_name( creator );
    validate_asset_type( fee, STEEM_SYMBOL, "Account creation fee must be STEEM" );
    validate_asset_type( delegation, VESTS_SYMBOL, "Delegation must be VESTS" );

    validate_authority( owner );
    validate_authority( active );
    validate_authority( posting );

    validate_is_string_in_utf8( json_metadata, "JSON Metadata not formatted in UTF8" );

    validate_asset_not_negative( fee, "Account creation fee cannot be negative" );
    validate_asset_not_negative( delegation, "Delegation cannot be negative" );
  }

  void account_update_operation::validate() const
  {
    validate_account_name( account );
    if( owner )
      validate_authority( *owner );
    if( active )
      validate_authority( *active );
    if( posting )
      validate_authority( *posting );

    validate_is_string_in_utf8( json_metadata, "JSON Metadata not formatted in UTF8" );
  }

  void comment_operation::validate() const
  {
    validate_string_max_size( title, RCMETER_COMMENT_TITLE_LIMIT, "Title size limit exceeded." );
    validate_is_string_in_utf8( title, "Title not formatted in UTF8" );
    RCMETER_ASSERT( body.size() > 0, malformed_operation_exception, "Body is empty", ("author", author)("permlink", permlink) );
    validate_is_string_in_utf8( body, "Body not formatted in UTF8" );

    if( parent_author.size() )
      validate_account_name( parent_author );
    validate_account_name( author );
    validate_permlink( parent_permlink );
    validate_permlink( permlink );

    validate_is_string_in_utf8( json_metadata, "JSON Metadata not formatted in UTF8" );
  }

  struct comment_options_extension_validate_visitor
  {
    typedef void result_type;

    void operator()( const comment_payout_beneficiaries& cpb ) const
    {
      cpb.validate();
    }

    void operator()( const allowed_vote_assets& va ) const
    {
      va.validate();
    }
  };

  struct votable_asset_info_validate_visitor
  {
    typedef void result_type;

    void operator()( const votable_asset_info_v1& info ) const
    {
      RCMETER_ASSERT( info.max_accepted_payout >= 0, malformed_operation_exception,
        "Cannot accept less than 0 payout", ("max_accepted_payout", info.max_accepted_payout) );
    }
  };

  void allowed_vote_assets::validate()const
  {
    RCMETER_ASSERT( votable_assets.size() <= RCMETER_MAX_VOTABLE_ASSETS, malformed_operation_exception,
      "Too many votable assets specified", ("size", votable_assets.size())("max", RCMETER_MAX_VOTABLE_ASSETS) );

    for( const auto& a : votable_assets )
    {
      RCMETER_ASSERT( a.first.space() == asset_symbol_type::smt_nai_space, malformed_operation_exception,
        "Votable asset ${nai} is not a token", ("nai", a.first.to_nai_string()) );
      a.second.visit( votable_asset_info_validate_visitor() );
    }
  }

  void comment_payout_beneficiaries::validate()const
  {
    uint32_t sum = 0;

    RCMETER_ASSERT( beneficiaries.size(), malformed_operation_exception, "Must specify at least one beneficiary", ("size", beneficiaries.size()) );
    RCMETER_ASSERT( beneficiaries.size() < RCMETER_BENEFICIARY_LIMIT, malformed_operation_exception,
      "Cannot specify more than ${max} beneficiaries.", ("max", RCMETER_BENEFICIARY_LIMIT - 1) ); // Require size serialization fits in one byte.

    for( size_t i = 0; i < beneficiaries.size(); i++ )
    {
      validate_account_name( beneficiaries[i].account );
      validate_number_in_100_percent_range( beneficiaries[i].weight, "Cannot allocate more than 100% of rewards to one account" );
      sum += beneficiaries[i].weight;
      validate_number_in_100_percent_range( sum, "Cannot allocate more than 100% of rewards to a comment" );
      if( i > 0 )
      {
        RCMETER_ASSERT( beneficiaries[i - 1] < beneficiaries[i], malformed_operation_exception,
          "Benficiaries must be specified in sorted order (account ascending)", ("account", beneficiaries[i].account) );
      }
    }
  }

  void comment_options_operation::validate()const
  {
    validate_account_name( author );
    validate_number_in_100_percent_range( percent_steem_dollars, "Percent cannot exceed 100%" );
    validate_asset_type( max_accepted_payout, SBD_SYMBOL, "Max accepted payout must be in SBD" );
    validate_asset_not_negative( max_accepted_payout, "Cannot accept less than 0 payout" );
    validate_permlink( permlink );
    for( auto& e : extensions )
      e.visit( comment_options_extension_validate_visitor() );
  }

  void delete_comment_operation::validate()const
  {
    validate_permlink( permlink );
    validate_account_name( author );
  }

  void claim_account_operation::validate()const
  {
    validate_account_name( creator );
    validate_asset_type( fee, STEEM_SYMBOL, "Account claiming fee must be STEEM" );
    validate_asset_not_negative( fee, "Account claiming fee cannot be negative" );
  }

  void create_claimed_account_operation::validate()const
  {
    validate_account_name( creator );
    validate_account_name( new_account_name );
    validate_authority( owner );
    validate_authority( active );
    validate_authority( posting );
    validate_auth_size( owner );
    validate_auth_size( active );
    validate_auth_size( posting );

    validate_is_string_in_utf8( json_metadata, "JSON Metadata not formatted in UTF8" );
  }

  void vote_operation::validate() const
  {
    validate_account_name( voter );
    validate_account_name( author );
    validate_number_in_100_percent_range( std::abs( weight ), "Weight is not a STEEM percentage" );
    validate_permlink( permlink );
  }

  void transfer_operation::validate() const
  { try {
    validate_account_name( from );
    validate_account_name( to );
    RCMETER_ASSERT( amount.symbol != VESTS_SYMBOL, malformed_operation_exception,
      "transferring of Steem Power (STMP) is not allowed.", ("amount", amount) );
    validate_asset_greater_than_zero( amount, "Cannot transfer a negative amount (aka: stealing)" );
    validate_string_max_size( memo, RCMETER_MAX_MEMO_SIZE, "Memo is too large" );
    validate_is_string_in_utf8( memo, "Memo is not UTF8" );
  } FC_CAPTURE_AND_RETHROW( (from)(to)(amount) ) }

  void transfer_to_vesting_operation::validate() const
  {
    validate_account_name( from );
    validate_asset_type( amount, STEEM_SYMBOL, "Amount must be STEEM" );
    if( to != account_name_type() ) validate_account_name( to );
    validate_asset_greater_than_zero( amount, "Must transfer a nonzero amount" );
  }

  void withdraw_vesting_operation::validate() const
  {
    validate_account_name( account );
    validate_asset_type( vesting_shares, VESTS_SYMBOL, "Amount must be VESTS" );
  }

  void set_withdraw_vesting_route_operation::validate() const
  {
    validate_account_name( from_account );
    validate_account_name( to_account );
    validate_number_in_100_percent_range( percent, "Percent must be valid STEEM percent" );
  }

  void chain_properties::validate()const
  {
    validate_asset_type( account_creation_fee, STEEM_SYMBOL, "account_creation_fee must be in STEEM" );
    RCMETER_ASSERT( account_creation_fee.amount >= RCMETER_MIN_ACCOUNT_CREATION_FEE, malformed_operation_exception,
      "account_creation_fee smaller than minimum account creation fee", ("min", RCMETER_MIN_ACCOUNT_CREATION_FEE) );
    RCMETER_ASSERT( maximum_block_size >= RCMETER_MIN_BLOCK_SIZE_LIMIT, malformed_operation_exception,
      "maximum_block_size smaller than minimum max block size", ("min", RCMETER_MIN_BLOCK_SIZE_LIMIT)(maximum_block_size) );
    validate_number_in_100_percent_range( sbd_interest_rate, "sbd_interest_rate must not exceed 100%" );
  }

  void witness_update_operation::validate() const
  {
    validate_account_name( owner );

    validate_string_max_size( url, RCMETER_MAX_WITNESS_URL_LENGTH, "URL is too long" );
    RCMETER_ASSERT( url.size() > 0, malformed_operation_exception, "URL size must be greater than 0", ("owner", owner) );
    validate_is_string_in_utf8( url, "URL is not valid UTF8" );
    validate_asset_not_negative( fee, "Fee cannot be negative" );
    props.validate();
  }

  void witness_set_properties_operation::validate() const
  {
    validate_account_name( owner );

    // current signing key must be present
    RCMETER_ASSERT( props.find( "key" ) != props.end(), malformed_operation_exception, "No signing key provided", ("owner", owner) );

    try
    {
      auto itr = props.find( "maximum_block_size" );
      if( itr != props.end() )
      {
        uint32_t maximum_block_size = 0u;
        fc::raw::unpack_from_vector( itr->second, maximum_block_size );
        RCMETER_ASSERT( maximum_block_size >= RCMETER_MIN_BLOCK_SIZE_LIMIT, malformed_operation_exception,
          "maximum_block_size smaller than minimum max block size", ("min", RCMETER_MIN_BLOCK_SIZE_LIMIT)(maximum_block_size) );
      }

      itr = props.find( "sbd_interest_rate" );
      if( itr != props.end() )
      {
        uint16_t sbd_interest_rate = 0u;
        fc::raw::unpack_from_vector( itr->second, sbd_interest_rate );
        validate_number_in_100_percent_range( sbd_interest_rate, "sbd_interest_rate must not exceed 100%" );
      }

      itr = props.find( "url" );
      if( itr != props.end() )
      {
        std::string url;
        fc::raw::unpack_from_vector( itr->second, url );

        validate_string_max_size( url, RCMETER_MAX_WITNESS_URL_LENGTH, "URL is too long" );
        RCMETER_ASSERT( url.size() > 0, malformed_operation_exception, "URL size must be greater than 0", ("owner", owner) );
        validate_is_string_in_utf8( url, "URL is not valid UTF8" );
      }
    }
    RCMETER_RECODE_EXC( fc::out_of_range_exception, malformed_operation_exception )
  }

  void account_witness_vote_operation::validate() const
  {
    validate_account_name( account );
    validate_account_name( witness );
  }

  void account_witness_proxy_operation::validate() const
  {
    validate_account_name( account );
    if( proxy.size() )
      validate_account_name( proxy );
    RCMETER_ASSERT( proxy != account, malformed_operation_exception, "Cannot proxy to self", (account) );
  }

  void custom_operation::validate() const {
    /// required auth accounts are the ones whose bandwidth is consumed
    RCMETER_ASSERT( required_auths.size() > 0, malformed_operation_exception, "at least one account must be specified", (id) );
  }

  void custom_json_operation::validate() const {
    /// required auth accounts are the ones whose bandwidth is consumed
    RCMETER_ASSERT( (required_auths.size() + required_posting_auths.size()) > 0, malformed_operation_exception,
      "at least one account must be specified", (id) );
    RCMETER_ASSERT( id.size() <= 32, malformed_operation_exception, "id is too long", (id) );
    validate_is_string_in_utf8( json, "JSON Metadata not formatted in UTF8" );
    RCMETER_ASSERT( fc::json::is_valid( json ), malformed_operation_exception, "JSON Metadata not valid JSON", (id) );
  }

  void custom_binary_operation::validate() const {
    /// required auth accounts are the ones whose bandwidth is consumed
    RCMETER_ASSERT( (required_owner_auths.size() + required_active_auths.size() + required_posting_auths.size() + required_auths.size()) > 0,
      malformed_operation_exception, "at least one account must be specified", (id) );
    RCMETER_ASSERT( id.size() <= 32, malformed_operation_exception, "id is too long", (id) );
    for( const auto& a : required_auths ) validate_authority( a );
  }

  void pow_operation::validate()const
  {
    props.validate();
    validate_account_name( worker_account );
    RCMETER_ASSERT( work.work != digest_type(), malformed_operation_exception, "work cannot consist of only zeroes", (worker_account) );
  }

  struct pow2_operation_validate_visitor
  {
    typedef void result_type;

    void operator()( const pow2& work )const
    {
      validate_account_name( work.input.worker_account );
    }

    void operator()( const equihash_pow& work )const
    {
      validate_account_name( work.input.worker_account );
      RCMETER_ASSERT( work.proof.inputs.size() > 0, malformed_operation_exception, "proof of work is empty",
        ("worker_account", work.input.worker_account) );
    }
  };

  void pow2_operation::validate()const
  {
    props.validate();
    work.visit( pow2_operation_validate_visitor() );
  }

  struct pow2_operation_get_required_active_visitor
  {
    typedef void result_type;

    pow2_operation_get_required_active_visitor( flat_set< account_name_type >& required_active )
      : _required_active( required_active ) {}

    template< typename PowType >
    void operator()( const PowType& work )const
    {
      _required_active.insert( work.input.worker_account );
    }

    flat_set<account_name_type>& _required_active;
  };

  void pow2_operation::get_required_active_authorities( flat_set<account_name_type>& a )const
  {
    if( !new_owner_key )
    {
      pow2_operation_get_required_active_visitor vtor( a );
      work.visit( vtor );
    }
  }

  void feed_publish_operation::validate()const
  {
    validate_account_name( publisher );
    RCMETER_ASSERT( ( exchange_rate.base.symbol == STEEM_SYMBOL && exchange_rate.quote.symbol == SBD_SYMBOL )
      || ( exchange_rate.base.symbol == SBD_SYMBOL && exchange_rate.quote.symbol == STEEM_SYMBOL ),
      malformed_operation_exception, "Price feed must be a STEEM/SBD price", (publisher) );
    exchange_rate.validate();
  }

  void limit_order_create_operation::validate()const
  {
    validate_account_name( owner );
    RCMETER_ASSERT( ( amount_to_sell.symbol == STEEM_SYMBOL && min_to_receive.symbol == SBD_SYMBOL )
      || ( amount_to_sell.symbol == SBD_SYMBOL && min_to_receive.symbol == STEEM_SYMBOL ),
      malformed_operation_exception, "Limit order must be for the STEEM:SBD market", (owner)(orderid) );

    price{ amount_to_sell, min_to_receive }.validate();
  }

  void limit_order_create2_operation::validate()const
  {
    validate_account_name( owner );
    validate_asset_type( amount_to_sell, exchange_rate.base.symbol, "Sell asset must be the base of the price" );
    exchange_rate.validate();

    RCMETER_ASSERT( ( amount_to_sell.symbol == STEEM_SYMBOL && exchange_rate.quote.symbol == SBD_SYMBOL )
      || ( amount_to_sell.symbol == SBD_SYMBOL && exchange_rate.quote.symbol == STEEM_SYMBOL ),
      malformed_operation_exception, "Limit order must be for the STEEM:SBD market", (owner)(orderid) );
    validate_asset_greater_than_zero( amount_to_sell, "Amount to sell cannot be 0" );
  }

  void limit_order_cancel_operation::validate()const
  {
    validate_account_name( owner );
  }

  void convert_operation::validate()const
  {
    validate_account_name( owner );
    /// only allow conversion from SBD to STEEM, allowing the opposite can enable traders to abuse
    /// market fluxuations through converting large quantities without moving the price.
    validate_asset_type( amount, SBD_SYMBOL, "Can only convert SBD to STEEM" );
    validate_asset_greater_than_zero( amount, "Must convert some SBD" );
  }

  void report_over_production_operation::validate()const
  {
    validate_account_name( reporter );
    validate_account_name( first_block.witness );
    RCMETER_ASSERT( first_block.witness == second_block.witness, malformed_operation_exception,
      "Blocks were not produced by the same witness", (reporter) );
    RCMETER_ASSERT( first_block.timestamp == second_block.timestamp, malformed_operation_exception,
      "Blocks were not produced at the same time", (reporter) );
    RCMETER_ASSERT( first_block.previous != second_block.previous || first_block.transaction_merkle_root != second_block.transaction_merkle_root,
      malformed_operation_exception, "Reported blocks are identical", (reporter) );
  }

  void escrow_transfer_operation::validate()const
  {
    validate_account_name( from );
    validate_account_name( to );
    validate_account_name( agent );
    validate_asset_not_negative( fee, "fee cannot be negative" );
    validate_asset_not_negative( sbd_amount, "sbd amount cannot be negative" );
    validate_asset_not_negative( steem_amount, "steem amount cannot be negative" );
    RCMETER_ASSERT( sbd_amount.amount > 0 || steem_amount.amount > 0, malformed_operation_exception,
      "escrow must transfer a non-zero amount", (escrow_id) );
    RCMETER_ASSERT( from != agent && to != agent, malformed_operation_exception, "agent must be a third party", (agent) );
    RCMETER_ASSERT( fee.symbol == STEEM_SYMBOL || fee.symbol == SBD_SYMBOL, malformed_operation_exception,
      "fee must be STEEM or SBD", (escrow_id) );
    validate_asset_type( sbd_amount, SBD_SYMBOL, "sbd amount must contain SBD" );
    validate_asset_type( steem_amount, STEEM_SYMBOL, "steem amount must contain STEEM" );
    RCMETER_ASSERT( ratification_deadline < escrow_expiration, malformed_operation_exception,
      "ratification deadline must be before escrow expiration", (ratification_deadline)(escrow_expiration) );
    validate_is_string_in_utf8( json_meta, "JSON Metadata not formatted in UTF8" );
  }

  void escrow_approve_operation::validate()const
  {
    validate_account_name( from );
    validate_account_name( to );
    validate_account_name( agent );
    validate_account_name( who );
    RCMETER_ASSERT( who == to || who == agent, malformed_operation_exception, "to or agent must approve escrow", (who) );
  }

  void escrow_dispute_operation::validate()const
  {
    validate_account_name( from );
    validate_account_name( to );
    validate_account_name( agent );
    validate_account_name( who );
    RCMETER_ASSERT( who == from || who == to, malformed_operation_exception, "who must be from or to", (who) );
  }

  void escrow_release_operation::validate()const
  {
    validate_account_name( from );
    validate_account_name( to );
    validate_account_name( agent );
    validate_account_name( who );
    validate_account_name( receiver );
    RCMETER_ASSERT( who == from || who == to || who == agent, malformed_operation_exception, "who must be from or to or agent", (who) );
    RCMETER_ASSERT( receiver == from || receiver == to, malformed_operation_exception, "receiver must be from or to", (receiver) );
    validate_asset_not_negative( sbd_amount, "sbd amount cannot be negative" );
    validate_asset_not_negative( steem_amount, "steem amount cannot be negative" );
    RCMETER_ASSERT( sbd_amount.amount > 0 || steem_amount.amount > 0, malformed_operation_exception,
      "escrow must release a non-zero amount", (escrow_id) );
    validate_asset_type( sbd_amount, SBD_SYMBOL, "sbd amount must contain SBD" );
    validate_asset_type( steem_amount, STEEM_SYMBOL, "steem amount must contain STEEM" );
  }

  void request_account_recovery_operation::validate()const
  {
    validate_account_name( recovery_account );
    validate_account_name( account_to_recover );
    validate_authority( new_owner_authority );
  }

  void recover_account_operation::validate()const
  {
    validate_account_name( account_to_recover );
    RCMETER_ASSERT( !( new_owner_authority == recent_owner_authority ), malformed_operation_exception,
      "Cannot set new owner authority to the recent owner authority", (account_to_recover) );
    RCMETER_ASSERT( !new_owner_authority.is_impossible(), malformed_operation_exception,
      "new owner authority cannot be impossible", (account_to_recover) );
    RCMETER_ASSERT( !recent_owner_authority.is_impossible(), malformed_operation_exception,
      "recent owner authority cannot be impossible", (account_to_recover) );
    RCMETER_ASSERT( new_owner_authority.weight_threshold, malformed_operation_exception,
      "new owner authority cannot be trivial", (account_to_recover) );
    validate_authority( new_owner_authority );
    validate_authority( recent_owner_authority );
  }

  void change_recovery_account_operation::validate()const
  {
    validate_account_name( account_to_recover );
    validate_account_name( new_recovery_account );
  }

  void transfer_to_savings_operation::validate()const {
    validate_account_name( from );
    validate_account_name( to );
    validate_asset_greater_than_zero( amount, "Must transfer to savings some amount" );
    RCMETER_ASSERT( amount.symbol == STEEM_SYMBOL || amount.symbol == SBD_SYMBOL, malformed_operation_exception,
      "Must transfer STEEM or SBD", (from) );
    validate_string_max_size( memo, RCMETER_MAX_MEMO_SIZE, "Memo is too large" );
    validate_is_string_in_utf8( memo, "Memo is not UTF8" );
  }

  void transfer_from_savings_operation::validate()const {
    validate_account_name( from );
    validate_account_name( to );
    validate_asset_greater_than_zero( amount, "Must transfer from savings some amount" );
    RCMETER_ASSERT( amount.symbol == STEEM_SYMBOL || amount.symbol == SBD_SYMBOL, malformed_operation_exception,
      "Must transfer STEEM or SBD", (from) );
    validate_string_max_size( memo, RCMETER_MAX_MEMO_SIZE, "Memo is too large" );
    validate_is_string_in_utf8( memo, "Memo is not UTF8" );
  }

  void cancel_transfer_from_savings_operation::validate()const {
    validate_account_name( from );
  }

  void decline_voting_rights_operation::validate()const
  {
    validate_account_name( account );
  }

  void reset_account_operation::validate()const
  {
    validate_account_name( reset_account );
    validate_account_name( account_to_reset );
    RCMETER_ASSERT( !new_owner_authority.is_impossible(), malformed_operation_exception,
      "new owner authority cannot be impossible", (account_to_reset) );
    RCMETER_ASSERT( new_owner_authority.weight_threshold, malformed_operation_exception,
      "new owner authority cannot be trivial", (account_to_reset) );
    validate_authority( new_owner_authority );
  }

  void set_reset_account_operation::validate()const
  {
    validate_account_name( account );
    if( current_reset_account.size() )
      validate_account_name( current_reset_account );
    validate_account_name( reset_account );
    RCMETER_ASSERT( current_reset_account != reset_account, malformed_operation_exception,
      "new reset account cannot be current reset account", (reset_account) );
  }

  void claim_reward_balance_operation::validate()const
  {
    validate_account_name( account );
    validate_asset_type( reward_steem, STEEM_SYMBOL, "Reward Steem must be STEEM" );
    validate_asset_type( reward_sbd, SBD_SYMBOL, "Reward Steem must be SBD" );
    validate_asset_type( reward_vests, VESTS_SYMBOL, "Reward Steem must be VESTS" );
    validate_asset_not_negative( reward_steem, "Cannot claim a negative amount" );
    validate_asset_not_negative( reward_sbd, "Cannot claim a negative amount" );
    validate_asset_not_negative( reward_vests, "Cannot claim a negative amount" );
    RCMETER_ASSERT( reward_steem.amount > 0 || reward_sbd.amount > 0 || reward_vests.amount > 0, malformed_operation_exception,
      "Must claim something.", (account) );
  }

  void delegate_vesting_shares_operation::validate()const
  {
    validate_account_name( delegator );
    validate_account_name( delegatee );
    RCMETER_ASSERT( delegator != delegatee, malformed_operation_exception, "You cannot delegate VESTS to yourself", (delegator) );
    validate_asset_type( vesting_shares, VESTS_SYMBOL, "Delegation must be VESTS" );
    validate_asset_not_negative( vesting_shares, "Delegation cannot be negative" );
  }

} } // rcmeter::protocol
