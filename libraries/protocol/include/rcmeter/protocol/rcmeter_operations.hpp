#pragma once
#include <rcmeter/protocol/base.hpp>
#include <rcmeter/protocol/asset.hpp>
#include <rcmeter/protocol/authority.hpp>
#include <rcmeter/protocol/config.hpp>

namespace rcmeter { namespace protocol {

  void validate_auth_size( const authority& a );

  struct account_create_operation : public base_operation
  {
    asset             fee;
    account_name_type creator;
    account_name_type new_account_name;
    authority         owner;
    authority         active;
    authority         posting;
    public_key_type   memo_key;
    string            json_metadata;

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert(creator); }
  };


  struct account_create_with_delegation_operation : public base_operation
  {
    asset             fee;
    asset             delegation;
    account_name_type creator;
    account_name_type new_account_name;
    authority         owner;
    authority         active;
    authority         posting;
    public_key_type   memo_key;
    string            json_metadata;

    extensions_type   extensions;

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert(creator); }
  };


  struct account_update_operation : public base_operation
  {
    account_name_type             account;
    fc::optional< authority >     owner;
    fc::optional< authority >     active;
    fc::optional< authority >     posting;
    public_key_type               memo_key;
    string                        json_metadata;

    void validate()const;

    void get_required_owner_authorities( flat_set<account_name_type>& a )const
    { if( owner ) a.insert( account ); }

    void get_required_active_authorities( flat_set<account_name_type>& a )const
    { if( !owner ) a.insert( account ); }
  };


  struct comment_operation : public base_operation
  {
    account_name_type parent_author;
    string            parent_permlink;

    account_name_type author;
    string            permlink;

    string            title;
    string            body;
    string            json_metadata;

    void validate()const;
    void get_required_posting_authorities( flat_set<account_name_type>& a )const{ a.insert(author); }
  };

  struct beneficiary_route_type
  {
    beneficiary_route_type() {}
    beneficiary_route_type( const account_name_type& a, const uint16_t& w ) : account( a ), weight( w ){}

    account_name_type account;
    uint16_t          weight = 0;

    // For use by std::sort such that the route is sorted first by name (ascending)
    bool operator < ( const beneficiary_route_type& o )const { return account < o.account; }
  };

  struct comment_payout_beneficiaries
  {
    vector< beneficiary_route_type > beneficiaries;

    void validate()const;
  };

  struct votable_asset_info_v1
  {
    votable_asset_info_v1() {}
    votable_asset_info_v1( int64_t max_payout, bool allow_curation )
      : max_accepted_payout( max_payout ), allow_curation_rewards( allow_curation ) {}

    int64_t           max_accepted_payout = 0;
    bool              allow_curation_rewards = false;
  };

  typedef static_variant<
        votable_asset_info_v1
      > votable_asset_info;

  /**
    * Assets that votes on the comment may be paid in, besides the core asset.
    * Carried by comment_options but does not create any state of its own.
    */
  struct allowed_vote_assets
  {
    flat_map< asset_symbol_type, votable_asset_info > votable_assets;

    void validate()const;
  };

  typedef static_variant<
        comment_payout_beneficiaries,
        allowed_vote_assets
      > comment_options_extension;

  typedef vector< comment_options_extension > comment_options_extensions_type;

  /**
    *  Authors of posts may not want all of the benefits that come from creating a post. This
    *  operation allows authors to update properties associated with their post.
    *
    *  The max_accepted_payout may be decreased, but never increased.
    *  The percent_steem_dollars may be decreased, but never increased
    *
    */
  struct comment_options_operation : public base_operation
  {
    account_name_type author;
    string            permlink;

    asset             max_accepted_payout    = asset( 1000000000, SBD_SYMBOL );
    uint16_t          percent_steem_dollars  = RCMETER_100_PERCENT;
    bool              allow_votes            = true;
    bool              allow_curation_rewards = true;
    comment_options_extensions_type extensions;

    void validate()const;
    void get_required_posting_authorities( flat_set<account_name_type>& a )const{ a.insert(author); }
  };


  struct claim_account_operation : public base_operation
  {
    account_name_type creator;
    asset             fee;
    extensions_type   extensions;

    void get_required_active_authorities( flat_set< account_name_type >& a )const{ a.insert( creator ); }
    void validate()const;
  };


  struct create_claimed_account_operation : public base_operation
  {
    account_name_type creator;
    account_name_type new_account_name;
    authority         owner;
    authority         active;
    authority         posting;
    public_key_type   memo_key;
    string            json_metadata;
    extensions_type   extensions;

    void get_required_active_authorities( flat_set< account_name_type >& a )const{ a.insert( creator ); }
    void validate()const;
  };


  struct delete_comment_operation : public base_operation
  {
    account_name_type author;
    string            permlink;

    void validate()const;
    void get_required_posting_authorities( flat_set<account_name_type>& a )const{ a.insert(author); }
  };


  struct vote_operation : public base_operation
  {
    account_name_type voter;
    account_name_type author;
    string            permlink;
    int16_t           weight = 0;

    void validate()const;
    void get_required_posting_authorities( flat_set<account_name_type>& a )const{ a.insert(voter); }
  };


  /**
    * @ingroup operations
    *
    * @brief Transfers STEEM from one account to another.
    */
  struct transfer_operation : public base_operation
  {
    account_name_type from;
    /// Account to transfer asset to
    account_name_type to;
    /// The amount of asset to transfer from @ref from to @ref to
    asset             amount;

    /// The memo is plain-text, any encryption on the memo is up to
    /// a higher level protocol.
    string            memo;

    void              validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert(from); }
  };


  /**
    *  The purpose of this operation is to enable someone to send money contingently to
    *  another individual. The funds leave the *from* account and go into a temporary balance
    *  where they are held until *from* releases it to *to* or *to* refunds it to *from*.
    *
    *  In the event of a dispute the *agent* can divide the funds between the to/from account.
    *  Disputes can be raised any time before or on the dispute deadline time, after the escrow
    *  has been approved by all parties.
    *
    *  This operation only creates a proposed escrow transfer. Both the *agent* and *to* must
    *  agree to the terms of the arrangement by approving the escrow.
    */
  struct escrow_transfer_operation : public base_operation
  {
    account_name_type from;
    account_name_type to;
    account_name_type agent;
    uint32_t          escrow_id = 30;

    asset             sbd_amount = asset( 0, SBD_SYMBOL );
    asset             steem_amount = asset( 0, STEEM_SYMBOL );
    asset             fee;

    time_point_sec    ratification_deadline;
    time_point_sec    escrow_expiration;

    string            json_meta;

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert(from); }
  };


  /**
    *  The agent and to accounts must approve an escrow transaction for it to be valid on
    *  the blockchain. Once a part approves the escrow, the cannot revoke their approval.
    *  Subsequent escrow approve operations, regardless of the approval, will be rejected.
    */
  struct escrow_approve_operation : public base_operation
  {
    account_name_type from;
    account_name_type to;
    account_name_type agent;
    account_name_type who; // Either to or agent

    uint32_t          escrow_id = 30;
    bool              approve = true;

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert(who); }
  };


  /**
    *  If either the sender or receiver of an escrow payment has an issue, they can
    *  raise it for dispute. Once a payment is in dispute, the agent has authority over
    *  who gets what.
    */
  struct escrow_dispute_operation : public base_operation
  {
    account_name_type from;
    account_name_type to;
    account_name_type agent;
    account_name_type who;

    uint32_t          escrow_id = 30;

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert(who); }
  };


  /**
    *  This operation can be used by anyone associated with the escrow transfer to
    *  release funds if they have permission.
    */
  struct escrow_release_operation : public base_operation
  {
    account_name_type from;
    account_name_type to; ///< the original 'to'
    account_name_type agent;
    account_name_type who; ///< the account that is attempting to release the funds, determines valid 'receiver'
    account_name_type receiver; ///< the account that should receive funds (might be from, might be to)

    uint32_t          escrow_id = 30;
    asset             sbd_amount = asset( 0, SBD_SYMBOL ); ///< the amount of sbd to release
    asset             steem_amount = asset( 0, STEEM_SYMBOL ); ///< the amount of steem to release

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert(who); }
  };


  /**
    *  This operation converts liquid token (STEEM) into VFS (Vesting Fund Shares,
    *  VESTS) at the current exchange rate. With this operation it is possible to
    *  give another account vesting shares so that faucets can pre-fund new accounts with vesting shares.
    */
  struct transfer_to_vesting_operation : public base_operation
  {
    account_name_type from;
    account_name_type to;      ///< if null, then same as from
    asset             amount;  ///< must be STEEM

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert(from); }
  };


  /**
    * At any given point in time an account can be withdrawing from their
    * vesting shares. A user may change the number of shares they wish to
    * cash out at any time between 0 and their total vesting stake.
    */
  struct withdraw_vesting_operation : public base_operation
  {
    account_name_type account;
    asset             vesting_shares;

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert(account); }
  };


  /**
    * Allows an account to setup a vesting withdraw but with the additional
    * request for the funds to be transferred directly to another account's
    * balance rather than the withdrawing account.
    */
  struct set_withdraw_vesting_route_operation : public base_operation
  {
    account_name_type from_account;
    account_name_type to_account;
    uint16_t          percent = 0;
    bool              auto_vest = false;

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const { a.insert( from_account ); }
  };


  /**
    * Witnesses must vote on how to set certain chain properties to ensure a smooth
    * and well functioning network.
    */
  struct chain_properties
  {
    asset             account_creation_fee = asset( RCMETER_MIN_ACCOUNT_CREATION_FEE, STEEM_SYMBOL );
    uint32_t          maximum_block_size = RCMETER_MIN_BLOCK_SIZE_LIMIT * 2;
    uint16_t          sbd_interest_rate = RCMETER_1_PERCENT;

    void validate()const;
  };


  /**
    *  Users who wish to become a witness must pay a fee acceptable to
    *  the current witnesses to apply for the position and allow voting
    *  to begin.
    */
  struct witness_update_operation : public base_operation
  {
    account_name_type owner;
    string            url;
    public_key_type   block_signing_key;
    chain_properties  props;
    asset             fee; ///< the fee paid to register a new witness, should be 10x current block production pay

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert(owner); }
  };


  /**
    * Properties are kept as serialized key value pairs, the signing key of the
    * witness is always required.
    */
  struct witness_set_properties_operation : public base_operation
  {
    account_name_type                   owner;
    flat_map< string, vector< char > >  props;
    extensions_type                     extensions;

    void validate()const;
  };


  /**
    * All accounts with a VFS can vote for or against any witness.
    */
  struct account_witness_vote_operation : public base_operation
  {
    account_name_type account;
    account_name_type witness;
    bool              approve = true;

    void validate() const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert(account); }
  };


  struct account_witness_proxy_operation : public base_operation
  {
    account_name_type account;
    account_name_type proxy;

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert(account); }
  };


  /**
    * @brief provides a generic way to add higher level protocols on top of witness consensus
    * @ingroup operations
    *
    * There is no validation for this operation other than that required auths are valid
    */
  struct custom_operation : public base_operation
  {
    flat_set< account_name_type > required_auths;
    uint16_t                      id = 0;
    vector< char >                data;

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ for( const auto& i : required_auths ) a.insert(i); }
  };


  /** serves the same purpose as custom_operation but also supports required posting authorities. Unlike custom_operation,
    * this operation is designed to be human readable/developer friendly.
    **/
  struct custom_json_operation : public base_operation
  {
    flat_set< account_name_type > required_auths;
    flat_set< account_name_type > required_posting_auths;
    string                        id; ///< must be less than 32 characters long
    string                        json; ///< must be proper utf8 / JSON string.

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ for( const auto& i : required_auths ) a.insert(i); }
    void get_required_posting_authorities( flat_set<account_name_type>& a )const{ for( const auto& i : required_posting_auths ) a.insert(i); }
  };


  struct custom_binary_operation : public base_operation
  {
    flat_set< account_name_type > required_owner_auths;
    flat_set< account_name_type > required_active_auths;
    flat_set< account_name_type > required_posting_auths;
    vector< authority >           required_auths;

    string                        id; ///< must be less than 32 characters long
    vector< char >                data;

    void validate()const;
    void get_required_owner_authorities( flat_set<account_name_type>& a )const{ for( const auto& i : required_owner_auths ) a.insert(i); }
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ for( const auto& i : required_active_auths ) a.insert(i); }
    void get_required_posting_authorities( flat_set<account_name_type>& a )const{ for( const auto& i : required_posting_auths ) a.insert(i); }
    void get_required_authorities( vector< authority >& a )const{ for( const auto& i : required_auths ) a.push_back( i ); }
  };


  /**
    *  Feeds can only be published by the top N witnesses which are included in every round and are
    *  used to define the exchange rate between steem and the dollar.
    */
  struct feed_publish_operation : public base_operation
  {
    account_name_type publisher;
    price             exchange_rate;

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert(publisher); }
  };


  /**
    *  This operation instructs the blockchain to start a conversion between STEEM and SBD,
    *  The funds are deposited after STEEM_CONVERSION_DELAY
    */
  struct convert_operation : public base_operation
  {
    account_name_type owner;
    uint32_t          requestid = 0;
    asset             amount;

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert(owner); }
  };


  /**
    * This operation creates a limit order and matches it against existing open orders.
    */
  struct limit_order_create_operation : public base_operation
  {
    account_name_type owner;
    uint32_t          orderid = 0; /// an ID assigned by owner, must be unique
    asset             amount_to_sell;
    asset             min_to_receive;
    bool              fill_or_kill = false;
    time_point_sec    expiration = time_point_sec::maximum();

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert(owner); }
  };


  /**
    *  This operation is identical to limit_order_create except it serializes the price rather
    *  than calculating it from other fields.
    */
  struct limit_order_create2_operation : public base_operation
  {
    account_name_type owner;
    uint32_t          orderid = 0; /// an ID assigned by owner, must be unique
    asset             amount_to_sell;
    bool              fill_or_kill = false;
    price             exchange_rate;
    time_point_sec    expiration = time_point_sec::maximum();

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert(owner); }
  };


  /**
    *  Cancels an order and returns the balance to owner.
    */
  struct limit_order_cancel_operation : public base_operation
  {
    account_name_type owner;
    uint32_t          orderid = 0;

    void validate()const;
    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert(owner); }
  };


  struct pow
  {
    public_key_type worker;
    digest_type     input;
    signature_type  signature;
    digest_type     work;
  };


  struct pow_operation : public base_operation
  {
    account_name_type worker_account;
    block_id_type     block_id;
    uint64_t          nonce = 0;
    pow               work;
    chain_properties  props;

    void validate()const;

    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert( worker_account ); }
  };


  struct pow2_input
  {
    account_name_type worker_account;
    block_id_type     prev_block;
    uint64_t          nonce = 0;
  };


  struct pow2
  {
    pow2_input        input;
    uint32_t          pow_summary = 0;
  };

  struct equihash_proof
  {
    uint32_t          n = 0;
    uint32_t          k = 0;
    digest_type       seed;
    vector< uint32_t > inputs;
  };

  struct equihash_pow
  {
    pow2_input        input;
    equihash_proof    proof;
    block_id_type     prev_block;
    uint32_t          pow_summary = 0;
  };

  typedef static_variant< pow2, equihash_pow > pow2_work;

  struct pow2_operation : public base_operation
  {
    pow2_work                     work;
    fc::optional< public_key_type > new_owner_key;
    chain_properties              props;

    void validate()const;

    void get_required_active_authorities( flat_set<account_name_type>& a )const;

    void get_required_authorities( vector< authority >& a )const
    {
      if( new_owner_key )
      {
        authority auth;
        auth.weight_threshold = 1;
        auth.add_authority( *new_owner_key, 1 );
        a.push_back( auth );
      }
    }
  };


  /**
    * Only the fields a witness signs are carried, header extensions are not part of
    * the double production evidence.
    */
  struct signed_block_header
  {
    block_id_type     previous;
    time_point_sec    timestamp;
    account_name_type witness;
    checksum_type     transaction_merkle_root;
    signature_type    witness_signature;
  };


  /**
    * This operation is used to report a miner who signs two blocks
    * at the same time. To be valid, the violation must be reported within
    * STEEM_MAX_WITNESSES blocks of the head block (1 round) and the
    * producer must be in the ACTIVE witness set.
    */
  struct report_over_production_operation : public base_operation
  {
    account_name_type    reporter;
    signed_block_header  first_block;
    signed_block_header  second_block;

    void validate()const;
  };


  /**
    * All account recovery requests come from a listed recovery account. This
    * is secure based on the assumption that only a trusted account should be
    * a recovery account. It is the responsibility of the recovery account to
    * verify the identity of the account holder of the account to recover by
    * whichever means they have agreed upon.
    */
  struct request_account_recovery_operation : public base_operation
  {
    account_name_type recovery_account;       ///< The recovery account is listed as the recovery account on the account to recover.

    account_name_type account_to_recover;     ///< The account to recover. This is likely due to a compromised owner authority.

    authority         new_owner_authority;    ///< The new owner authority the account to recover wishes to have.

    extensions_type   extensions;             ///< Extensions. Not currently used.

    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert( recovery_account ); }

    void validate() const;
  };


  /**
    * Recover an account to a new authority using a previous authority and verification
    * of the recovery account as proof of identity.
    */
  struct recover_account_operation : public base_operation
  {
    account_name_type account_to_recover;        ///< The account to be recovered

    authority         new_owner_authority;       ///< The new owner authority as specified in the request account recovery operation.

    authority         recent_owner_authority;    ///< A previous owner authority that the account holder will use to prove past ownership of the account to be recovered.

    extensions_type   extensions;                ///< Extensions. Not currently used.

    void get_required_authorities( vector< authority >& a )const
    {
      a.push_back( new_owner_authority );
      a.push_back( recent_owner_authority );
    }

    void validate() const;
  };


  /**
    *  This operation allows recovery_account to change account_to_reset's owner authority to
    *  new_owner_authority after 60 days of inactivity.
    */
  struct reset_account_operation : public base_operation
  {
    account_name_type reset_account;
    account_name_type account_to_reset;
    authority         new_owner_authority;

    void get_required_active_authorities( flat_set<account_name_type>& a )const { a.insert( reset_account ); }
    void validate()const;
  };

  /**
    * This operation allows 'account' owner to control which account has the power
    * to execute the 'reset_account_operation' after 60 days.
    */
  struct set_reset_account_operation : public base_operation
  {
    account_name_type account;
    account_name_type current_reset_account;
    account_name_type reset_account;

    void validate()const;
    void get_required_owner_authorities( flat_set<account_name_type>& a )const
    {
      if( reset_account.size() )
        a.insert( account );
    }

    void get_required_posting_authorities( flat_set<account_name_type>& a )const
    {
      if( !reset_account.size() )
        a.insert( account );
    }
  };


  /**
    * Each account lists another account as their recovery account.
    * The recovery account has the ability to create account_recovery_requests
    * for the account to recover.
    */
  struct change_recovery_account_operation : public base_operation
  {
    account_name_type account_to_recover;     ///< The account that would be recovered in case of compromise
    account_name_type new_recovery_account;   ///< The account that creates the recover request
    extensions_type   extensions;             ///< Extensions. Not currently used.

    void get_required_owner_authorities( flat_set<account_name_type>& a )const{ a.insert( account_to_recover ); }
    void validate() const;
  };


  struct transfer_to_savings_operation : public base_operation
  {
    account_name_type from;
    account_name_type to;
    asset             amount;
    string            memo;

    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert( from ); }
    void validate() const;
  };


  struct transfer_from_savings_operation : public base_operation
  {
    account_name_type from;
    uint32_t          request_id = 0;
    account_name_type to;
    asset             amount;
    string            memo;

    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert( from ); }
    void validate() const;
  };


  struct cancel_transfer_from_savings_operation : public base_operation
  {
    account_name_type from;
    uint32_t          request_id = 0;

    void get_required_active_authorities( flat_set<account_name_type>& a )const{ a.insert( from ); }
    void validate() const;
  };


  struct decline_voting_rights_operation : public base_operation
  {
    account_name_type account;
    bool              decline = true;

    void get_required_owner_authorities( flat_set<account_name_type>& a )const{ a.insert( account ); }
    void validate() const;
  };


  struct claim_reward_balance_operation : public base_operation
  {
    account_name_type account;
    asset             reward_steem;
    asset             reward_sbd;
    asset             reward_vests;

    void get_required_posting_authorities( flat_set< account_name_type >& a )const{ a.insert( account ); }
    void validate() const;
  };


  /**
    * Delegate vesting shares from one account to the other. The vesting shares are still owned
    * by the original account, but content voting rights and bandwidth allocation are transferred
    * to the receiving account.
    */
  struct delegate_vesting_shares_operation : public base_operation
  {
    account_name_type delegator;        ///< The account delegating vesting shares
    account_name_type delegatee;        ///< The account receiving vesting shares
    asset             vesting_shares;   ///< The amount of vesting shares delegated

    void get_required_active_authorities( flat_set< account_name_type >& a ) const { a.insert( delegator ); }
    void validate() const;
  };

} } // rcmeter::protocol

FC_REFLECT( rcmeter::protocol::chain_properties, (account_creation_fee)(maximum_block_size)(sbd_interest_rate) )

FC_REFLECT( rcmeter::protocol::pow, (worker)(input)(signature)(work) )
FC_REFLECT( rcmeter::protocol::pow2_input, (worker_account)(prev_block)(nonce) )
FC_REFLECT( rcmeter::protocol::pow2, (input)(pow_summary) )
FC_REFLECT( rcmeter::protocol::equihash_proof, (n)(k)(seed)(inputs) )
FC_REFLECT( rcmeter::protocol::equihash_pow, (input)(proof)(prev_block)(pow_summary) )
FC_REFLECT( rcmeter::protocol::signed_block_header, (previous)(timestamp)(witness)(transaction_merkle_root)(witness_signature) )

FC_REFLECT( rcmeter::protocol::pow_operation, (worker_account)(block_id)(nonce)(work)(props) )
FC_REFLECT( rcmeter::protocol::pow2_operation, (work)(new_owner_key)(props) )

FC_REFLECT( rcmeter::protocol::account_create_operation,
        (fee)
        (creator)
        (new_account_name)
        (owner)
        (active)
        (posting)
        (memo_key)
        (json_metadata) )

FC_REFLECT( rcmeter::protocol::account_create_with_delegation_operation,
        (fee)
        (delegation)
        (creator)
        (new_account_name)
        (owner)
        (active)
        (posting)
        (memo_key)
        (json_metadata)
        (extensions) )

FC_REFLECT( rcmeter::protocol::account_update_operation,
        (account)
        (owner)
        (active)
        (posting)
        (memo_key)
        (json_metadata) )

FC_REFLECT( rcmeter::protocol::transfer_operation, (from)(to)(amount)(memo) )
FC_REFLECT( rcmeter::protocol::transfer_to_vesting_operation, (from)(to)(amount) )
FC_REFLECT( rcmeter::protocol::withdraw_vesting_operation, (account)(vesting_shares) )
FC_REFLECT( rcmeter::protocol::set_withdraw_vesting_route_operation, (from_account)(to_account)(percent)(auto_vest) )
FC_REFLECT( rcmeter::protocol::witness_update_operation, (owner)(url)(block_signing_key)(props)(fee) )
FC_REFLECT( rcmeter::protocol::witness_set_properties_operation, (owner)(props)(extensions) )
FC_REFLECT( rcmeter::protocol::account_witness_vote_operation, (account)(witness)(approve) )
FC_REFLECT( rcmeter::protocol::account_witness_proxy_operation, (account)(proxy) )
FC_REFLECT( rcmeter::protocol::comment_operation, (parent_author)(parent_permlink)(author)(permlink)(title)(body)(json_metadata) )
FC_REFLECT( rcmeter::protocol::vote_operation, (voter)(author)(permlink)(weight) )
FC_REFLECT( rcmeter::protocol::custom_operation, (required_auths)(id)(data) )
FC_REFLECT( rcmeter::protocol::custom_json_operation, (required_auths)(required_posting_auths)(id)(json) )
FC_REFLECT( rcmeter::protocol::custom_binary_operation, (required_owner_auths)(required_active_auths)(required_posting_auths)(required_auths)(id)(data) )
FC_REFLECT( rcmeter::protocol::limit_order_create_operation, (owner)(orderid)(amount_to_sell)(min_to_receive)(fill_or_kill)(expiration) )
FC_REFLECT( rcmeter::protocol::limit_order_create2_operation, (owner)(orderid)(amount_to_sell)(exchange_rate)(fill_or_kill)(expiration) )
FC_REFLECT( rcmeter::protocol::limit_order_cancel_operation, (owner)(orderid) )

FC_REFLECT( rcmeter::protocol::delete_comment_operation, (author)(permlink) )

FC_REFLECT( rcmeter::protocol::beneficiary_route_type, (account)(weight) )
FC_REFLECT( rcmeter::protocol::comment_payout_beneficiaries, (beneficiaries) )
FC_REFLECT( rcmeter::protocol::votable_asset_info_v1, (max_accepted_payout)(allow_curation_rewards) )
FC_REFLECT( rcmeter::protocol::allowed_vote_assets, (votable_assets) )
FC_REFLECT( rcmeter::protocol::comment_options_operation, (author)(permlink)(max_accepted_payout)(percent_steem_dollars)(allow_votes)(allow_curation_rewards)(extensions) )

FC_REFLECT( rcmeter::protocol::escrow_transfer_operation, (from)(to)(sbd_amount)(steem_amount)(escrow_id)(agent)(fee)(json_meta)(ratification_deadline)(escrow_expiration) );
FC_REFLECT( rcmeter::protocol::escrow_approve_operation, (from)(to)(agent)(who)(escrow_id)(approve) );
FC_REFLECT( rcmeter::protocol::escrow_dispute_operation, (from)(to)(agent)(who)(escrow_id) );
FC_REFLECT( rcmeter::protocol::escrow_release_operation, (from)(to)(agent)(who)(receiver)(escrow_id)(sbd_amount)(steem_amount) );
FC_REFLECT( rcmeter::protocol::claim_account_operation, (creator)(fee)(extensions) );
FC_REFLECT( rcmeter::protocol::create_claimed_account_operation, (creator)(new_account_name)(owner)(active)(posting)(memo_key)(json_metadata)(extensions) );
FC_REFLECT( rcmeter::protocol::request_account_recovery_operation, (recovery_account)(account_to_recover)(new_owner_authority)(extensions) );
FC_REFLECT( rcmeter::protocol::recover_account_operation, (account_to_recover)(new_owner_authority)(recent_owner_authority)(extensions) );
FC_REFLECT( rcmeter::protocol::reset_account_operation, (reset_account)(account_to_reset)(new_owner_authority) );
FC_REFLECT( rcmeter::protocol::set_reset_account_operation, (account)(current_reset_account)(reset_account) );
FC_REFLECT( rcmeter::protocol::change_recovery_account_operation, (account_to_recover)(new_recovery_account)(extensions) );
FC_REFLECT( rcmeter::protocol::transfer_to_savings_operation, (from)(to)(amount)(memo) )
FC_REFLECT( rcmeter::protocol::transfer_from_savings_operation, (from)(request_id)(to)(amount)(memo) )
FC_REFLECT( rcmeter::protocol::cancel_transfer_from_savings_operation, (from)(request_id) )
FC_REFLECT( rcmeter::protocol::decline_voting_rights_operation, (account)(decline) );
FC_REFLECT( rcmeter::protocol::claim_reward_balance_operation, (account)(reward_steem)(reward_sbd)(reward_vests) )
FC_REFLECT( rcmeter::protocol::delegate_vesting_shares_operation, (delegator)(delegatee)(vesting_shares) );
FC_REFLECT( rcmeter::protocol::feed_publish_operation, (publisher)(exchange_rate) )
FC_REFLECT( rcmeter::protocol::convert_operation, (owner)(requestid)(amount) )
FC_REFLECT( rcmeter::protocol::report_over_production_operation, (reporter)(first_block)(second_block) )
