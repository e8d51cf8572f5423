#pragma once
#include <rcmeter/protocol/types.hpp>

namespace rcmeter { namespace protocol {

  struct authority
  {
    authority() = default;

    void add_authority( const public_key_type& k, weight_type w );
    void add_authority( const account_name_type& k, weight_type w, bool is_account );

    uint32_t num_auths()const { return account_auths.size() + key_auths.size(); }
    bool is_impossible()const;
    void validate()const;

    typedef flat_map< account_name_type, weight_type > account_authority_map;
    typedef flat_map< public_key_type, weight_type >   key_authority_map;

    uint32_t              weight_threshold = 0;
    account_authority_map account_auths;
    key_authority_map     key_auths;
  };

  bool operator == ( const authority& a, const authority& b );

  bool is_valid_account_name( const string& name );

} } // rcmeter::protocol

FC_REFLECT( rcmeter::protocol::authority, (weight_threshold)(account_auths)(key_auths) )
