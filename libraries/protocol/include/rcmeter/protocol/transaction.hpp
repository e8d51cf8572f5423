#pragma once
#include <rcmeter/protocol/operations.hpp>
#include <rcmeter/protocol/types.hpp>

namespace rcmeter { namespace protocol {

  struct transaction
  {
    uint16_t           ref_block_num    = 0;
    uint32_t           ref_block_prefix = 0;

    fc::time_point_sec expiration;

    vector<operation>  operations;
    extensions_type    extensions;

    void               validate() const;

    void get_required_authorities( flat_set< account_name_type >& active,
                          flat_set< account_name_type >& owner,
                          flat_set< account_name_type >& posting,
                          vector< authority >& other )const;
  };

  /**
    * Signatures are carried so the whole signed form can be decoded, they are never verified.
    * Byte size of the transaction is always supplied by the caller.
    */
  struct signed_transaction : public transaction
  {
    signed_transaction( const transaction& trx = transaction() )
      : transaction(trx){}

    vector<signature_type> signatures;

    void clear() { operations.clear(); signatures.clear(); }
  };

} } // rcmeter::protocol

FC_REFLECT( rcmeter::protocol::transaction, (ref_block_num)(ref_block_prefix)(expiration)(operations)(extensions) )
FC_REFLECT_DERIVED( rcmeter::protocol::signed_transaction, (rcmeter::protocol::transaction), (signatures) )
