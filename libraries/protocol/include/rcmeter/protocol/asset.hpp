#pragma once
#include <rcmeter/protocol/types.hpp>
#include <rcmeter/protocol/asset_symbol.hpp>

namespace rcmeter { namespace protocol {

  struct asset
  {
    asset( share_type a, asset_symbol_type id )
      : amount( a ), symbol( id ) {}

    asset()
      : amount( 0 ), symbol( STEEM_SYMBOL ) {}

    share_type        amount;
    asset_symbol_type symbol;

    void validate()const;

    friend bool operator == ( const asset& a, const asset& b )
    {
      return std::tie( a.symbol, a.amount ) == std::tie( b.symbol, b.amount );
    }

    friend bool operator != ( const asset& a, const asset& b )
    {
      return !( a == b );
    }

    friend bool operator < ( const asset& a, const asset& b )
    {
      FC_ASSERT( a.symbol == b.symbol );
      return a.amount < b.amount;
    }

    friend bool operator <= ( const asset& a, const asset& b )
    {
      FC_ASSERT( a.symbol == b.symbol );
      return a.amount <= b.amount;
    }
  };

  /** Represents quotation of the relative value of asset against another asset.
    * Similar to 'currency pair' used to determine value of currencies.
    */
  struct price
  {
    asset base;
    asset quote;

    void validate()const;
  };

} } // rcmeter::protocol

namespace fc {

  void to_variant( const rcmeter::protocol::asset& var, fc::variant& vo );
  void from_variant( const fc::variant& var, rcmeter::protocol::asset& vo );

} // fc

FC_REFLECT( rcmeter::protocol::price, (base)(quote) )
