#pragma once

#include <fc/reflect/reflect.hpp>

#include <cstdint>
#include <string>

#define RCMETER_ASSET_SYMBOL_PRECISION_BITS     4
#define RCMETER_ASSET_CONTROL_BITS              1
#define RCMETER_NAI_SHIFT                       ( RCMETER_ASSET_SYMBOL_PRECISION_BITS + RCMETER_ASSET_CONTROL_BITS )
#define RCMETER_MAX_NAI                             99999999
#define RCMETER_MIN_NAI                             1
#define RCMETER_ASSET_SYMBOL_NAI_LENGTH         10
#define RCMETER_ASSET_SYMBOL_NAI_STRING_LENGTH  ( RCMETER_ASSET_SYMBOL_NAI_LENGTH + 2 )

#define RCMETER_PRECISION_SBD    (3)
#define RCMETER_PRECISION_STEEM  (3)
#define RCMETER_PRECISION_VESTS  (6)

// One's place is used for check digit, which means NAI 0-9 all have NAI data of 0 which is invalid
#define RCMETER_NAI_SBD    (1)
#define RCMETER_NAI_STEEM  (2)
#define RCMETER_NAI_VESTS  (3)

#define RCMETER_ASSET_NUM_SBD    (uint32_t(((RCMETER_MAX_NAI + RCMETER_NAI_SBD)   << RCMETER_NAI_SHIFT) | RCMETER_PRECISION_SBD))
#define RCMETER_ASSET_NUM_STEEM  (uint32_t(((RCMETER_MAX_NAI + RCMETER_NAI_STEEM) << RCMETER_NAI_SHIFT) | RCMETER_PRECISION_STEEM))
#define RCMETER_ASSET_NUM_VESTS  (uint32_t(((RCMETER_MAX_NAI + RCMETER_NAI_VESTS) << RCMETER_NAI_SHIFT) | RCMETER_PRECISION_VESTS))

#define RCMETER_ASSET_MAX_DECIMALS  12

#define RCMETER_ASSET_NUM_PRECISION_MASK   0xF
#define RCMETER_ASSET_NUM_CONTROL_MASK     0x10
#define RCMETER_ASSET_NUM_VESTING_MASK     0x20

#define SBD_SYMBOL    (rcmeter::protocol::asset_symbol_type::from_asset_num( RCMETER_ASSET_NUM_SBD ))
#define STEEM_SYMBOL  (rcmeter::protocol::asset_symbol_type::from_asset_num( RCMETER_ASSET_NUM_STEEM ))
#define VESTS_SYMBOL  (rcmeter::protocol::asset_symbol_type::from_asset_num( RCMETER_ASSET_NUM_VESTS ))

namespace rcmeter { namespace protocol {

class asset_symbol_type
{
  public:
    enum asset_symbol_space
    {
      legacy_space = 1,
      smt_nai_space = 2
    };

    static asset_symbol_type from_nai_string( const std::string& nai_string, uint8_t decimal_places );
    static asset_symbol_type from_asset_num( uint32_t asset_num )
    {   asset_symbol_type result;   result.asset_num = asset_num;   return result;   }
    static uint32_t asset_num_from_nai( uint32_t nai, uint8_t decimal_places );
    static asset_symbol_type from_nai( uint32_t nai, uint8_t decimal_places )
    {   return from_asset_num( asset_num_from_nai( nai, decimal_places ) );          }
    static uint8_t damm_checksum_8digit( uint32_t value );

    std::string to_nai_string()const;
    uint32_t to_nai()const;

    bool is_vesting()const;
    asset_symbol_space space()const;
    uint8_t decimals()const
    {  return uint8_t( asset_num & RCMETER_ASSET_NUM_PRECISION_MASK );    }

    friend bool operator == ( const asset_symbol_type& a, const asset_symbol_type& b )
    {  return (a.asset_num == b.asset_num);   }
    friend bool operator != ( const asset_symbol_type& a, const asset_symbol_type& b )
    {  return (a.asset_num != b.asset_num);   }
    friend bool operator <  ( const asset_symbol_type& a, const asset_symbol_type& b )
    {  return (a.asset_num <  b.asset_num);   }

    uint32_t asset_num = 0;
};

} } // rcmeter::protocol

FC_REFLECT( rcmeter::protocol::asset_symbol_type, (asset_num) )
