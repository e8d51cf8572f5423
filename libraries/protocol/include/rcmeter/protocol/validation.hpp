#pragma once

#include <rcmeter/protocol/asset.hpp>
#include <rcmeter/protocol/authority.hpp>
#include <rcmeter/protocol/config.hpp>
#include <rcmeter/protocol/exceptions.hpp>

#include <fc/utf8.hpp>

namespace rcmeter { namespace protocol {

inline void validate_account_name( const string& name )
{
  RCMETER_ASSERT( is_valid_account_name( name ), malformed_operation_exception,
    "Account name ${n} is invalid", ("n", name) );
}

inline void validate_permlink( const string& permlink )
{
  RCMETER_ASSERT( permlink.size() < RCMETER_MAX_PERMLINK_LENGTH, malformed_operation_exception,
    "permlink is too long: ${p}", ("p", permlink) );
  RCMETER_ASSERT( fc::is_utf8( permlink ), malformed_operation_exception,
    "permlink not formatted in UTF8", ("p", permlink) );
}

inline void validate_asset_type( const asset& a, const asset_symbol_type& symbol, const char* context )
{
  RCMETER_ASSERT( a.symbol == symbol, malformed_operation_exception,
    "${c}: expected ${expected}, got ${actual}",
    ("c", context)("expected", symbol.to_nai_string())("actual", a.symbol.to_nai_string()) );
}

inline void validate_asset_greater_than_zero( const asset& a, const char* context )
{
  RCMETER_ASSERT( a.amount > 0, malformed_operation_exception, "${c}", ("c", context)("amount", a.amount) );
}

inline void validate_asset_not_negative( const asset& a, const char* context )
{
  RCMETER_ASSERT( a.amount >= 0, malformed_operation_exception, "${c}", ("c", context)("amount", a.amount) );
}

inline void validate_string_max_size( const string& str, size_t max_size, const char* context )
{
  RCMETER_ASSERT( str.size() < max_size, malformed_operation_exception,
    "${c}. Size: ${size}, Max: ${max}", ("c", context)("size", str.size())("max", max_size) );
}

inline void validate_is_string_in_utf8( const string& str, const char* context )
{
  RCMETER_ASSERT( fc::is_utf8( str ), malformed_operation_exception, "${c}", ("c", context) );
}

template< typename int_t >
inline void validate_number_in_100_percent_range( const int_t number, const char* context )
{
  RCMETER_ASSERT( number <= RCMETER_100_PERCENT, malformed_operation_exception,
    "${c}. Value: ${v}, Max: ${max}", ("c", context)("v", number)("max", RCMETER_100_PERCENT) );
}

inline void validate_authority( const authority& a )
{
  try
  {
    a.validate();
  }
  RCMETER_RECODE_EXC( fc::assert_exception, malformed_operation_exception )

  RCMETER_ASSERT( a.num_auths() <= RCMETER_MAX_AUTHORITY_MEMBERSHIP, malformed_operation_exception,
    "Authority membership exceeded. Max: ${max} Current: ${n}",
    ("max", RCMETER_MAX_AUTHORITY_MEMBERSHIP)("n", a.num_auths()) );
}

} } // rcmeter::protocol
