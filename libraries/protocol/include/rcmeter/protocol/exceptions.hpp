#pragma once

#include <fc/exception/exception.hpp>

#define RCMETER_ASSERT( expr, exc_type, FORMAT, ... )           \
  FC_EXPAND_MACRO(                                              \
    FC_MULTILINE_MACRO_BEGIN                                    \
      if( UNLIKELY(!(expr)) )                                   \
      {                                                         \
        if( fc::enable_record_assert_trip )                     \
           fc::record_assert_trip( __FILE__, __LINE__, #expr ); \
        FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );    \
      }                                                         \
    FC_MULTILINE_MACRO_END                                      \
  )

namespace rcmeter { namespace protocol {

  FC_DECLARE_EXCEPTION( rc_exception, 5000000, "resource credit exception" )
  FC_DECLARE_DERIVED_EXCEPTION( unknown_operation_exception,     rcmeter::protocol::rc_exception, 5010000, "unknown operation" )
  FC_DECLARE_DERIVED_EXCEPTION( malformed_operation_exception,   rcmeter::protocol::rc_exception, 5020000, "malformed operation" )
  FC_DECLARE_DERIVED_EXCEPTION( malformed_transaction_exception, rcmeter::protocol::rc_exception, 5030000, "malformed transaction" )

  #define RCMETER_RECODE_EXC( cause_type, effect_type ) \
    catch( const cause_type& e ) \
    { throw( effect_type( e.what(), e.get_log() ) ); }

} } // rcmeter::protocol
