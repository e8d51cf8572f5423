#include <rcmeter/protocol/operation_decoder.hpp>
#include <rcmeter/protocol/exceptions.hpp>
#include <rcmeter/protocol/variant_decoder.hpp>

#include <fc/variant_object.hpp>

namespace rcmeter { namespace protocol {

namespace {

void decode_operation_at( const fc::variant& v, operation& op, const std::string& path )
{
  try
  {
    decode_variant( v, op, path );
    operation_validate( op );
  }
  catch( const unknown_operation_exception& )
  {
    throw;
  }
  catch( const malformed_operation_exception& )
  {
    throw;
  }
  RCMETER_RECODE_EXC( fc::exception, malformed_operation_exception )
}

} // anonymous

void decode_operation( const fc::variant& v, operation& op )
{
  decode_operation_at( v, op, "operation" );
}

void decode_transaction( const fc::variant& v, signed_transaction& trx )
{
  const char* operations_key = "operations";

  try
  {
    RCMETER_ASSERT( v.is_object(), malformed_transaction_exception, "Transaction has to be an object", ("trx", v) );
    const auto& obj = v.get_object();

    auto ops_itr = obj.find( operations_key );
    RCMETER_ASSERT( ops_itr != obj.end() && ops_itr->value().is_array(), malformed_transaction_exception,
      "Transaction requires an array of operations", ("trx", v) );

    /* Everything but the operations is decoded as the envelope. */
    fc::mutable_variant_object envelope( obj );
    envelope[ operations_key ] = fc::variants();
    signed_transaction result;
    decode_variant( fc::variant( envelope ), result, "trx" );

    const auto& ops = ops_itr->value().get_array();
    result.operations.resize( ops.size() );
    for( size_t i = 0; i < ops.size(); ++i )
      decode_operation_at( ops[i], result.operations[i], "trx.operations[" + std::to_string( i ) + "]" );

    result.validate();
    trx = std::move( result );
  }
  catch( const rc_exception& )
  {
    throw;
  }
  RCMETER_RECODE_EXC( fc::exception, malformed_transaction_exception )
}

} } // rcmeter::protocol
