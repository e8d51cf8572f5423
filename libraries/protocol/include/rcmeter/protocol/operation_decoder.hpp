#pragma once

#include <rcmeter/protocol/operations.hpp>
#include <rcmeter/protocol/transaction.hpp>

#include <fc/variant.hpp>

namespace rcmeter { namespace protocol {

  /**
    * Decodes a `{ "type": "<name>_operation", "value": { ... } }` document and validates the result.
    *
    * @throws unknown_operation_exception when the name is not one of the known operations
    * @throws malformed_operation_exception when the value does not decode or does not validate
    */
  void decode_operation( const fc::variant& v, operation& op );

  /**
    * Decodes a signed transaction document, every operation is decoded with decode_operation.
    *
    * @throws malformed_transaction_exception when the envelope does not decode or has no operations
    */
  void decode_transaction( const fc::variant& v, signed_transaction& trx );

} } // rcmeter::protocol
