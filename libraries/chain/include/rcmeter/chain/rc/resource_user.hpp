#pragma once

#include <rcmeter/protocol/operations.hpp>

namespace rcmeter { namespace protocol {

struct signed_transaction;

} } // rcmeter::protocol

namespace rcmeter { namespace chain {

/**
  * Account charged for the operation: first required active authority, then owner, then posting.
  * witness_set_properties is charged to its owner and recover_account to the recovered account.
  * Returns empty name when the operation names no account.
  */
rcmeter::protocol::account_name_type get_resource_user( const rcmeter::protocol::operation& op );

// RC payer of the transaction, decided by the first operation that names an account
rcmeter::protocol::account_name_type get_resource_user( const rcmeter::protocol::signed_transaction& tx );

} } // rcmeter::chain
