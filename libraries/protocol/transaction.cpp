#include <rcmeter/protocol/transaction.hpp>
#include <rcmeter/protocol/exceptions.hpp>

namespace rcmeter { namespace protocol {

void transaction::validate() const
{
  RCMETER_ASSERT( operations.size() > 0, malformed_transaction_exception, "A transaction must have at least one operation", ("ref_block_num", ref_block_num)("ref_block_prefix", ref_block_prefix) );
  RCMETER_ASSERT( extensions.empty(), malformed_transaction_exception, "Transaction extensions are not supported", ("extensions", extensions.size()) );
  for( const auto& op : operations )
  {
    RCMETER_ASSERT( !is_virtual_operation( op ), malformed_transaction_exception,
      "Virtual operation ${op} cannot be part of a transaction", ("op", get_operation_name( op )) );
    operation_validate(op);
  }
}

void transaction::get_required_authorities( flat_set< account_name_type >& active,
                                  flat_set< account_name_type >& owner,
                                  flat_set< account_name_type >& posting,
                                  vector< authority >& other )const
{
  for( const auto& op : operations )
    operation_get_required_authorities( op, active, owner, posting, other );
}

} } // rcmeter::protocol
