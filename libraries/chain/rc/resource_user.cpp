#include <rcmeter/chain/rc/resource_user.hpp>

#include <rcmeter/protocol/transaction.hpp>

namespace rcmeter { namespace chain {

using namespace rcmeter::protocol;

namespace {

account_name_type first_account( const flat_set< account_name_type >& accounts )
{
  return accounts.empty() ? account_name_type() : *accounts.begin();
}

struct resource_user_visitor
{
  typedef account_name_type result_type;

  account_name_type operator()( const witness_set_properties_operation& op )const { return op.owner; }
  account_name_type operator()( const recover_account_operation& op )const { return op.account_to_recover; }

  template< typename Op >
  account_name_type operator()( const Op& op )const
  {
    flat_set< account_name_type > active, owner, posting;

    op.get_required_active_authorities( active );
    if( !active.empty() )
      return first_account( active );

    op.get_required_owner_authorities( owner );
    if( !owner.empty() )
      return first_account( owner );

    op.get_required_posting_authorities( posting );
    return first_account( posting );
  }
};

} // anonymous

account_name_type get_resource_user( const operation& op )
{
  return op.visit( resource_user_visitor() );
}

account_name_type get_resource_user( const signed_transaction& tx )
{
  for( const operation& op : tx.operations )
  {
    account_name_type payer = get_resource_user( op );
    if( !payer.empty() )
      return payer;
  }
  return account_name_type();
}

} } // rcmeter::chain
