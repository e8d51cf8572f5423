#pragma once

#include <rcmeter/protocol/authority.hpp>
#include <rcmeter/protocol/base.hpp>
#include <rcmeter/protocol/misc_utilities.hpp>

#include <fc/variant.hpp>

#include <boost/container/flat_set.hpp>

#include <map>
#include <string>
#include <vector>

namespace rcmeter { namespace protocol {

struct get_required_auth_visitor
{
  typedef void result_type;

  flat_set< account_name_type >&        active;
  flat_set< account_name_type >&        owner;
  flat_set< account_name_type >&        posting;
  std::vector< authority >&  other;

  get_required_auth_visitor(
      flat_set< account_name_type >& a,
      flat_set< account_name_type >& own,
      flat_set< account_name_type >& post,
      std::vector< authority >& oth )
    : active( a ), owner( own ), posting( post ), other( oth ) {}

  template< typename T >
  void operator()( const T& v )const
  {
    v.get_required_active_authorities( active );
    v.get_required_owner_authorities( owner );
    v.get_required_posting_authorities( posting );
    v.get_required_authorities( other );
  }
};

struct operation_validate_visitor
{
  typedef void result_type;
  template<typename T>
  void operator()( const T& v )const { v.validate(); }
};

struct get_static_variant_name
{
  string& name;
  get_static_variant_name( string& dv )
    : name( dv ) {}

  typedef void result_type;
  template< typename T > void operator()( const T& v )const
  {
    name = trim_typename_namespace( fc::get_typename< T >::name() );
  }
};

/**
  * Maps the names of the alternatives of a static_variant to their tags.
  * The table is built once per variant type from its type list.
  */
template< typename variant_type >
const std::map< string, int64_t >& static_variant_name_table()
{
  static const std::map< string, int64_t > name_map = []()
  {
    std::map< string, int64_t > result;
    for( int64_t i = 0; i < variant_type::count(); ++i )
    {
      variant_type tmp;
      tmp.set_which(i);
      string n;
      tmp.visit( get_static_variant_name( n ) );
      result[n] = i;
    }
    return result;
  }();

  return name_map;
}

template< typename variant_type >
string static_variant_name( const variant_type& v )
{
  string n;
  v.visit( get_static_variant_name( n ) );
  return n;
}

} } // rcmeter::protocol

//
// Place RCMETER_DECLARE_OPERATION_TYPE in a .hpp file to declare
// functions related to your operation type
//
#define RCMETER_DECLARE_OPERATION_TYPE( OperationType )                         \
                                                                                \
namespace rcmeter { namespace protocol {                                        \
                                                                                \
void operation_validate( const OperationType& o );                              \
void operation_get_required_authorities( const OperationType& op,               \
                            flat_set< account_name_type >& active,              \
                            flat_set< account_name_type >& owner,               \
                            flat_set< account_name_type >& posting,             \
                            vector< authority >& other );                       \
                                                                                \
} } /* rcmeter::protocol */

//
// Place RCMETER_DEFINE_OPERATION_TYPE in a .cpp file to define
// functions related to your operation type
//
#define RCMETER_DEFINE_OPERATION_TYPE( OperationType )                          \
                                                                                \
namespace rcmeter { namespace protocol {                                        \
                                                                                \
void operation_validate( const OperationType& op )                              \
{                                                                               \
  op.visit( rcmeter::protocol::operation_validate_visitor() );                  \
}                                                                               \
                                                                                \
void operation_get_required_authorities( const OperationType& op,               \
                            flat_set< account_name_type >& active,              \
                            flat_set< account_name_type >& owner,               \
                            flat_set< account_name_type >& posting,             \
                            vector< authority >& other )                        \
{                                                                               \
  op.visit( rcmeter::protocol::get_required_auth_visitor( active, owner, posting, other ) ); \
}                                                                               \
                                                                                \
} } /* rcmeter::protocol */
