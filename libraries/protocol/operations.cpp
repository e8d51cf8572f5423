#include <rcmeter/protocol/operations.hpp>

namespace rcmeter { namespace protocol {

struct is_vop_visitor
{
  typedef bool result_type;

  template< typename T >
  bool operator()( const T& v )const { return v.is_virtual(); }
};

bool is_virtual_operation( const operation& op )
{
  return op.visit( is_vop_visitor() );
}

string get_operation_name( const operation& op )
{
  return static_variant_name( op );
}

} } // rcmeter::protocol

RCMETER_DEFINE_OPERATION_TYPE( rcmeter::protocol::operation )
