#include <rcmeter/chain/rc/resource_sizes.hpp>
#include <rcmeter/chain/rc/rc_exceptions.hpp>

namespace rcmeter { namespace chain {

namespace {

template< typename T >
struct non_negative_member_check
{
  const T&    info;
  const char* section;

  non_negative_member_check( const T& i, const char* s ) : info( i ), section( s ) {}

  template< typename Member, class Class, Member (Class::*member) >
  void operator()( const char* name )const
  {
    RCMETER_ASSERT( info.*member >= 0, invalid_rc_config_exception,
      "${section}.${name} cannot be negative", ("section", section)("name", name)("value", info.*member) );
  }
};

} // anonymous

void rc_size_info::validate()const
{
  fc::reflector< state_object_size_info >::visit(
    non_negative_member_check< state_object_size_info >( resource_state_bytes, "resource_state_bytes" ) );
  fc::reflector< operation_exec_info >::visit(
    non_negative_member_check< operation_exec_info >( resource_execution_time, "resource_execution_time" ) );
}

} } // rcmeter::chain
