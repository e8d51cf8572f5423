#include <rcmeter/protocol/types.hpp>
#include <rcmeter/protocol/config.hpp>

#include <fc/exception/exception.hpp>

namespace rcmeter { namespace protocol {

//note: only the textual shape is checked, key recovery belongs to the signature layer
bool is_valid_public_key( const public_key_type& key )
{
  const std::string prefix( RCMETER_ADDRESS_PREFIX );
  if( key.size() <= prefix.size() || key.compare( 0, prefix.size(), prefix ) != 0 )
    return false;

  static const std::string base58_chars = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
  return key.find_first_not_of( base58_chars, prefix.size() ) == std::string::npos;
}

} } // rcmeter::protocol

namespace fc {

  void to_variant( const rcmeter::protocol::wide_int& var, fc::variant& vo )
  {
    vo = var.str();
  }

  void from_variant( const fc::variant& var, rcmeter::protocol::wide_int& vo )
  {
    try
    {
      if( var.is_int64() )
      {
        vo = rcmeter::protocol::wide_int( var.as_int64() );
        return;
      }
      if( var.is_uint64() )
      {
        vo = rcmeter::protocol::wide_int( var.as_uint64() );
        return;
      }

      FC_ASSERT( var.is_string(), "Expected an integer or a decimal string" );
      const std::string& s = var.get_string();
      size_t first_digit = ( s.size() > 0 && s[0] == '-' ) ? 1 : 0;
      FC_ASSERT( s.size() > first_digit, "Empty number" );
      FC_ASSERT( s.find_first_not_of( "0123456789", first_digit ) == std::string::npos, "Invalid decimal number ${s}", (s) );
      vo = rcmeter::protocol::wide_int( s.c_str() );
    } FC_CAPTURE_AND_RETHROW( (var) )
  }

} // fc
