#include <rcmeter/protocol/asset.hpp>
#include <rcmeter/protocol/exceptions.hpp>

#include <boost/lexical_cast.hpp>

#define ASSET_AMOUNT_KEY     "amount"
#define ASSET_PRECISION_KEY  "precision"
#define ASSET_NAI_KEY        "nai"

namespace rcmeter { namespace protocol {

std::string asset_symbol_type::to_nai_string()const
{
  static_assert( RCMETER_ASSET_SYMBOL_NAI_STRING_LENGTH >= 12, "This code will overflow a short buffer" );
  char buf[ RCMETER_ASSET_SYMBOL_NAI_STRING_LENGTH ];
  uint32_t x = to_nai();
  buf[11] = '\0';
  for( int i = 10; i >= 3; --i )
  {
    buf[i] = ((x%10)+'0');
    x /= 10;
  }
  buf[ 2] = ((x   )+'0');
  buf[ 1] = '@';
  buf[ 0] = '@';
  return std::string( buf );
}

asset_symbol_type asset_symbol_type::from_nai_string( const std::string& nai_string, uint8_t decimal_places )
{
  try
  {
    FC_ASSERT( nai_string.size() == RCMETER_ASSET_SYMBOL_NAI_STRING_LENGTH - 1, "Incorrect NAI string length" );
    FC_ASSERT( nai_string[0] == '@' && nai_string[1] == '@', "Invalid NAI string prefix" );
    for( size_t i = 2; i < nai_string.size(); ++i )
      FC_ASSERT( nai_string[i] >= '0' && nai_string[i] <= '9', "NAI has to be numeric" );
    uint32_t nai = boost::lexical_cast< uint32_t >( nai_string.substr( 2 ) );
    return asset_symbol_type::from_nai( nai, decimal_places );
  } FC_CAPTURE_AND_RETHROW( (nai_string)(decimal_places) );
}

// Highly optimized implementation of Damm algorithm
// https://en.wikipedia.org/wiki/Damm_algorithm
uint8_t asset_symbol_type::damm_checksum_8digit( uint32_t value )
{
  FC_ASSERT( value < 100000000 );

  const uint8_t t[] = {
      0, 30, 10, 70, 50, 90, 80, 60, 40, 20,
    70,  0, 90, 20, 10, 50, 40, 80, 60, 30,
    40, 20,  0, 60, 80, 70, 10, 30, 50, 90,
    10, 70, 50,  0, 90, 80, 30, 40, 20, 60,
    60, 10, 20, 30,  0, 40, 50, 90, 70, 80,
    30, 60, 70, 40, 20,  0, 90, 50, 80, 10,
    50, 80, 60, 90, 70, 20,  0, 10, 30, 40,
    80, 90, 40, 50, 30, 60, 20,  0, 10, 70,
    90, 40, 30, 80, 60, 10, 70, 20,  0, 50,
    20, 50, 80, 10, 40, 30, 60, 70, 90, 0
  };

  uint8_t x = 0;
  for( uint32_t divisor = 10000000; divisor > 0; divisor /= 10 )
    x = t[ x + ( value / divisor ) % 10 ];
  return x/10;
}

uint32_t asset_symbol_type::asset_num_from_nai( uint32_t nai, uint8_t decimal_places )
{
  uint32_t nai_check_digit = nai % 10;
  uint32_t nai_data_digits = nai / 10;

  FC_ASSERT( (nai_data_digits >= RCMETER_MIN_NAI) & (nai_data_digits <= RCMETER_MAX_NAI), "NAI out of range" );
  FC_ASSERT( nai_check_digit == damm_checksum_8digit(nai_data_digits), "Invalid check digit" );

  switch( nai_data_digits )
  {
    case RCMETER_NAI_STEEM:
      FC_ASSERT( decimal_places == RCMETER_PRECISION_STEEM );
      return RCMETER_ASSET_NUM_STEEM;
    case RCMETER_NAI_SBD:
      FC_ASSERT( decimal_places == RCMETER_PRECISION_SBD );
      return RCMETER_ASSET_NUM_SBD;
    case RCMETER_NAI_VESTS:
      FC_ASSERT( decimal_places == RCMETER_PRECISION_VESTS );
      return RCMETER_ASSET_NUM_VESTS;
    default:
      FC_ASSERT( decimal_places <= RCMETER_ASSET_MAX_DECIMALS, "Invalid decimal_places" );
      return (nai_data_digits << RCMETER_NAI_SHIFT) | RCMETER_ASSET_NUM_CONTROL_MASK | decimal_places;
  }
}

uint32_t asset_symbol_type::to_nai()const
{
  uint32_t nai_data_digits = 0;

  switch( asset_num )
  {
    case RCMETER_ASSET_NUM_STEEM:
      nai_data_digits = RCMETER_NAI_STEEM;
      break;
    case RCMETER_ASSET_NUM_SBD:
      nai_data_digits = RCMETER_NAI_SBD;
      break;
    case RCMETER_ASSET_NUM_VESTS:
      nai_data_digits = RCMETER_NAI_VESTS;
      break;
    default:
      FC_ASSERT( space() == smt_nai_space );
      nai_data_digits = (asset_num >> RCMETER_NAI_SHIFT);
  }

  uint32_t nai_check_digit = damm_checksum_8digit(nai_data_digits);
  return nai_data_digits * 10 + nai_check_digit;
}

bool asset_symbol_type::is_vesting()const
{
  if( space() == legacy_space )
    return asset_num == RCMETER_ASSET_NUM_VESTS;
  return ( asset_num & RCMETER_ASSET_NUM_VESTING_MASK ) != 0;
}

asset_symbol_type::asset_symbol_space asset_symbol_type::space()const
{
  switch( asset_num )
  {
    case RCMETER_ASSET_NUM_STEEM:
    case RCMETER_ASSET_NUM_SBD:
    case RCMETER_ASSET_NUM_VESTS:
      return legacy_space;
    default:
      return smt_nai_space;
  }
}

void asset::validate()const
{
  FC_ASSERT( amount >= 0, "Asset amount cannot be negative" );
  FC_ASSERT( symbol.decimals() <= RCMETER_ASSET_MAX_DECIMALS );
}

void price::validate()const
{ try {
  FC_ASSERT( base.amount > share_type(0) );
  FC_ASSERT( quote.amount > share_type(0) );
  FC_ASSERT( base.symbol != quote.symbol );
} FC_CAPTURE_AND_RETHROW( (base)(quote) ) }

} } // rcmeter::protocol

namespace fc {

  void to_variant( const rcmeter::protocol::asset& var, fc::variant& vo )
  {
    try
    {
      variant v = mutable_variant_object( ASSET_AMOUNT_KEY, boost::lexical_cast< std::string >( var.amount.value ) )
                              ( ASSET_PRECISION_KEY, uint64_t( var.symbol.decimals() ) )
                              ( ASSET_NAI_KEY, var.symbol.to_nai_string() );
      vo = v;
    } FC_CAPTURE_AND_RETHROW()
  }

  void from_variant( const fc::variant& var, rcmeter::protocol::asset& vo )
  {
    try
    {
      FC_ASSERT( var.is_object(), "Asset has to be treated as object." );

      const auto& v_object = var.get_object();

      FC_ASSERT( v_object.contains( ASSET_AMOUNT_KEY ), "Amount field doesn't exist." );
      FC_ASSERT( v_object[ ASSET_AMOUNT_KEY ].is_string(), "Expected a string type for value '${key}'.", ("key", ASSET_AMOUNT_KEY) );
      vo.amount = boost::lexical_cast< int64_t >( v_object[ ASSET_AMOUNT_KEY ].as_string() );
      FC_ASSERT( vo.amount >= 0, "Asset amount cannot be negative" );

      FC_ASSERT( v_object.contains( ASSET_PRECISION_KEY ), "Precision field doesn't exist." );
      FC_ASSERT( v_object[ ASSET_PRECISION_KEY ].is_uint64(), "Expected an unsigned integer type for value '${key}'.", ("key", ASSET_PRECISION_KEY) );
      FC_ASSERT( v_object[ ASSET_PRECISION_KEY ].as_uint64() <= RCMETER_ASSET_MAX_DECIMALS, "Invalid decimal_places" );

      FC_ASSERT( v_object.contains( ASSET_NAI_KEY ), "NAI field doesn't exist." );
      FC_ASSERT( v_object[ ASSET_NAI_KEY ].is_string(), "Expected a string type for value '${key}'.", ("key", ASSET_NAI_KEY) );

      vo.symbol = rcmeter::protocol::asset_symbol_type::from_nai_string( v_object[ ASSET_NAI_KEY ].as_string(),
        static_cast< uint8_t >( v_object[ ASSET_PRECISION_KEY ].as_uint64() ) );
    } FC_CAPTURE_AND_RETHROW( (var) )
  }

} // fc
