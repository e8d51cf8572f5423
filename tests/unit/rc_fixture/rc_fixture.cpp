#include "rc_fixture.hpp"

#include <rcmeter/protocol/operation_decoder.hpp>

#include <fc/io/json.hpp>
#include <fc/variant_object.hpp>

namespace rcmeter { namespace chain {

rc_fixture::rc_fixture()
{ try {
  params = std::make_shared< const rc_resource_param_set >( load_resource_params( data_file( "resource_params.json" ) ) );
  pool = load_resource_pool( data_file( "resource_pool.json" ) );
  rc_regen = compute_rc_regen( wide_int( RCMETER_SAMPLE_TOTAL_VESTING_SHARES ) );

  fc::variant doc = fc::json::from_file( data_file( "transactions.json" ) );
  for( const auto& entry : doc.get_object() )
  {
    example_transaction example;
    rcmeter::protocol::decode_transaction( entry.value()[ "tx" ], example.tx );
    example.tx_size = entry.value()[ "tx_size" ].as_uint64();
    examples.emplace( entry.key(), std::move( example ) );
  }
} FC_LOG_AND_RETHROW() }

fc::path rc_fixture::data_file( const std::string& name )
{
  return fc::path( RCMETER_TEST_DATA_DIR ) / name;
}

rc_model rc_fixture::make_model()const
{
  return rc_model( params, pool, rc_regen );
}

const example_transaction& rc_fixture::get_example( const std::string& name )const
{
  auto itr = examples.find( name );
  FC_ASSERT( itr != examples.end(), "Missing example transaction ${n}", ("n", name) );
  return itr->second;
}

} } // rcmeter::chain
