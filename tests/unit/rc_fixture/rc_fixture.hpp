#pragma once

#include <rcmeter/chain/rc/rc_model.hpp>
#include <rcmeter/chain/rc/rc_params.hpp>

#include <rcmeter/protocol/transaction.hpp>

#include <fc/filesystem.hpp>

#include <map>
#include <memory>
#include <string>

#define RCMETER_REQUIRE_THROW( expr, exc_type )          \
  BOOST_REQUIRE_THROW( expr, exc_type );

#define RCMETER_CHECK_THROW( expr, exc_type )            \
  BOOST_CHECK_THROW( expr, exc_type );

// total_vesting_shares of the sample chain state the pools were taken from
#define RCMETER_SAMPLE_TOTAL_VESTING_SHARES "397114288290855167"

namespace rcmeter { namespace chain {

struct example_transaction
{
  rcmeter::protocol::signed_transaction tx;
  size_t                                tx_size = 0;
};

/**
  * Loads the sample resource parameters, pools and transactions from tests/unit/data.
  */
struct rc_fixture
{
  rc_fixture();

  static fc::path data_file( const std::string& name );

  rc_model make_model()const;
  const example_transaction& get_example( const std::string& name )const;

  std::shared_ptr< const rc_resource_param_set >  params;
  resource_pool_type                              pool;
  wide_int                                        rc_regen;
  std::map< std::string, example_transaction >    examples;
};

} } // rcmeter::chain
