#pragma once

#include <rcmeter/protocol/config.hpp>
#include <rcmeter/protocol/types.hpp>

#include <fc/int_array.hpp>
#include <fc/reflect/reflect.hpp>

#include <array>
#include <cstddef>
#include <vector>

namespace rcmeter { namespace protocol {

struct signed_transaction;

} } // rcmeter::protocol

namespace rcmeter { namespace chain {

struct rc_size_info;

enum rc_resource_types
{
  resource_history_bytes,
  resource_new_accounts,
  resource_market_bytes,
  resource_state_bytes,
  resource_execution_time
};

} } // rcmeter::chain

FC_REFLECT_ENUM( rcmeter::chain::rc_resource_types,
  (resource_history_bytes)
  (resource_new_accounts)
  (resource_market_bytes)
  (resource_state_bytes)
  (resource_execution_time)
)

namespace rcmeter { namespace chain {

using rcmeter::protocol::wide_int;

constexpr size_t RCMETER_RC_NUM_RESOURCE_TYPES = fc::reflector< rc_resource_types >::total_member_count;
static_assert( RCMETER_RC_NUM_RESOURCE_TYPES == RCMETER_NUM_RESOURCE_TYPES, "resource list out of sync with config" );

typedef fc::int_array< int64_t, RCMETER_RC_NUM_RESOURCE_TYPES > resource_count_type;
typedef std::array< wide_int, RCMETER_RC_NUM_RESOURCE_TYPES >   resource_cost_type;
typedef std::array< wide_int, RCMETER_RC_NUM_RESOURCE_TYPES >   resource_pool_type;

typedef resource_count_type count_resources_result;

/// name of the resource as used in configuration documents and reports
const char* get_resource_name( size_t resource );

// scans transaction for used resources, `size` is the serialized size of the transaction
void count_resources(
  const rcmeter::protocol::signed_transaction& tx,
  const size_t size,
  count_resources_result& result,
  const rc_size_info& size_info );

} } // rcmeter::chain

FC_REFLECT_TYPENAME( rcmeter::chain::resource_count_type )
