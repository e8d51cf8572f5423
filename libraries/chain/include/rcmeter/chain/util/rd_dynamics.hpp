#pragma once

#include <rcmeter/protocol/types.hpp>

#include <fc/reflect/reflect.hpp>

#include <cstdint>

// Resource dynamics: a pool is filled by a constant budget every time unit, drained by usage
// and decays by a fixed fraction of its content. This header includes RESOURCES functionality only,
// no RC (price / price curve).

namespace rcmeter { namespace chain { namespace util {

using rcmeter::protocol::wide_int;

struct rd_decay_params
{
  wide_int        decay_per_time_unit = 0;
  uint8_t         decay_per_time_unit_denom_shift = 0;
};

struct rd_dynamics_params
{
  uint64_t        resource_unit = 0;
  wide_int        budget_per_time_unit = 0;
  wide_int        pool_eq = 0;
  wide_int        max_pool_size = 0;

  rd_decay_params decay_params;
  wide_int        min_decay = 0;
};

/**
  * Amount the pool loses to decay over dt time units, never more than the pool holds.
  * A negative pool decays towards zero, result is then negative.
  */
wide_int rd_compute_pool_decay(
  const rd_decay_params& decay_params,
  const wide_int& current_pool,
  uint32_t dt
  );

} } } // rcmeter::chain::util

FC_REFLECT( rcmeter::chain::util::rd_decay_params,
  (decay_per_time_unit)
  (decay_per_time_unit_denom_shift)
  )

FC_REFLECT( rcmeter::chain::util::rd_dynamics_params,
  (resource_unit)
  (budget_per_time_unit)
  (pool_eq)
  (max_pool_size)
  (decay_params)
  (min_decay)
  )
