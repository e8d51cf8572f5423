#include <rcmeter/chain/util/rd_dynamics.hpp>

namespace rcmeter { namespace chain { namespace util {

wide_int rd_compute_pool_decay(
  const rd_decay_params& decay_params,
  const wide_int& current_pool,
  uint32_t dt
  )
{
  if( current_pool < 0 )
    return -rd_compute_pool_decay( decay_params, -current_pool, dt );

  wide_int decay_amount = decay_params.decay_per_time_unit * dt;
  decay_amount *= current_pool;
  decay_amount >>= decay_params.decay_per_time_unit_denom_shift;
  return ( decay_amount < current_pool ) ? decay_amount : current_pool;
}

} } } // rcmeter::chain::util
