#pragma once

#include <rcmeter/protocol/types.hpp>

#include <rcmeter/chain/util/rd_dynamics.hpp>

#include <fc/reflect/reflect.hpp>

namespace rcmeter { namespace chain {

using rcmeter::protocol::wide_int;

/**
  * Price curve p(x) = A / (B + x) of a resource, with A = rc_regen * coeff_a >> shift.
  * x is the current pool, negative pools are priced like an empty one.
  */
struct rc_price_curve_params
{
  wide_int        coeff_a = 0;
  wide_int        coeff_b = 0;
  uint8_t         shift = 0;
};

struct rc_resource_params
{
  util::rd_dynamics_params resource_dynamics_params;
  rc_price_curve_params    price_curve_params;
};

class resource_credits
{
  public:
    // calculates cost of resource given curve params, current pool level, how much was used and regen rate
    static wide_int compute_cost(
      const rc_price_curve_params& curve_params,
      const wide_int& current_pool,
      const wide_int& resource_count,
      const wide_int& rc_regen );
};

} } // rcmeter::chain

FC_REFLECT( rcmeter::chain::rc_price_curve_params, (coeff_a)(coeff_b)(shift) )
FC_REFLECT( rcmeter::chain::rc_resource_params, (resource_dynamics_params)(price_curve_params) )
