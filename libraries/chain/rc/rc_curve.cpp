#include <rcmeter/chain/rc/rc_curve.hpp>
#include <rcmeter/chain/rc/rc_exceptions.hpp>

namespace rcmeter { namespace chain {

wide_int resource_credits::compute_cost(
  const rc_price_curve_params& curve_params,
  const wide_int& current_pool,
  const wide_int& resource_count,
  const wide_int& rc_regen
  )
{
  FC_ASSERT( rc_regen >= 0, "Regeneration rate cannot be negative", ("rc_regen", rc_regen.str()) );

  if( resource_count <= 0 )
  {
    if( resource_count < 0 )
      return -compute_cost( curve_params, current_pool, -resource_count, rc_regen );
    return 0;
  }
  wide_int num = rc_regen;
  num *= curve_params.coeff_a;
  // shift before multiplying by resource_count, same rounding as the consensus formula
  num >>= curve_params.shift;
  // err on the side of rounding not in the user's favor
  num += 1;
  num *= resource_count;

  wide_int denom = curve_params.coeff_b;

  // Negative pool doesn't increase price beyond p_max
  //   i.e. define p(x) = p(0) for all x < 0
  if( current_pool > 0 )
    denom += current_pool;

  RCMETER_ASSERT( denom > 0, degenerate_curve_exception, "Price curve denominator ${d} is not positive",
    ("d", denom.str())("coeff_b", curve_params.coeff_b.str()) );

  wide_int num_denom = num / denom;
  // Add 1 to avoid 0 result in case of various rounding issues,
  // err on the side of rounding not in the user's favor
  return num_denom + 1;
}

} } // rcmeter::chain
