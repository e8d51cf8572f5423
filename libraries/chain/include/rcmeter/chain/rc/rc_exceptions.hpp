#pragma once

#include <rcmeter/protocol/exceptions.hpp>

namespace rcmeter { namespace chain {

  FC_DECLARE_DERIVED_EXCEPTION( degenerate_curve_exception,   rcmeter::protocol::rc_exception, 5040000, "price curve denominator is not positive" )
  FC_DECLARE_DERIVED_EXCEPTION( invalid_rc_config_exception,  rcmeter::protocol::rc_exception, 5050000, "invalid resource credit configuration" )

} } // rcmeter::chain
