#pragma once

#include <fc/container/flat.hpp>
#include <fc/crypto/ripemd160.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/static_variant.hpp>
#include <fc/time.hpp>
#include <fc/variant.hpp>
#include <fc/reflect/reflect.hpp>

#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>
#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace rcmeter { namespace protocol {

  using boost::container::flat_map;
  using boost::container::flat_set;
  using fc::static_variant;
  using fc::time_point_sec;
  using fc::variant;
  using fc::variant_object;
  using std::map;
  using std::pair;
  using std::string;
  using std::vector;

  /// arbitrary precision integer used by the price curve and pool dynamics
  typedef boost::multiprecision::cpp_int   wide_int;

  typedef fc::safe< int64_t >              share_type;
  typedef uint16_t                         weight_type;
  typedef uint16_t                         authority_weight_type;

  typedef string                           account_name_type;
  /// base58 encoded key including the address prefix
  typedef string                           public_key_type;
  /// hex encoded compact signature
  typedef string                           signature_type;

  typedef fc::ripemd160                    block_id_type;
  typedef fc::ripemd160                    checksum_type;
  typedef fc::ripemd160                    transaction_id_type;
  typedef fc::sha256                       digest_type;

  struct void_t {};

  bool is_valid_public_key( const public_key_type& key );

} } // rcmeter::protocol

namespace fc {

  void to_variant( const rcmeter::protocol::wide_int& var, fc::variant& vo );
  void from_variant( const fc::variant& var, rcmeter::protocol::wide_int& vo );

} // fc

FC_REFLECT( rcmeter::protocol::void_t, )
