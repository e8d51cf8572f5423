#pragma once

#include <rcmeter/protocol/types.hpp>
#include <rcmeter/protocol/authority.hpp>

#include <fc/time.hpp>

namespace rcmeter { namespace protocol {

  struct base_operation
  {
    void get_required_authorities( vector<authority>& )const {}
    void get_required_active_authorities( flat_set<account_name_type>& )const {}
    void get_required_posting_authorities( flat_set<account_name_type>& )const {}
    void get_required_owner_authorities( flat_set<account_name_type>& )const {}

    bool is_virtual()const { return false; }
    void validate()const {}
  };

  struct virtual_operation : public base_operation
  {
    bool is_virtual()const { return true; }
    void validate()const { FC_ASSERT( false, "This is a virtual operation" ); }
  };

  typedef static_variant<
    void_t
    >                                future_extensions;

  /// extensions are reserved, a non empty list is rejected on decoding
  typedef vector<future_extensions> extensions_type;

} } // rcmeter::protocol
