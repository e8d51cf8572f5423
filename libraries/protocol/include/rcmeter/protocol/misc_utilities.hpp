#pragma once

#include <string>

namespace rcmeter { namespace protocol {

/// Strips the namespace from a reflected type name, `rcmeter::protocol::vote_operation` becomes `vote_operation`.
std::string trim_typename_namespace( const std::string& name );

} } // rcmeter::protocol
