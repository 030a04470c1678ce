#pragma once

#include <optional>
#include <set>
#include <string>

#include "platform.h"
#include "policy.h"

namespace aclgen
{

/// declared protocols of term, or the platform default protocol
std::set<std::string> effective_protocols(const platform_t& platform,
                                          const term_t& term);

/**
 * @brief Add high destination ports to terms with the established option.
 *
 * Stateless targets need an explicit 1024-65535 destination range to match
 * return traffic of TCP/UDP connections. The term itself is never modified.
 *
 * @return fixed copy of term, or std::nullopt when term should be rendered as is
 *
 * @throws error_result_t(unsupportedAddressFamily) af not supported by platform
 * @throws error_result_t(unsupportedFilter) protocol blacklisted for af
 * @throws error_result_t(establishedOption) established with non TCP/UDP protocols
 */
std::optional<term_t> fix_high_ports(const platform_t& platform,
                                     const term_t& term,
                                     const std::string& af = "inet",
                                     bool all_protocols_stateful = false);

}
