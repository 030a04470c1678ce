#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/type.h"

#include "proto.h"

namespace aclgen
{

/// std::nullopt matches every ICMP type
using icmp_codes_t = std::vector<std::optional<tIcmpCode>>;

/**
 * @brief Convert address family name to its numeric value.
 *
 * Numeric values 4 and 6 are returned unchanged, names are mapped
 * ("inet" -> 4, "inet6" -> 6, "bridge" -> 4).
 *
 * @throws error_result_t(unsupportedAddressFamily)
 */
tAddressFamily normalize_address_family(const af_arg_t& af,
                                        const std::string& term_name,
                                        const std::string& platform = {});

/// plain integer overload, normalize_address_family(4, ...) without a cast
tAddressFamily normalize_address_family(int af,
                                        const std::string& term_name,
                                        const std::string& platform = {});

/**
 * @brief Resolve ICMP type names of a term into sorted numeric codes.
 *
 * Empty icmp_types yields {std::nullopt}. Otherwise protocols must be exactly
 * {"icmp"} with af 4 or exactly {"icmpv6"} with af 6.
 *
 * @throws error_result_t(unsupportedFilter) icmp types with non-icmp protocols
 * @throws error_result_t(unsupportedAddressFamily)
 * @throws error_result_t(mismatchIcmpInet) icmp/icmpv6 and address family disagree
 * @throws error_result_t(unknownIcmpType)
 */
icmp_codes_t normalize_icmp_types(const std::vector<std::string>& icmp_types,
                                  const std::vector<std::string>& protocols,
                                  const af_arg_t& af,
                                  const std::string& term_name,
                                  const std::string& platform = {});

}
