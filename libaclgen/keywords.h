#pragma once

#include "platform.h"
#include "policy.h"

namespace aclgen
{

/// populated fields of term that platform does not accept, internal fields excluded
std::vector<std::string> unsupported_keywords(const platform_t& platform,
                                              const term_t& term);

/**
 * @brief Check every term active on platform, in every filter whose header
 * targets platform.
 *
 * @throws error_result_t(unsupportedFilter) with all offending keywords of
 * the first failing term
 */
void validate_keywords(const platform_t& platform,
                       const policy_t& policy);

}
