#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "normalizer.h"
#include "platform.h"
#include "policy.h"

namespace aclgen
{

/// throws error_result_t(duplicateTermName) on the first repeated term name
void check_duplicate_term_names(const filter_t& filter);

/// warn that term has a direction ("source", "destination") match without af addresses
void log_no_address_family(const term_t& term,
                           const std::string& direction,
                           const std::string& af);

/**
 * Shared core of a platform renderer.
 *
 * Construction validates keywords of every term active on the platform and
 * throws on the first offending term. Renderers own a generator_t and pass
 * each term through its normalization helpers before emitting it.
 */
class generator_t
{
public:
	generator_t(const platform_t& platform, const policy_t& policy);

	const platform_t& platform() const
	{
		return platformConfig;
	}

	/// filters whose header targets the platform
	std::vector<std::reference_wrapper<const filter_t>> filters() const;

	/// same as filters(), throws error_result_t(noPlatformPolicy) if there are none
	std::vector<std::reference_wrapper<const filter_t>> require_filters() const;

	tAddressFamily normalize_address_family(const af_arg_t& af,
	                                        const term_t& term) const;
	tAddressFamily normalize_address_family(int af,
	                                        const term_t& term) const;

	icmp_codes_t normalize_icmp_types(const term_t& term,
	                                  const af_arg_t& af) const;

	/// uses platform all_protocols_stateful
	std::optional<term_t> fix_high_ports(const term_t& term,
	                                     const std::string& af = "inet") const;

	std::optional<term_t> fix_high_ports(const term_t& term,
	                                     const std::string& af,
	                                     bool all_protocols_stateful) const;

	/// fits name into platform term_max_length
	std::string fix_term_length(const std::string& term_name,
	                            bool abbreviate = false,
	                            bool truncate = false) const;

protected:
	platform_t platformConfig;
	policy_t policy;
};

}
