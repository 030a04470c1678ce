#include <set>

#include "common/errors.h"

#include "generator.h"
#include "keywords.h"
#include "ports.h"
#include "term_name.h"

common::log::LogPriority common::log::logPriority = common::log::TLOG_INFO;

using namespace aclgen;

namespace
{

template<typename function_T>
auto log_errors(const function_T& function) -> decltype(function())
{
	try
	{
		return function();
	}
	catch (const error_result_t& error)
	{
		ACLGEN_LOG_ERROR("%s: %s\n", common::result_to_c_str(error.result()), error.what());
		throw;
	}
}

}

void aclgen::check_duplicate_term_names(const filter_t& filter)
{
	std::set<std::string> names;
	for (const auto& term : filter.terms)
	{
		if (!names.emplace(term.name).second)
		{
			throw error_result_t(eResult::duplicateTermName,
			                     "multiple definitions of term " + term.name,
			                     term.name,
			                     {},
			                     {term.name});
		}
	}
}

void aclgen::log_no_address_family(const term_t& term,
                                   const std::string& direction,
                                   const std::string& af)
{
	ACLGEN_LOG_WARNING("term %s will not be rendered, as it has %s address match specified but no %s addresses of %s address family are present\n",
	                   term.name.data(),
	                   direction.data(),
	                   direction.data(),
	                   af.data());
}

generator_t::generator_t(const platform_t& platform,
                         const policy_t& policy) :
        platformConfig(platform),
        policy(policy)
{
	ACLGEN_LOG_DEBUG("validate keywords for platform %s\n", platformConfig.name.data());

	log_errors([this]() {
		validate_keywords(platformConfig, this->policy);
	});
}

std::vector<std::reference_wrapper<const filter_t>> generator_t::filters() const
{
	std::vector<std::reference_wrapper<const filter_t>> result;
	for (const auto& filter : policy.filters)
	{
		if (filter.header.has_platform(platformConfig.name))
		{
			result.emplace_back(filter);
		}
	}

	return result;
}

std::vector<std::reference_wrapper<const filter_t>> generator_t::require_filters() const
{
	auto result = filters();
	if (result.empty())
	{
		ACLGEN_LOG_ERROR("policy has no filters for platform %s\n", platformConfig.name.data());
		throw error_result_t(eResult::noPlatformPolicy,
		                     "policy does not contain filters for platform " + platformConfig.name,
		                     {},
		                     platformConfig.name);
	}

	return result;
}

tAddressFamily generator_t::normalize_address_family(const af_arg_t& af,
                                                     const term_t& term) const
{
	return log_errors([&]() {
		return aclgen::normalize_address_family(af, term.name, platformConfig.name);
	});
}

tAddressFamily generator_t::normalize_address_family(int af,
                                                     const term_t& term) const
{
	return log_errors([&]() {
		return aclgen::normalize_address_family(af, term.name, platformConfig.name);
	});
}

icmp_codes_t generator_t::normalize_icmp_types(const term_t& term,
                                               const af_arg_t& af) const
{
	return log_errors([&]() {
		return aclgen::normalize_icmp_types(term.icmp_type, term.protocol, af, term.name, platformConfig.name);
	});
}

std::optional<term_t> generator_t::fix_high_ports(const term_t& term,
                                                  const std::string& af) const
{
	return fix_high_ports(term, af, platformConfig.all_protocols_stateful);
}

std::optional<term_t> generator_t::fix_high_ports(const term_t& term,
                                                  const std::string& af,
                                                  bool all_protocols_stateful) const
{
	return log_errors([&]() {
		auto fixed = aclgen::fix_high_ports(platformConfig, term, af, all_protocols_stateful);
		if (fixed)
		{
			ACLGEN_LOG_DEBUG("term %s: high ports added for established option\n", term.name.data());
		}
		return fixed;
	});
}

std::string generator_t::fix_term_length(const std::string& term_name,
                                         bool abbreviate,
                                         bool truncate) const
{
	return log_errors([&]() {
		return aclgen::fix_term_length(term_name, platformConfig.term_max_length, abbreviate, truncate);
	});
}
