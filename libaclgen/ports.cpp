#include "common/errors.h"

#include "ports.h"

using namespace aclgen;

std::set<std::string> aclgen::effective_protocols(const platform_t& platform,
                                                  const term_t& term)
{
	if (term.protocol.empty())
	{
		return {platform.default_protocol};
	}

	return {term.protocol.begin(), term.protocol.end()};
}

std::optional<term_t> aclgen::fix_high_ports(const platform_t& platform,
                                             const term_t& term,
                                             const std::string& af,
                                             bool all_protocols_stateful)
{
	const auto protocols = effective_protocols(platform, term);

	if (!platform.supports_af(af))
	{
		throw error_result_t(eResult::unsupportedAddressFamily,
		                     "address family " + af + ", found in " + term.name + ", unsupported by " + platform.name,
		                     term.name,
		                     platform.name,
		                     {af});
	}

	auto it = platform.filter_blacklist.find(af);
	if (it != platform.filter_blacklist.end())
	{
		std::vector<std::string> unsupported;
		for (const auto& protocol : protocols)
		{
			if (exist(it->second, protocol))
			{
				unsupported.emplace_back(protocol);
			}
		}

		if (!unsupported.empty())
		{
			throw error_result_t(eResult::unsupportedFilter,
			                     platform.name + " targets do not support protocol(s) " + join(unsupported) + " with address family " + af + " (in " + term.name + ")",
			                     term.name,
			                     platform.name,
			                     unsupported);
		}
	}

	for (const auto& option : term.option)
	{
		if (!starts_with(option, ACLGEN_ESTABLISHED_OPTION))
		{
			continue;
		}

		std::vector<std::string> stateless;
		for (const auto& protocol : protocols)
		{
			if (protocol != "tcp" && protocol != "udp")
			{
				stateless.emplace_back(protocol);
			}
		}

		if (stateless.empty())
		{
			term_t fixed = term;
			fixed.destination_port.emplace_back(ACLGEN_HIGH_PORT_FROM, ACLGEN_PORT_MAX);
			fixed.destination_port = common::collapse(fixed.destination_port);
			return fixed;
		}
		else if (!all_protocols_stateful)
		{
			throw error_result_t(eResult::establishedOption,
			                     "established option supplied with inappropriate protocol(s) " + join(stateless) + " in term " + term.name,
			                     term.name,
			                     platform.name,
			                     stateless);
		}

		break;
	}

	return std::nullopt;
}
