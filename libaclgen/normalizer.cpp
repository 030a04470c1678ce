#include <algorithm>

#include "common/errors.h"

#include "normalizer.h"
#include "policy.h"

using namespace aclgen;

tAddressFamily aclgen::normalize_address_family(const af_arg_t& af,
                                                const std::string& term_name,
                                                const std::string& platform)
{
	if (std::holds_alternative<tAddressFamily>(af))
	{
		const auto number = std::get<tAddressFamily>(af);
		if (af::is_known(number))
		{
			return number;
		}
	}
	else if (const auto number = af::number(std::get<std::string>(af)))
	{
		return *number;
	}

	throw error_result_t(eResult::unsupportedAddressFamily,
	                     "address family " + af::to_string(af) + " is not supported, term " + term_name,
	                     term_name,
	                     platform,
	                     {af::to_string(af)});
}

tAddressFamily aclgen::normalize_address_family(int af,
                                                const std::string& term_name,
                                                const std::string& platform)
{
	if (af < 0 || af > UINT8_MAX)
	{
		throw error_result_t(eResult::unsupportedAddressFamily,
		                     "address family " + std::to_string(af) + " is not supported, term " + term_name,
		                     term_name,
		                     platform,
		                     {std::to_string(af)});
	}

	return normalize_address_family(af_arg_t(static_cast<tAddressFamily>(af)), term_name, platform);
}

icmp_codes_t aclgen::normalize_icmp_types(const std::vector<std::string>& icmp_types,
                                          const std::vector<std::string>& protocols,
                                          const af_arg_t& af,
                                          const std::string& term_name,
                                          const std::string& platform)
{
	if (icmp_types.empty())
	{
		return {std::nullopt};
	}

	static const std::vector<std::string> only_icmp = {"icmp"};
	static const std::vector<std::string> only_icmpv6 = {"icmpv6"};

	// only protocols icmp or icmpv6 can be used with icmp types
	if (protocols != only_icmp && protocols != only_icmpv6)
	{
		throw error_result_t(eResult::unsupportedFilter,
		                     "icmp types specified for non-icmp protocols in term " + term_name,
		                     term_name,
		                     platform,
		                     protocols);
	}

	const auto number = normalize_address_family(af, term_name, platform);

	if ((protocols == only_icmp && number != ACLGEN_AF_INET) ||
	    (protocols == only_icmpv6 && number != ACLGEN_AF_INET6))
	{
		throw error_result_t(eResult::mismatchIcmpInet,
		                     "ICMP/ICMPv6 mismatch with address family IPv4/IPv6 in term " + term_name,
		                     term_name,
		                     platform,
		                     {protocols.front(), af::to_string(af)});
	}

	const auto& types = icmp::types().at(number);

	icmp_codes_t codes;
	for (const auto& icmp_type : icmp_types)
	{
		auto it = types.find(icmp_type);
		if (it == types.end())
		{
			throw error_result_t(eResult::unknownIcmpType,
			                     "unrecognized ICMP type (" + icmp_type + ") specified in term " + term_name,
			                     term_name,
			                     platform,
			                     {icmp_type});
		}

		codes.emplace_back(it->second);
	}

	std::sort(codes.begin(), codes.end());
	return codes;
}
