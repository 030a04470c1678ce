#include <array>
#include <string_view>
#include <utility>

#include "proto.h"

using namespace aclgen;

namespace
{

constexpr std::array<std::pair<std::string_view, tProtocolNumber>, 26> protocols{{
        {"ip", 0},
        {"icmp", 1},
        {"igmp", 2},
        {"ggp", 3},
        {"ipencap", 4},
        {"tcp", 6},
        {"egp", 8},
        {"igp", 9},
        {"udp", 17},
        {"rdp", 27},
        {"ipv6", 41},
        {"ipv6-route", 43},
        {"ipv6-frag", 44},
        {"rsvp", 46},
        {"gre", 47},
        {"esp", 50},
        {"ah", 51},
        {"icmpv6", 58},
        {"ipv6-nonxt", 59},
        {"ipv6-opts", 60},
        {"ospf", 89},
        {"ipip", 94},
        {"pim", 103},
        {"vrrp", 112},
        {"l2tp", 115},
        {"sctp", 132},
}};

// "bridge" is listed last, so the reverse lookup for 4 yields "inet"
constexpr std::array<std::pair<std::string_view, tAddressFamily>, 3> address_families{{
        {"inet", ACLGEN_AF_INET},
        {"inet6", ACLGEN_AF_INET6},
        {"bridge", ACLGEN_AF_INET},
}};

}

std::optional<tProtocolNumber> proto::number(const std::string& name)
{
	for (const auto& [protocol_name, protocol_number] : protocols)
	{
		if (protocol_name == name)
		{
			return protocol_number;
		}
	}

	return std::nullopt;
}

std::optional<std::string> proto::name(tProtocolNumber number)
{
	for (const auto& [protocol_name, protocol_number] : protocols)
	{
		if (protocol_number == number)
		{
			return std::string(protocol_name);
		}
	}

	return std::nullopt;
}

std::optional<tAddressFamily> af::number(const std::string& name)
{
	for (const auto& [af_name, af_number] : address_families)
	{
		if (af_name == name)
		{
			return af_number;
		}
	}

	return std::nullopt;
}

std::optional<std::string> af::name(tAddressFamily number)
{
	for (const auto& [af_name, af_number] : address_families)
	{
		if (af_number == number)
		{
			return std::string(af_name);
		}
	}

	return std::nullopt;
}

bool af::is_known(tAddressFamily number)
{
	return number == ACLGEN_AF_INET ||
	       number == ACLGEN_AF_INET6;
}

std::string af::to_string(const af_arg_t& af)
{
	if (std::holds_alternative<tAddressFamily>(af))
	{
		return std::to_string(std::get<tAddressFamily>(af));
	}

	return std::get<std::string>(af);
}
