#include "common/errors.h"

#include "policy.h"

using namespace aclgen;

const std::map<tAddressFamily, icmp::types_t>& icmp::types()
{
	static const std::map<tAddressFamily, types_t> types = {
	        {ACLGEN_AF_INET,
	         {{"echo-reply", 0},
	          {"unreachable", 3},
	          {"source-quench", 4},
	          {"redirect", 5},
	          {"alternate-address", 6},
	          {"echo-request", 8},
	          {"router-advertisement", 9},
	          {"router-solicitation", 10},
	          {"time-exceeded", 11},
	          {"parameter-problem", 12},
	          {"timestamp-request", 13},
	          {"timestamp-reply", 14},
	          {"information-request", 15},
	          {"information-reply", 16},
	          {"mask-request", 17},
	          {"mask-reply", 18},
	          {"conversion-error", 31},
	          {"mobile-redirect", 32}}},
	        {ACLGEN_AF_INET6,
	         {{"destination-unreachable", 1},
	          {"packet-too-big", 2},
	          {"time-exceeded", 3},
	          {"parameter-problem", 4},
	          {"echo-request", 128},
	          {"echo-reply", 129},
	          {"multicast-listener-query", 130},
	          {"multicast-listener-report", 131},
	          {"multicast-listener-done", 132},
	          {"router-solicit", 133},
	          {"router-advertisement", 134},
	          {"neighbor-solicit", 135},
	          {"neighbor-advertisement", 136},
	          {"redirect-message", 137},
	          {"router-renumbering", 138},
	          {"icmp-node-information-query", 139},
	          {"icmp-node-information-response", 140},
	          {"inverse-neighbor-discovery-solicitation", 141},
	          {"inverse-neighbor-discovery-advertisement", 142},
	          {"version-2-multicast-listener-report", 143},
	          {"home-agent-address-discovery-request", 144},
	          {"home-agent-address-discovery-reply", 145},
	          {"mobile-prefix-solicitation", 146},
	          {"mobile-prefix-advertisement", 147},
	          {"certification-path-solicitation", 148},
	          {"certification-path-advertisement", 149},
	          {"multicast-router-advertisement", 151},
	          {"multicast-router-solicitation", 152},
	          {"multicast-router-termination", 153}}},
	};

	return types;
}

std::vector<std::string> term_t::populated_keywords() const
{
	std::vector<std::string> keywords;

	const auto check = [&keywords](const char* keyword, bool populated) {
		if (populated)
		{
			keywords.emplace_back(keyword);
		}
	};

	check("name", !name.empty());
	check("action", !action.empty());
	check("comment", !comment.empty());
	check("protocol", !protocol.empty());
	check("protocol_except", !protocol_except.empty());
	check("option", !option.empty());
	check("source_address", !source_address.empty());
	check("source_address_exclude", !source_address_exclude.empty());
	check("destination_address", !destination_address.empty());
	check("destination_address_exclude", !destination_address_exclude.empty());
	check("source_port", !source_port.empty());
	check("destination_port", !destination_port.empty());
	check("icmp_type", !icmp_type.empty());
	check("platform", !platform.empty());
	check("platform_exclude", !platform_exclude.empty());
	check("counter", !counter.empty());
	check("logging", !logging.empty());
	check("policer", !policer.empty());
	check("traffic_class", !traffic_class.empty());
	check("verbatim", !verbatim.empty());
	check("translated", translated);
	check("flattened", flattened);
	check("flattened_addr", flattened_addr);
	check("flattened_saddr", flattened_saddr);
	check("flattened_daddr", flattened_daddr);

	for (const auto& [keyword, value] : attributes)
	{
		check(keyword.data(), !value.empty());
	}

	return keywords;
}

bool term_t::active_on(const std::string& target) const
{
	if (!platform.empty() &&
	    !exist(platform, target))
	{
		return false;
	}

	if (!platform_exclude.empty() &&
	    exist(platform_exclude, target))
	{
		return false;
	}

	return true;
}

namespace
{

template<typename type_T>
void get_optional(const nlohmann::json& json, const char* key, type_T& value)
{
	if (exist(json, key))
	{
		json.at(key).get_to(value);
	}
}

tPort parse_port_number(const nlohmann::json& json)
{
	if (!json.is_number_unsigned() ||
	    json.get<uint64_t>() > ACLGEN_PORT_MAX)
	{
		throw error_result_t(eResult::invalidJson, "invalid port: " + json.dump());
	}

	return json.get<tPort>();
}

common::range_t parse_port(const nlohmann::json& json)
{
	if (json.is_number())
	{
		return common::range_t(parse_port_number(json));
	}
	else if (json.is_string())
	{
		try
		{
			return common::range_t(json.get<std::string>());
		}
		catch (const std::logic_error&)
		{
			throw error_result_t(eResult::invalidJson, "invalid port: " + json.get<std::string>());
		}
	}
	else if (json.is_array() && json.size() == 2)
	{
		const common::range_t range(parse_port_number(json[0]), parse_port_number(json[1]));
		if (range.from() > range.to())
		{
			throw error_result_t(eResult::invalidJson, "inverted port range: " + json.dump());
		}
		return range;
	}

	throw error_result_t(eResult::invalidJson, "invalid port: " + json.dump());
}

bool is_set(const nlohmann::json& json)
{
	if (json.is_boolean())
	{
		return json.get<bool>();
	}
	else if (json.is_number())
	{
		return json.get<double>() != 0;
	}
	else if (json.is_string())
	{
		return !json.get_ref<const std::string&>().empty();
	}

	return !json.empty();
}

void get_ports(const nlohmann::json& json, const char* key, common::ranges_t& ports)
{
	if (!exist(json, key))
	{
		return;
	}

	for (const auto& portJson : json.at(key))
	{
		ports.emplace_back(parse_port(portJson));
	}
}

}

void aclgen::from_json(const nlohmann::json& json, term_t& term)
{
	static const std::set<std::string> fields = {
	        "name",
	        "action",
	        "comment",
	        "protocol",
	        "protocol_except",
	        "option",
	        "source_address",
	        "source_address_exclude",
	        "destination_address",
	        "destination_address_exclude",
	        "source_port",
	        "destination_port",
	        "icmp_type",
	        "platform",
	        "platform_exclude",
	        "counter",
	        "logging",
	        "policer",
	        "traffic_class",
	        "verbatim",
	        "translated"};

	json.at("name").get_to(term.name);
	get_optional(json, "action", term.action);
	get_optional(json, "comment", term.comment);
	get_optional(json, "protocol", term.protocol);
	get_optional(json, "protocol_except", term.protocol_except);
	get_optional(json, "option", term.option);
	get_optional(json, "source_address", term.source_address);
	get_optional(json, "source_address_exclude", term.source_address_exclude);
	get_optional(json, "destination_address", term.destination_address);
	get_optional(json, "destination_address_exclude", term.destination_address_exclude);
	get_ports(json, "source_port", term.source_port);
	get_ports(json, "destination_port", term.destination_port);
	get_optional(json, "icmp_type", term.icmp_type);
	get_optional(json, "platform", term.platform);
	get_optional(json, "platform_exclude", term.platform_exclude);
	get_optional(json, "counter", term.counter);
	get_optional(json, "logging", term.logging);
	get_optional(json, "policer", term.policer);
	get_optional(json, "traffic_class", term.traffic_class);
	get_optional(json, "verbatim", term.verbatim);
	get_optional(json, "translated", term.translated);

	// anything else is kept as a free-form attribute
	for (const auto& item : json.items())
	{
		if (exist(fields, item.key()))
		{
			continue;
		}

		// false, 0, null and empty containers count as not set
		if (!is_set(item.value()))
		{
			term.attributes[item.key()] = "";
		}
		else
		{
			term.attributes[item.key()] = item.value().is_string() ? item.value().get<std::string>() : item.value().dump();
		}
	}
}

void aclgen::from_json(const nlohmann::json& json, header_t& header)
{
	for (const auto& item : json.at("targets").items())
	{
		auto& options = header.targets[item.key()];
		if (!item.value().is_null())
		{
			item.value().get_to(options);
		}
	}

	get_optional(json, "comment", header.comment);
}

void aclgen::from_json(const nlohmann::json& json, filter_t& filter)
{
	json.at("header").get_to(filter.header);
	get_optional(json, "terms", filter.terms);
}

policy_t aclgen::load_policy(const nlohmann::json& json)
{
	policy_t policy;

	try
	{
		json.at("filters").get_to(policy.filters);
	}
	catch (const nlohmann::json::exception& exception)
	{
		throw error_result_t(eResult::invalidJson, std::string("invalid policy: ") + exception.what());
	}

	return policy;
}
