#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/type.h"

namespace aclgen
{

namespace icmp
{

using types_t = std::map<std::string, tIcmpCode>;

/// ICMP type name -> code, keyed by numeric address family
const std::map<tAddressFamily, types_t>& types();

}

struct term_t
{
	std::string name;
	std::vector<std::string> action;
	std::vector<std::string> comment;
	std::vector<std::string> protocol;
	std::vector<std::string> protocol_except;
	std::vector<std::string> option;

	std::vector<std::string> source_address;
	std::vector<std::string> source_address_exclude;
	std::vector<std::string> destination_address;
	std::vector<std::string> destination_address_exclude;
	common::ranges_t source_port;
	common::ranges_t destination_port;

	std::vector<std::string> icmp_type;
	std::vector<std::string> platform;
	std::vector<std::string> platform_exclude;

	std::string counter;
	std::vector<std::string> logging;
	std::string policer;
	std::string traffic_class;
	std::vector<std::string> verbatim;
	bool translated = false;

	// set when address lists were expanded by the policy flattener
	bool flattened = false;
	bool flattened_addr = false;
	bool flattened_saddr = false;
	bool flattened_daddr = false;

	/// keywords without a dedicated field
	std::map<std::string, std::string> attributes;

	/// names of every populated field, internal ones included
	std::vector<std::string> populated_keywords() const;

	bool active_on(const std::string& target) const;
};

struct header_t
{
	/// target platforms and their filter options
	std::map<std::string, std::vector<std::string>> targets;
	std::vector<std::string> comment;

	bool has_platform(const std::string& target) const
	{
		return targets.find(target) != targets.end();
	}
};

struct filter_t
{
	header_t header;
	std::vector<term_t> terms;
};

struct policy_t
{
	std::vector<filter_t> filters;
};

void from_json(const nlohmann::json& json, term_t& term);
void from_json(const nlohmann::json& json, header_t& header);
void from_json(const nlohmann::json& json, filter_t& filter);

/// throws error_result_t(invalidJson) on malformed input
policy_t load_policy(const nlohmann::json& json);

}
