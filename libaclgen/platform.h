#pragma once

#include <map>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include "common/type.h"

namespace aclgen
{

/// keywords every platform must accept
const std::set<std::string>& required_keywords();

/// capabilities of one target platform
class platform_t
{
public:
	platform_t();
	explicit platform_t(const std::string& name);

	/// required_keywords plus optional_keywords
	std::set<std::string> valid_keywords() const;

	bool supports_af(const std::string& af) const
	{
		return exist(supported_af, af);
	}

public:
	std::string name;

	/// used when a term declares no protocol
	std::string default_protocol;

	std::set<std::string> supported_af;

	/// protocols the platform can not express, per address family
	std::map<std::string, std::set<std::string>> filter_blacklist;

	std::set<std::string> required;
	std::set<std::string> optional;

	std::size_t term_max_length;

	/// established is expressed by the platform itself for any protocol
	bool all_protocols_stateful;
};

/// throws error_result_t on missing or malformed options
platform_t load_platform(const nlohmann::json& json);

}
