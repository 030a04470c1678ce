#include "common/errors.h"

#include "platform.h"
#include "proto.h"

using namespace aclgen;

namespace
{

inline void require(const nlohmann::json& json, const char* name)
{
	if (!exist(json, name))
	{
		throw error_result_t(eResult::missingRequiredOption, std::string(name) + " not set");
	}
}

}

const std::set<std::string>& aclgen::required_keywords()
{
	static const std::set<std::string> keywords = {
	        "action",
	        "comment",
	        "destination_address",
	        "destination_address_exclude",
	        "destination_port",
	        "icmp_type",
	        "name", ///< term attribute, not a keyword
	        "option",
	        "protocol",
	        "platform",
	        "platform_exclude",
	        "source_address",
	        "source_address_exclude",
	        "source_port",
	        "translated", ///< term attribute, not a keyword
	        "verbatim",
	};

	return keywords;
}

platform_t::platform_t() :
        default_protocol(ACLGEN_DEFAULT_PROTOCOL),
        supported_af({"inet", "inet6"}),
        required(required_keywords()),
        term_max_length(ACLGEN_TERM_MAX_LENGTH_DEFAULT),
        all_protocols_stateful(false)
{
}

platform_t::platform_t(const std::string& name) :
        platform_t()
{
	this->name = name;
}

std::set<std::string> platform_t::valid_keywords() const
{
	std::set<std::string> keywords = required;
	keywords.insert(optional.begin(), optional.end());
	return keywords;
}

platform_t aclgen::load_platform(const nlohmann::json& json)
{
	require(json, "platform");

	platform_t platform;

	try
	{
		platform.name = json["platform"].get<std::string>();

		if (exist(json, "default_protocol"))
		{
			platform.default_protocol = json["default_protocol"].get<std::string>();
		}

		if (exist(json, "supported_af"))
		{
			platform.supported_af.clear();
			for (const std::string family : json["supported_af"])
			{
				if (!af::number(family))
				{
					throw error_result_t(eResult::invalidConfigurationFile, "unknown address family in supported_af: " + family);
				}

				platform.supported_af.emplace(family);
			}
		}

		if (exist(json, "filter_blacklist"))
		{
			for (const auto& item : json["filter_blacklist"].items())
			{
				if (!af::number(item.key()))
				{
					throw error_result_t(eResult::invalidConfigurationFile, "unknown address family in filter_blacklist: " + item.key());
				}

				auto& protocols = platform.filter_blacklist[item.key()];
				for (const std::string protocol : item.value())
				{
					protocols.emplace(protocol);
				}
			}
		}

		if (exist(json, "required_keywords"))
		{
			platform.required.clear();
			for (const std::string keyword : json["required_keywords"])
			{
				platform.required.emplace(keyword);
			}
		}

		if (exist(json, "optional_keywords"))
		{
			for (const std::string keyword : json["optional_keywords"])
			{
				platform.optional.emplace(keyword);
			}
		}

		if (exist(json, "term_max_length"))
		{
			platform.term_max_length = json["term_max_length"].get<std::size_t>();
			if (platform.term_max_length == 0)
			{
				throw error_result_t(eResult::invalidConfigurationFile, "term_max_length must be positive");
			}
		}

		if (exist(json, "all_protocols_stateful"))
		{
			platform.all_protocols_stateful = json["all_protocols_stateful"].get<bool>();
		}
	}
	catch (const nlohmann::json::exception& exception)
	{
		throw error_result_t(eResult::invalidConfigurationFile, "platform " + platform.name + ": " + exception.what());
	}

	ACLGEN_LOG_DEBUG("platform %s loaded: %lu optional keywords, term_max_length %lu\n",
	                 platform.name.data(),
	                 platform.optional.size(),
	                 platform.term_max_length);

	return platform;
}
