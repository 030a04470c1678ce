#include "common/errors.h"

#include "keywords.h"

using namespace aclgen;

std::vector<std::string> aclgen::unsupported_keywords(const platform_t& platform,
                                                      const term_t& term)
{
	const auto valid_keywords = platform.valid_keywords();

	std::vector<std::string> result;
	for (const auto& keyword : term.populated_keywords())
	{
		if (starts_with(keyword, ACLGEN_INTERNAL_KEYWORD_PREFIX) ||
		    exist(valid_keywords, keyword))
		{
			continue;
		}

		result.emplace_back(keyword);
	}

	return result;
}

void aclgen::validate_keywords(const platform_t& platform,
                               const policy_t& policy)
{
	for (const auto& filter : policy.filters)
	{
		if (!filter.header.has_platform(platform.name))
		{
			continue;
		}

		for (const auto& term : filter.terms)
		{
			if (!term.active_on(platform.name))
			{
				ACLGEN_LOG_DEBUG("term %s is not active on %s, keywords not checked\n",
				                 term.name.data(),
				                 platform.name.data());
				continue;
			}

			const auto keywords = unsupported_keywords(platform, term);
			if (!keywords.empty())
			{
				throw error_result_t(eResult::unsupportedFilter,
				                     term.name + " unsupported optional keywords for target " + platform.name + " in policy: " + join(keywords),
				                     term.name,
				                     platform.name,
				                     keywords);
			}
		}
	}
}
