#include "common/errors.h"

#include "term_name.h"

using namespace aclgen;

namespace
{

void replace_all(std::string& string, std::string_view from, std::string_view to)
{
	for (auto pos = string.find(from);
	     pos != std::string::npos;
	     pos = string.find(from, pos + to.size()))
	{
		string.replace(pos, from.size(), to);
	}
}

}

const std::vector<std::pair<std::string_view, std::string_view>>& aclgen::abbreviations()
{
	// uppercase to tell abbreviations from lowercase names
	static const std::vector<std::pair<std::string_view, std::string_view>> table = {
	        {"bogons", "BGN"},
	        {"bogon", "BGN"},
	        {"reserved", "RSV"},
	        {"rfc1918", "PRV"},
	        {"rfc-1918", "PRV"},
	        {"internet", "EXT"},
	        {"global", "GBL"},
	        {"internal", "INT"},
	        {"customer", "CUST"},
	        {"google", "GOOG"},
	        {"ballmer", "ASS"},
	        {"microsoft", "LOL"},
	        {"china", "BAN"},
	        {"border", "BDR"},
	        {"service", "SVC"},
	        {"router", "RTR"},
	        {"transit", "TRNS"},
	        {"experiment", "EXP"},
	        {"established", "EST"},
	        {"unreachable", "UNR"},
	        {"fragment", "FRG"},
	        {"accept", "OK"},
	        {"discard", "DSC"},
	        {"reject", "REJ"},
	        {"replies", "ACK"},
	        {"request", "REQ"},
	};

	return table;
}

std::string aclgen::fix_term_length(const std::string& term_name,
                                    std::size_t max_length,
                                    bool abbreviate,
                                    bool truncate)
{
	std::string result = term_name;
	if (result.size() <= max_length)
	{
		return result;
	}

	if (abbreviate)
	{
		for (const auto& [word, abbreviation] : abbreviations())
		{
			replace_all(result, word, abbreviation);
			if (result.size() <= max_length)
			{
				return result;
			}
		}
	}

	if (truncate)
	{
		result.resize(max_length);
	}

	if (result.size() <= max_length)
	{
		return result;
	}

	throw error_result_t(eResult::termNameTooLong,
	                     "term " + result + " (originally " + term_name + ") is too long. limit is " + std::to_string(max_length) +
	                             " characters (vs. " + std::to_string(result.size()) + ") and no abbreviations remain or abbreviations disabled",
	                     term_name,
	                     {},
	                     {result});
}
