#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "common/result.h"

namespace common
{

class error_result_t : public std::runtime_error
{
public:
	error_result_t(eResult result, const std::string& error) :
	        std::runtime_error(error), code(result)
	{}

	error_result_t(eResult result,
	               const std::string& error,
	               const std::string& term,
	               const std::string& platform,
	               const std::vector<std::string>& values = {}) :
	        std::runtime_error(error),
	        code(result),
	        termName(term),
	        platformName(platform),
	        offendingValues(values)
	{}

	eResult result() const
	{
		return code;
	}

	/// name of the term that caused the error, empty if not related to a term
	const std::string& term() const
	{
		return termName;
	}

	const std::string& platform() const
	{
		return platformName;
	}

	/// offending keywords, protocols or icmp types
	const std::vector<std::string>& values() const
	{
		return offendingValues;
	}

protected:
	eResult code;
	std::string termName;
	std::string platformName;
	std::vector<std::string> offendingValues;
};

}

using error_result_t = common::error_result_t;
