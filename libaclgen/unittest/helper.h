#pragma once

#include <string>

#include <gtest/gtest.h>

#include "common/errors.h"

#include "../policy.h"

namespace aclgen::unittest
{

/// result code thrown by function, success if nothing was thrown
template<typename function_T>
eResult result_of(const function_T& function)
{
	try
	{
		function();
	}
	catch (const error_result_t& error)
	{
		return error.result();
	}

	return eResult::success;
}

/// error thrown by function, fails the test if nothing was thrown
template<typename function_T>
error_result_t error_of(const function_T& function)
{
	try
	{
		function();
	}
	catch (const error_result_t& error)
	{
		return error;
	}

	ADD_FAILURE() << "error_result_t was not thrown";
	return error_result_t(eResult::success, "");
}

inline term_t make_term(const std::string& name,
                        const std::vector<std::string>& protocol = {},
                        const std::vector<std::string>& option = {},
                        const common::ranges_t& destination_port = {})
{
	term_t term;
	term.name = name;
	term.action = {"accept"};
	term.protocol = protocol;
	term.option = option;
	term.destination_port = destination_port;
	return term;
}

}
