#pragma once

#include <inttypes.h>

namespace common
{

enum class result_e : uint32_t
{
	success,
	unsupportedAddressFamily,
	unsupportedFilter,
	unknownIcmpType,
	mismatchIcmpInet,
	establishedOption,
	termNameTooLong,
	duplicateTermName,
	noPlatformPolicy,
	invalidConfigurationFile,
	invalidJson,
	missingRequiredOption,
};

static constexpr const char* result_to_c_str(common::result_e e)
{
	using common::result_e;

	switch (e)
	{
		case result_e::success:
			return "success";
		case result_e::unsupportedAddressFamily:
			return "unsupportedAddressFamily";
		case result_e::unsupportedFilter:
			return "unsupportedFilter";
		case result_e::unknownIcmpType:
			return "unknownIcmpType";
		case result_e::mismatchIcmpInet:
			return "mismatchIcmpInet";
		case result_e::establishedOption:
			return "establishedOption";
		case result_e::termNameTooLong:
			return "termNameTooLong";
		case result_e::duplicateTermName:
			return "duplicateTermName";
		case result_e::noPlatformPolicy:
			return "noPlatformPolicy";
		case result_e::invalidConfigurationFile:
			return "invalidConfigurationFile";
		case result_e::invalidJson:
			return "invalidJson";
		case result_e::missingRequiredOption:
			return "missingRequiredOption";
	}

	return "?";
}

}

using eResult = common::result_e;
