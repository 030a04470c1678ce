#pragma once

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include <inttypes.h>

#include "define.h"

using tProtocolNumber = uint8_t;
using tAddressFamily = uint8_t;
using tIcmpCode = uint8_t;
using tPort = uint16_t;

namespace common
{

/// closed interval of ports [from, to]
class range_t
{
public:
	constexpr range_t() :
	        range(0, 0)
	{
	}

	constexpr range_t(const tPort& value) :
	        range(value, value)
	{
	}

	constexpr range_t(const tPort& from,
	                  const tPort& to) :
	        range(from, to)
	{
	}

	/// "80", "0x50" or "8000-8080", throws std::logic_error on malformed input
	range_t(const std::string& string)
	{
		const auto delimiter = string.find('-');
		if (delimiter == std::string::npos)
		{
			range = {parse(string), parse(string)};
		}
		else
		{
			range = {parse(string.substr(0, delimiter)),
			         parse(string.substr(delimiter + 1))};
		}

		if (from() > to())
		{
			throw std::invalid_argument("inverted port range: " + string);
		}
	}

	constexpr bool operator==(const range_t& second) const
	{
		return range == second.range;
	}

	constexpr bool operator!=(const range_t& second) const
	{
		return range != second.range;
	}

	constexpr bool operator<(const range_t& second) const
	{
		return range < second.range;
	}

	operator std::string() const
	{
		return toString();
	}

public:
	std::string toString() const
	{
		return std::to_string(from()) + (from() == to() ? "" : "-" + std::to_string(to()));
	}

	tPort& from()
	{
		return std::get<0>(range);
	}

	const tPort& from() const
	{
		return std::get<0>(range);
	}

	tPort& to()
	{
		return std::get<1>(range);
	}

	const tPort& to() const
	{
		return std::get<1>(range);
	}

protected:
	static tPort parse(const std::string& string)
	{
		const auto value = std::stoull(string, nullptr, 0);
		if (value > ACLGEN_PORT_MAX)
		{
			throw std::out_of_range("port out of range: " + string);
		}
		return static_cast<tPort>(value);
	}

	std::tuple<tPort, tPort> range;
};

inline std::ostream& operator<<(std::ostream& stream, const range_t& range)
{
	return stream << range.toString();
}

/// ordered list of port ranges, may overlap until collapsed
using ranges_t = std::vector<range_t>;

/// merge overlapping and adjacent ranges into sorted disjoint list
inline ranges_t collapse(const ranges_t& ranges)
{
	ranges_t sorted = ranges;
	std::sort(sorted.begin(), sorted.end());

	ranges_t result;
	for (const auto& range : sorted)
	{
		/// compare as uint32_t, to() + 1 overflows on 65535
		if (!result.empty() &&
		    (uint32_t)range.from() <= (uint32_t)result.back().to() + 1)
		{
			result.back().to() = std::max(result.back().to(), range.to());
			continue;
		}

		result.emplace_back(range);
	}

	return result;
}

}
