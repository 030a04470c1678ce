#include <set>

#include <gtest/gtest.h>

#include "../proto.h"

namespace
{

using namespace aclgen;

TEST(Proto, 001_ByName)
{
	EXPECT_EQ(0, proto::number("ip"));
	EXPECT_EQ(1, proto::number("icmp"));
	EXPECT_EQ(6, proto::number("tcp"));
	EXPECT_EQ(17, proto::number("udp"));
	EXPECT_EQ(41, proto::number("ipv6"));
	EXPECT_EQ(58, proto::number("icmpv6"));
	EXPECT_EQ(132, proto::number("sctp"));

	EXPECT_FALSE(proto::number("tcpp"));
	EXPECT_FALSE(proto::number(""));
}

TEST(Proto, 002_ByNumber)
{
	EXPECT_EQ("tcp", proto::name(6));
	EXPECT_EQ("vrrp", proto::name(112));
	EXPECT_FALSE(proto::name(5));
	EXPECT_FALSE(proto::name(255));
}

TEST(Proto, 003_Bijection)
{
	std::set<std::string> names;
	for (unsigned int number = 0; number < 256; number++)
	{
		const auto name = proto::name(number);
		if (!name)
		{
			continue;
		}

		EXPECT_TRUE(names.emplace(*name).second) << *name;
		EXPECT_EQ(number, proto::number(*name));
	}

	EXPECT_EQ(26u, names.size());
}

TEST(AddressFamily, 001_Names)
{
	EXPECT_EQ(4, af::number("inet"));
	EXPECT_EQ(6, af::number("inet6"));
	EXPECT_EQ(4, af::number("bridge"));
	EXPECT_FALSE(af::number("inet4"));

	EXPECT_EQ("inet", af::name(4));
	EXPECT_EQ("inet6", af::name(6));
	EXPECT_FALSE(af::name(5));

	EXPECT_TRUE(af::is_known(4));
	EXPECT_TRUE(af::is_known(6));
	EXPECT_FALSE(af::is_known(0));
}

} // namespace
