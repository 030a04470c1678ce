#include <gtest/gtest.h>

#include "../ports.h"
#include "helper.h"

namespace
{

using namespace aclgen;
using aclgen::unittest::error_of;
using aclgen::unittest::make_term;
using aclgen::unittest::result_of;
using common::range_t;
using common::ranges_t;

TEST(Collapse, 001_Basic)
{
	EXPECT_EQ((ranges_t{{80, 80}, {1024, 65535}}), common::collapse({{80, 80}, {1024, 65535}}));
	EXPECT_EQ((ranges_t{{1023, 65535}}), common::collapse({{1023, 1030}, {1024, 65535}}));
	EXPECT_TRUE(common::collapse({}).empty());
}

TEST(Collapse, 002_Adjacent)
{
	EXPECT_EQ((ranges_t{{1, 30}}), common::collapse({{21, 30}, {1, 10}, {11, 20}}));
	EXPECT_EQ((ranges_t{{1, 10}, {12, 20}}), common::collapse({{12, 20}, {1, 10}}));
}

TEST(Collapse, 003_Overlap)
{
	EXPECT_EQ((ranges_t{{1, 100}}), common::collapse({{1, 100}, {5, 10}, {50, 60}}));
	EXPECT_EQ((ranges_t{{0, 65535}}), common::collapse({{0, 65535}, {65535, 65535}}));
	EXPECT_EQ((ranges_t{{53, 53}}), common::collapse({{53, 53}, {53, 53}}));
}

TEST(Collapse, 004_Idempotent)
{
	const ranges_t ranges = {{443, 443}, {22, 22}, {8000, 8080}, {8080, 9000}, {23, 23}};
	const auto collapsed = common::collapse(ranges);
	EXPECT_EQ((ranges_t{{22, 23}, {443, 443}, {8000, 9000}}), collapsed);
	EXPECT_EQ(collapsed, common::collapse(collapsed));
}

TEST(FixHighPorts, 001_Established)
{
	const platform_t platform("speedway");
	const auto term = make_term("return-web", {"tcp"}, {"established"}, {{80, 80}});

	const auto fixed = fix_high_ports(platform, term);
	ASSERT_TRUE(fixed);
	EXPECT_EQ((ranges_t{{80, 80}, {1024, 65535}}), fixed->destination_port);

	// original is never modified
	EXPECT_EQ((ranges_t{{80, 80}}), term.destination_port);
}

TEST(FixHighPorts, 002_EstablishedMerge)
{
	const platform_t platform("speedway");
	const auto term = make_term("return-any", {"tcp", "udp"}, {"established"}, {{1023, 1030}});

	const auto fixed = fix_high_ports(platform, term, "inet6");
	ASSERT_TRUE(fixed);
	EXPECT_EQ((ranges_t{{1023, 65535}}), fixed->destination_port);
	EXPECT_EQ((ranges_t{{1023, 1030}}), term.destination_port);
	EXPECT_EQ(term.name, fixed->name);
	EXPECT_EQ(term.protocol, fixed->protocol);
}

TEST(FixHighPorts, 003_EstablishedPrefix)
{
	const platform_t platform("speedway");

	auto term = make_term("return-tcp", {"tcp"}, {"counter", "established-only"});
	auto fixed = fix_high_ports(platform, term);
	ASSERT_TRUE(fixed);
	EXPECT_EQ((ranges_t{{1024, 65535}}), fixed->destination_port);

	term.option = {"tcp-established"};
	EXPECT_FALSE(fix_high_ports(platform, term));
}

TEST(FixHighPorts, 004_NoEstablished)
{
	const platform_t platform("speedway");
	const auto term = make_term("allow-dns", {"udp"}, {}, {{53, 53}});
	EXPECT_FALSE(fix_high_ports(platform, term));

	// icmp without established is fine
	EXPECT_FALSE(fix_high_ports(platform, make_term("allow-ping", {"icmp"})));
}

TEST(FixHighPorts, 005_EstablishedStateless)
{
	const platform_t platform("speedway");
	const auto term = make_term("return-icmp", {"icmp", "tcp"}, {"established"});

	const auto error = error_of([&]() {
		fix_high_ports(platform, term);
	});
	EXPECT_EQ(eResult::establishedOption, error.result());
	EXPECT_EQ("return-icmp", error.term());
	EXPECT_EQ(std::vector<std::string>{"icmp"}, error.values());

	EXPECT_FALSE(fix_high_ports(platform, term, "inet", true));
	EXPECT_TRUE(term.destination_port.empty());
}

TEST(FixHighPorts, 006_DefaultProtocol)
{
	platform_t platform("speedway");
	const auto term = make_term("return-all", {}, {"established"});

	EXPECT_EQ(std::set<std::string>{"ip"}, effective_protocols(platform, term));
	EXPECT_EQ(eResult::establishedOption, result_of([&]() {
		          fix_high_ports(platform, term);
	          }));

	platform.default_protocol = "tcp";
	const auto fixed = fix_high_ports(platform, term);
	ASSERT_TRUE(fixed);
	EXPECT_EQ((ranges_t{{1024, 65535}}), fixed->destination_port);
}

TEST(FixHighPorts, 007_UnsupportedAddressFamily)
{
	platform_t platform("speedway");
	platform.supported_af = {"inet"};

	const auto term = make_term("allow-web", {"tcp"}, {}, {{80, 80}});
	EXPECT_EQ(eResult::success, result_of([&]() {
		          fix_high_ports(platform, term, "inet");
	          }));

	const auto error = error_of([&]() {
		fix_high_ports(platform, term, "inet6");
	});
	EXPECT_EQ(eResult::unsupportedAddressFamily, error.result());
	EXPECT_EQ("speedway", error.platform());
}

TEST(FixHighPorts, 008_Blacklist)
{
	platform_t platform("speedway");
	platform.filter_blacklist["inet6"] = {"icmp", "igmp"};

	const auto term = make_term("allow-mixed", {"icmp", "igmp", "tcp"});
	EXPECT_EQ(eResult::success, result_of([&]() {
		          fix_high_ports(platform, term, "inet");
	          }));

	const auto error = error_of([&]() {
		fix_high_ports(platform, term, "inet6");
	});
	EXPECT_EQ(eResult::unsupportedFilter, error.result());

	const std::vector<std::string> expect = {"icmp", "igmp"};
	EXPECT_EQ(expect, error.values());
}

TEST(FixHighPorts, 009_FirstEstablishedOnly)
{
	const platform_t platform("speedway");
	const auto term = make_term("return-web", {"tcp"}, {"established", "established"}, {{80, 80}});

	const auto fixed = fix_high_ports(platform, term);
	ASSERT_TRUE(fixed);
	EXPECT_EQ((ranges_t{{80, 80}, {1024, 65535}}), fixed->destination_port);
}

} // namespace
