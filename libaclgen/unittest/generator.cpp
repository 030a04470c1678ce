#include <gtest/gtest.h>

#include "../generator.h"
#include "helper.h"

namespace
{

using namespace aclgen;
using aclgen::unittest::error_of;
using aclgen::unittest::make_term;
using aclgen::unittest::result_of;
using common::ranges_t;

auto make_platform() -> platform_t
{
	platform_t platform("speedway");
	platform.term_max_length = 24;
	platform.filter_blacklist["inet6"] = {"icmp"};
	return platform;
}

auto make_policy() -> policy_t
{
	filter_t filter;
	filter.header.targets["speedway"] = {"INPUT"};

	auto ping = make_term("allow-ping-from-internal-network", {"icmp"});
	ping.icmp_type = {"echo-request", "echo-reply"};
	filter.terms.emplace_back(ping);
	filter.terms.emplace_back(make_term("return-tcp", {"tcp"}, {"established"}, {{22, 22}}));

	policy_t policy;
	policy.filters.emplace_back(filter);
	return policy;
}

TEST(Generator, 001_Render)
{
	const auto policy = make_policy();
	const generator_t generator(make_platform(), policy);

	const auto filters = generator.require_filters();
	ASSERT_EQ(1u, filters.size());

	check_duplicate_term_names(filters.front());

	const auto& terms = filters.front().get().terms;
	for (const auto& term : terms)
	{
		EXPECT_EQ(4, generator.normalize_address_family(std::string("inet"), term));
		EXPECT_EQ(6, generator.normalize_address_family(6, term));
	}

	const icmp_codes_t codes = {0, 8};
	EXPECT_EQ(codes, generator.normalize_icmp_types(terms[0], std::string("inet")));
	EXPECT_EQ(icmp_codes_t{std::nullopt}, generator.normalize_icmp_types(terms[1], std::string("inet")));

	EXPECT_EQ("allow-ping-from-INT-netw", generator.fix_term_length(terms[0].name, true, true));

	const auto fixed = generator.fix_high_ports(terms[1]);
	ASSERT_TRUE(fixed);
	EXPECT_EQ((ranges_t{{22, 22}, {1024, 65535}}), fixed->destination_port);
	EXPECT_EQ((ranges_t{{22, 22}}), terms[1].destination_port);

	EXPECT_FALSE(generator.fix_high_ports(terms[0]));
	EXPECT_EQ(eResult::unsupportedFilter, result_of([&]() {
		          generator.fix_high_ports(terms[0], "inet6");
	          }));
}

TEST(Generator, 002_KeywordsOnConstruction)
{
	auto policy = make_policy();
	policy.filters.front().terms[1].policer = "slow";
	policy.filters.front().terms[1].attributes["owner"] = "netops";

	const auto error = error_of([&]() {
		generator_t generator(make_platform(), policy);
	});
	EXPECT_EQ(eResult::unsupportedFilter, error.result());
	EXPECT_EQ("return-tcp", error.term());
	EXPECT_EQ("speedway", error.platform());

	const std::vector<std::string> expect = {"policer", "owner"};
	EXPECT_EQ(expect, error.values());

	// not targeted, nothing to check
	auto platform = make_platform();
	platform.name = "juniper";
	EXPECT_EQ(eResult::success, result_of([&]() {
		          generator_t generator(platform, policy);
	          }));
}

TEST(Generator, 003_NoPlatformPolicy)
{
	auto platform = make_platform();
	platform.name = "juniper";

	const generator_t generator(platform, make_policy());
	EXPECT_TRUE(generator.filters().empty());

	const auto error = error_of([&]() {
		generator.require_filters();
	});
	EXPECT_EQ(eResult::noPlatformPolicy, error.result());
	EXPECT_EQ("juniper", error.platform());
}

TEST(Generator, 004_DuplicateTermName)
{
	auto policy = make_policy();
	auto& filter = policy.filters.front();
	filter.terms.emplace_back(make_term("return-tcp", {"udp"}));

	const auto error = error_of([&]() {
		check_duplicate_term_names(filter);
	});
	EXPECT_EQ(eResult::duplicateTermName, error.result());
	EXPECT_EQ("return-tcp", error.term());
}

TEST(Generator, 005_StatefulPlatform)
{
	auto platform = make_platform();
	const auto term = make_term("return-all", {"tcp", "gre"}, {"established"});

	policy_t policy;
	{
		const generator_t generator(platform, policy);
		EXPECT_EQ(eResult::establishedOption, result_of([&]() {
			          generator.fix_high_ports(term);
		          }));
		EXPECT_FALSE(generator.fix_high_ports(term, "inet", true));
	}

	platform.all_protocols_stateful = true;
	{
		const generator_t generator(platform, policy);
		EXPECT_FALSE(generator.fix_high_ports(term));
	}
}

TEST(Generator, 006_TermNameTooLong)
{
	const generator_t generator(make_platform(), policy_t{});

	EXPECT_EQ(eResult::termNameTooLong, result_of([&]() {
		          generator.fix_term_length("this-term-name-has-no-abbreviations", true, false);
	          }));
	EXPECT_EQ("this-term-name-has-no-ab", generator.fix_term_length("this-term-name-has-no-abbreviations", true, true));
}

TEST(Generator, 007_NoAddressFamilyWarning)
{
	auto term = make_term("v6-only");
	term.source_address = {"2001:db8::/32"};

	const auto priority = common::log::logPriority;
	common::log::logPriority = common::log::TLOG_WARNING;

	testing::internal::CaptureStdout();
	log_no_address_family(term, "source", "inet");
	const auto output = testing::internal::GetCapturedStdout();

	common::log::logPriority = priority;

	EXPECT_NE(std::string::npos, output.find("[WARNING]"));
	EXPECT_NE(std::string::npos, output.find("term v6-only will not be rendered"));
	EXPECT_NE(std::string::npos, output.find("no source addresses of inet address family"));
}

} // namespace
