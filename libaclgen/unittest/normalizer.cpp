#include <gtest/gtest.h>

#include "../normalizer.h"
#include "helper.h"

namespace
{

using namespace aclgen;
using aclgen::unittest::error_of;
using aclgen::unittest::result_of;

TEST(NormalizeAddressFamily, 001_Numeric)
{
	EXPECT_EQ(4, normalize_address_family(ACLGEN_AF_INET, "term"));
	EXPECT_EQ(6, normalize_address_family(ACLGEN_AF_INET6, "term"));
}

TEST(NormalizeAddressFamily, 002_Symbolic)
{
	EXPECT_EQ(4, normalize_address_family(std::string("inet"), "term"));
	EXPECT_EQ(6, normalize_address_family(std::string("inet6"), "term"));
	EXPECT_EQ(4, normalize_address_family(std::string("bridge"), "term"));
}

TEST(NormalizeAddressFamily, 003_Unsupported)
{
	const auto error = error_of([]() {
		normalize_address_family(std::string("bogus"), "allow-web", "juniper");
	});
	EXPECT_EQ(eResult::unsupportedAddressFamily, error.result());
	EXPECT_EQ("allow-web", error.term());
	EXPECT_EQ("juniper", error.platform());
	EXPECT_EQ(std::vector<std::string>{"bogus"}, error.values());

	EXPECT_EQ(eResult::unsupportedAddressFamily, result_of([]() {
		          normalize_address_family(tAddressFamily(5), "term");
	          }));
}

TEST(NormalizeAddressFamily, 004_PlainInteger)
{
	EXPECT_EQ(4, normalize_address_family(4, "term"));
	EXPECT_EQ(6, normalize_address_family(6, "term"));

	for (const int family : {0, 5, 260, -4})
	{
		const auto error = error_of([&]() {
			normalize_address_family(family, "allow-web");
		});
		EXPECT_EQ(eResult::unsupportedAddressFamily, error.result());
		EXPECT_EQ(std::vector<std::string>{std::to_string(family)}, error.values());
	}
}

TEST(NormalizeIcmpTypes, 001_EmptyMeansAny)
{
	const icmp_codes_t expect = {std::nullopt};
	EXPECT_EQ(expect, normalize_icmp_types({}, {"tcp"}, ACLGEN_AF_INET, "term"));
	EXPECT_EQ(expect, normalize_icmp_types({}, {}, std::string("bogus"), "term"));
}

TEST(NormalizeIcmpTypes, 002_Resolve)
{
	const icmp_codes_t expect = {0};
	EXPECT_EQ(expect, normalize_icmp_types({"echo-reply"}, {"icmp"}, std::string("inet"), "term"));
}

TEST(NormalizeIcmpTypes, 003_Sorted)
{
	const icmp_codes_t expect = {0, 3, 8, 11};
	EXPECT_EQ(expect, normalize_icmp_types({"time-exceeded", "echo-request", "unreachable", "echo-reply"}, {"icmp"}, ACLGEN_AF_INET, "term"));

	const icmp_codes_t expect6 = {1, 128, 129};
	EXPECT_EQ(expect6, normalize_icmp_types({"echo-reply", "destination-unreachable", "echo-request"}, {"icmpv6"}, std::string("inet6"), "term"));
}

TEST(NormalizeIcmpTypes, 004_NonIcmpProtocol)
{
	EXPECT_EQ(eResult::unsupportedFilter, result_of([]() {
		          normalize_icmp_types({"echo-reply"}, {"tcp"}, std::string("inet"), "term");
	          }));

	// icmp together with another protocol is not allowed either
	EXPECT_EQ(eResult::unsupportedFilter, result_of([]() {
		          normalize_icmp_types({"echo-reply"}, {"icmp", "tcp"}, std::string("inet"), "term");
	          }));

	EXPECT_EQ(eResult::unsupportedFilter, result_of([]() {
		          normalize_icmp_types({"echo-reply"}, {}, std::string("inet"), "term");
	          }));
}

TEST(NormalizeIcmpTypes, 005_Mismatch)
{
	EXPECT_EQ(eResult::mismatchIcmpInet, result_of([]() {
		          normalize_icmp_types({"echo-reply"}, {"icmp"}, std::string("inet6"), "term");
	          }));

	EXPECT_EQ(eResult::mismatchIcmpInet, result_of([]() {
		          normalize_icmp_types({"echo-reply"}, {"icmpv6"}, ACLGEN_AF_INET, "term");
	          }));
}

TEST(NormalizeIcmpTypes, 006_Unknown)
{
	const auto error = error_of([]() {
		normalize_icmp_types({"echo-reply", "bogus-type"}, {"icmp"}, std::string("inet"), "allow-ping");
	});
	EXPECT_EQ(eResult::unknownIcmpType, error.result());
	EXPECT_EQ("allow-ping", error.term());
	EXPECT_EQ(std::vector<std::string>{"bogus-type"}, error.values());

	// valid for inet6 only
	EXPECT_EQ(eResult::unknownIcmpType, result_of([]() {
		          normalize_icmp_types({"packet-too-big"}, {"icmp"}, std::string("inet"), "term");
	          }));
}

TEST(NormalizeIcmpTypes, 007_UnsupportedAddressFamily)
{
	EXPECT_EQ(eResult::unsupportedAddressFamily, result_of([]() {
		          normalize_icmp_types({"echo-reply"}, {"icmp"}, std::string("bogus"), "term");
	          }));
}

} // namespace
