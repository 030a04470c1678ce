#include <gtest/gtest.h>

#include "../term_name.h"
#include "helper.h"

namespace
{

using namespace aclgen;
using aclgen::unittest::error_of;
using aclgen::unittest::result_of;

TEST(FixTermLength, 001_Fits)
{
	EXPECT_EQ("short-name", fix_term_length("short-name", 62, true, true));
	EXPECT_EQ("short-name", fix_term_length("short-name", 10, false, false));

	// fitting names are not abbreviated
	EXPECT_EQ("global-internal", fix_term_length("global-internal", 62, true, false));
}

TEST(FixTermLength, 002_Abbreviate)
{
	EXPECT_EQ("GBL-INT-router-BDR", fix_term_length("global-internal-router-border", 20, true, false));

	// stops as soon as the name fits
	EXPECT_EQ("GBL-INT-router-border", fix_term_length("global-internal-router-border", 21, true, false));
	EXPECT_EQ("GBL-internal-router-border", fix_term_length("global-internal-router-border", 26, true, false));
}

TEST(FixTermLength, 003_AbbreviateEveryOccurrence)
{
	EXPECT_EQ("INT-to-INT-accept", fix_term_length("internal-to-internal-accept", 20, true, false));
}

TEST(FixTermLength, 004_AbbreviateOrder)
{
	// "bogons" is tried before "bogon"
	EXPECT_EQ("deny-BGN-and-more", fix_term_length("deny-bogons-and-more", 18, true, false));
	EXPECT_EQ("deny-BGN-BGN", fix_term_length("deny-bogons-bogon", 13, true, false));
}

TEST(FixTermLength, 005_TooLong)
{
	const std::string name(70, 'x');

	const auto error = error_of([&]() {
		fix_term_length(name, 62, true, false);
	});
	EXPECT_EQ(eResult::termNameTooLong, error.result());
	EXPECT_EQ(name, error.term());
	EXPECT_EQ(std::vector<std::string>{name}, error.values());

	EXPECT_EQ(eResult::termNameTooLong, result_of([&]() {
		          fix_term_length(name, 62, false, false);
	          }));
}

TEST(FixTermLength, 006_Truncate)
{
	const std::string name(70, 'x');
	EXPECT_EQ(std::string(62, 'x'), fix_term_length(name, 62, false, true));
	EXPECT_EQ(std::string(62, 'x'), fix_term_length(name, 62, true, true));
}

TEST(FixTermLength, 007_AbbreviateThenTruncate)
{
	const auto result = fix_term_length("global-internal-customer-transit-router", 12, true, true);
	EXPECT_EQ("GBL-INT-CUST", result);
	EXPECT_EQ(12u, result.size());
}

TEST(FixTermLength, 008_Deterministic)
{
	const std::string name = "accept-established-replies-from-internet-to-google-service";
	const auto first = fix_term_length(name, 30, true, true);
	for (int i = 0; i < 10; i++)
	{
		EXPECT_EQ(first, fix_term_length(name, 30, true, true));
	}
	EXPECT_LE(first.size(), 30u);
}

} // namespace
