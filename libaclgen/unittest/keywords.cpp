#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "../keywords.h"
#include "helper.h"

namespace
{

using namespace aclgen;
using aclgen::unittest::error_of;
using aclgen::unittest::make_term;
using aclgen::unittest::result_of;

auto make_platform() -> platform_t
{
	platform_t platform("speedway");
	platform.optional = {"counter"};
	return platform;
}

auto make_policy(const std::vector<term_t>& terms,
                 const std::vector<std::string>& targets = {"speedway"}) -> policy_t
{
	filter_t filter;
	for (const auto& target : targets)
	{
		filter.header.targets[target] = {};
	}
	filter.terms = terms;

	policy_t policy;
	policy.filters.emplace_back(filter);
	return policy;
}

TEST(Keywords, 001_Required)
{
	auto term = make_term("allow-web", {"tcp"}, {"established"}, {80});
	term.source_address = {"10.0.0.0/8"};
	term.comment = {"web"};
	term.counter = "web-counter";

	EXPECT_TRUE(unsupported_keywords(make_platform(), term).empty());
	EXPECT_EQ(eResult::success, result_of([&]() {
		          validate_keywords(make_platform(), make_policy({term}));
	          }));
}

TEST(Keywords, 002_AllOffendingListed)
{
	auto term = make_term("allow-web", {"tcp"});
	term.policer = "slow";
	term.logging = {"syslog"};
	term.attributes["qos"] = "af4";
	term.attributes["owner"] = "";

	const auto error = error_of([&]() {
		validate_keywords(make_platform(), make_policy({term}));
	});
	EXPECT_EQ(eResult::unsupportedFilter, error.result());
	EXPECT_EQ("allow-web", error.term());
	EXPECT_EQ("speedway", error.platform());

	const std::vector<std::string> expect = {"logging", "policer", "qos"};
	EXPECT_EQ(expect, error.values());
}

TEST(Keywords, 003_InternalAllowed)
{
	auto term = make_term("allow-web", {"tcp"});
	term.flattened = true;
	term.flattened_saddr = true;
	term.attributes["flatten_cache"] = "1";

	EXPECT_TRUE(unsupported_keywords(make_platform(), term).empty());
}

TEST(Keywords, 004_PlatformSkipped)
{
	auto term = make_term("juniper-only", {"tcp"});
	term.policer = "slow";
	term.platform = {"juniper"};

	EXPECT_EQ(eResult::success, result_of([&]() {
		          validate_keywords(make_platform(), make_policy({term}));
	          }));

	term.platform = {"juniper", "speedway"};
	EXPECT_EQ(eResult::unsupportedFilter, result_of([&]() {
		          validate_keywords(make_platform(), make_policy({term}));
	          }));
}

TEST(Keywords, 005_PlatformExcludeSkipped)
{
	auto term = make_term("not-speedway", {"tcp"});
	term.policer = "slow";
	term.platform_exclude = {"speedway"};

	EXPECT_EQ(eResult::success, result_of([&]() {
		          validate_keywords(make_platform(), make_policy({term}));
	          }));

	term.platform_exclude = {"juniper"};
	EXPECT_EQ(eResult::unsupportedFilter, result_of([&]() {
		          validate_keywords(make_platform(), make_policy({term}));
	          }));
}

TEST(Keywords, 006_OtherPlatformHeader)
{
	auto term = make_term("allow-web", {"tcp"});
	term.policer = "slow";

	EXPECT_EQ(eResult::success, result_of([&]() {
		          validate_keywords(make_platform(), make_policy({term}, {"juniper"}));
	          }));
}

TEST(Keywords, 007_EveryHeaderChecked)
{
	auto good = make_term("good", {"tcp"});
	auto bad = make_term("bad", {"udp"});
	bad.policer = "slow";

	auto policy = make_policy({good});
	policy.filters.emplace_back(make_policy({good}, {"juniper"}).filters.front());
	policy.filters.emplace_back(make_policy({good, bad}).filters.front());

	const auto error = error_of([&]() {
		validate_keywords(make_platform(), policy);
	});
	EXPECT_EQ(eResult::unsupportedFilter, error.result());
	EXPECT_EQ("bad", error.term());
}

TEST(Keywords, 008_OptionalByPlatform)
{
	auto term = make_term("counted", {"tcp"});
	term.counter = "hits";

	platform_t platform("iptables");
	EXPECT_EQ(std::vector<std::string>{"counter"}, unsupported_keywords(platform, term));

	platform.optional.emplace("counter");
	EXPECT_TRUE(unsupported_keywords(platform, term).empty());
}

TEST(Keywords, 009_FalsyAttributesNotSet)
{
	const auto policy = load_policy(nlohmann::json::parse(R"JSON(
{
  "filters": [
    {
      "header": {"targets": {"speedway": []}},
      "terms": [
        {"name": "t", "protocol": ["tcp"], "disabled": false, "tags": [], "weight": 0, "extra": {}, "note": null}
      ]
    }
  ]
}
)JSON"));

	EXPECT_EQ(eResult::success, result_of([&]() {
		          validate_keywords(make_platform(), policy);
	          }));

	const auto truthy = load_policy(nlohmann::json::parse(R"({"filters": [{"header": {"targets": {"speedway": []}}, "terms": [{"name": "t", "disabled": true, "tags": ["a"]}]}]})"));
	const auto error = error_of([&]() {
		validate_keywords(make_platform(), truthy);
	});
	EXPECT_EQ(eResult::unsupportedFilter, error.result());
	EXPECT_EQ((std::vector<std::string>{"disabled", "tags"}), error.values());
}

} // namespace
