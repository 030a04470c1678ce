#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "../policy.h"
#include "helper.h"

namespace
{

using namespace aclgen;
using aclgen::unittest::result_of;
using common::ranges_t;

const auto policy_json = R"JSON(
{
  "filters": [
    {
      "header": {"targets": {"speedway": ["INPUT", "ACCEPT"], "juniper": null}},
      "terms": [
        {
          "name": "allow-web",
          "protocol": ["tcp"],
          "destination_port": [80, "443", "8000-8080", [9000, 9100]],
          "destination_address": ["10.0.0.0/8"],
          "action": ["accept"],
          "qos": "af4"
        },
        {
          "name": "allow-ping",
          "protocol": ["icmp"],
          "icmp_type": ["echo-request"],
          "platform_exclude": ["juniper"],
          "action": ["accept"]
        }
      ]
    }
  ]
}
)JSON";

TEST(Policy, 001_Load)
{
	const auto policy = load_policy(nlohmann::json::parse(policy_json));
	ASSERT_EQ(1u, policy.filters.size());

	const auto& filter = policy.filters.front();
	EXPECT_TRUE(filter.header.has_platform("speedway"));
	EXPECT_TRUE(filter.header.has_platform("juniper"));
	EXPECT_FALSE(filter.header.has_platform("iptables"));
	EXPECT_EQ((std::vector<std::string>{"INPUT", "ACCEPT"}), filter.header.targets.at("speedway"));

	ASSERT_EQ(2u, filter.terms.size());
	const auto& web = filter.terms[0];
	EXPECT_EQ("allow-web", web.name);
	EXPECT_EQ((ranges_t{{80, 80}, {443, 443}, {8000, 8080}, {9000, 9100}}), web.destination_port);
	EXPECT_EQ("af4", web.attributes.at("qos"));

	const std::vector<std::string> keywords = {"name", "action", "protocol", "destination_address", "destination_port", "qos"};
	EXPECT_EQ(keywords, web.populated_keywords());
}

TEST(Policy, 002_ActiveOn)
{
	const auto policy = load_policy(nlohmann::json::parse(policy_json));
	const auto& ping = policy.filters.front().terms[1];

	EXPECT_TRUE(ping.active_on("speedway"));
	EXPECT_FALSE(ping.active_on("juniper"));

	auto only = ping;
	only.platform_exclude.clear();
	only.platform = {"juniper"};
	EXPECT_TRUE(only.active_on("juniper"));
	EXPECT_FALSE(only.active_on("speedway"));
}

TEST(Policy, 003_Invalid)
{
	EXPECT_EQ(eResult::invalidJson, result_of([]() {
		          load_policy(nlohmann::json::parse(R"({"filters": [{"terms": []}]})"));
	          }));

	EXPECT_EQ(eResult::invalidJson, result_of([]() {
		          load_policy(nlohmann::json::parse(R"({"filters": [{"header": {"targets": {"speedway": []}}, "terms": [{"name": "t", "source_port": ["http"]}]}]})"));
	          }));
}

auto load_ports(const std::string& ports) -> ranges_t
{
	const auto policy = load_policy(nlohmann::json::parse(R"({"filters": [{"header": {"targets": {"speedway": []}}, "terms": [{"name": "t", "destination_port": [)" + ports + "]}]}]}"));
	return policy.filters.front().terms.front().destination_port;
}

TEST(Policy, 005_PortBounds)
{
	EXPECT_EQ((ranges_t{{0, 0}, {65535, 65535}, {1024, 65535}, {1, 1}}), load_ports(R"(0, "65535", [1024, 65535], "1-1")"));

	for (const std::string ports : {R"("70000")",
	                                R"(65536)",
	                                R"("2000-1000")",
	                                R"([2000, 1000])",
	                                R"("80-70000")",
	                                R"([80, 65536])",
	                                R"(-1)",
	                                R"(80.5)"})
	{
		EXPECT_EQ(eResult::invalidJson, result_of([&]() {
			          load_ports(ports);
		          })) << ports;
	}
}

TEST(Policy, 006_Translated)
{
	const auto policy = load_policy(nlohmann::json::parse(R"({"filters": [{"header": {"targets": {"speedway": []}}, "terms": [{"name": "nat", "translated": true}, {"name": "plain", "translated": false}]}]})"));
	const auto& terms = policy.filters.front().terms;

	EXPECT_TRUE(terms[0].translated);
	EXPECT_FALSE(exist(terms[0].attributes, std::string("translated")));
	EXPECT_EQ((std::vector<std::string>{"name", "translated"}), terms[0].populated_keywords());

	EXPECT_FALSE(terms[1].translated);
	EXPECT_EQ(std::vector<std::string>{"name"}, terms[1].populated_keywords());
}

TEST(Policy, 007_FalsyAttributes)
{
	const auto policy = load_policy(nlohmann::json::parse(R"({"filters": [{"header": {"targets": {"speedway": []}}, "terms": [{"name": "t", "disabled": false, "weight": 0, "tags": [], "extra": {}, "note": null, "owner": "", "qos": "af4", "enabled": true}]}]})"));
	const auto& term = policy.filters.front().terms.front();

	EXPECT_EQ("", term.attributes.at("disabled"));
	EXPECT_EQ("", term.attributes.at("tags"));
	EXPECT_EQ("true", term.attributes.at("enabled"));
	EXPECT_EQ((std::vector<std::string>{"name", "enabled", "qos"}), term.populated_keywords());
}

TEST(Policy, 004_IcmpTypes)
{
	const auto& types = icmp::types();
	EXPECT_EQ(0, types.at(4).at("echo-reply"));
	EXPECT_EQ(8, types.at(4).at("echo-request"));
	EXPECT_EQ(129, types.at(6).at("echo-reply"));
	EXPECT_EQ(128, types.at(6).at("echo-request"));
	EXPECT_FALSE(exist(types.at(4), std::string("packet-too-big")));
}

} // namespace
