#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "../platform.h"
#include "helper.h"

namespace
{

using namespace aclgen;
using aclgen::unittest::result_of;

TEST(Platform, 001_Defaults)
{
	const platform_t platform("iptables");

	EXPECT_EQ("iptables", platform.name);
	EXPECT_EQ("ip", platform.default_protocol);
	EXPECT_EQ((std::set<std::string>{"inet", "inet6"}), platform.supported_af);
	EXPECT_TRUE(platform.filter_blacklist.empty());
	EXPECT_EQ(62u, platform.term_max_length);
	EXPECT_FALSE(platform.all_protocols_stateful);
	EXPECT_EQ(required_keywords(), platform.valid_keywords());
	EXPECT_EQ(16u, required_keywords().size());
}

TEST(Platform, 002_Load)
{
	const auto json = nlohmann::json::parse(R"JSON(
{
  "platform": "speedway",
  "default_protocol": "all",
  "supported_af": ["inet", "inet6"],
  "filter_blacklist": {"inet6": ["icmp"]},
  "optional_keywords": ["counter", "logging"],
  "term_max_length": 24,
  "all_protocols_stateful": true
}
)JSON");

	const auto platform = load_platform(json);
	EXPECT_EQ("speedway", platform.name);
	EXPECT_EQ("all", platform.default_protocol);
	EXPECT_EQ(std::set<std::string>{"icmp"}, platform.filter_blacklist.at("inet6"));
	EXPECT_EQ(24u, platform.term_max_length);
	EXPECT_TRUE(platform.all_protocols_stateful);
	EXPECT_TRUE(exist(platform.valid_keywords(), std::string("logging")));
	EXPECT_TRUE(exist(platform.valid_keywords(), std::string("action")));
}

TEST(Platform, 003_LoadErrors)
{
	EXPECT_EQ(eResult::missingRequiredOption, result_of([]() {
		          load_platform(nlohmann::json::parse(R"({"term_max_length": 24})"));
	          }));

	EXPECT_EQ(eResult::invalidConfigurationFile, result_of([]() {
		          load_platform(nlohmann::json::parse(R"({"platform": "speedway", "term_max_length": "long"})"));
	          }));

	EXPECT_EQ(eResult::invalidConfigurationFile, result_of([]() {
		          load_platform(nlohmann::json::parse(R"({"platform": "speedway", "supported_af": ["inet5"]})"));
	          }));

	EXPECT_EQ(eResult::invalidConfigurationFile, result_of([]() {
		          load_platform(nlohmann::json::parse(R"({"platform": "speedway", "term_max_length": 0})"));
	          }));

	EXPECT_EQ(eResult::invalidConfigurationFile, result_of([]() {
		          load_platform(nlohmann::json::parse(R"({"platform": "speedway", "filter_blacklist": {"inet7": ["icmp"]}})"));
	          }));
}

TEST(Platform, 004_RequiredKeywordsOverride)
{
	const auto platform = load_platform(nlohmann::json::parse(R"({"platform": "minimal", "required_keywords": ["name", "action"]})"));
	EXPECT_EQ((std::set<std::string>{"action", "name"}), platform.valid_keywords());
}

} // namespace
