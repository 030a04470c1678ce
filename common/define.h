#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace common::log
{
enum LogPriority
{
	TLOG_EMERG = 0 /* "EMERG" */,
	TLOG_ALERT = 1 /* "ALERT" */,
	TLOG_CRIT = 2 /* "CRITICAL_INFO" */,
	TLOG_ERR = 3 /* "ERROR" */,
	TLOG_WARNING = 4 /* "WARNING" */,
	TLOG_NOTICE = 5 /* "NOTICE" */,
	TLOG_INFO = 6 /* "INFO" */,
	TLOG_DEBUG = 7 /* "DEBUG" */
};
extern LogPriority logPriority;
} // common::log

#define ACLGEN_LOG_(name, level, msg, args...)                                                                                         \
	do                                                                                                                             \
		if (common::log::logPriority >= common::log::TLOG_##level)                                                             \
		{                                                                                                                      \
			timespec ts;                                                                                                   \
			timespec_get(&ts, TIME_UTC);                                                                                   \
			fprintf(stdout, "[" name "] %lu.%06lu %s:%d: " msg, ts.tv_sec, ts.tv_nsec / 1000, __FILE__, __LINE__, ##args); \
			fflush(stdout);                                                                                                \
		}                                                                                                                      \
	while (0)
#define ACLGEN_LOG(level, msg, args...) ACLGEN_LOG_(#level, level, msg, ##args)

#define ACLGEN_LOG_DEBUG(msg, args...) ACLGEN_LOG(DEBUG, msg, ##args)
#define ACLGEN_LOG_INFO(msg, args...) ACLGEN_LOG(INFO, msg, ##args)
#define ACLGEN_LOG_NOTICE(msg, args...) ACLGEN_LOG(NOTICE, msg, ##args)
#define ACLGEN_LOG_WARNING(msg, args...) ACLGEN_LOG(WARNING, msg, ##args)
#define ACLGEN_LOG_ERROR(msg, args...) ACLGEN_LOG_("ERROR", ERR, msg, ##args)

#define ACLGEN_AF_INET ((uint8_t)(4))
#define ACLGEN_AF_INET6 ((uint8_t)(6))

#define ACLGEN_PORT_MAX ((uint16_t)(65535))
#define ACLGEN_HIGH_PORT_FROM ((uint16_t)(1024))

#define ACLGEN_TERM_MAX_LENGTH_DEFAULT ((std::size_t)(62))
#define ACLGEN_DEFAULT_PROTOCOL "ip"
#define ACLGEN_INTERNAL_KEYWORD_PREFIX "flatten"
#define ACLGEN_ESTABLISHED_OPTION "established"

/// @todo: move
template<typename map_T,
         typename key_T>
inline bool exist(const map_T& map, const key_T& key)
{
	return map.find(key) != map.end();
}

template<typename key_T,
         typename value_T>
inline bool exist(const std::map<key_T, value_T>& map, const key_T& key)
{
	return map.find(key) != map.end();
}

template<typename key_T>
inline bool exist(const std::set<key_T>& set, const key_T& key)
{
	return set.find(key) != set.end();
}

template<typename type_T>
inline bool exist(const std::vector<type_T>& vector, const type_T& value)
{
	for (const auto& iter : vector)
	{
		if (iter == value)
		{
			return true;
		}
	}

	return false;
}

inline bool starts_with(const std::string& string, const char* prefix)
{
	return string.rfind(prefix, 0) == 0;
}

/// space separated list, used in error messages
template<typename container_T>
inline std::string join(const container_T& container, const char* separator = " ")
{
	std::string result;
	for (const auto& iter : container)
	{
		if (!result.empty())
		{
			result += separator;
		}
		result += iter;
	}
	return result;
}
