#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace aclgen
{

/// long form -> short form, earlier entries are applied first
const std::vector<std::pair<std::string_view, std::string_view>>& abbreviations();

/**
 * @brief Fit term name into max_length characters.
 *
 * Abbreviations are applied one by one until the name fits, then the name is
 * truncated if allowed. A name that already fits is returned as is.
 *
 * @throws error_result_t(termNameTooLong)
 */
std::string fix_term_length(const std::string& term_name,
                            std::size_t max_length,
                            bool abbreviate = false,
                            bool truncate = false);

}
