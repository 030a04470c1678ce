#pragma once

#include <optional>
#include <string>
#include <variant>

#include "common/type.h"

namespace aclgen
{

/// address family as written in policy: numeric (4, 6) or symbolic ("inet")
using af_arg_t = std::variant<tAddressFamily, std::string>;

namespace proto
{

std::optional<tProtocolNumber> number(const std::string& name);
std::optional<std::string> name(tProtocolNumber number);

}

namespace af
{

/// "inet", "inet6" and the legacy "bridge" alias
std::optional<tAddressFamily> number(const std::string& name);

/// canonical name, "inet" for 4 and "inet6" for 6
std::optional<std::string> name(tAddressFamily number);

bool is_known(tAddressFamily number);

std::string to_string(const af_arg_t& af);

}

}
